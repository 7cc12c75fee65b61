#ifndef STATUS_H
#define STATUS_H

#include <cstdint>

// Result of every operation that can be rejected.
// Values are part of the exported C interface (see sudoplay.hpp).
enum class Status : uint8_t {
  Ok = 0,
  CellLocked = 1,           // mutation or hint on a fixed cell
  InvalidState = 2,         // session already finished
  InvalidConfiguration = 3, // blank count outside 0..81
  InvalidArgument = 4       // index, digit or imported board out of range
};

inline const char *statusToString(Status status) {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::CellLocked:
      return "cell locked";
    case Status::InvalidState:
      return "invalid state";
    case Status::InvalidConfiguration:
      return "invalid configuration";
    case Status::InvalidArgument:
      return "invalid argument";
  }
  return "unknown";
}

#endif // STATUS_H
