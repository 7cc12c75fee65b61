#ifndef GAME_CONFIG_H
#define GAME_CONFIG_H

#include <cctype>
#include <cstdint>

enum class Difficulty : uint8_t {
  Easy = 0,
  Medium = 1,
  Hard = 2
};

// =========================================================
// Difficulty table
// =========================================================

struct DifficultyConfig {
  const char *name;
  int blanks;            // cells removed from the solution
  int timeLimitSeconds;  // used when the caller does not supply its own limit
};

static constexpr DifficultyConfig DIFFICULTY_TABLE[] = {
  { "easy",   35, 1800 },
  { "medium", 45, 2400 },
  { "hard",   55, 3000 }
};

static constexpr int NUM_DIFFICULTIES = sizeof(DIFFICULTY_TABLE) / sizeof(DIFFICULTY_TABLE[0]);

inline const DifficultyConfig &difficultyConfig(Difficulty difficulty) {
  return DIFFICULTY_TABLE[static_cast<int>(difficulty)];
}

inline int blanksFor(Difficulty difficulty) {
  return difficultyConfig(difficulty).blanks;
}

inline int timeLimitFor(Difficulty difficulty) {
  return difficultyConfig(difficulty).timeLimitSeconds;
}

inline const char *difficultyName(Difficulty difficulty) {
  return difficultyConfig(difficulty).name;
}

inline bool equalsIgnoreCase(const char *a, const char *b) {
  for (; *a != '\0' && *b != '\0'; a++, b++) {
    if (std::tolower((unsigned char)*a) != std::tolower((unsigned char)*b)) {
      return false;
    }
  }
  return *a == *b;
}

// Accepts "easy", "medium", "hard" in any case.
// Returns 0 if the name is unknown, else 1.
inline int difficultyFromString(const char *name, Difficulty &out) {
  if (name == nullptr) {
    return 0;
  }
  for (int i = 0; i < NUM_DIFFICULTIES; i++) {
    if (equalsIgnoreCase(name, DIFFICULTY_TABLE[i].name)) {
      out = static_cast<Difficulty>(i);
      return 1;
    }
  }
  return 0;
}

inline int difficultyFromInt(int value, Difficulty &out) {
  if (value < 0 || value >= NUM_DIFFICULTIES) {
    return 0;
  }
  out = static_cast<Difficulty>(value);
  return 1;
}

// =========================================================
// Scoring
// =========================================================

static constexpr int SCORE_BASE = 1000;
static constexpr int SCORE_SECONDS_PER_BONUS_POINT = 5;
static constexpr int SCORE_ERROR_PENALTY = 5;
static constexpr int SCORE_HINT_PENALTY = 10;
static constexpr int SCORE_EMPTY_PENALTY = 3;

#endif // GAME_CONFIG_H
