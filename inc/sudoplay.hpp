#ifndef SUDOPLAY_H
#define SUDOPLAY_H

#include <cstdint>

// status codes, same values as Status
enum {
  SUDOPLAY_OK = 0,
  SUDOPLAY_CELL_LOCKED = 1,
  SUDOPLAY_INVALID_STATE = 2,
  SUDOPLAY_INVALID_CONFIGURATION = 3,
  SUDOPLAY_INVALID_ARGUMENT = 4
};

// cell states, same values as CellState
enum {
  SUDOPLAY_CELL_FIXED = 0,
  SUDOPLAY_CELL_EMPTY = 1,
  SUDOPLAY_CELL_CORRECT = 2,
  SUDOPLAY_CELL_INCORRECT = 3
};

// difficulties, same values as Difficulty
enum {
  SUDOPLAY_EASY = 0,
  SUDOPLAY_MEDIUM = 1,
  SUDOPLAY_HARD = 2
};

struct SudoplaySession;

struct SudoplayScore {
  int32_t score;
  int32_t errors;
  int32_t empties;
  int32_t hintsUsed;
  int32_t timeBonus;
  int32_t errorPenalty;
  int32_t hintPenalty;
  int32_t emptyPenalty;
  int32_t elapsedSeconds;
  int32_t correct;  // 1 if the board equals the solution
};

struct SudoplayCellSummary {
  int32_t fixed;
  int32_t empty;
  int32_t correct;
  int32_t incorrect;
};

extern "C"
{
  int sudoplay_difficulty_from_name(const char *name);

  int sudoplay_new_session(int difficulty, uint32_t seed, int useSeed, SudoplaySession **out);

  int sudoplay_session_from_strings(const char *puzzle81, const char *solution81, int difficulty, SudoplaySession **out);

  void sudoplay_free_session(SudoplaySession *session);

  int sudoplay_set_value(SudoplaySession *session, int row, int col, int value);

  int sudoplay_is_valid_move(const SudoplaySession *session, int row, int col, int value);

  int sudoplay_use_help(SudoplaySession *session, int row, int col, int *outDigit);

  int sudoplay_check_cell(const SudoplaySession *session, int row, int col);

  int sudoplay_is_complete(const SudoplaySession *session);

  int sudoplay_is_correct(const SudoplaySession *session);

  int sudoplay_check_all_cells(const SudoplaySession *session, SudoplayCellSummary *out);

  int sudoplay_hints_used(const SudoplaySession *session);

  int sudoplay_elapsed_seconds(const SudoplaySession *session);

  int sudoplay_time_limit(const SudoplaySession *session);

  int sudoplay_reset_game(SudoplaySession *session);

  int sudoplay_finish_game(SudoplaySession *session, int elapsedSeconds, int timeLimitSeconds, SudoplayScore *out);

  int sudoplay_export_board(const SudoplaySession *session, char *out81);
} // extern "C"

#endif // SUDOPLAY_H
