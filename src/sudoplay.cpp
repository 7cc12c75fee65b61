// Sudoplay game core (C++)
// C++ owns puzzle generation and game rules; rendering and input stay in the front-end.
//
// Exported functions:
//   int  sudoplay_difficulty_from_name(const char *name);
//   int  sudoplay_new_session(int difficulty, uint32_t seed, int useSeed, SudoplaySession **out);
//   int  sudoplay_session_from_strings(const char *puzzle81, const char *solution81, int difficulty, SudoplaySession **out);
//   void sudoplay_free_session(SudoplaySession *session);
//   int  sudoplay_set_value(SudoplaySession *session, int row, int col, int value);
//   int  sudoplay_is_valid_move(const SudoplaySession *session, int row, int col, int value);
//   int  sudoplay_use_help(SudoplaySession *session, int row, int col, int *outDigit);
//   int  sudoplay_check_cell(const SudoplaySession *session, int row, int col);
//   int  sudoplay_is_complete(const SudoplaySession *session);
//   int  sudoplay_is_correct(const SudoplaySession *session);
//   int  sudoplay_check_all_cells(const SudoplaySession *session, SudoplayCellSummary *out);
//   int  sudoplay_hints_used(const SudoplaySession *session);
//   int  sudoplay_elapsed_seconds(const SudoplaySession *session);
//   int  sudoplay_time_limit(const SudoplaySession *session);
//   int  sudoplay_reset_game(SudoplaySession *session);
//   int  sudoplay_finish_game(SudoplaySession *session, int elapsedSeconds, int timeLimitSeconds, SudoplayScore *out);
//   int  sudoplay_export_board(const SudoplaySession *session, char *out81);
//
// Front-end -> core contract:
//   row, col   : 0..8
//   value      : 0 = erase, 1..9 = digit
//   puzzle81   : 81 chars (0 or . = empty, 1..9 = digit)
//
// Return values:
//   Functions returning a status use SUDOPLAY_OK / SUDOPLAY_CELL_LOCKED / ...
//   Predicates return 1 or 0 (0 also for a null session or bad coordinates).
//   sudoplay_check_cell returns a SUDOPLAY_CELL_* value or -1 on bad input.
//   Counters (difficulty, hints, seconds, time limit) return -1 on bad input.
//   Once a game is finished, every mutating call answers SUDOPLAY_INVALID_STATE,
//   whatever its other arguments.
//
// Notes:
//   - Each session is independent; the front-end owns the handle and must
//     release it with sudoplay_free_session when a new game starts.
//   - The solution is only reachable through sudoplay_use_help.
//   - Elapsed time is measured by the front-end and passed to sudoplay_finish_game;
//     sudoplay_elapsed_seconds and sudoplay_time_limit give it the session clock
//     and the default limit of the difficulty.

#include <cstdint>
#include <memory>
#include <utility>

#include "sudoplay.hpp"
#include "BoardGenerator.hpp"
#include "GameSession.hpp"
#include "log.hpp"
#include "utils.hpp"

struct SudoplaySession {
  std::unique_ptr<GameSession> game;
};

static int toCode(Status status) {
  return static_cast<int>(status);
}

static SudoplaySession *wrap(std::unique_ptr<GameSession> &game) {
  SudoplaySession *session = new SudoplaySession();
  session->game = std::move(game);
  return session;
}

// =========================================================
// Public API exported to the front-end
// =========================================================

extern "C"
{
  // Maps "easy" / "medium" / "hard" (any case) to SUDOPLAY_EASY / ... or -1.
  SUDOPLAY_EXPORT
  int sudoplay_difficulty_from_name(const char *name) {
    Difficulty level;
    if (!difficultyFromString(name, level)) {
      return -1;
    }
    return static_cast<int>(level);
  }

  // Generates a puzzle and starts a game on it.
  // With useSeed == 0 the generator is seeded from the system.
  SUDOPLAY_EXPORT
  int sudoplay_new_session(int difficulty, uint32_t seed, int useSeed, SudoplaySession **out) {
    if (out == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }

    Difficulty level;
    if (!difficultyFromInt(difficulty, level)) {
      SUDOPLAY_LOG("unknown difficulty %d", difficulty);
      return SUDOPLAY_INVALID_CONFIGURATION;
    }

    BoardGenerator generator = useSeed ? BoardGenerator(seed) : BoardGenerator();
    std::unique_ptr<GameSession> game;
    const Status status = GameSession::create(generator, level, game);
    if (status != Status::Ok) {
      return toCode(status);
    }

    *out = wrap(game);
    return SUDOPLAY_OK;
  }

  // Starts a game on a known (puzzle, solution) pair.
  SUDOPLAY_EXPORT
  int sudoplay_session_from_strings(const char *puzzle81, const char *solution81, int difficulty, SudoplaySession **out) {
    if (puzzle81 == nullptr || solution81 == nullptr || out == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }

    Difficulty level;
    if (!difficultyFromInt(difficulty, level)) {
      SUDOPLAY_LOG("unknown difficulty %d", difficulty);
      return SUDOPLAY_INVALID_CONFIGURATION;
    }

    std::unique_ptr<GameSession> game;
    const Status status = GameSession::fromStrings(puzzle81, solution81, level, game);
    if (status != Status::Ok) {
      return toCode(status);
    }

    *out = wrap(game);
    return SUDOPLAY_OK;
  }

  SUDOPLAY_EXPORT
  void sudoplay_free_session(SudoplaySession *session) {
    delete session;
  }

  SUDOPLAY_EXPORT
  int sudoplay_set_value(SudoplaySession *session, int row, int col, int value) {
    if (session == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }
    if (session->game->isFinished()) {
      return SUDOPLAY_INVALID_STATE;
    }
    if (!isValidPosition(row, col) || !isValidDigit(value)) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }
    return toCode(session->game->setValue(toIndex(row, col), (Digit)value));
  }

  SUDOPLAY_EXPORT
  int sudoplay_is_valid_move(const SudoplaySession *session, int row, int col, int value) {
    if (session == nullptr || !isValidPosition(row, col) || !isValidDigit(value)) {
      return 0;
    }
    return session->game->isValidMove(toIndex(row, col), (Digit)value) ? 1 : 0;
  }

  // Reveals the solution digit of a cell; the board is left unchanged.
  SUDOPLAY_EXPORT
  int sudoplay_use_help(SudoplaySession *session, int row, int col, int *outDigit) {
    if (session == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }
    if (session->game->isFinished()) {
      return SUDOPLAY_INVALID_STATE;
    }
    if (outDigit == nullptr || !isValidPosition(row, col)) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }

    Digit digit = EMPTY_DIGIT;
    const Status status = session->game->useHelp(toIndex(row, col), digit);
    if (status == Status::Ok) {
      *outDigit = digit;
    }
    return toCode(status);
  }

  SUDOPLAY_EXPORT
  int sudoplay_check_cell(const SudoplaySession *session, int row, int col) {
    if (session == nullptr || !isValidPosition(row, col)) {
      return -1;
    }
    return static_cast<int>(session->game->checkCell(toIndex(row, col)));
  }

  SUDOPLAY_EXPORT
  int sudoplay_is_complete(const SudoplaySession *session) {
    if (session == nullptr) {
      return 0;
    }
    return session->game->isComplete() ? 1 : 0;
  }

  SUDOPLAY_EXPORT
  int sudoplay_is_correct(const SudoplaySession *session) {
    if (session == nullptr) {
      return 0;
    }
    return session->game->isCorrect() ? 1 : 0;
  }

  SUDOPLAY_EXPORT
  int sudoplay_check_all_cells(const SudoplaySession *session, SudoplayCellSummary *out) {
    if (session == nullptr || out == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }

    const CellSummary summary = session->game->checkAllCells();
    out->fixed = summary.fixed;
    out->empty = summary.empty;
    out->correct = summary.correct;
    out->incorrect = summary.incorrect;
    return SUDOPLAY_OK;
  }

  SUDOPLAY_EXPORT
  int sudoplay_hints_used(const SudoplaySession *session) {
    if (session == nullptr) {
      return -1;
    }
    return session->game->hintsUsed();
  }

  SUDOPLAY_EXPORT
  int sudoplay_elapsed_seconds(const SudoplaySession *session) {
    if (session == nullptr) {
      return -1;
    }
    return session->game->elapsedSeconds();
  }

  SUDOPLAY_EXPORT
  int sudoplay_time_limit(const SudoplaySession *session) {
    if (session == nullptr) {
      return -1;
    }
    return timeLimitFor(session->game->difficulty());
  }

  // Back to the initial puzzle: player entries and hints are dropped, the clock restarts.
  SUDOPLAY_EXPORT
  int sudoplay_reset_game(SudoplaySession *session) {
    if (session == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }
    return toCode(session->game->resetGame());
  }

  SUDOPLAY_EXPORT
  int sudoplay_finish_game(SudoplaySession *session, int elapsedSeconds, int timeLimitSeconds, SudoplayScore *out) {
    if (session == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }
    if (session->game->isFinished()) {
      return SUDOPLAY_INVALID_STATE;
    }
    if (out == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }

    Score score;
    const Status status = session->game->finishGame(elapsedSeconds, timeLimitSeconds, score);
    if (status != Status::Ok) {
      return toCode(status);
    }

    // serialize score and send it back
    out->score = score.score;
    out->errors = score.errors;
    out->empties = score.empties;
    out->hintsUsed = score.hintsUsed;
    out->timeBonus = score.timeBonus;
    out->errorPenalty = score.errorPenalty;
    out->hintPenalty = score.hintPenalty;
    out->emptyPenalty = score.emptyPenalty;
    out->elapsedSeconds = score.elapsedSeconds;
    out->correct = score.correct ? 1 : 0;
    return SUDOPLAY_OK;
  }

  SUDOPLAY_EXPORT
  int sudoplay_export_board(const SudoplaySession *session, char *out81) {
    if (session == nullptr || out81 == nullptr) {
      return SUDOPLAY_INVALID_ARGUMENT;
    }
    session->game->exportBoard(out81);
    return SUDOPLAY_OK;
  }
} // extern "C"
