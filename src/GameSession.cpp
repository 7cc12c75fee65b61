#include "GameSession.hpp"

#include <algorithm>
#include <climits>
#include <cstdint>

#include "log.hpp"
#include "utils.hpp"

// =========================================================
// GameSession
// =========================================================

GameSession::GameSession(const Puzzle &source)
    : puzzle(source.puzzle),
      solution(source.solution),
      board(source.puzzle),
      level(source.difficulty),
      state(SessionState::InProgress),
      hints(0),
      startTime(std::chrono::steady_clock::now()) { }

Status GameSession::create(BoardGenerator &generator, Difficulty difficulty, std::unique_ptr<GameSession> &out) {
  Puzzle puzzle;
  const Status status = generator.generatePuzzle(difficulty, puzzle);
  if (status != Status::Ok) {
    return status;
  }

  out.reset(new GameSession(puzzle));
  SUDOPLAY_LOG("new %s game, %d blanks", difficultyName(difficulty), puzzle.puzzle.countEmpty());
  return Status::Ok;
}

Status GameSession::fromStrings(const char *puzzle81, const char *solution81, Difficulty difficulty,
                                std::unique_ptr<GameSession> &out) {
  Puzzle puzzle;
  puzzle.difficulty = difficulty;

  if (!puzzle.puzzle.importFromString(puzzle81) || !puzzle.solution.importFromString(solution81)) {
    SUDOPLAY_LOG("import failed: expected 81 cells per board");
    return Status::InvalidArgument;
  }
  if (!puzzle.solution.isValidSolution()) {
    SUDOPLAY_LOG("import failed: solution is not a complete valid grid");
    return Status::InvalidArgument;
  }
  for (Index idx = 0; idx < NUM_CELLS; idx++) {
    if (!puzzle.puzzle.isEmpty(idx) && puzzle.puzzle.getValue(idx) != puzzle.solution.getValue(idx)) {
      SUDOPLAY_LOG("import failed: given at idx=%d disagrees with the solution", idx);
      return Status::InvalidArgument;
    }
  }
  puzzle.puzzle.markGivens();

  out.reset(new GameSession(puzzle));
  return Status::Ok;
}

// --- moves ---
Status GameSession::setValue(Index idx, Digit digit) {
  if (state != SessionState::InProgress) {
    return Status::InvalidState;
  }
  if (!isValidIndex(idx) || !isValidDigit(digit)) {
    return Status::InvalidArgument;
  }
  if (board.isFixed(idx)) {
    return Status::CellLocked;
  }

  // no rule check here: wrong digits are stored and scored as errors
  board.setValue(idx, digit);
  return Status::Ok;
}

bool GameSession::isValidMove(Index idx, Digit digit) const {
  if (!isValidIndex(idx)) {
    return false;
  }
  return board.isValidPlacement(idx, digit);
}

Status GameSession::useHelp(Index idx, Digit &out) {
  if (state != SessionState::InProgress) {
    return Status::InvalidState;
  }
  if (!isValidIndex(idx)) {
    return Status::InvalidArgument;
  }
  if (board.isFixed(idx)) {
    return Status::CellLocked;
  }

  hints++;
  out = solution.getValue(idx);
  return Status::Ok;
}

Status GameSession::resetGame() {
  if (state != SessionState::InProgress) {
    return Status::InvalidState;
  }

  board = puzzle;
  hints = 0;
  startTime = std::chrono::steady_clock::now();
  return Status::Ok;
}

// --- inspection ---
CellState GameSession::checkCell(Index idx) const {
  if (board.isFixed(idx)) {
    return CellState::Fixed;
  }
  if (board.isEmpty(idx)) {
    return CellState::Empty;
  }
  if (board.getValue(idx) == solution.getValue(idx)) {
    return CellState::Correct;
  }
  return CellState::Incorrect;
}

CellSummary GameSession::checkAllCells() const {
  CellSummary summary = { 0, 0, 0, 0 };
  for (Index idx = 0; idx < NUM_CELLS; idx++) {
    switch (checkCell(idx)) {
      case CellState::Fixed:
        summary.fixed++;
        break;
      case CellState::Empty:
        summary.empty++;
        break;
      case CellState::Correct:
        summary.correct++;
        break;
      case CellState::Incorrect:
        summary.incorrect++;
        break;
    }
  }
  return summary;
}

Digit GameSession::getValue(Index idx) const {
  return board.getValue(idx);
}

bool GameSession::isCellFixed(Index idx) const {
  return board.isFixed(idx);
}

bool GameSession::isComplete() const {
  return board.isCompletelySolved();
}

bool GameSession::isCorrect() const {
  return board == solution;
}

void GameSession::exportBoard(char *out81) const {
  board.exportToString(out81);
}

int GameSession::hintsUsed() const {
  return hints;
}

Difficulty GameSession::difficulty() const {
  return level;
}

bool GameSession::isFinished() const {
  return state == SessionState::Finished;
}

int GameSession::elapsedSeconds() const {
  const auto elapsed = std::chrono::steady_clock::now() - startTime;
  return (int)std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
}

// --- end of game ---
Status GameSession::finishGame(int elapsed, int timeLimitSeconds, Score &out) {
  if (state != SessionState::InProgress) {
    return Status::InvalidState;
  }
  if (elapsed < 0) {
    return Status::InvalidArgument;
  }
  state = SessionState::Finished;

  const CellSummary summary = checkAllCells();
  // widened so that any pair of int inputs is representable
  const int64_t diff = (int64_t)timeLimitSeconds - (int64_t)elapsed;
  const int remaining = (int)std::min<int64_t>(std::max<int64_t>(diff, 0), INT_MAX);

  Score result;
  result.errors = summary.incorrect;
  result.empties = summary.empty;
  result.hintsUsed = hints;
  result.elapsedSeconds = elapsed;
  result.timeBonus = remaining / SCORE_SECONDS_PER_BONUS_POINT;
  result.errorPenalty = result.errors * SCORE_ERROR_PENALTY;
  result.hintPenalty = result.hintsUsed * SCORE_HINT_PENALTY;
  result.emptyPenalty = result.empties * SCORE_EMPTY_PENALTY;
  // no lower bound, a bad game may score below zero
  result.score = SCORE_BASE + result.timeBonus - result.errorPenalty - result.hintPenalty - result.emptyPenalty;
  result.correct = isCorrect();

  SUDOPLAY_LOG("game finished: score=%d errors=%d empties=%d hints=%d bonus=%d",
               result.score, result.errors, result.empties, result.hintsUsed, result.timeBonus);

  out = result;
  return Status::Ok;
}

Status GameSession::finishGame(Score &out) {
  return finishGame(elapsedSeconds(), timeLimitFor(level), out);
}
