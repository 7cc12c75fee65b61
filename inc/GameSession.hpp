#ifndef GAME_SESSION_H
#define GAME_SESSION_H

#include <chrono>
#include <cstdint>
#include <memory>
#include "BoardGenerator.hpp"
#include "GameConfig.hpp"
#include "Status.hpp"
#include "SudokuBoard.hpp"

enum class SessionState : uint8_t {
  InProgress = 0,
  Finished = 1
};

// Classification used by the front-end to colour a cell.
enum class CellState : uint8_t {
  Fixed = 0,
  Empty = 1,
  Correct = 2,
  Incorrect = 3
};

struct CellSummary {
  int fixed;
  int empty;
  int correct;
  int incorrect;
};

struct Score {
  int score;
  int errors;
  int empties;
  int hintsUsed;
  int timeBonus;
  int errorPenalty;
  int hintPenalty;
  int emptyPenalty;
  int elapsedSeconds;
  bool correct;
};

// One game: the puzzle, its solution and the player's board.
// A new game means a new GameSession; a finished one is never reopened.
class GameSession
{
public:
  // givens of `source.puzzle` must match `source.solution`
  explicit GameSession(const Puzzle &source);

  // Generates a fresh puzzle of the requested difficulty.
  static Status create(BoardGenerator &generator, Difficulty difficulty, std::unique_ptr<GameSession> &out);

  // Validates a (puzzle, solution) pair given as 81-char strings: the solution
  // must be complete and consistent, every given must agree with it.
  static Status fromStrings(const char *puzzle81, const char *solution81, Difficulty difficulty, std::unique_ptr<GameSession> &out);

  // --- moves ---
  Status setValue(Index idx, Digit digit);

  bool isValidMove(Index idx, Digit digit) const;

  // Reveals the solution digit of a cell without placing it.
  Status useHelp(Index idx, Digit &out);

  Status resetGame();

  // --- inspection (idx must be 0..80) ---
  CellState checkCell(Index idx) const;

  CellSummary checkAllCells() const;

  Digit getValue(Index idx) const;

  bool isCellFixed(Index idx) const;

  bool isComplete() const;

  bool isCorrect() const;

  void exportBoard(char *out81) const;

  int hintsUsed() const;

  Difficulty difficulty() const;

  bool isFinished() const;

  // whole seconds since the session (re)started
  int elapsedSeconds() const;

  // --- end of game ---
  // Negative `elapsed` is rejected with InvalidArgument and the game stays open.
  Status finishGame(int elapsed, int timeLimitSeconds, Score &out);

  // uses the session clock and the difficulty's time limit
  Status finishGame(Score &out);

private:
  SudokuBoard puzzle;
  SudokuBoard solution;
  SudokuBoard board;
  Difficulty level;
  SessionState state;
  int hints;
  std::chrono::steady_clock::time_point startTime;
};

#endif // GAME_SESSION_H
