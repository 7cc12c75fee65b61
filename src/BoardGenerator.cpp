#include "BoardGenerator.hpp"

#include <algorithm>
#include <stdexcept>

#include "log.hpp"
#include "utils.hpp"

// =========================================================
// BoardGenerator
// =========================================================

BoardGenerator::BoardGenerator() : rng(std::random_device{}()) { }

BoardGenerator::BoardGenerator(uint32_t seed) : rng(seed) { }

void BoardGenerator::generateCompleteBoard(SudokuBoard &out) {
  SudokuBoard board;
  // an empty grid always has a completion, so the top level cannot fail
  if (!fillFrom(board, 0)) {
    throw std::logic_error("BoardGenerator: backtracking exhausted on an empty grid");
  }
  out = board;
}

// Depth-first search over cells in row-major order. Cells before `start` are
// already filled, so the scan for the next empty cell resumes there.
bool BoardGenerator::fillFrom(SudokuBoard &board, Index start) {
  Index idx = start;
  while (idx < NUM_CELLS && !board.isEmpty(idx)) {
    idx++;
  }
  if (idx == NUM_CELLS) {
    return true;
  }

  Digit candidates[9];
  const uint8_t n = maskToDigits(board.candidateMask(idx), candidates);
  std::shuffle(candidates, candidates + n, rng);

  for (uint8_t i = 0; i < n; i++) {
    board.setValue(idx, candidates[i]);
    if (fillFrom(board, idx + 1)) {
      return true;
    }
    board.clearValue(idx);
  }

  // dead end: the caller tries its next candidate
  return false;
}

Status BoardGenerator::createPuzzle(const SudokuBoard &solution, int targetBlanks, SudokuBoard &puzzle) {
  if (targetBlanks < 0 || targetBlanks > NUM_CELLS) {
    SUDOPLAY_LOG("rejected puzzle with %d blanks (allowed 0..%d)", targetBlanks, NUM_CELLS);
    return Status::InvalidConfiguration;
  }

  Index positions[NUM_CELLS];
  for (Index idx = 0; idx < NUM_CELLS; idx++) {
    positions[idx] = idx;
  }
  std::shuffle(positions, positions + NUM_CELLS, rng);

  SudokuBoard carved = solution;
  for (int i = 0; i < targetBlanks; i++) {
    carved.clearValue(positions[i]);
  }
  carved.markGivens();

  puzzle = carved;
  return Status::Ok;
}

Status BoardGenerator::createPuzzle(const SudokuBoard &solution, Difficulty difficulty, SudokuBoard &puzzle) {
  return createPuzzle(solution, blanksFor(difficulty), puzzle);
}

Status BoardGenerator::generatePuzzle(Difficulty difficulty, Puzzle &out) {
  Puzzle result;
  result.difficulty = difficulty;
  generateCompleteBoard(result.solution);

  const Status status = createPuzzle(result.solution, difficulty, result.puzzle);
  if (status != Status::Ok) {
    return status;
  }

  out = result;
  return Status::Ok;
}
