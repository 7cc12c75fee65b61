#ifndef BOARD_GENERATOR_H
#define BOARD_GENERATOR_H

#include <cstdint>
#include <random>
#include "GameConfig.hpp"
#include "Status.hpp"
#include "SudokuBoard.hpp"

// A carved puzzle together with the solution it was carved from.
// Givens are the fixed cells of `puzzle`.
struct Puzzle {
  SudokuBoard puzzle;
  SudokuBoard solution;
  Difficulty difficulty = Difficulty::Easy;
};

class BoardGenerator
{
public:
  // seeded from std::random_device
  BoardGenerator();

  // reproducible sequence of boards
  explicit BoardGenerator(uint32_t seed);

  // Fills `out` with a complete valid grid by randomized backtracking.
  void generateCompleteBoard(SudokuBoard &out);

  // Copies `solution` into `puzzle` and clears `targetBlanks` distinct cells
  // chosen uniformly at random. Remaining cells become fixed.
  // Unique solvability of the result is not checked.
  Status createPuzzle(const SudokuBoard &solution, int targetBlanks, SudokuBoard &puzzle);

  Status createPuzzle(const SudokuBoard &solution, Difficulty difficulty, SudokuBoard &puzzle);

  // generateCompleteBoard + createPuzzle
  Status generatePuzzle(Difficulty difficulty, Puzzle &out);

private:
  std::mt19937 rng;

  bool fillFrom(SudokuBoard &board, Index start);
};

#endif // BOARD_GENERATOR_H
