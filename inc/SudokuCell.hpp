#ifndef SUDOKU_CELL_H
#define SUDOKU_CELL_H

#include <cstdint>
#include "utils.hpp"

class SudokuCell
{
public:
  SudokuCell();

  // --- value ---
  Digit getValue() const;

  bool isEmpty() const;

  void setValue(Digit digit);

  void clearValue();

  // --- given ---
  bool isFixed() const;

  void setFixed(bool fixed);

  bool operator==(const SudokuCell &other) const;

private:
  Digit value;  // 0..9
  bool  fixed;  // given by the puzzle, never edited by the player
};

#endif // SUDOKU_CELL_H
