#ifndef SUDOKU_BOARD_H
#define SUDOKU_BOARD_H

#include <cstdint>
#include <set>
#include "SudokuCell.hpp"

class SudokuBoard
{
public:
  SudokuBoard();

  // digits 1..9 are values; 0 or '.' are empty; other characters are skipped.
  // Returns 1 if exactly 81 cells were recognised, else 0.
  int importFromString(const char *values);

  // writes 81 chars plus terminator ('.' for empty)
  void exportToString(char *out81) const;

  // --- values API ---
  Digit getValue(Index idx) const;

  bool isEmpty(Index idx) const;

  void setValue(Index idx, Digit digit);

  void clearValue(Index idx);

  // --- givens API ---
  bool isFixed(Index idx) const;

  // marks every filled cell as fixed and every empty one as editable
  void markGivens();

  std::set<Index> fixedCells() const;

  // --- rules API ---
  // digits already placed in the row, column and box of idx (idx excluded)
  Mask usedMask(Index idx) const;

  Mask candidateMask(Index idx) const;

  bool isValidPlacement(Index idx, Digit digit) const;

  // no digit repeated among filled cells of any unit
  bool isConsistent() const;

  bool isValidSolution() const;

  bool isCompletelySolved() const;

  int countEmpty() const;

  bool operator==(const SudokuBoard &other) const;

  bool operator!=(const SudokuBoard &other) const;

private:
  SudokuCell cells[NUM_CELLS];
};

#endif // SUDOKU_BOARD_H
