#include "SudokuCell.hpp"

// =========================================================
// SudokuCell
// =========================================================

SudokuCell::SudokuCell() : value(EMPTY_DIGIT), fixed(false) { }

// --- value ---
Digit SudokuCell::getValue() const {
  return value;
}

bool SudokuCell::isEmpty() const {
  return value == EMPTY_DIGIT;
}

void SudokuCell::setValue(Digit digit) {
  value = digit;
}

void SudokuCell::clearValue() {
  value = EMPTY_DIGIT;
}

// --- given ---
bool SudokuCell::isFixed() const {
  return fixed;
}

void SudokuCell::setFixed(bool fixed) {
  this->fixed = fixed;
}

// only the value takes part in comparison, givens are session metadata
bool SudokuCell::operator==(const SudokuCell &other) const {
  return value == other.value;
}
