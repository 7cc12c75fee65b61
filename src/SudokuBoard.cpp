#include "SudokuBoard.hpp"
#include "utils.hpp"

// =========================================================
// SudokuBoard
// =========================================================

// empty board
SudokuBoard::SudokuBoard() = default;

int SudokuBoard::importFromString(const char *values) {
  if (values == nullptr) {
    return 0;
  }

  SudokuCell parsed[NUM_CELLS];
  int tokens = 0;
  for (int i = 0; values[i] != '\0'; i++) {
    const char ch = values[i];
    const bool digit = ch >= '1' && ch <= '9';
    if (!digit && ch != '0' && ch != '.') {
      continue;
    }
    // a 82nd cell means the input is not a single board
    if (tokens == NUM_CELLS) {
      return 0;
    }
    if (digit) {
      parsed[tokens++].setValue((Digit)(ch - '0'));
    } else {
      parsed[tokens++].clearValue();
    }
  }

  // incomplete board: the current state is left untouched
  if (tokens < NUM_CELLS) {
    return 0;
  }

  for (int i = 0; i < NUM_CELLS; i++) {
    cells[i] = parsed[i];
  }
  return 1;
}

void SudokuBoard::exportToString(char *out81) const {
  for (int i = 0; i < NUM_CELLS; i++) {
    const Digit value = cells[i].getValue();
    out81[i] = value ? (char)('0' + value) : '.';
  }
  out81[NUM_CELLS] = '\0';
}

// --- values API ---
Digit SudokuBoard::getValue(Index idx) const {
  return cells[idx].getValue();
}

bool SudokuBoard::isEmpty(Index idx) const {
  return cells[idx].isEmpty();
}

void SudokuBoard::setValue(Index idx, Digit digit) {
  cells[idx].setValue(digit);
}

void SudokuBoard::clearValue(Index idx) {
  cells[idx].clearValue();
}

// --- givens API ---
bool SudokuBoard::isFixed(Index idx) const {
  return cells[idx].isFixed();
}

void SudokuBoard::markGivens() {
  for (SudokuCell &cell : cells) {
    cell.setFixed(!cell.isEmpty());
  }
}

std::set<Index> SudokuBoard::fixedCells() const {
  std::set<Index> fixed;
  for (Index idx = 0; idx < NUM_CELLS; idx++) {
    if (isFixed(idx)) {
      fixed.insert(idx);
    }
  }
  return fixed;
}

// --- rules API ---
Mask SudokuBoard::usedMask(Index idx) const {
  const int r = idxRow(idx);
  const int c = idxCol(idx);
  const int b = idxBox(idx);

  Mask used = 0;
  for (int k = 0; k < 9; k++) {
    const int peers[3] = { ROW_CELLS[r][k], COL_CELLS[c][k], BOX_CELLS[b][k] };
    for (int peer : peers) {
      if (peer != idx && !isEmpty(peer)) {
        used |= digitToBit(getValue(peer));
      }
    }
  }
  return used;
}

Mask SudokuBoard::candidateMask(Index idx) const {
  return (Mask)(ALL_DIGITS & ~usedMask(idx));
}

bool SudokuBoard::isValidPlacement(Index idx, Digit digit) const {
  if (digit < 1 || digit > 9) {
    return false;
  }
  return (usedMask(idx) & digitToBit(digit)) == 0;
}

bool SudokuBoard::isConsistent() const {
  uint16_t rowUsed[9] = {0};
  uint16_t colUsed[9] = {0};
  uint16_t boxUsed[9] = {0};

  for (Index idx = 0; idx < NUM_CELLS; idx++) {
    const Digit value = getValue(idx);
    if (value == EMPTY_DIGIT) {
      continue;
    }
    if (value > 9) {
      return false;
    }

    const uint16_t mask = digitToBit(value);
    const int r = idxRow(idx);
    const int c = idxCol(idx);
    const int b = idxBox(idx);

    if ((rowUsed[r] & mask) != 0 || (colUsed[c] & mask) != 0 || (boxUsed[b] & mask) != 0) {
      return false;
    }

    rowUsed[r] = static_cast<uint16_t>(rowUsed[r] | mask);
    colUsed[c] = static_cast<uint16_t>(colUsed[c] | mask);
    boxUsed[b] = static_cast<uint16_t>(boxUsed[b] | mask);
  }

  return true;
}

bool SudokuBoard::isValidSolution() const {
  return isCompletelySolved() && isConsistent();
}

bool SudokuBoard::isCompletelySolved() const {
  for (const SudokuCell &cell : cells) {
    if (cell.isEmpty()) {
      return false;
    }
  }
  return true;
}

int SudokuBoard::countEmpty() const {
  int n = 0;
  for (const SudokuCell &cell : cells) {
    if (cell.isEmpty()) {
      n++;
    }
  }
  return n;
}

bool SudokuBoard::operator==(const SudokuBoard &other) const {
  for (int i = 0; i < NUM_CELLS; i++) {
    if (!(cells[i] == other.cells[i])) {
      return false;
    }
  }
  return true;
}

bool SudokuBoard::operator!=(const SudokuBoard &other) const {
  return !(*this == other);
}
