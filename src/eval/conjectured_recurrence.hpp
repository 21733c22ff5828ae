#pragma once

#include "math/sequence.hpp"

// Evaluator for the three-term recurrence proposed by Martin Rubey, which is
// conjectured to generate A300793. With 0-based term indices i and the
// initial terms 1, 3, 13, every later term is given by
//
//   a[i] = 4(i-1)^2(i-2) a[i-3] - 2(3i-2)(i-1) a[i-2] + (4i-1) a[i-1]
//
// Only the last three terms are kept between calls of next().
//
class ConjecturedRecurrence {
 public:
  static const Sequence INITIAL_TERMS;

  ConjecturedRecurrence();

  void reset();

  // Compute the next term.
  Number next();

  // 0-based index of the term returned by the next call of next().
  inline int64_t getIndex() const { return index; }

  static Sequence computeTerms(int64_t num_terms);

 private:
  Number a1, a2, a3;  // a[i-1], a[i-2], a[i-3]
  int64_t index;
};
