#pragma once

#include "math/sequence.hpp"

// Evaluator for A300793 based on the proven recursion over the triangular
// array of helper values b(n,k), see https://oeis.org/A300793/a300793_2.pdf.
//
// Generation n holds a row of n values b(n,0..n-1), starting with the row
// [-1] at generation 1. The term a(n) is the signed row sum (-1)^n * sum_k
// b(n,k). Every call of next() returns the term of the current generation
// and advances the row to the next generation.
//
class ProvenRecurrence {
 public:
  ProvenRecurrence();

  void reset();

  // Compute the term of the current generation and advance the row.
  Number next();

  inline int64_t getGeneration() const { return generation; }

  inline const Sequence& getRow() const { return row; }

  // Compute the row of generation n+1 from a row of generation n >= 1.
  static Sequence advanceRow(const Sequence& row);

  static Sequence computeRow(int64_t generation);

  static Sequence computeTerms(int64_t num_terms);

 private:
  Sequence row;
  int64_t generation;
};
