#include "eval/proven_recurrence.hpp"

#include <stdexcept>

#include "sys/log.hpp"

ProvenRecurrence::ProvenRecurrence() { reset(); }

void ProvenRecurrence::reset() {
  row = Sequence({-1});
  generation = 1;
}

Number ProvenRecurrence::next() {
  auto term = row.sum();
  if (generation % 2 == 1) {
    term.negate();
  }
  row = advanceRow(row);
  generation++;
  return term;
}

Sequence ProvenRecurrence::advanceRow(const Sequence& row) {
  if (row.empty()) {
    throw std::invalid_argument("Cannot advance empty row");
  }
  const int64_t n = row.size();
  Sequence next;
  next.resize(n + 1);
  next[0] = row[0];
  next[0] *= Number(-n);
  for (int64_t j = 1; j < n; j++) {
    auto left = row[j];
    left *= Number(2 * j - n);
    auto right = row[j - 1];
    right *= Number(2 * j - 3 * n - 1);
    left += right;
    next[j] = left;
  }
  // boundary term for j = n: 2n - 3n - 1 = -(n + 1)
  next[n] = row[n - 1];
  next[n] *= Number(-(n + 1));
  return next;
}

Sequence ProvenRecurrence::computeRow(int64_t generation) {
  if (generation < 1) {
    throw std::invalid_argument("Invalid generation: " +
                                std::to_string(generation));
  }
  ProvenRecurrence rec;
  while (rec.getGeneration() < generation) {
    rec.row = advanceRow(rec.row);
    rec.generation++;
  }
  return rec.row;
}

Sequence ProvenRecurrence::computeTerms(int64_t num_terms) {
  if (num_terms < 0) {
    throw std::invalid_argument("Invalid number of terms: " +
                                std::to_string(num_terms));
  }
  Sequence result;
  result.reserve(num_terms);
  ProvenRecurrence rec;
  for (int64_t i = 0; i < num_terms; i++) {
    result.push_back(rec.next());
  }
  if (Log::get().level == Log::Level::DEBUG && num_terms > 0) {
    Log::get().debug("Computed " + std::to_string(num_terms) +
                     " terms using proven recurrence; last row uses " +
                     std::to_string(rec.getRow().back().getNumUsedWords()) +
                     " words");
  }
  return result;
}
