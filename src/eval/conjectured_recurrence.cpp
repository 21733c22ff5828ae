#include "eval/conjectured_recurrence.hpp"

#include <stdexcept>

#include "sys/log.hpp"

const Sequence ConjecturedRecurrence::INITIAL_TERMS({1, 3, 13});

ConjecturedRecurrence::ConjecturedRecurrence() { reset(); }

void ConjecturedRecurrence::reset() {
  a1 = Number::ZERO;
  a2 = Number::ZERO;
  a3 = Number::ZERO;
  index = 0;
}

Number ConjecturedRecurrence::next() {
  Number term;
  const int64_t i = index;
  if (i < static_cast<int64_t>(INITIAL_TERMS.size())) {
    term = INITIAL_TERMS[i];
  } else {
    // coefficients are computed as numbers to avoid overflows for large i
    Number c3(4 * (i - 1));
    c3 *= Number(i - 1);
    c3 *= Number(i - 2);
    c3 *= a3;
    Number c2(2 * (3 * i - 2));
    c2 *= Number(i - 1);
    c2 *= a2;
    Number c1(4 * i - 1);
    c1 *= a1;
    term = c3;
    term -= c2;
    term += c1;
  }
  a3 = a2;
  a2 = a1;
  a1 = term;
  index++;
  return term;
}

Sequence ConjecturedRecurrence::computeTerms(int64_t num_terms) {
  if (num_terms < 0) {
    throw std::invalid_argument("Invalid number of terms: " +
                                std::to_string(num_terms));
  }
  Sequence result;
  result.reserve(num_terms);
  ConjecturedRecurrence rec;
  for (int64_t i = 0; i < num_terms; i++) {
    result.push_back(rec.next());
  }
  Log::get().debug("Computed " + std::to_string(num_terms) +
                   " terms using conjectured recurrence");
  return result;
}
