#pragma once

#include <utility>
#include <vector>

#include "math/sequence.hpp"
#include "seq/bfile.hpp"
#include "sys/util.hpp"

enum class status_t { OK, ERROR };

// pairs of 1-based term index and term value
typedef std::vector<std::pair<int64_t, Number>> report_t;

// Cross-validates the proven and the conjectured recurrence for A300793.
class Validator {
 public:
  // index of the first term of A300793
  static constexpr int64_t OFFSET = 1;

  explicit Validator(const Settings &settings);

  // Compute the terms using both recurrences. Throws an exception if they
  // differ in length or in any term.
  report_t validateAndReport(int64_t num_terms);

  // Pair up the terms of both recurrences. Throws an exception if they differ
  // in length or in any term.
  static report_t assertAgreement(const Sequence &proven,
                                  const Sequence &conjectured);

  status_t check(int64_t num_terms);

  // Compare both recurrences with the terms of a reference b-file.
  status_t checkReference(const BFile &bfile);

 private:
  const Settings &settings;

  status_t compare(const Sequence &actual, const Sequence &expected,
                   const std::string &name, bool print) const;
};
