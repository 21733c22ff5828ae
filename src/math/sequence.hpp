#pragma once

#include <cstdint>
#include <vector>

#include "math/number.hpp"

class Sequence : public std::vector<Number> {
 public:
  Sequence() = default;

  Sequence(const Sequence &s) = default;

  Sequence &operator=(const Sequence &s) = default;

  Sequence(const std::vector<int64_t> &s);

  Sequence subsequence(size_t start, size_t length) const;

  bool is_prefix_of(const Sequence &s) const;

  Number sum() const;

  bool operator==(const Sequence &s) const;

  bool operator!=(const Sequence &s) const;

  friend std::ostream &operator<<(std::ostream &out, const Sequence &s);

  void to_b_file(std::ostream &out, int64_t offset) const;

  std::string to_string() const;
};
