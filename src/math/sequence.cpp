#include "math/sequence.hpp"

#include <algorithm>
#include <sstream>

Sequence::Sequence(const std::vector<int64_t> &s) {
  const auto t = s.size();
  resize(t);
  for (size_t i = 0; i < t; i++) {
    (*this)[i] = Number(s[i]);
  }
}

Sequence Sequence::subsequence(size_t start, size_t length) const {
  Sequence s;
  if (start < size() && length > 0) {
    const auto new_size = std::min(length, size() - start);
    s.resize(new_size);
    for (size_t i = 0; i < new_size; i++) {
      s[i] = (*this)[start + i];
    }
  }
  return s;
}

bool Sequence::is_prefix_of(const Sequence &s) const {
  if (size() > s.size()) {
    return false;
  }
  for (size_t i = 0; i < size(); i++) {
    if ((*this)[i] != s[i]) {
      return false;
    }
  }
  return true;
}

Number Sequence::sum() const {
  Number result;
  for (auto &n : *this) {
    result += n;
  }
  return result;
}

bool Sequence::operator==(const Sequence &m) const {
  if (size() != m.size()) {
    return false;
  }
  for (size_t i = 0; i < size(); i++) {
    if ((*this)[i] != m[i]) {
      return false;  // not equal
    }
  }
  return true;
}

bool Sequence::operator!=(const Sequence &m) const { return !((*this) == m); }

std::ostream &operator<<(std::ostream &out, const Sequence &seq) {
  for (size_t i = 0; i < seq.size(); i++) {
    if (i > 0) out << ",";
    out << seq[i];
  }
  return out;
}

std::string Sequence::to_string() const {
  std::stringstream ss;
  ss << (*this);
  return ss.str();
}

void Sequence::to_b_file(std::ostream &out, int64_t offset) const {
  for (size_t i = 0; i < size(); i++) {
    out << (offset + static_cast<int64_t>(i)) << " " << (*this)[i] << "\n";
  }
}
