#include "math/big_number.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

// decimal digits per conversion chunk; 10^9 fits into a half word
static constexpr int64_t CHUNK_DIGITS = 9;
static constexpr uint64_t CHUNK_BASE = 1000000000ull;

static constexpr uint64_t INT_MAGNITUDE_MAX =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

BigNumber::BigNumber() : is_negative(false) {}

BigNumber::BigNumber(int64_t value) : is_negative(value < 0) {
  if (value != 0) {
    // negate in unsigned arithmetic to support the minimum int64 value
    const uint64_t m = is_negative ? static_cast<uint64_t>(-(value + 1)) + 1
                                   : static_cast<uint64_t>(value);
    words.push_back(m);
  }
}

BigNumber::BigNumber(const std::string &s) : is_negative(false) { load(s); }

void throwNumberParseError(const std::string &s) {
  throw std::invalid_argument("error reading number: '" + s + "'");
}

void BigNumber::load(const std::string &s) {
  int64_t size = s.length();
  int64_t start = 0;
  while (start < size && s[start] == ' ') {
    start++;
  }
  if (start == size) {
    throwNumberParseError(s);
  }
  if (s[start] == '-') {
    is_negative = true;
    if (++start == size) {
      throwNumberParseError(s);
    }
  } else {
    is_negative = false;
  }
  size -= start;
  while (size > 0 && s[start + size - 1] == ' ') {
    size--;
  }
  if (size == 0) {
    throwNumberParseError(s);
  }
  words.clear();
  int64_t pos = 0;
  while (pos < size) {
    const int64_t len = std::min<int64_t>(CHUNK_DIGITS, size - pos);
    uint64_t chunk = 0, factor = 1;
    for (int64_t i = 0; i < len; i++) {
      const char ch = s[start + pos + i];
      if (ch < '0' || ch > '9') {
        throwNumberParseError(s);
      }
      chunk = (chunk * 10) + (ch - '0');
      factor *= 10;
    }
    mulShort(factor);
    add(BigNumber(static_cast<int64_t>(chunk)));
    pos += len;
  }
  trim();
  if (isZero()) {
    is_negative = false;
  }
}

void BigNumber::trim() {
  while (!words.empty() && words.back() == 0) {
    words.pop_back();
  }
}

bool BigNumber::fitsInt() const {
  if (words.size() > 1) {
    return false;
  }
  if (words.empty()) {
    return true;
  }
  return is_negative ? (words[0] <= INT_MAGNITUDE_MAX + 1)
                     : (words[0] <= INT_MAGNITUDE_MAX);
}

int64_t BigNumber::asInt() const {
  if (!fitsInt()) {
    throw std::runtime_error("Integer overflow");
  }
  if (words.empty()) {
    return 0;
  }
  if (is_negative) {
    if (words[0] == INT_MAGNITUDE_MAX + 1) {
      return std::numeric_limits<int64_t>::min();
    }
    return -static_cast<int64_t>(words[0]);
  }
  return static_cast<int64_t>(words[0]);
}

int64_t BigNumber::getNumUsedWords() const {
  return std::max<int64_t>(words.size(), 1);
}

bool BigNumber::operator==(const BigNumber &n) const {
  return (is_negative == n.is_negative) && (words == n.words);
}

bool BigNumber::operator!=(const BigNumber &n) const { return !(*this == n); }

bool BigNumber::operator<(const BigNumber &n) const {
  if (is_negative != n.is_negative) {
    return is_negative;
  }
  const int c = compareAbs(n);
  return is_negative ? (c > 0) : (c < 0);
}

int BigNumber::compareAbs(const BigNumber &n) const {
  if (words.size() != n.words.size()) {
    return (words.size() < n.words.size()) ? -1 : 1;
  }
  for (size_t i = words.size(); i-- > 0;) {
    if (words[i] != n.words[i]) {
      return (words[i] < n.words[i]) ? -1 : 1;
    }
  }
  return 0;
}

BigNumber &BigNumber::negate() {
  if (!isZero()) {
    is_negative = !is_negative;
  }
  return *this;
}

BigNumber &BigNumber::operator+=(const BigNumber &n) {
  if (is_negative == n.is_negative) {
    add(n);
  } else if (compareAbs(n) >= 0) {
    sub(n);
  } else {
    BigNumber m(n);
    m.sub(*this);
    (*this) = m;
  }
  if (isZero()) {
    is_negative = false;
  }
  return *this;
}

// adds the magnitude of n; n may alias this
void BigNumber::add(const BigNumber &n) {
  if (words.size() < n.words.size()) {
    words.resize(n.words.size(), 0);
  }
  const size_t s = n.words.size();
  uint64_t carry = 0;
  for (size_t i = 0; i < words.size(); i++) {
    if (i >= s && carry == 0) {
      break;
    }
    const uint64_t m = (i < s) ? n.words[i] : 0;
    uint64_t low, high;
    low = (words[i] & LOW_BIT_MASK) + (m & LOW_BIT_MASK) + carry;
    carry = low >> 32;
    high = (words[i] >> 32) + (m >> 32) + carry;
    carry = high >> 32;
    words[i] = ((high & LOW_BIT_MASK) << 32) | (low & LOW_BIT_MASK);
  }
  if (carry) {
    words.push_back(carry);
  }
}

// subtracts the magnitude of n; requires |n| <= |this|
void BigNumber::sub(const BigNumber &n) {
  const size_t s = n.words.size();
  uint64_t carry = 0;
  for (size_t i = 0; i < words.size(); i++) {
    if (i >= s && carry == 0) {
      break;
    }
    const uint64_t m = (i < s) ? n.words[i] : 0;
    uint64_t low, high;
    low = (words[i] & LOW_BIT_MASK) - (m & LOW_BIT_MASK) - carry;
    carry = (low >> 32) != 0;
    high = (words[i] >> 32) - (m >> 32) - carry;
    carry = (high >> 32) != 0;
    words[i] = ((high & LOW_BIT_MASK) << 32) | (low & LOW_BIT_MASK);
  }
  trim();
}

BigNumber &BigNumber::operator*=(const BigNumber &n) {
  if (isZero() || n.isZero()) {
    words.clear();
    is_negative = false;
    return *this;
  }
  // multiply by one half word of n at a time; n may alias this
  BigNumber result;
  const int64_t s = n.words.size() * 2;
  for (int64_t i = 0; i < s; i++) {
    const uint64_t w = n.words[i / 2];
    const uint64_t h = (i % 2 == 0) ? (w & LOW_BIT_MASK) : (w >> 32);
    if (h == 0) {
      continue;
    }
    auto copy = *this;
    copy.mulShort(h);
    copy.shift(i);
    result.add(copy);
  }
  result.is_negative = (is_negative != n.is_negative);
  (*this) = result;
  return (*this);
}

// multiplies the magnitude by a half word
void BigNumber::mulShort(uint64_t n) {
  uint64_t carry = 0;
  for (auto &w : words) {
    uint64_t low, high;
    high = (w >> 32) * n;
    low = (w & LOW_BIT_MASK) * n;
    w = low + ((high & LOW_BIT_MASK) << 32) + carry;
    carry = ((high + ((low + carry) >> 32)) >> 32);
  }
  if (carry) {
    words.push_back(carry);
  }
}

// shifts the magnitude left by n half words
void BigNumber::shift(int64_t n) {
  if (isZero() || n <= 0) {
    return;
  }
  if (n >= 2) {
    words.insert(words.begin(), static_cast<size_t>(n / 2), 0);
  }
  if (n % 2) {
    uint64_t next = 0;
    for (auto &w : words) {
      uint64_t h = w >> 32;
      uint64_t l = w & LOW_BIT_MASK;
      w = (l << 32) + next;
      next = h;
    }
    if (next) {
      words.push_back(next);
    }
  }
}

// divides the magnitude by a half word and returns the remainder
uint64_t BigNumber::divShort(const uint64_t n) {
  uint64_t carry = 0;
  for (size_t i = words.size(); i-- > 0;) {
    uint64_t h, l, t, h2, u, l2;
    auto &w = words[i];
    h = w >> 32;
    l = w & LOW_BIT_MASK;
    t = (carry << 32) + h;
    h2 = t / n;
    carry = t % n;
    u = (carry << 32) + l;
    l2 = u / n;
    carry = u % n;
    w = (h2 << 32) + l2;
  }
  trim();
  return carry;
}

std::string BigNumber::toString() const {
  if (isZero()) {
    return "0";
  }
  std::vector<uint64_t> chunks;
  BigNumber m = *this;
  while (!m.isZero()) {
    chunks.push_back(m.divShort(CHUNK_BASE));
  }
  std::stringstream ss;
  if (is_negative) {
    ss << '-';
  }
  ss << chunks.back();
  for (size_t i = chunks.size() - 1; i-- > 0;) {
    ss << std::setw(CHUNK_DIGITS) << std::setfill('0') << chunks[i];
  }
  return ss.str();
}

std::ostream &operator<<(std::ostream &out, const BigNumber &n) {
  out << n.toString();
  return out;
}
