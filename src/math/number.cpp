#include "math/number.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "math/big_number.hpp"

const Number Number::ZERO(0);
const Number Number::ONE(1);
const Number Number::MINUS_ONE(-1);

constexpr int64_t MIN_INT = std::numeric_limits<int64_t>::min();
constexpr int64_t MAX_INT = std::numeric_limits<int64_t>::max();

Number::Number() : value(0), big(nullptr) {}

Number::Number(const Number& n)
    : value(n.value), big(n.big ? new BigNumber(*n.big) : nullptr) {}

Number::Number(int64_t value) : value(value), big(nullptr) {}

Number::Number(const std::string& s) : value(0), big(nullptr) {
  BigNumber b(s);
  if (b.fitsInt()) {
    value = b.asInt();
  } else {
    big = new BigNumber(b);
  }
}

Number::~Number() { delete big; }

Number& Number::operator=(const Number& n) {
  if (this != &n) {
    value = n.value;
    delete big;
    big = n.big ? new BigNumber(*n.big) : nullptr;
  }
  return *this;
}

bool Number::operator==(const Number& n) const {
  if (big) {
    if (n.big) {
      return (*big) == (*n.big);
    } else {
      return (*big) == BigNumber(n.value);
    }
  } else if (n.big) {
    return BigNumber(value) == (*n.big);
  } else {
    return (value == n.value);
  }
}

bool Number::operator!=(const Number& n) const { return !(*this == n); }

bool Number::operator<(const Number& n) const {
  if (big) {
    if (n.big) {
      return (*big) < (*n.big);
    } else {
      return (*big) < BigNumber(n.value);
    }
  }
  if (n.big) {
    return BigNumber(value) < (*n.big);
  } else {
    return (value < n.value);
  }
}

bool Number::operator>(const Number& n) const { return (n < *this); }

bool Number::operator<=(const Number& n) const { return !(n < *this); }

bool Number::operator>=(const Number& n) const { return !(*this < n); }

Number& Number::negate() {
  if (big) {
    big->negate();
  } else if (value == MIN_INT) {
    convertToBig();
    big->negate();
  } else {
    value = -value;
  }
  return *this;
}

Number& Number::operator+=(const Number& n) {
  // One of the operands big?
  if (big) {
    if (n.big) {
      (*big) += (*n.big);
    } else {
      (*big) += BigNumber(n.value);
    }
    return *this;
  }
  if (n.big) {
    convertToBig();
    (*big) += (*n.big);
    return *this;
  }
  // None of the operands is big
  if ((value > 0 && n.value > MAX_INT - value) ||
      (value < 0 && n.value < MIN_INT - value)) {
    convertToBig();
    // It could be that *this == n. In that case, we just converted n to big
    // as well!
    if (n.big) {
      (*big) += (*n.big);
    } else {
      (*big) += BigNumber(n.value);
    }
  } else {
    value += n.value;
  }
  return *this;
}

Number& Number::operator-=(const Number& n) {
  auto m = n;
  m.negate();
  *this += m;
  return *this;
}

bool mulOverflows(int64_t a, int64_t b) {
  if (a == 0 || b == 0) {
    return false;
  }
  if (a == MIN_INT || b == MIN_INT) {
    return true;
  }
  return (MAX_INT / std::abs(b) < std::abs(a));
}

Number& Number::operator*=(const Number& n) {
  // One of the operands big?
  if (big) {
    if (n.big) {
      (*big) *= (*n.big);
    } else {
      (*big) *= BigNumber(n.value);
    }
    return *this;
  }
  if (n.big) {
    convertToBig();
    (*big) *= (*n.big);
    return *this;
  }
  // None of the operands is big
  if (mulOverflows(value, n.value)) {
    convertToBig();
    // It could be that *this == n. In that case, we just converted n to big
    // as well!
    if (n.big) {
      (*big) *= (*n.big);
    } else {
      (*big) *= BigNumber(n.value);
    }
  } else {
    value *= n.value;
  }
  return *this;
}

int64_t Number::asInt() const {
  if (big) {
    return big->asInt();
  }
  return value;
}

int64_t Number::getNumUsedWords() const {
  if (big) {
    return big->getNumUsedWords();
  }
  return 1;
}

std::ostream& operator<<(std::ostream& out, const Number& n) {
  if (n.big) {
    out << *n.big;
  } else {
    out << n.value;
  }
  return out;
}

std::string Number::to_string() const {
  std::stringstream ss;
  ss << (*this);
  return ss.str();
}

void throwParseError() { throw std::invalid_argument("Error parsing number"); }

void Number::readIntString(std::istream& in, std::string& out) {
  out.clear();
  auto ch = in.peek();
  if (!std::isdigit(ch) && ch != '-') {
    throwParseError();
  }
  out += (char)ch;
  in.get();
  while (true) {
    ch = in.peek();
    if (!std::isdigit(ch)) {
      break;
    }
    out += (char)ch;
    in.get();
  }
  if (out[0] == '0' && out.size() > 1) {
    throwParseError();
  }
  if (out[0] == '-' && (out.size() == 1 || out[1] == '0')) {
    throwParseError();
  }
}

void Number::convertToBig() {
  if (!big) {
    big = new BigNumber(value);
  }
  value = 0;
}
