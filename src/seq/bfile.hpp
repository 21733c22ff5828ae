#pragma once

#include <iostream>
#include <string>

#include "math/sequence.hpp"

// Terms of an integer sequence in the OEIS b-file format: one line per term
// with the index and the value separated by a space. Lines starting with #
// are comments. Files ending with .gz are read and written gzip-compressed.
class BFile {
 public:
  BFile();

  BFile(int64_t offset, const Sequence& terms);

  static BFile read(const std::string& path);

  static BFile parse(std::istream& in, const std::string& source);

  void write(const std::string& path, const std::string& comment = "") const;

  int64_t offset;
  Sequence terms;
};
