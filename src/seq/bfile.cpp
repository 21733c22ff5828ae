#include "seq/bfile.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "sys/file.hpp"
#include "sys/gzip.hpp"
#include "sys/log.hpp"

BFile::BFile() : offset(0) {}

BFile::BFile(int64_t offset, const Sequence& terms)
    : offset(offset), terms(terms) {}

BFile BFile::read(const std::string& path) {
  std::string content;
  if (isGzipFile(path)) {
    content = gunzipToString(path);
  } else {
    content = getFileAsString(path);
  }
  std::stringstream in(content);
  auto result = parse(in, path);
  Log::get().debug("Read b-file " + path + " with " +
                   std::to_string(result.terms.size()) + " terms");
  return result;
}

BFile BFile::parse(std::istream& in, const std::string& source) {
  BFile result;
  std::string l, buf;
  int64_t expected_index = -1, index = 0;
  while (std::getline(in, l)) {
    l.erase(l.begin(), std::find_if(l.begin(), l.end(), [](char ch) {
              return !std::isspace(static_cast<unsigned char>(ch));
            }));
    if (l.empty() || l[0] == '#') {
      continue;
    }
    std::stringstream ss(l);
    if (!(ss >> index)) {
      Log::get().error("Invalid line in b-file " + source + ": " + l, true);
    }
    if (expected_index == -1) {
      expected_index = index;
      result.offset = index;
    }
    if (index != expected_index) {
      Log::get().error("Unexpected index " + std::to_string(index) +
                           " in b-file " + source,
                       true);
    }
    ss >> std::ws;
    try {
      Number::readIntString(ss, buf);
    } catch (const std::exception&) {
      Log::get().error("Invalid term in b-file " + source + ": " + l, true);
    }
    if (!(ss >> std::ws).eof()) {
      Log::get().error("Invalid line in b-file " + source + ": " + l, true);
    }
    result.terms.push_back(Number(buf));
    ++expected_index;
  }
  if (result.terms.empty()) {
    Log::get().error("Empty b-file " + source, true);
  }
  return result;
}

void BFile::write(const std::string& path, const std::string& comment) const {
  std::stringstream buf;
  if (!comment.empty()) {
    buf << "# " << comment << "\n";
  }
  terms.to_b_file(buf, offset);
  ensureDir(path);
  if (isGzipFile(path)) {
    gzipToFile(buf.str(), path);
  } else {
    std::ofstream out(path);
    out << buf.str();
    out.close();
    if (!out) {
      Log::get().error("Error writing b-file " + path, true);
    }
  }
  Log::get().debug("Wrote b-file " + path + " with " +
                   std::to_string(terms.size()) + " terms");
}
