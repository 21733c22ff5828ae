#include "sys/gzip.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <zlib.h>

#include "sys/log.hpp"

static constexpr size_t CHUNK_SIZE = 16384;

bool isGzipFile(const std::string &path) {
  return path.size() > 3 && path.substr(path.size() - 3) == ".gz";
}

std::string gunzipToString(const std::string &path) {
  gzFile gz = gzopen(path.c_str(), "rb");
  if (!gz) {
    throw std::runtime_error("Cannot open gzip file: " + path);
  }

  // Decompress
  std::string result;
  std::vector<char> buffer(CHUNK_SIZE);
  int bytes_read;
  while ((bytes_read = gzread(gz, buffer.data(), CHUNK_SIZE)) > 0) {
    result.append(buffer.data(), bytes_read);
  }

  // Check for errors
  int err;
  const char *error_msg = gzerror(gz, &err);
  if (bytes_read < 0 || (err != Z_OK && err != Z_STREAM_END)) {
    std::string msg = error_msg ? error_msg : "Unknown error";
    gzclose(gz);
    throw std::runtime_error("Error decompressing file: " + path + " - " + msg);
  }

  gzclose(gz);
  Log::get().debug("Decompressed " + std::to_string(result.size()) +
                   " bytes from " + path);
  return result;
}

void gzipToFile(const std::string &content, const std::string &path) {
  gzFile gz = gzopen(path.c_str(), "wb");
  if (!gz) {
    throw std::runtime_error("Cannot create gzip file: " + path);
  }

  // Compress
  size_t pos = 0;
  while (pos < content.size()) {
    const size_t len = std::min(CHUNK_SIZE, content.size() - pos);
    if (gzwrite(gz, content.data() + pos, static_cast<unsigned>(len)) <= 0) {
      int err;
      const char *error_msg = gzerror(gz, &err);
      std::string msg = error_msg ? error_msg : "Unknown error";
      gzclose(gz);
      throw std::runtime_error("Error compressing file: " + path + " - " + msg);
    }
    pos += len;
  }

  if (gzclose(gz) != Z_OK) {
    throw std::runtime_error("Error closing gzip file: " + path);
  }
}
