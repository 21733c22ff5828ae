#pragma once

#include <string>

/**
 * Check whether a path refers to a gzip file (file extension: .gz).
 */
bool isGzipFile(const std::string &path);

/**
 * Decompress a gzip file using zlib and return its content.
 *
 * @param path Path to the gzip file
 */
std::string gunzipToString(const std::string &path);

/**
 * Compress a string using zlib and write it to a gzip file.
 *
 * @param content Uncompressed content
 * @param path Path to the gzip file; an existing file is overwritten
 */
void gzipToFile(const std::string &content, const std::string &path);
