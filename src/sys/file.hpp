#pragma once

#include <string>

#ifdef _WIN64
static constexpr char FILE_SEP = '\\';
#else
static constexpr char FILE_SEP = '/';
#endif

bool isDir(const std::string &path);

void ensureDir(const std::string &path);

void ensureTrailingFileSep(std::string &dir);

std::string getHomeDir();

std::string getTmpDir();

std::string getFileAsString(const std::string &filename,
                            bool fail_on_error = true);
