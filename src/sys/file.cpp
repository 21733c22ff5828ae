#include "sys/file.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "sys/log.hpp"

#ifdef _WIN64
#include <windows.h>
#else
#include <sys/stat.h>
#include <sys/types.h>
#endif

bool isDir(const std::string &path) {
  struct stat st;
  return (stat(path.c_str(), &st) == 0 && (st.st_mode & S_IFDIR));
}

void ensureDir(const std::string &path) {
  auto index = path.find_last_of(FILE_SEP);
  if (index != std::string::npos) {
    auto dir = path.substr(0, index);
    if (!dir.empty() && !isDir(dir)) {
#ifdef _WIN64
      auto cmd = "md \"" + dir + "\"";
#else
      auto cmd = "mkdir -p \"" + dir + "\"";
#endif
      if (system(cmd.c_str()) != 0 && !isDir(dir)) {
        Log::get().error("Error creating directory " + dir, true);
      }
    }
  }
}

void ensureTrailingFileSep(std::string &dir) {
  if (dir.empty() || dir.back() != FILE_SEP) {
    dir += FILE_SEP;
  }
}

std::string getHomeDir() {
  static std::string home;
  if (home.empty()) {
#ifdef _WIN64
    auto d = std::getenv("HOMEDRIVE");
    auto p = std::getenv("HOMEPATH");
    if (!d || !p) {
      Log::get().error("Cannot determine home directory!", true);
    }
    home = std::string(d) + std::string(p);
#else
    auto h = std::getenv("HOME");
    if (!h) {
      Log::get().error("Cannot determine home directory!", true);
    }
    home = std::string(h);
#endif
  }
  return home;
}

std::string A300793_TMP_DIR;

std::string getTmpDir() {
  if (A300793_TMP_DIR.empty()) {
#ifdef _WIN64
    char tmp[500];
    if (GetTempPathA(sizeof(tmp), tmp)) {
      A300793_TMP_DIR = std::string(tmp);
    } else {
      Log::get().error("Cannot determine temp directory", true);
      return {};
    }
#else
    A300793_TMP_DIR = "/tmp/";
#endif
  }
  return A300793_TMP_DIR;
}

std::string getFileAsString(const std::string &filename, bool fail_on_error) {
  std::ifstream in(filename);
  std::stringstream buf;
  if (in.good()) {
    buf << in.rdbuf();
    in.close();
  }
  auto str = buf.str();
  if (str.empty()) {
    Log::get().error("Error loading " + filename, fail_on_error);
  }
  return str;
}
