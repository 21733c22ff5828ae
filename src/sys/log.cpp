#include "sys/log.hpp"

#include <ctime>
#include <iostream>
#include <stdexcept>

Log::Log() : level(Level::INFO), silent(false) {}

Log& Log::get() {
  static Log log;
  return log;
}

void Log::debug(const std::string& msg) { log(Log::Level::DEBUG, msg); }

void Log::info(const std::string& msg) { log(Log::Level::INFO, msg); }

void Log::error(const std::string& msg, bool throw_) {
  log(Log::Level::ERROR, msg);
  if (throw_) {
    throw std::runtime_error(msg);
  }
}

Log::Level Log::parseLevel(const std::string& level) {
  if (level == "debug") {
    return Log::Level::DEBUG;
  } else if (level == "info") {
    return Log::Level::INFO;
  } else if (level == "warn") {
    return Log::Level::WARN;
  } else if (level == "error") {
    return Log::Level::ERROR;
  }
  throw std::invalid_argument("Unknown log level: " + level);
}

void Log::log(Level level, const std::string& msg) {
  if (level < this->level || silent) {
    return;
  }
  time_t rawtime;
  char buffer[80];
  time(&rawtime);
  auto timeinfo = localtime(&rawtime);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", timeinfo);
  std::string lev;
  switch (level) {
    case Log::Level::DEBUG:
      lev = "DEBUG";
      break;
    case Log::Level::INFO:
      lev = "INFO ";
      break;
    case Log::Level::WARN:
      lev = "WARN ";
      break;
    case Log::Level::ERROR:
      lev = "ERROR";
      break;
  }
  std::cerr << std::string(buffer) << "|" << lev << "|" << msg << std::endl;
}
