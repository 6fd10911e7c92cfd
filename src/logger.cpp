#include "logger.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

static std::atomic<int> g_min_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mu;

void set_log_level(LogLevel level) {
  g_min_level.store(static_cast<int>(level));
}

bool set_log_level_from_string(const std::string& level) {
  std::string l;
  l.reserve(level.size());
  for (char c : level)
    l.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));

  if (l == "debug")
    set_log_level(LogLevel::Debug);
  else if (l == "info")
    set_log_level(LogLevel::Info);
  else if (l == "warn")
    set_log_level(LogLevel::Warn);
  else if (l == "error")
    set_log_level(LogLevel::Error);
  else {
    set_log_level(LogLevel::Info);
    return false;
  }
  return true;
}

LogLevel log_level() { return static_cast<LogLevel>(g_min_level.load()); }

static const char* level_label(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO ";
    case LogLevel::Warn: return "WARN ";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO ";
}

static void log_internal(LogLevel level, const std::string& tag,
                         const std::string& msg) {
  if (static_cast<int>(level) < g_min_level.load()) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << "[" << level_label(level) << "] [" << tag << "] " << msg
            << "\n";
}

void log_debug(const std::string& msg, const std::string& tag) {
  log_internal(LogLevel::Debug, tag, msg);
}
void log_info(const std::string& msg, const std::string& tag) {
  log_internal(LogLevel::Info, tag, msg);
}
void log_warn(const std::string& msg, const std::string& tag) {
  log_internal(LogLevel::Warn, tag, msg);
}
void log_error(const std::string& msg, const std::string& tag) {
  log_internal(LogLevel::Error, tag, msg);
}
