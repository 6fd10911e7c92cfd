#pragma once

#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

void set_log_level(LogLevel level);
// Unknown names fall back to info. Returns false in that case.
bool set_log_level_from_string(const std::string& level);
LogLevel log_level();

// Writes "[LEVEL] [tag] msg" to stderr. Safe to call from any thread.
void log_debug(const std::string& msg, const std::string& tag = "http");
void log_info(const std::string& msg, const std::string& tag = "http");
void log_warn(const std::string& msg, const std::string& tag = "http");
void log_error(const std::string& msg, const std::string& tag = "http");
