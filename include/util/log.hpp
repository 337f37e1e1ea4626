#ifndef LOG_HPP
#define LOG_HPP

#include <string>
#include <optional>

#include <spdlog/spdlog.h>

// Maps "trace", "debug", "info", "warn", "error", "off" to a level
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string &name);

// Routes the default logger to a file; the terminal belongs to the UI.
// Returns false and keeps the current logger if the file cannot be opened.
bool initFileLogging(const std::string &path, spdlog::level::level_enum level, std::string &error);

#endif
