#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace logger {

enum class Level {
    Info = 0,
    Warn = 1,
    Error = 2
};

// Optionally mirror log lines to a file. Empty path disables file logging.
// Returns false if the file could not be opened (console logging continues).
bool set_log_file(const std::string& path);
void set_level(Level level);
Level level();

// Console lines go to stderr so stdout stays free for decoded output.
void set_console(bool enabled);

// Log APIs
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

// In-memory ring buffer
// Returns a copy of current log lines (thread-safe snapshot).
std::vector<std::string> lines();

// Clears the in-memory buffer (does not affect file/console).
void clear();

std::size_t line_count();

// Maximum lines kept in memory (default 2000).
void set_buffer_limit(std::size_t max_lines);

// "info" | "warn" | "error" (case-sensitive). Unknown names map to Info.
Level parse_level(const std::string& name);
const char* level_name(Level level);

} // namespace logger
