#include "logger.hpp"
#include <mutex>
#include <memory>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

struct LogState {
    std::mutex mutex;
    logger::Level level = logger::Level::Info;
    bool console = true;
    std::unique_ptr<std::ofstream> file;
    std::vector<std::string> buffer;
    std::size_t buffer_max = 2000; // keep last 2000 lines
};

LogState& state() {
    static LogState s;
    return s;
}

std::string now_timestamp() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    std::time_t tt = system_clock::to_time_t(tp);
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &tt);
#else
    localtime_r(&tt, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void trim_buffer(LogState& s) {
    if (s.buffer.size() > s.buffer_max) {
        s.buffer.erase(s.buffer.begin(), s.buffer.begin() + (s.buffer.size() - s.buffer_max));
    }
}

void write_line(logger::Level level, const std::string& msg) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level < s.level) return;

    std::ostringstream line;
    line << "[" << now_timestamp() << "] [" << logger::level_name(level) << "] " << msg << '\n';
    const std::string text = line.str();

    if (s.console) {
        std::cerr << text;
    }
    if (s.file) {
        (*s.file) << text;
        s.file->flush();
    }

    s.buffer.push_back(text);
    trim_buffer(s);
}

} // namespace

namespace logger {

bool set_log_file(const std::string& path) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file) {
        s.file->flush();
        s.file.reset();
    }
    if (path.empty()) return true;
    auto f = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!f->is_open()) {
        return false;
    }
    s.file = std::move(f);
    return true;
}

void set_level(Level lvl) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = lvl;
}

Level level() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.level;
}

void set_console(bool enabled) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.console = enabled;
}

void info(const std::string& msg) {
    write_line(Level::Info, msg);
}

void warn(const std::string& msg) {
    write_line(Level::Warn, msg);
}

void error(const std::string& msg) {
    write_line(Level::Error, msg);
}

std::vector<std::string> lines() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.buffer;
}

void clear() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.buffer.clear();
}

std::size_t line_count() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.buffer.size();
}

void set_buffer_limit(std::size_t max_lines) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.buffer_max = max_lines;
    trim_buffer(s);
}

Level parse_level(const std::string& name) {
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        default:           return "INFO";
    }
}

} // namespace logger
