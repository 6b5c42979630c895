#pragma once
// Purpose: Effective runtime configuration (file settings + command-line overrides).
//
// Notes:
// - settings::Config is the persisted JSON shape; AppConfig is the typed, validated view the
//   decoder works with.
// - merge follows "b overrides a" semantics (fields present in b replace a).

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "settings/settings.hpp"
#include "../logger.hpp"

namespace app {
namespace config {

enum class OutputFormat {
    Json,
    Text
};

inline OutputFormat parse_format(const std::string& s) {
    return s == "text" ? OutputFormat::Text : OutputFormat::Json;
}

inline const char* format_name(OutputFormat f) {
    return f == OutputFormat::Text ? "text" : "json";
}

struct AppConfig {
    logger::Level log_level = logger::Level::Info;
    std::string log_file;               // empty = no file logging
    std::size_t chunk_size = 0;         // 0 = feed whole input at once
    OutputFormat format = OutputFormat::Json;
    bool describe_fields = false;
    int indent = 2;
    std::chrono::milliseconds capture_timeout{200};
    bool capture = false;               // command line only
};

// Command-line overrides; unset fields keep the file value.
struct Overrides {
    std::optional<logger::Level> log_level;
    std::optional<std::string> log_file;
    std::optional<std::size_t> chunk_size;
    std::optional<OutputFormat> format;
    std::optional<bool> describe_fields;
    std::optional<bool> capture;
};

inline AppConfig from_settings(const settings::Config& s) {
    settings::Config c = s;
    settings::apply_defaults(c);

    AppConfig out;
    out.log_level = logger::parse_level(c.log_level);
    out.log_file = c.log_to_file ? c.log_file : std::string();
    out.chunk_size = static_cast<std::size_t>(c.chunk_size);
    out.format = parse_format(c.output_format);
    out.describe_fields = c.describe_fields;
    out.indent = c.indent;
    out.capture_timeout = std::chrono::milliseconds(c.capture_timeout_ms);
    return out;
}

// Inverse of from_settings, used when writing the effective config back out.
inline settings::Config to_settings(const AppConfig& a) {
    settings::Config c;
    c.log_level = a.log_level == logger::Level::Error ? "error"
                : a.log_level == logger::Level::Warn  ? "warn" : "info";
    c.log_to_file = !a.log_file.empty();
    if (!a.log_file.empty()) c.log_file = a.log_file;
    c.chunk_size = static_cast<int>(a.chunk_size);
    c.output_format = format_name(a.format);
    c.describe_fields = a.describe_fields;
    c.indent = a.indent;
    c.capture_timeout_ms = static_cast<int>(a.capture_timeout.count());
    settings::apply_defaults(c);
    return c;
}

inline AppConfig merge(const AppConfig& a, const Overrides& b) {
    AppConfig out = a;
    if (b.log_level)       out.log_level = *b.log_level;
    if (b.log_file)        out.log_file = *b.log_file;
    if (b.chunk_size)      out.chunk_size = *b.chunk_size;
    if (b.format)          out.format = *b.format;
    if (b.describe_fields) out.describe_fields = *b.describe_fields;
    if (b.capture)         out.capture = *b.capture;
    return out;
}

} // namespace config
} // namespace app
