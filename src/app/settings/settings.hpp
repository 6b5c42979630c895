#pragma once
// Settings handling
// - Config structure and serialization (JSON via nlohmann::json)
// - Store: load/save
// NOTE: header-only implementation for simplicity

#include <string>
#include <fstream>

#include <nlohmann/json.hpp>

#include "../../logger.hpp"

namespace app {
namespace settings {

struct Config {
    // Logging
    std::string log_level = "info";  // "info" | "warn" | "error"
    bool log_to_file = false;
    std::string log_file = "dlid.log";

    // Input feeding: characters per append, 0 = whole input at once
    int chunk_size = 0;

    // Output
    std::string output_format = "json"; // "json" | "text"
    bool describe_fields = false;       // text output: add element descriptions
    int indent = 2;                     // json output indent, -1 = compact

    // Capture session idle timeout
    int capture_timeout_ms = 200;
};

// Clamp values into their valid ranges.
inline void apply_defaults(Config& c) {
    if (c.log_level != "info" && c.log_level != "warn" && c.log_level != "error") c.log_level = "info";
    if (c.log_file.empty()) c.log_file = "dlid.log";
    if (c.chunk_size < 0) c.chunk_size = 0;
    if (c.output_format != "json" && c.output_format != "text") c.output_format = "json";
    if (c.indent < -1) c.indent = -1;
    if (c.capture_timeout_ms <= 0) c.capture_timeout_ms = 200;
}

class Store {
public:
    // Load config from JSON. Always sets 'out' (merged with defaults).
    // Returns true if the file existed and was parsed, false if missing or malformed.
    static bool load(const std::string& path, Config& out);

    static bool save(const std::string& path, const Config& cfg);
};

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"log_level", c.log_level},
        {"log_to_file", c.log_to_file},
        {"log_file", c.log_file},
        {"chunk_size", c.chunk_size},
        {"output_format", c.output_format},
        {"describe_fields", c.describe_fields},
        {"indent", c.indent},
        {"capture_timeout_ms", c.capture_timeout_ms}
    };
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // keep defaults first
    Config tmp = c;

    if (j.contains("log_level")) j.at("log_level").get_to(tmp.log_level);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(tmp.log_to_file);
    if (j.contains("log_file")) j.at("log_file").get_to(tmp.log_file);

    if (j.contains("chunk_size")) j.at("chunk_size").get_to(tmp.chunk_size);

    if (j.contains("output_format")) j.at("output_format").get_to(tmp.output_format);
    if (j.contains("describe_fields")) j.at("describe_fields").get_to(tmp.describe_fields);
    if (j.contains("indent")) j.at("indent").get_to(tmp.indent);

    if (j.contains("capture_timeout_ms")) j.at("capture_timeout_ms").get_to(tmp.capture_timeout_ms);

    c = std::move(tmp);
}

// --------- Store implementation ----------
inline bool Store::load(const std::string& path, Config& out) {
    Config cfg;
    apply_defaults(cfg);

    std::ifstream in(path, std::ios::in);
    if (!in.is_open()) {
        out = std::move(cfg);
        return false;
    }

    try {
        nlohmann::json j;
        in >> j;
        from_json(j, cfg);
        apply_defaults(cfg);
        out = std::move(cfg);
        return true;
    } catch (const nlohmann::json::exception& e) {
        logger::warn("Config " + path + " ignored: " + e.what());
        Config defaults;
        apply_defaults(defaults);
        out = std::move(defaults);
        return false;
    }
}

inline bool Store::save(const std::string& path, const Config& cfg) {
    nlohmann::json j = cfg;
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        logger::error("Cannot write config " + path);
        return false;
    }
    out << j.dump(2) << '\n';
    return static_cast<bool>(out);
}

} // namespace settings
} // namespace app
