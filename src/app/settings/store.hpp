#pragma once
// Purpose: Config file location and thin load/save facade over settings::Store.

#include <cstdlib>
#include <string>
#include <system_error>
#include <filesystem>

#include "settings.hpp"

namespace app {
namespace settings {
namespace store {

namespace fs = std::filesystem;

constexpr const char* CONFIG_FILE_NAME = "dlid.json";

// Lookup order: $DLID_CONFIG, ./dlid.json, $XDG_CONFIG_HOME/dlid-reader/dlid.json,
// $HOME/.config/dlid-reader/dlid.json. Falls back to ./dlid.json when none exists.
inline std::string default_path() {
    if (const char* env = std::getenv("DLID_CONFIG")) {
        if (*env) return env;
    }
    std::error_code ec;
    if (fs::exists(CONFIG_FILE_NAME, ec)) return CONFIG_FILE_NAME;

    fs::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = fs::path(home) / ".config";
    }
    if (!base.empty()) {
        fs::path p = base / "dlid-reader" / CONFIG_FILE_NAME;
        if (fs::exists(p, ec)) return p.string();
    }
    return CONFIG_FILE_NAME;
}

// Load config from given path. Always writes 'out' (defaults if parse fails).
inline bool load_from(const std::string& path, Config& out) {
    return Store::load(path, out);
}

// Save config, creating the parent directory if needed.
inline bool save_to(const std::string& path, const Config& cfg) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            logger::error("Cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }
    return Store::save(path, cfg);
}

} // namespace store
} // namespace settings
} // namespace app
