#pragma once
// Small character helpers shared by the header, designator and subfile parsers.

#include <string>
#include <cctype>
#include <cstdio>

namespace dlid {
namespace text {

// Strict decimal: every character must be a digit. Empty input is rejected.
inline bool parse_decimal(const std::string& s, int& out) {
    if (s.empty()) return false;
    int v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

// Separators may not be a letter, a digit or a space.
inline bool is_forbidden_separator(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return c == ' ' || (u < 0x80 && std::isalnum(u));
}

// Three uppercase ASCII letters.
inline bool is_record_key(const std::string& key) {
    if (key.size() != 3) return false;
    for (char c : key) {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}

// "0x1e" style code point used in error messages.
inline std::string hex_code(char c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
    return buf;
}

} // namespace text
} // namespace dlid
