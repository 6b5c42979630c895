#pragma once
// Purpose: Render parse results for the command line (JSON via nlohmann::json, or plain text).

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../dlid/types.hpp"

namespace app {
namespace output {

nlohmann::json header_json(const dlid::Header& h);
nlohmann::json result_json(const dlid::ParseResult& r);

// Indent -1 prints compact JSON.
std::string render_json(const dlid::ParseResult& r, int indent);

// Capture mode: every completed result plus the text that was not part of a payload.
std::string render_capture_json(const std::vector<dlid::ParseResult>& results,
                                const std::string& text, int indent);

// "KEY value" lines; with describe, known element IDs get their AAMVA description appended.
std::string render_text(const dlid::ParseResult& r, bool describe);

// Printable form of a separator character, e.g. "0x1e".
std::string separator_label(const std::string& sep);

} // namespace output
} // namespace app
