#include "output.hpp"

#include <sstream>

#include "../dlid/elements.hpp"
#include "../dlid/text.hpp"

namespace app {
namespace output {

nlohmann::json header_json(const dlid::Header& h) {
    return nlohmann::json{
        {"data_element_separator", h.data_element_separator},
        {"record_separator", h.record_separator},
        {"segment_terminator", h.segment_terminator},
        {"iin", h.iin},
        {"aamva_version", h.aamva_version},
        {"jurisdiction_version", h.jurisdiction_version},
        {"num_entries", h.num_entries}
    };
}

nlohmann::json result_json(const dlid::ParseResult& r) {
    nlohmann::json designators = nlohmann::json::array();
    for (const auto& sd : r.subfile_designators) {
        designators.push_back({{"type", sd.type}, {"offset", sd.offset}, {"length", sd.length}});
    }
    nlohmann::json subfiles = nlohmann::json::object();
    for (const auto& [type, records] : r.subfiles) {
        subfiles[type] = records; // std::map<string,string> -> object
    }
    return nlohmann::json{
        {"header", header_json(r.header)},
        {"subfile_designators", designators},
        {"subfiles", subfiles}
    };
}

std::string render_json(const dlid::ParseResult& r, int indent) {
    // replace: card data is not guaranteed to be valid UTF-8
    return result_json(r).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string render_capture_json(const std::vector<dlid::ParseResult>& results,
                                const std::string& text, int indent) {
    nlohmann::json j{{"results", nlohmann::json::array()}, {"text", text}};
    for (const auto& r : results) {
        j["results"].push_back(result_json(r));
    }
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string separator_label(const std::string& sep) {
    if (sep.empty()) return "-";
    return dlid::text::hex_code(sep[0]);
}

std::string render_text(const dlid::ParseResult& r, bool describe) {
    std::ostringstream out;
    const dlid::Header& h = r.header;
    out << "IIN                  " << h.iin << '\n';
    out << "AAMVA version        " << h.aamva_version << '\n';
    out << "Jurisdiction version " << h.jurisdiction_version << '\n';
    out << "Separators           " << separator_label(h.data_element_separator) << ' '
        << separator_label(h.record_separator) << ' '
        << separator_label(h.segment_terminator) << '\n';
    out << "Entries              " << h.num_entries << '\n';
    for (const auto& sd : r.subfile_designators) {
        out << "Subfile " << sd.type << " @" << sd.offset << " +" << sd.length;
        if (r.subfiles.find(sd.type) == r.subfiles.end()) out << " (not parsed)";
        out << '\n';
    }
    for (const auto& [type, records] : r.subfiles) {
        out << '\n' << '[' << type << "]\n";
        for (const auto& [key, value] : records) {
            out << key << ' ' << value;
            if (describe) {
                std::string d = dlid::elements::describe(key);
                if (!d.empty()) out << "  # " << d;
            }
            out << '\n';
        }
    }
    return out.str();
}

} // namespace output
} // namespace app
