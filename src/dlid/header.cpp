#include "header.hpp"

#include <string>
#include <utility>

#include "errors.hpp"
#include "text.hpp"

namespace dlid {

namespace {

std::string read_separator(StringReader& reader, const char* which) {
    std::string sep = reader.read(1);
    if (text::is_forbidden_separator(sep[0])) {
        throw HeaderParseError(std::string("Invalid ") + which + " " + text::hex_code(sep[0]));
    }
    return sep;
}

} // namespace

Step make_header_step(StringReader& reader) {
    StringReader* r = &reader;
    return [r](const ParseResult& result) {
        StepResult out{result, {}};
        out.next = {
            [r](const ParseResult& res) {
                std::string a = r->read(1);
                if (a[0] != HEADER_MARKER) {
                    throw HeaderParseError("Expected '@', got " + text::hex_code(a[0]));
                }
                return StepResult{res, {}};
            },
            [r](const ParseResult& res) {
                ParseResult next = res;
                next.header.data_element_separator = read_separator(*r, "data element separator");
                return StepResult{std::move(next), {}};
            },
            [r](const ParseResult& res) {
                ParseResult next = res;
                next.header.record_separator = read_separator(*r, "record separator");
                return StepResult{std::move(next), {}};
            },
            [r](const ParseResult& res) {
                ParseResult next = res;
                next.header.segment_terminator = read_separator(*r, "segment terminator");
                return StepResult{std::move(next), {}};
            },
            [r](const ParseResult& res) {
                if (r->read(5) != HEADER_FILE_TYPE) {
                    throw ParseError("Invalid header: missing 'ANSI '");
                }
                return StepResult{res, {}};
            },
            [r](const ParseResult& res) {
                ParseResult next = res;
                next.header.iin = r->read(6);
                return StepResult{std::move(next), {}};
            },
            [r](const ParseResult& res) {
                ParseResult next = res;
                next.header.aamva_version = r->read(2);
                return StepResult{std::move(next), {}};
            },
            [r](const ParseResult& res) {
                ParseResult next = res;
                next.header.jurisdiction_version = r->read(2);
                return StepResult{std::move(next), {}};
            },
            [r](const ParseResult& res) {
                // Validate before consuming; a bad count leaves the cursor on it.
                std::string raw = r->peek(2);
                int entries = 0;
                if (!text::parse_decimal(raw, entries)) {
                    throw ParseError("Invalid number of entries: '" + raw + "'");
                }
                r->read(2);
                ParseResult next = res;
                next.header.num_entries = entries;
                return StepResult{std::move(next), {}};
            },
        };
        return out;
    };
}

} // namespace dlid
