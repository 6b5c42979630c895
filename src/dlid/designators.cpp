#include "designators.hpp"

#include <string>
#include <utility>

#include "errors.hpp"
#include "text.hpp"

namespace dlid {

Step make_designators_step(StringReader& reader) {
    StringReader* r = &reader;
    return [r](const ParseResult& result) {
        StepResult out{result, {}};
        out.next.reserve(static_cast<std::size_t>(result.header.num_entries));
        for (int i = 0; i < result.header.num_entries; ++i) {
            out.next.push_back(make_designator_step(*r));
        }
        return out;
    };
}

Step make_designator_step(StringReader& reader) {
    StringReader* r = &reader;
    return [r](const ParseResult& result) {
        StringReader block(r->peek(SUBFILE_DESIGNATOR_SIZE));

        SubfileDesignator sd;
        sd.type = block.read(2);
        const std::string offset = block.read(4);
        const std::string length = block.read(4);
        if (!text::parse_decimal(offset, sd.offset)) {
            throw ParseError("Invalid offset '" + offset + "' for subfile " + sd.type);
        }
        if (!text::parse_decimal(length, sd.length)) {
            throw ParseError("Invalid length '" + length + "' for subfile " + sd.type);
        }

        r->read(SUBFILE_DESIGNATOR_SIZE);

        ParseResult next = result;
        next.subfile_designators.push_back(std::move(sd));
        return StepResult{std::move(next), {}};
    };
}

} // namespace dlid
