#include "subfiles.hpp"

#include <utility>

#include "errors.hpp"
#include "text.hpp"
#include "../logger.hpp"

namespace dlid {

namespace {

enum class RecordState {
    AwaitingRecordOrEnd,
    ReadingKey,
    ReadingValue,
    Done
};

constexpr std::size_t RECORD_KEY_SIZE = 3;
constexpr std::size_t SUBFILE_TYPE_SIZE = 2;

void commit_record(SubfileData& records, const std::string& type, std::string key, std::string value) {
    auto it = records.find(key);
    if (it != records.end()) {
        logger::warn("Subfile " + type + ": duplicate record " + key + ", keeping last value");
        it->second = std::move(value);
        return;
    }
    records.emplace(std::move(key), std::move(value));
}

} // namespace

bool is_record_subfile(const std::string& type) {
    return type == "DL" || type == "ID";
}

SubfileData scan_records(const std::string& window, const Header& header, const std::string& type) {
    if (window.size() < SUBFILE_TYPE_SIZE) {
        throw ParseError("Subfile " + type + " is shorter than its type marker");
    }
    const char des = header.data_element_separator.empty() ? '\0' : header.data_element_separator[0];
    const char seg = header.segment_terminator.empty() ? '\0' : header.segment_terminator[0];

    StringReader sf(window);
    sf.read(SUBFILE_TYPE_SIZE);

    SubfileData records;
    RecordState state = RecordState::AwaitingRecordOrEnd;
    std::string key;
    std::string value;

    while (state != RecordState::Done) {
        switch (state) {
            case RecordState::AwaitingRecordOrEnd: {
                if (sf.remaining() == 0) {
                    state = RecordState::Done;
                    break;
                }
                const char c = sf.peek(1)[0];
                if (c == seg) {
                    sf.read(1);
                    state = RecordState::Done;
                } else if (c == des) {
                    sf.read(1);
                } else {
                    state = RecordState::ReadingKey;
                }
                break;
            }
            case RecordState::ReadingKey: {
                if (sf.remaining() < RECORD_KEY_SIZE) {
                    throw ParseError("Subfile " + type + " ends inside a record key: '" +
                                     sf.peek(sf.remaining()) + "'");
                }
                key = sf.read(RECORD_KEY_SIZE);
                if (!text::is_record_key(key)) {
                    throw ParseError("Invalid record: '" + key + "'");
                }
                value.clear();
                state = RecordState::ReadingValue;
                break;
            }
            case RecordState::ReadingValue: {
                if (sf.remaining() == 0) {
                    // window end acts as the terminator
                    logger::warn("Subfile " + type + " ends without a segment terminator after " + key);
                    commit_record(records, type, std::move(key), std::move(value));
                    state = RecordState::Done;
                    break;
                }
                const char c = sf.read(1)[0];
                if (c == des) {
                    commit_record(records, type, std::move(key), std::move(value));
                    state = RecordState::AwaitingRecordOrEnd;
                } else if (c == seg) {
                    commit_record(records, type, std::move(key), std::move(value));
                    state = RecordState::Done;
                } else {
                    value += c;
                }
                break;
            }
            case RecordState::Done:
                break;
        }
    }
    return records;
}

Step make_subfiles_step(StringReader& reader) {
    StringReader* r = &reader;
    return [r](const ParseResult& result) {
        StepResult out{result, {}};
        out.next.reserve(result.subfile_designators.size());
        for (const auto& sd : result.subfile_designators) {
            out.next.push_back(make_subfile_step(*r, sd));
        }
        return out;
    };
}

Step make_subfile_step(StringReader& reader, SubfileDesignator designator) {
    StringReader* r = &reader;
    return [r, designator](const ParseResult& result) {
        // Re-seek on the backing buffer; the shared cursor is left alone.
        if (static_cast<std::size_t>(designator.offset) > r->data().size()) {
            throw InsufficientData();
        }
        StringReader at(r->data(), static_cast<std::size_t>(designator.offset));
        const std::string window = at.peek(static_cast<std::size_t>(designator.length));

        if (!is_record_subfile(designator.type)) {
            logger::info("Skipping subfile " + designator.type + " (" +
                         std::to_string(designator.length) + " chars)");
            return StepResult{result, {}};
        }

        SubfileData records = scan_records(window, result.header, designator.type);
        logger::info("Parsed subfile " + designator.type + ": " +
                     std::to_string(records.size()) + " records");

        ParseResult next = result;
        next.subfiles[designator.type] = std::move(records);
        return StepResult{std::move(next), {}};
    };
}

} // namespace dlid
