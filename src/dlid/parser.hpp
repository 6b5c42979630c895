#pragma once
// Purpose: DL/ID parser facade. Owns the growable buffer and the step engine.
//
// Two ways to drive it:
// - append(data): feed characters, returns true while more data is needed. Never throws
//   for parse failures; inspect has_error()/error_kind() afterwards.
// - parse(): throws InsufficientData to signal "wait for more input", HeaderParseError /
//   ParseError for fatal failures.
// A failed parser stays failed; create a new one to start over.

#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "steps.hpp"
#include "string_reader.hpp"
#include "types.hpp"

namespace dlid {

class Parser {
public:
    explicit Parser(std::string initial = {});

    // Steps hold a pointer to reader_.
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    bool append(const std::string& data);
    const ParseResult& parse();

    const std::string& data() const { return reader_.data(); }
    bool is_complete() const { return result_.has_value(); }
    bool has_error() const { return error_kind_ != ErrorKind::None; }
    ErrorKind error_kind() const { return error_kind_; }
    const std::string& error_message() const { return error_message_; }

    // Available once is_complete(); throw std::logic_error before that.
    const ParseResult& result() const;
    const Header& header() const { return result().header; }
    const std::vector<SubfileDesignator>& subfile_designators() const { return result().subfile_designators; }
    const Subfiles& subfiles() const { return result().subfiles; }

private:
    StringReader reader_;
    StepEngine engine_;
    std::optional<ParseResult> result_;
    ErrorKind error_kind_ = ErrorKind::None;
    std::string error_message_;
};

} // namespace dlid
