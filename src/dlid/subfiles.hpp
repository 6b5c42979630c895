#pragma once
// Purpose: Subfile body steps and the record scanner.
//
// Notes:
// - Only "DL" and "ID" subfiles are split into records. Any other type only has its declared
//   byte range checked and gets no entry in ParseResult::subfiles.
// - The scanner works on a snapshot of exactly <length> characters taken at <offset> of the
//   shared buffer, so bytes of the next subfile are never visible to it.
// - Duplicate keys keep the last value and are logged.

#include <string>

#include "steps.hpp"
#include "string_reader.hpp"
#include "types.hpp"

namespace dlid {

// True for the subfile types whose records are extracted.
bool is_record_subfile(const std::string& type);

// Expands into one step per collected designator, in directory order.
Step make_subfiles_step(StringReader& reader);

Step make_subfile_step(StringReader& reader, SubfileDesignator designator);

// Splits a full subfile window (type marker included) into records.
// Throws ParseError on a malformed or truncated key.
SubfileData scan_records(const std::string& window, const Header& header, const std::string& type);

} // namespace dlid
