#pragma once
// Purpose: Steps for the fixed-layout DL/ID header:
// '@' <data element sep> <record sep> <segment terminator> "ANSI " <iin:6><ver:2><jur:2><entries:2>

#include "steps.hpp"
#include "string_reader.hpp"

namespace dlid {

constexpr char HEADER_MARKER = '@';
constexpr const char* HEADER_FILE_TYPE = "ANSI ";

// One step that expands into a sub-step per header field, so a suspension inside the header
// never re-validates fields the reader has already consumed.
Step make_header_step(StringReader& reader);

} // namespace dlid
