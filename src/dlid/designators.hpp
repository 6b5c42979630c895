#pragma once
// Purpose: Subfile designator (directory) steps.
// Each designator is a fixed 10-character block: <type:2><offset:4><length:4>.

#include <cstddef>

#include "steps.hpp"
#include "string_reader.hpp"

namespace dlid {

constexpr std::size_t SUBFILE_DESIGNATOR_SIZE = 10;

// Expands into header.num_entries designator steps once the header is committed.
Step make_designators_step(StringReader& reader);

// Parses a single designator block; consumes nothing unless the whole block is valid.
Step make_designator_step(StringReader& reader);

} // namespace dlid
