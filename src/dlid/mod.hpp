#pragma once
// Purpose: Aggregator for the DL/ID parser module.

#include "errors.hpp"
#include "string_reader.hpp"
#include "types.hpp"
#include "steps.hpp"
#include "header.hpp"
#include "designators.hpp"
#include "subfiles.hpp"
#include "parser.hpp"
#include "elements.hpp"
