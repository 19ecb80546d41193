#pragma once

#include <esrdecoder/field_info.hpp>

#include <vector>

namespace esrdecoder::cli {

// Prints the fields and their subfields to stdout, one field per line, indenting each level of subfields by two
// spaces.
void PrintFields(const std::vector<FieldInfo> &fields, bool verbose, size_t level = 0);

} // namespace esrdecoder::cli
