#pragma once
#include "artemis/scenario.hpp"
#include <string>
#include <string_view>

namespace artemis {

// On-disk form of the ordered scenario list: a JSON array of strings (also valid YAML).
// Non-ASCII text is written verbatim as UTF-8.
std::string write_string_list(const string_list& lines);

// Accepts any YAML sequence of strings, so both the JSON arrays written above and
// block-style `- "..."` lists read back. Throws string_list_error for anything else.
string_list read_string_list(std::string_view text);

} // namespace artemis
