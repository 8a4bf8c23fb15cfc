#pragma once
#include "artemis/value.hpp"
#include "artemis/lexer.hpp"
#include <string_view>
#include <vector>

namespace artemis {

// Recursive descent over a token sequence:
//   document := (identifier '=' value)*
//   value    := array | string | integer | float | identifier ['=' value]
//   array    := '{' (value (',' value)* ','?)? '}'
// A bare identifier followed by '=' becomes a one-key dictionary, otherwise a string.
// Returns the document as a dictionary node; throws parse_error.
node_ptr parse_tokens(const std::vector<token>& tokens);

// tokenize() followed by parse_tokens().
node_ptr parse(std::string_view src, std::string_view source_name = "<memory>");

} // namespace artemis
