#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace artemis {

enum class token_kind {
    equal,           // "="
    open_brace,      // "{"
    close_brace,     // "}"
    comma,           // ","
    identifier,      // astver, block_00000, text ...
    string_literal,  // escape-decoded contents
    integer_literal,
    float_literal,
};

struct token {
    token_kind kind{token_kind::equal};
    std::string text;   // identifier name or decoded string contents
    int64_t ival{0};
    double fval{0.0};
    int line{0};
    int col{0};
};

// Tokenize a whole script dump. Throws lex_error on malformed input.
std::vector<token> tokenize(std::string_view src, std::string_view source_name = "<memory>");

// Short description for diagnostics, e.g. "'='" or "identifier 'text'".
std::string describe(const token& t);

} // namespace artemis
