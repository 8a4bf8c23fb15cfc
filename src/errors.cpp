#include "artemis/errors.hpp"

namespace artemis {

const char* to_string(lex_errc c){
    switch(c){
        case lex_errc::unknown_escape: return "unknown-escape";
        case lex_errc::incomplete_escape: return "incomplete-escape";
        case lex_errc::unterminated_string: return "unterminated-string";
        case lex_errc::unexpected_character: return "unexpected-character";
        case lex_errc::number_format: return "number-format";
    }
    return "unknown";
}

const char* to_string(parse_errc c){
    switch(c){
        case parse_errc::expected_identifier: return "expected-identifier";
        case parse_errc::unexpected_token: return "unexpected-token";
        case parse_errc::unexpected_end_of_input: return "unexpected-end-of-input";
    }
    return "unknown";
}

const char* to_string(tree_errc c){
    switch(c){
        case tree_errc::missing_field: return "missing-field";
        case tree_errc::type_mismatch: return "type-mismatch";
        case tree_errc::exhausted_input: return "exhausted-input";
        case tree_errc::unused_input: return "unused-input";
    }
    return "unknown";
}

} // namespace artemis
