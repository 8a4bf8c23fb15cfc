#include "artemis/lexer.hpp"
#include "artemis/errors.hpp"
#include "artemis/config.hpp"
#include "lexer/grammar.hpp"
#include "lexer/actions.hpp"
#include <tao/pegtl.hpp>
#include <cstdio>
#include <sstream>

namespace artemis {
using namespace artemis::lexer;

std::vector<token> tokenize(std::string_view src, std::string_view source_name){
    tao::pegtl::memory_input<> in(src.data(), src.size(), std::string(source_name));
    lex_state st;
    try {
        tao::pegtl::parse< grammar::script, actions::action, lex_control >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        throw lex_error(lex_errc::unexpected_character, e.what(), static_cast<int>(p.line), static_cast<int>(p.column));
    }
    if (trace_enabled())
        std::fprintf(stderr, "[dbg][lex] %.*s: %zu tokens from %zu bytes\n", (int)source_name.size(), source_name.data(), st.tokens.size(), src.size());
    return std::move(st.tokens);
}

std::string describe(const token& t){
    switch(t.kind){
        case token_kind::equal: return "'='";
        case token_kind::open_brace: return "'{'";
        case token_kind::close_brace: return "'}'";
        case token_kind::comma: return "','";
        case token_kind::identifier: return "identifier '" + t.text + "'";
        case token_kind::string_literal: return "string \"" + t.text + "\"";
        case token_kind::integer_literal: return "integer " + std::to_string(t.ival);
        case token_kind::float_literal: { std::ostringstream oss; oss << t.fval; return "float " + oss.str(); }
    }
    return "token";
}

} // namespace artemis
