// parser.cpp - recursive descent from tokens to a value tree
#include "artemis/parser.hpp"
#include "artemis/errors.hpp"
#include "artemis/config.hpp"
#include <cstdio>

namespace artemis {

namespace {

class token_cursor {
public:
    explicit token_cursor(const std::vector<token>& toks) : toks_(toks) {}

    bool at_end() const { return pos_ >= toks_.size(); }
    // Lookahead without consuming; nullptr past the end.
    const token* peek() const { return at_end() ? nullptr : &toks_[pos_]; }
    // Consume one token; `what` names the expectation for the end-of-input message.
    const token& next(const char* what){
        if (at_end())
            throw parse_error(parse_errc::unexpected_end_of_input, std::string("unexpected end of input, expected ") + what);
        return toks_[pos_++];
    }

private:
    const std::vector<token>& toks_;
    size_t pos_ = 0;
};

[[noreturn]] void unexpected(const token& t, const char* expected){
    throw parse_error(parse_errc::unexpected_token, "unexpected " + describe(t) + ", expected " + expected, t.line, t.col);
}

node_ptr parse_value(token_cursor& cur);

node_ptr parse_array(token_cursor& cur){
    array out;
    for (;;) {
        const token* t = cur.peek();
        if (!t)
            throw parse_error(parse_errc::unexpected_end_of_input, "unexpected end of input, expected '}'");
        if (t->kind == token_kind::close_brace) { cur.next("'}'"); break; }
        if (t->kind == token_kind::comma) { cur.next("','"); continue; }
        out.elems.push_back(parse_value(cur));
    }
    return detail::make_node(std::move(out));
}

node_ptr parse_value(token_cursor& cur){
    const token& t = cur.next("a value");
    switch (t.kind) {
    case token_kind::open_brace:
        return parse_array(cur);
    case token_kind::string_literal:
        return n_str(t.text);
    case token_kind::integer_literal:
        return n_i64(t.ival);
    case token_kind::float_literal:
        return n_f64(t.fval);
    case token_kind::identifier: {
        const token* la = cur.peek();
        if (!la)
            throw parse_error(parse_errc::unexpected_end_of_input, "unexpected end of input after identifier '" + t.text + "'");
        if (la->kind != token_kind::equal)
            return n_str(t.text);
        cur.next("'='");
        dictionary d;
        d.insert(t.text, parse_value(cur));
        return detail::make_node(std::move(d));
    }
    default:
        unexpected(t, "a value");
    }
}

} // namespace

node_ptr parse_tokens(const std::vector<token>& tokens){
    token_cursor cur(tokens);
    dictionary doc;
    while (!cur.at_end()) {
        const token& key = cur.next("an identifier");
        if (key.kind != token_kind::identifier)
            throw parse_error(parse_errc::expected_identifier, "expected identifier at top level, found " + describe(key), key.line, key.col);
        const token& eq = cur.next("'='");
        if (eq.kind != token_kind::equal)
            unexpected(eq, "'='");
        doc.insert(key.text, parse_value(cur));
    }
    if (trace_enabled())
        std::fprintf(stderr, "[dbg][parse] document with %zu top-level keys\n", doc.size());
    return detail::make_node(std::move(doc));
}

node_ptr parse(std::string_view src, std::string_view source_name){
    return parse_tokens(tokenize(src, source_name));
}

} // namespace artemis
