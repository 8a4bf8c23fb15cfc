#pragma once
#include "grammar.hpp"
#include "artemis/errors.hpp"
#include "artemis/lexer.hpp"
#include <tao/pegtl.hpp>
#include <charconv>
#include <cstdio>
#include <string>
#include <vector>

namespace artemis::lexer {

// Token sink shared by the actions below
struct lex_state {
    std::vector<artemis::token> tokens;
    std::string buffer;   // decoded contents of the string literal being read
    int string_line{0};
    int string_col{0};

    template<typename Position>
    void push(token_kind k, const Position& p){
        artemis::token t; t.kind = k; t.line = static_cast<int>(p.line); t.col = static_cast<int>(p.column);
        tokens.push_back(std::move(t));
    }
};

namespace actions {
using namespace tao::pegtl;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::equal_sign > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){ st.push(token_kind::equal, in.position()); }
};
template<> struct action< grammar::open_brace > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){ st.push(token_kind::open_brace, in.position()); }
};
template<> struct action< grammar::close_brace > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){ st.push(token_kind::close_brace, in.position()); }
};
template<> struct action< grammar::comma > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){ st.push(token_kind::comma, in.position()); }
};

template<> struct action< grammar::string_open > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        const auto p = in.position();
        st.buffer.clear(); st.string_line = static_cast<int>(p.line); st.string_col = static_cast<int>(p.column);
    }
};
template<> struct action< grammar::plain > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){ st.buffer.append(in.begin(), in.size()); }
};
template<> struct action< grammar::escape_char > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        switch(*in.begin()){
            case 'n': st.buffer += '\n'; break;
            case 't': st.buffer += '\t'; break;
            default: st.buffer += *in.begin(); break; // '"' and '\\' stand for themselves
        }
    }
};
template<> struct action< grammar::string_lit > {
    template<typename ActionInput>
    static void apply(const ActionInput&, lex_state& st){
        artemis::token t; t.kind = token_kind::string_literal; t.text = std::move(st.buffer);
        t.line = st.string_line; t.col = st.string_col;
        st.tokens.push_back(std::move(t));
        st.buffer.clear();
    }
};

template<> struct action< grammar::number > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        const std::string s = in.string();
        const auto p = in.position();
        const char* first = s.data();
        const char* last = s.data() + s.size();
        st.push(token_kind::integer_literal, p);
        auto& t = st.tokens.back();
        if(s.find('.') != std::string::npos){
            t.kind = token_kind::float_literal;
            auto r = std::from_chars(first, last, t.fval);
            if(r.ec != std::errc() || r.ptr != last)
                throw lex_error(lex_errc::number_format, "invalid float literal '" + s + "'", t.line, t.col);
        } else {
            auto r = std::from_chars(first, last, t.ival);
            if(r.ec != std::errc() || r.ptr != last)
                throw lex_error(lex_errc::number_format, "invalid integer literal '" + s + "'", t.line, t.col);
        }
    }
};

template<> struct action< grammar::identifier > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        st.push(token_kind::identifier, in.position());
        st.tokens.back().text = in.string();
    }
};

} // namespace actions

// Default: any other must<> failure surfaces as a pegtl::parse_error (converted by tokenize()).
template<typename Rule>
struct lex_control : tao::pegtl::normal<Rule> {};

template<> struct lex_control< grammar::escape_char > : tao::pegtl::normal< grammar::escape_char > {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...){
        const auto p = in.position();
        if(in.empty())
            throw lex_error(lex_errc::incomplete_escape, "backslash at end of input", static_cast<int>(p.line), static_cast<int>(p.column));
        throw lex_error(lex_errc::unknown_escape, std::string("unknown escape sequence '\\") + in.peek_char() + "'", static_cast<int>(p.line), static_cast<int>(p.column));
    }
};

template<> struct lex_control< grammar::string_close > : tao::pegtl::normal< grammar::string_close > {
    template<typename ParseInput>
    [[noreturn]] static void raise(const ParseInput&, lex_state& st){
        throw lex_error(lex_errc::unterminated_string, "string literal is not terminated", st.string_line, st.string_col);
    }
};

template<> struct lex_control< grammar::end_of_input > : tao::pegtl::normal< grammar::end_of_input > {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...){
        const auto p = in.position();
        std::string shown;
        const unsigned char c = static_cast<unsigned char>(in.peek_char());
        if(c >= 0x20 && c < 0x7f) shown = std::string("'") + static_cast<char>(c) + "'";
        else { char buf[8]; std::snprintf(buf, sizeof(buf), "0x%02X", c); shown = buf; }
        throw lex_error(lex_errc::unexpected_character, "unexpected character " + shown, static_cast<int>(p.line), static_cast<int>(p.column));
    }
};

} // namespace artemis::lexer
