#pragma once
#include <tao/pegtl.hpp>

namespace artemis::lexer::grammar {
using namespace tao::pegtl;

// Whitespace: ASCII space class plus the Unicode White_Space code points above U+007F
struct wide_space : sor< utf8::one< 0x85, 0xA0, 0x1680, 0x2028, 0x2029, 0x202F, 0x205F, 0x3000 >,
                         utf8::range< 0x2000, 0x200A > > {};
struct blank : sor< space, wide_space > {};
struct skip : star< blank > {};

// Punctuation
struct equal_sign : one<'='> {};
struct open_brace : one<'{'> {};
struct close_brace : one<'}'> {};
struct comma : one<','> {};

// "..." with \n \t \" \\ escapes; everything else is copied byte for byte
struct escape_char : one<'n','t','"','\\'> {};
struct escape : if_must< one<'\\'>, escape_char > {};
struct plain : plus< not_one<'"','\\'> > {};
struct string_open : one<'"'> {};
struct string_close : one<'"'> {};
struct string_body : star< sor< escape, plain > > {};
struct string_lit : if_must< string_open, string_body, string_close > {};

// -?digit(digit|.)*  (malformed text such as 1.2.3 is rejected when converted)
struct number : seq< opt< one<'-'> >, digit, star< sor< digit, one<'.'> > > > {};

// Identifiers: ASCII alnum/underscore or any non-ASCII code point that is not whitespace
struct ident_wide : minus< utf8::range< 0x80, 0x10FFFF >, wide_space > {};
struct ident_char : sor< alnum, one<'_'>, ident_wide > {};
struct identifier : plus< ident_char > {};

// Numbers win over identifiers for a leading digit
struct lexeme : sor< equal_sign, open_brace, close_brace, comma, string_lit, number, identifier > {};

struct end_of_input : eof {};
struct script : seq< opt< utf8::bom >, skip, star< lexeme, skip >, must< end_of_input > > {};

} // namespace artemis::lexer::grammar
