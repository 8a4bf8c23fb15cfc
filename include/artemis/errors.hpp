// errors.hpp - typed failures raised by the lexer, parser, tree algorithms and list codec
#pragma once
#include <stdexcept>
#include <string>

namespace artemis
{

    enum class lex_errc
    {
        unknown_escape,
        incomplete_escape,
        unterminated_string,
        unexpected_character,
        number_format,
    };

    enum class parse_errc
    {
        expected_identifier,
        unexpected_token,
        unexpected_end_of_input,
    };

    enum class tree_errc
    {
        missing_field,
        type_mismatch,
        exhausted_input,
        unused_input,
    };

    const char *to_string(lex_errc c);
    const char *to_string(parse_errc c);
    const char *to_string(tree_errc c);

    // Common base: category ("lex", "parse", "tree", "string-list"), stable code name and
    // an optional 1-based source position (0 when unknown).
    class error : public std::runtime_error
    {
    public:
        error(const char *category, const char *code, const std::string &message, int line = 0, int col = 0)
            : std::runtime_error(message), category_(category), code_(code), line_(line), col_(col) {}

        const char *category() const noexcept { return category_; }
        const char *code_name() const noexcept { return code_; }
        int line() const noexcept { return line_; }
        int col() const noexcept { return col_; }

    private:
        const char *category_;
        const char *code_;
        int line_;
        int col_;
    };

    class lex_error : public error
    {
    public:
        lex_error(lex_errc c, const std::string &message, int line, int col)
            : error("lex", to_string(c), message, line, col), code_(c) {}
        lex_errc code() const noexcept { return code_; }

    private:
        lex_errc code_;
    };

    class parse_error : public error
    {
    public:
        parse_error(parse_errc c, const std::string &message, int line = 0, int col = 0)
            : error("parse", to_string(c), message, line, col), code_(c) {}
        parse_errc code() const noexcept { return code_; }

    private:
        parse_errc code_;
    };

    class tree_error : public error
    {
    public:
        tree_error(tree_errc c, const std::string &message)
            : error("tree", to_string(c), message), code_(c) {}
        tree_errc code() const noexcept { return code_; }

    private:
        tree_errc code_;
    };

    class string_list_error : public error
    {
    public:
        explicit string_list_error(const std::string &message)
            : error("string-list", "invalid-list", message) {}
    };

} // namespace artemis
