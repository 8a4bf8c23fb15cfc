#pragma once
#include "artemis/value.hpp"
#include <string>
#include <string_view>

namespace artemis {

struct print_options {
    std::string indent{"\t"}; // one nesting level
};

// Quote a string, inverting the lexer's escape table (\\ \" \n \t).
std::string quote(std::string_view s);

// "2.0" for integral values, otherwise the shortest fixed-notation text that reads back
// as the same double. Throws tree_error(type_mismatch) for NaN/infinity.
std::string format_float(double d);

// Render one value at nesting `level` in the script format.
std::string to_script(const node& n, int level, const print_options& opts = {});

// Render a whole document: one `key = value` line per top-level entry, in entry order.
std::string document_to_script(const node& doc, const print_options& opts = {});
inline std::string document_to_script(const node_ptr& doc, const print_options& opts = {}) { return document_to_script(*doc, opts); }

// Compact single-line form for messages and test output.
std::string to_string(const node& n);
inline std::string to_string(const node_ptr& p) { return to_string(*p); }

} // namespace artemis
