// printer.cpp - value tree back to script text
#include "artemis/printer.hpp"
#include "artemis/errors.hpp"
#include <charconv>
#include <cmath>
#include <array>

namespace artemis {

namespace {

std::string repeat(const std::string& unit, int n){
    std::string out;
    for (int i = 0; i < n; ++i) out += unit;
    return out;
}

} // namespace

std::string quote(std::string_view s){
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

std::string format_float(double d){
    if (!std::isfinite(d))
        throw tree_error(tree_errc::type_mismatch, "non-finite float has no script representation");
    std::array<char, 512> buf{};
    std::to_chars_result r;
    if (std::trunc(d) == d)
        r = std::to_chars(buf.data(), buf.data() + buf.size(), d, std::chars_format::fixed, 1);
    else
        r = std::to_chars(buf.data(), buf.data() + buf.size(), d, std::chars_format::fixed);
    if (r.ec != std::errc())
        throw tree_error(tree_errc::type_mismatch, "float does not fit the output buffer");
    return std::string(buf.data(), r.ptr);
}

std::string to_script(const node& n, int level, const print_options& opts){
    const std::string indent = repeat(opts.indent, level);
    const std::string next_indent = indent + opts.indent;

    struct V {
        const std::string& indent; const std::string& next_indent; int level; const print_options& opts;
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return format_float(d); }
        std::string operator()(const std::string& s) const { return quote(s); }
        std::string operator()(const array& a) const {
            if (a.elems.empty()) return "{}";
            std::string out = "{\n" + next_indent;
            bool first = true;
            for (auto& e : a.elems) {
                if (!first) out += ",\n" + next_indent;
                first = false;
                out += to_script(*e, level + 1, opts);
            }
            out += "\n" + indent + "}";
            return out;
        }
        // Nested dictionaries sit on their own lines inside the enclosing braces
        std::string operator()(const dictionary& d) const {
            std::string out = "\n" + next_indent;
            bool first = true;
            for (auto& kv : d.entries) {
                if (!first) out += ",\n" + next_indent;
                first = false;
                out += kv.first + "=" + to_script(*kv.second, level + 1, opts);
            }
            out += "\n" + indent;
            return out;
        }
    };
    return std::visit(V{indent, next_indent, level, opts}, n.data);
}

std::string document_to_script(const node& doc, const print_options& opts){
    const dictionary* d = as_dictionary(doc);
    if (!d)
        throw tree_error(tree_errc::type_mismatch, std::string("document must be a dictionary, got ") + kind_name(doc));
    std::string script;
    for (auto& kv : d->entries) {
        script += kv.first;
        script += " = ";
        script += to_script(*kv.second, 0, opts);
        script += '\n';
    }
    return script;
}

std::string to_string(const node& n){
    struct V {
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return std::isfinite(d) ? format_float(d) : (std::isnan(d) ? "nan" : (d < 0 ? "-inf" : "inf")); }
        std::string operator()(const std::string& s) const { return quote(s); }
        std::string operator()(const array& a) const {
            std::string out = "{";
            bool first = true;
            for (auto& e : a.elems) {
                if (!first) out += ", ";
                first = false;
                out += to_string(*e);
            }
            out += '}';
            return out;
        }
        std::string operator()(const dictionary& d) const {
            std::string out = "[";
            bool first = true;
            for (auto& kv : d.entries) {
                if (!first) out += ", ";
                first = false;
                out += kv.first + "=" + to_string(*kv.second);
            }
            out += ']';
            return out;
        }
    };
    return std::visit(V{}, n.data);
}

} // namespace artemis
