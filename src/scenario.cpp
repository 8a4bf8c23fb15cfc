// scenario.cpp - extract / merge / prune
#include "artemis/scenario.hpp"
#include "artemis/errors.hpp"
#include "artemis/config.hpp"
#include <algorithm>
#include <cstdio>
#include <string_view>
#include <utility>

namespace artemis {

namespace {

constexpr std::string_view kBlockPrefix = "block_";

bool is_block_key(const std::string& k){ return k.compare(0, kBlockPrefix.size(), kBlockPrefix) == 0; }

// Validated `ast` array; works for both const and mutable documents.
template<typename Node>
auto& ast_blocks(Node& doc){
    auto* top = as_dictionary(doc);
    if (!top)
        throw tree_error(tree_errc::type_mismatch, std::string("document must be a dictionary, got ") + kind_name(doc));
    auto ast = top->find("ast");
    if (!ast)
        throw tree_error(tree_errc::missing_field, "document has no 'ast' field");
    auto* blocks = as_array(*ast);
    if (!blocks)
        throw tree_error(tree_errc::type_mismatch, std::string("'ast' must be an array, got ") + kind_name(*ast));
    for (size_t i = 0; i < blocks->elems.size(); ++i) {
        if (!is_dictionary(*blocks->elems[i]))
            throw tree_error(tree_errc::type_mismatch, "ast[" + std::to_string(i) + "] must be a dictionary, got " + kind_name(*blocks->elems[i]));
    }
    return *blocks;
}

// Calls fn(items_array) for each block_* entry holding an array. Non-dictionary wrappers are skipped.
template<typename Blocks, typename Fn>
void for_each_block_in(Blocks& blocks, Fn&& fn){
    for (auto& wrapper : blocks.elems) {
        auto* w = as_dictionary(*wrapper);
        if (!w) continue;
        for (auto& kv : w->entries) {
            if (!is_block_key(kv.first)) continue;
            if (auto* items = as_array(*kv.second)) fn(*items);
        }
    }
}

template<typename Node, typename Fn>
void for_each_block(Node& doc, Fn&& fn){
    for_each_block_in(ast_blocks(doc), std::forward<Fn>(fn));
}

// The `ast` array if the document has one; prune leaves other shapes alone.
array* find_ast_blocks(node& doc){
    auto* top = as_dictionary(doc);
    if (!top) return nullptr;
    auto ast = top->find("ast");
    return ast ? as_array(*ast) : nullptr;
}

// Visits every scenario string in walk order. The cursor is passed to `visit` by value and
// the advanced cursor it returns is threaded into the next call; the final cursor is returned.
template<typename Node, typename Visit>
size_t walk_scenario(Node& doc, size_t cursor, Visit visit){
    for_each_block(doc, [&](auto& items){
        for (auto& item : items.elems) {
            auto* rec = as_dictionary(*item);
            if (!rec) continue;
            auto text = rec->find("text");
            if (!text) continue;
            auto* text_blocks = as_array(*text);
            if (!text_blocks) continue;
            for (auto& tb : text_blocks->elems) {
                auto* tbd = as_dictionary(*tb);
                if (!tbd) continue;
                auto ja = tbd->find("ja");
                if (!ja) continue;
                auto* lines = as_array(*ja);
                if (!lines) continue;
                for (auto& line : lines->elems) {
                    auto* parts = as_array(*line);
                    if (!parts) continue;
                    for (auto& part : parts->elems) {
                        if (auto* s = as_string(*part)) cursor = visit(*s, cursor);
                    }
                }
            }
        }
    });
    return cursor;
}

} // namespace

size_t count_scenario_text(const node& doc){
    return walk_scenario(doc, 0, [](const std::string&, size_t c){ return c + 1; });
}

string_list extract(const node& doc){
    string_list out;
    walk_scenario(doc, 0, [&out](const std::string& s, size_t c){ out.push_back(s); return c + 1; });
    if (trace_enabled())
        std::fprintf(stderr, "[dbg][extract] %zu scenario strings\n", out.size());
    return out;
}

void merge(node& doc, const string_list& lines){
    const size_t needed = count_scenario_text(doc);
    if (lines.size() < needed)
        throw tree_error(tree_errc::exhausted_input, "ran out of strings: document has " + std::to_string(needed) + " scenario strings, got " + std::to_string(lines.size()));
    if (lines.size() > needed)
        throw tree_error(tree_errc::unused_input, "not all strings were used: document has " + std::to_string(needed) + " scenario strings, got " + std::to_string(lines.size()));
    walk_scenario(doc, 0, [&lines](std::string& s, size_t c){ s = lines[c]; return c + 1; });
    if (trace_enabled())
        std::fprintf(stderr, "[dbg][merge] replaced %zu scenario strings\n", needed);
}

void prune(node& doc){
    size_t dropped = 0, kept = 0;
    array* blocks = find_ast_blocks(doc);
    if (!blocks) {
        if (trace_enabled())
            std::fprintf(stderr, "[dbg][prune] no ast array, nothing to prune\n");
        return;
    }
    for_each_block_in(*blocks, [&](array& items){
        for (auto& item : items.elems) {
            if (auto* rec = as_dictionary(*item)) {
                auto& e = rec->entries;
                e.erase(std::remove_if(e.begin(), e.end(), [](const auto& kv){ return kv.first != "linknext" && kv.first != "line"; }), e.end());
            }
        }
        const size_t before = items.elems.size();
        items.elems.erase(std::remove_if(items.elems.begin(), items.elems.end(), [](const node_ptr& it){
            const dictionary* rec = as_dictionary(*it);
            return !rec || rec->empty();
        }), items.elems.end());
        dropped += before - items.elems.size();
        kept += items.elems.size();
    });
    if (trace_enabled())
        std::fprintf(stderr, "[dbg][prune] kept %zu items, dropped %zu\n", kept, dropped);
}

} // namespace artemis
