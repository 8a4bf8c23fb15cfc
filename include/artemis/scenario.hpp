// scenario.hpp - dialogue text extraction, merge and pruning over a parsed script dump
#pragma once
#include "artemis/value.hpp"
#include <string>
#include <vector>

namespace artemis {

using string_list = std::vector<std::string>;

// All three operations walk the same path:
//   ast[] -> wrapper{} -> block_*[] -> item{} .text[] -> text-block{} .ja[] -> line[] -> string
// Keys are visited in dictionary entry order, so two walks over the same document see the
// same leaves in the same order.
//
// Shape checks for extract and merge (tree_error): document not a dictionary or `ast` not an
// array -> type_mismatch, no `ast` -> missing_field, an `ast` element that is not a
// dictionary -> type_mismatch. Anything else off the path is skipped.

// Number of scenario strings the walk visits.
size_t count_scenario_text(const node& doc);

// Scenario strings in walk order.
string_list extract(const node& doc);
inline string_list extract(const node_ptr& doc) { return extract(*doc); }

// Strip every item of every block down to its `linknext`/`line` keys. Items that are not
// dictionaries, or that keep no key, are removed. Nothing above the item level changes.
// Never fails: a document without an `ast` array is left as is.
void prune(node& doc);
inline void prune(const node_ptr& doc) { prune(*doc); }

// Overwrite the visited strings with `lines`, in walk order. The sizes must match exactly:
// fewer lines -> exhausted_input, more -> unused_input. Sizes are checked before anything
// is written, so a failed merge leaves the document unchanged.
void merge(node& doc, const string_list& lines);
inline void merge(const node_ptr& doc, const string_list& lines) { merge(*doc, lines); }

} // namespace artemis
