// Node-based value tree for Artemis script AST dumps
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <utility>
#include <cstdint>
#include <initializer_list>

namespace artemis
{

    struct node; // forward declaration

    using node_ptr = std::shared_ptr<node>;

    struct array
    {
        std::vector<node_ptr> elems;
    };

    // Keys are unique; entries keep insertion (source) order.
    struct dictionary
    {
        std::vector<std::pair<std::string, node_ptr>> entries;

        node_ptr find(std::string_view key) const
        {
            for (auto &kv : entries)
                if (kv.first == key)
                    return kv.second;
            return nullptr;
        }
        // Replaces the value of an existing key in place, otherwise appends.
        void insert(std::string key, node_ptr value)
        {
            for (auto &kv : entries)
            {
                if (kv.first == key)
                {
                    kv.second = std::move(value);
                    return;
                }
            }
            entries.emplace_back(std::move(key), std::move(value));
        }
        size_t size() const { return entries.size(); }
        bool empty() const { return entries.empty(); }
    };

    using node_data = std::variant<int64_t, double, std::string, array, dictionary>;

    struct node
    {
        node_data data;
    };

    // Structural deep equality. Dictionary key order is ignored, array order is not.
    bool equal(const node_ptr &a, const node_ptr &b);

    namespace detail
    {
        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d)}); }
    }

    inline bool is_dictionary(const node &n) { return std::holds_alternative<dictionary>(n.data); }

    inline const std::string *as_string(const node &n) { return std::get_if<std::string>(&n.data); }
    inline std::string *as_string(node &n) { return std::get_if<std::string>(&n.data); }
    inline const array *as_array(const node &n) { return std::get_if<array>(&n.data); }
    inline array *as_array(node &n) { return std::get_if<array>(&n.data); }
    inline const dictionary *as_dictionary(const node &n) { return std::get_if<dictionary>(&n.data); }
    inline dictionary *as_dictionary(node &n) { return std::get_if<dictionary>(&n.data); }

    // Human readable variant name, used in error messages.
    inline const char *kind_name(const node &n)
    {
        static_assert(std::variant_size_v<node_data> == 5, "kind_name needs a case for every node kind");
        switch (n.data.index())
        {
        case 0:
            return "integer";
        case 1:
            return "float";
        case 2:
            return "string";
        case 3:
            return "array";
        case 4:
            return "dictionary";
        }
        return "unknown";
    }

    // ------ Factory helpers ------

    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_f64(double v) { return detail::make_node(v); }

    inline node_ptr node_array() { return detail::make_node(array{}); }

    inline node_ptr node_array(std::initializer_list<node_ptr> xs)
    {
        array a;
        a.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(a));
    }
    inline node_ptr node_dict(std::initializer_list<std::pair<std::string, node_ptr>> xs)
    {
        dictionary d;
        for (auto &kv : xs)
            d.insert(kv.first, kv.second);
        return detail::make_node(std::move(d));
    }

    inline std::pair<std::string, node_ptr> kvp(std::string k, node_ptr v) { return {std::move(k), std::move(v)}; }

} // namespace artemis
