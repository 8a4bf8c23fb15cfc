// Structural equality for value trees.
#include "artemis/value.hpp"
#include <vector>

namespace artemis {

static bool equal_impl(const node_ptr& a, const node_ptr& b) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->data.index() != b->data.index()) return false;

	struct Visitor {
		const node_ptr& a; const node_ptr& b;
		bool operator()(int64_t) const { return std::get<int64_t>(a->data) == std::get<int64_t>(b->data); }
		bool operator()(double) const { return std::get<double>(a->data) == std::get<double>(b->data); }
		bool operator()(const std::string&) const { return std::get<std::string>(a->data) == std::get<std::string>(b->data); }
		bool operator()(const array&) const {
			const auto& le = std::get<array>(a->data).elems;
			const auto& re = std::get<array>(b->data).elems;
			if (le.size() != re.size()) return false;
			for (size_t i = 0; i < le.size(); ++i) if (!equal_impl(le[i], re[i])) return false;
			return true;
		}
		// keys are unique, so a lookup per entry is enough
		bool operator()(const dictionary&) const {
			const auto& ld = std::get<dictionary>(a->data);
			const auto& rd = std::get<dictionary>(b->data);
			if (ld.size() != rd.size()) return false;
			for (const auto& kv : ld.entries) {
				auto other = rd.find(kv.first);
				if (!other || !equal_impl(kv.second, other)) return false;
			}
			return true;
		}
	};

	return std::visit(Visitor{a, b}, a->data);
}

bool equal(const node_ptr& a, const node_ptr& b) { return equal_impl(a, b); }

} // namespace artemis
