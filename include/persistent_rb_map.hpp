// persistent_rb_map.hpp
// Ordered map over a persistent red-black tree (see persistent_rb_tree.hpp).
//
// - C++17 header-only.
// - PersistentRBMap holds a single "current" root. put / remove / erase replace that root with the
//   new one returned by the persistent operations; nodes already built are never touched.
// - share() hands out the current root in O(1). The returned snapshot, and any Iter built from it,
//   stays unchanged no matter how the map is mutated afterwards. unshare() adopts a snapshot back.
// - Copying a map copies the root handle only; the copies then evolve independently.
// - size() walks the tree (O(n)); no count is cached.
// - Invariant helpers:
//     * validate_invariants_json(std::string& out_json) const
//         - Validates red-black properties and strict key order.
//         - Produces a JSON object: valid, size, height, black_height, issues, nodes (BFS order).
//     * validate_invariants(std::string* out) const
//         - Human-readable wrapper (validity, JSON, tree dump).
//     * tree_dump(std::ostream& os, bool show_addresses = false) const
//   These require Key to be streamable (operator<<); nothing else does.
//
// Use as:
//   prbt::PersistentRBMap<int, std::string> m;
//   m.put(1, "one");
//   auto snap = m.share();
//   m.remove(1);                                // snap still holds 1 -> "one"
//   for (const auto& kv : prbt::iter(snap, prbt::Direction::bwd)) { ... }
//
//   std::string diag;
//   ASSERT_TRUE(m.validate_invariants(&diag)) << diag;

#ifndef PERSISTENT_RB_MAP_HPP
#define PERSISTENT_RB_MAP_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "persistent_rb_tree.hpp"

namespace prbt {

template <
    typename Key,
    typename T,
    typename Compare = ThreeWayCompare<Key>
>
class PersistentRBMap {
public:
    using key_type      = Key;
    using mapped_type   = T;
    using value_type    = std::pair<const Key, T>;
    using key_compare   = Compare;
    using size_type     = std::size_t;
    using snapshot_type = Tree<Key, T>;
    using iter_type     = Iter<Key, T>;

    explicit PersistentRBMap(const key_compare& comp = key_compare())
        : root_(), comp_(comp) {}

    // lookup
    std::optional<mapped_type> get(const key_type& k) const { return prbt::get(root_, k, comp_); }
    bool contains(const key_type& k) const { return prbt::contains(root_, k, comp_); }

    // Insert or overwrite; returns the previous value.
    std::optional<mapped_type> put(const key_type& k, const mapped_type& v) {
        auto r = prbt::put(root_, k, v, comp_);
        root_ = std::move(r.first);
        return std::move(r.second);
    }

    std::optional<mapped_type> replace(const key_type& k, const mapped_type& v) { return put(k, v); }

    // Removes k if present.
    void erase(const key_type& k) { root_ = prbt::erase(root_, k, comp_); }

    // Removes k, returning the value it was bound to.
    std::optional<mapped_type> remove(const key_type& k) {
        auto r = prbt::remove(root_, k, comp_);
        root_ = std::move(r.first);
        return std::move(r.second);
    }

    // snapshots
    snapshot_type share() const noexcept { return root_; }
    void unshare(snapshot_type t) noexcept { root_ = std::move(t); }

    // iteration over the current root; later mutations are not observed
    iter_type entries() const { return prbt::iter(root_, Direction::fwd); }
    iter_type entries_rev() const { return prbt::iter(root_, Direction::bwd); }

    // capacity
    bool empty() const noexcept { return !root_; }
    size_type size() const { return prbt::size(root_); }
    void clear() noexcept { root_.reset(); }

    const key_compare& key_comp() const noexcept { return comp_; }

    friend bool operator==(const PersistentRBMap& a, const PersistentRBMap& b) {
        return prbt::equal(a.root_, b.root_, a.comp_);
    }
    friend bool operator!=(const PersistentRBMap& a, const PersistentRBMap& b) { return !(a == b); }

    // Produces structured JSON diagnostics in out_json (format documented at prbt::validate).
    // Returns true if invariants hold, false otherwise.
    bool validate_invariants_json(std::string& out_json) const {
        return prbt::validate(root_, comp_, out_json);
    }

    // If out is non-null, fills it with the validity flag, the JSON diagnostics and a tree dump.
    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (!out) return ok;
        std::ostringstream oss;
        oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
        oss << "JSON diagnostics:\n" << json << "\n";
        oss << "Tree dump:\n";
        oss << tree_dump_to_string(false) << "\n";
        *out = oss.str();
        return ok;
    }

    // Pretty-print tree with indentation. Set show_addresses = true to include node addresses.
    void tree_dump(std::ostream& os, bool show_addresses = false) const {
        prbt::dump(root_, os, show_addresses);
    }

    std::string tree_dump_to_string(bool show_addresses = false) const {
        std::ostringstream oss;
        prbt::dump(root_, oss, show_addresses);
        return oss.str();
    }

private:
    snapshot_type root_;
    key_compare comp_;
};

} // namespace prbt

#endif // PERSISTENT_RB_MAP_HPP
