// persistent_rb_tree.hpp
// Persistent (immutable-spine) red-black tree with structural sharing.
//
// - C++17 header-only.
// - A tree is a Tree<K,V> handle (std::shared_ptr<const Node<K,V>>); an empty handle is a leaf.
//   Nodes are never modified after construction. Every mutation returns a new root that shares
//   all untouched subtrees with the old one, so any previously obtained root is a stable snapshot.
// - Ordering comes from a three-way comparator returning prbt::Order.
// - Insertion uses the Okasaki balance patterns; deletion physically unlinks the node and
//   repairs the black-height deficit with bal_left / bal_right / append (Kahrs).
//
// Free functions (all take the snapshot by const reference):
//     get / contains / put / replace / remove / erase
//     iter(tree, Direction::fwd|bwd) -> Iter<K,V>   lazy, single-pass
//     size, height, black_height, fold_left, fold_right, map_values, equal
//     validate(tree, cmp, out_json) / dump(tree, os)  diagnostics, need operator<< for Key
//
// Use as:
//   prbt::Tree<int, std::string> t;
//   prbt::ThreeWayCompare<int> cmp;
//   t = prbt::put(t, 3, std::string("three"), cmp).first;
//   for (const auto& kv : prbt::iter(t, prbt::Direction::fwd)) { ... }

#ifndef PERSISTENT_RB_TREE_HPP
#define PERSISTENT_RB_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace prbt {

enum class Order { less, equal, greater };

// Default comparator: derives a three-way order from operator<.
template <typename T>
struct ThreeWayCompare {
    Order operator()(const T& a, const T& b) const {
        if (a < b) return Order::less;
        if (b < a) return Order::greater;
        return Order::equal;
    }
};

enum Color { RED = 1, BLACK = 0 };

enum class Direction { fwd, bwd };

// Raised when rebalancing meets a shape no valid red-black tree can produce.
class invariant_error : public std::logic_error {
public:
    explicit invariant_error(const std::string& what) : std::logic_error(what) {}
};

template <typename K, typename V>
struct Node;

template <typename K, typename V>
using Tree = std::shared_ptr<const Node<K, V>>;

template <typename K, typename V>
struct Node {
    using value_type = std::pair<const K, V>;

    Color color;
    Tree<K, V> left;
    value_type entry;
    Tree<K, V> right;

    Node(Color c, Tree<K, V> l, const value_type& e, Tree<K, V> r)
        : color(c), left(std::move(l)), entry(e), right(std::move(r)) {}
};

namespace detail {

// keeps key arguments out of template deduction so get(t, "a", cmp) works for string keys
template <typename T>
struct type_identity { using type = T; };

template <typename T>
using non_deduced_t = typename type_identity<T>::type;

template <typename K, typename V>
struct TreeOps {
    using tree_type  = Tree<K, V>;
    using node_type  = Node<K, V>;
    using entry_type = typename node_type::value_type;

    static tree_type node(Color c, tree_type l, const entry_type& x, tree_type r) {
        return std::make_shared<node_type>(c, std::move(l), x, std::move(r));
    }

    static bool is_red(const tree_type& t) noexcept { return t && t->color == RED; }

    // true only for a black *node*; a leaf is black too but is not matched here
    static bool is_black_node(const tree_type& t) noexcept { return t && t->color == BLACK; }

    static tree_type recolor(const tree_type& t, Color c) {
        if (t->color == c) return t;
        return node(c, t->left, t->entry, t->right);
    }

    static tree_type blacken_root(const tree_type& t) {
        if (is_red(t)) return recolor(t, BLACK);
        return t;
    }

    // Rebuild a black node whose left subtree may start with a red-red chain.
    static tree_type lbalance(const tree_type& left, const entry_type& x, const tree_type& right) {
        if (is_red(left)) {
            if (is_red(left->left)) {
                const tree_type& ll = left->left;
                return node(RED, node(BLACK, ll->left, ll->entry, ll->right), left->entry,
                            node(BLACK, left->right, x, right));
            }
            if (is_red(left->right)) {
                const tree_type& lr = left->right;
                return node(RED, node(BLACK, left->left, left->entry, lr->left), lr->entry,
                            node(BLACK, lr->right, x, right));
            }
        }
        return node(BLACK, left, x, right);
    }

    // Mirror of lbalance.
    static tree_type rbalance(const tree_type& left, const entry_type& x, const tree_type& right) {
        if (is_red(right)) {
            if (is_red(right->left)) {
                const tree_type& rl = right->left;
                return node(RED, node(BLACK, left, x, rl->left), rl->entry,
                            node(BLACK, rl->right, right->entry, right->right));
            }
            if (is_red(right->right)) {
                const tree_type& rr = right->right;
                return node(RED, node(BLACK, left, x, right->left), right->entry,
                            node(BLACK, rr->left, rr->entry, rr->right));
            }
        }
        return node(BLACK, left, x, right);
    }

    template <typename Compare>
    static tree_type ins(const tree_type& t, const K& key, const V& value, const Compare& cmp,
                         std::optional<V>& prev) {
        if (!t) return node(RED, nullptr, entry_type(key, value), nullptr);
        switch (cmp(key, t->entry.first)) {
            case Order::less: {
                tree_type l = ins(t->left, key, value, cmp, prev);
                if (t->color == BLACK) return lbalance(l, t->entry, t->right);
                return node(RED, std::move(l), t->entry, t->right);
            }
            case Order::greater: {
                tree_type r = ins(t->right, key, value, cmp, prev);
                if (t->color == BLACK) return rbalance(t->left, t->entry, r);
                return node(RED, t->left, t->entry, std::move(r));
            }
            case Order::equal:
                prev = t->entry.second;
                return node(t->color, t->left, entry_type(key, value), t->right);
        }
        throw invariant_error("put: comparator returned an unknown order");
    }

    static tree_type redden(const tree_type& t) {
        if (is_black_node(t)) return node(RED, t->left, t->entry, t->right);
        throw invariant_error("redden: expected a black node");
    }

    // `left` is one black level short of `right`.
    static tree_type bal_left(const tree_type& left, const entry_type& x, const tree_type& right) {
        if (is_red(left)) return node(RED, recolor(left, BLACK), x, right);
        if (is_black_node(right)) return rbalance(left, x, recolor(right, RED));
        if (is_red(right) && is_black_node(right->left)) {
            const tree_type& rl = right->left;
            return node(RED, node(BLACK, left, x, rl->left), rl->entry,
                        rbalance(rl->right, right->entry, redden(right->right)));
        }
        throw invariant_error("bal_left: sibling subtree has an impossible shape");
    }

    // `right` is one black level short of `left`.
    static tree_type bal_right(const tree_type& left, const entry_type& x, const tree_type& right) {
        if (is_red(right)) return node(RED, left, x, recolor(right, BLACK));
        if (is_black_node(left)) return lbalance(recolor(left, RED), x, right);
        if (is_red(left) && is_black_node(left->right)) {
            const tree_type& lr = left->right;
            return node(RED, lbalance(redden(left->left), left->entry, lr->left), lr->entry,
                        node(BLACK, lr->right, x, right));
        }
        throw invariant_error("bal_right: sibling subtree has an impossible shape");
    }

    // Join the two children of a removed node; every key of `left` precedes every key of `right`.
    static tree_type append(const tree_type& left, const tree_type& right) {
        if (!left) return right;
        if (!right) return left;
        if (is_red(left) && is_red(right)) {
            tree_type mid = append(left->right, right->left);
            if (is_red(mid)) {
                return node(RED, node(RED, left->left, left->entry, mid->left), mid->entry,
                            node(RED, mid->right, right->entry, right->right));
            }
            return node(RED, left->left, left->entry, node(RED, std::move(mid), right->entry, right->right));
        }
        if (is_red(right)) return node(RED, append(left, right->left), right->entry, right->right);
        if (is_red(left)) return node(RED, left->left, left->entry, append(left->right, right));
        tree_type mid = append(left->right, right->left);
        if (is_red(mid)) {
            return node(RED, node(BLACK, left->left, left->entry, mid->left), mid->entry,
                        node(BLACK, mid->right, right->entry, right->right));
        }
        return bal_left(left->left, left->entry, node(BLACK, std::move(mid), right->entry, right->right));
    }

    template <typename Compare>
    static tree_type del(const tree_type& t, const K& key, const Compare& cmp, std::optional<V>& prev) {
        if (!t) return t;
        switch (cmp(key, t->entry.first)) {
            case Order::less: {
                tree_type l = del(t->left, key, cmp, prev);
                if (is_black_node(t->left)) return bal_left(l, t->entry, t->right);
                return node(RED, std::move(l), t->entry, t->right);
            }
            case Order::greater: {
                tree_type r = del(t->right, key, cmp, prev);
                if (is_black_node(t->right)) return bal_right(t->left, t->entry, r);
                return node(RED, t->left, t->entry, std::move(r));
            }
            case Order::equal:
                prev = t->entry.second;
                return append(t->left, t->right);
        }
        throw invariant_error("remove: comparator returned an unknown order");
    }

    template <typename A, typename F>
    static A fold_left(const tree_type& t, A acc, F& f) {
        if (!t) return acc;
        acc = fold_left(t->left, std::move(acc), f);
        acc = f(std::move(acc), t->entry.first, t->entry.second);
        return fold_left(t->right, std::move(acc), f);
    }

    template <typename A, typename F>
    static A fold_right(const tree_type& t, A acc, F& f) {
        if (!t) return acc;
        acc = fold_right(t->right, std::move(acc), f);
        acc = f(t->entry.first, t->entry.second, std::move(acc));
        return fold_right(t->left, std::move(acc), f);
    }
};

template <typename K, typename V, typename W, typename F>
Tree<K, W> map_values_rec(const Tree<K, V>& t, F& f) {
    if (!t) return nullptr;
    Tree<K, W> l = map_values_rec<K, V, W>(t->left, f);
    std::pair<const K, W> e(t->entry.first, f(t->entry.first, t->entry.second));
    Tree<K, W> r = map_values_rec<K, V, W>(t->right, f);
    return std::make_shared<Node<K, W>>(t->color, std::move(l), e, std::move(r));
}

// utility: convert pointer to hex string
inline std::string pointer_to_hex(const void* p) {
    std::ostringstream oss;
    oss << "0x" << std::hex << reinterpret_cast<std::uintptr_t>(p) << std::dec;
    return oss.str();
}

// utility: escape string for JSON and wrap in quotes
inline std::string json_escape_and_quote(const std::string& s) {
    std::ostringstream o;
    o << "\"";
    for (char c : s) {
        switch (c) {
            case '\"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u00" << std::hex << (static_cast<int>(c) >> 4) << (static_cast<int>(c) & 0xf) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    o << "\"";
    return o.str();
}

// helper: stream a key into a string (requires operator<<)
template <typename K>
std::string key_to_string(const K& k) {
    std::ostringstream oss;
    oss << k;
    return oss.str();
}

} // namespace detail

// ---------------------------
// Lookup
// ---------------------------

template <typename K, typename V, typename Compare>
std::optional<V> get(const Tree<K, V>& t, const detail::non_deduced_t<K>& key, const Compare& cmp) {
    const Node<K, V>* x = t.get();
    while (x) {
        switch (cmp(key, x->entry.first)) {
            case Order::less: x = x->left.get(); break;
            case Order::greater: x = x->right.get(); break;
            case Order::equal: return x->entry.second;
        }
    }
    return std::nullopt;
}

template <typename K, typename V, typename Compare>
bool contains(const Tree<K, V>& t, const detail::non_deduced_t<K>& key, const Compare& cmp) {
    const Node<K, V>* x = t.get();
    while (x) {
        switch (cmp(key, x->entry.first)) {
            case Order::less: x = x->left.get(); break;
            case Order::greater: x = x->right.get(); break;
            case Order::equal: return true;
        }
    }
    return false;
}

// ---------------------------
// Mutation (returns a new root, the argument is left untouched)
// ---------------------------

// Insert or overwrite. Returns the new root and the value previously bound to key, if any.
template <typename K, typename V, typename Compare>
std::pair<Tree<K, V>, std::optional<V>> put(const Tree<K, V>& t, const detail::non_deduced_t<K>& key,
                                            const detail::non_deduced_t<V>& value, const Compare& cmp) {
    std::optional<V> prev;
    Tree<K, V> r = detail::TreeOps<K, V>::ins(t, key, value, cmp, prev);
    return { detail::TreeOps<K, V>::blacken_root(r), std::move(prev) };
}

template <typename K, typename V, typename Compare>
std::pair<Tree<K, V>, std::optional<V>> replace(const Tree<K, V>& t, const detail::non_deduced_t<K>& key,
                                                const detail::non_deduced_t<V>& value, const Compare& cmp) {
    return prbt::put(t, key, value, cmp);
}

// Physically removes key. When key is absent the very same root is returned.
template <typename K, typename V, typename Compare>
std::pair<Tree<K, V>, std::optional<V>> remove(const Tree<K, V>& t, const detail::non_deduced_t<K>& key,
                                               const Compare& cmp) {
    std::optional<V> prev;
    Tree<K, V> r = detail::TreeOps<K, V>::del(t, key, cmp, prev);
    if (!prev) return { t, std::nullopt };
    return { detail::TreeOps<K, V>::blacken_root(r), std::move(prev) };
}

template <typename K, typename V, typename Compare>
Tree<K, V> erase(const Tree<K, V>& t, const detail::non_deduced_t<K>& key, const Compare& cmp) {
    return prbt::remove(t, key, cmp).first;
}

// ---------------------------
// Iteration
// ---------------------------

// Lazy in-order walk over a snapshot. Holds the snapshot root, so the walk is unaffected by
// later mutations of whatever map the root came from. Single-pass: call iter() again to restart.
template <typename K, typename V>
class Iter {
public:
    using value_type = std::pair<const K, V>;
    using tree_type  = Tree<K, V>;

    class iterator {
        friend class Iter;
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Iter::value_type;
        using reference         = const value_type&;
        using pointer           = const value_type*;
        using difference_type   = std::ptrdiff_t;

        iterator() noexcept : owner_(nullptr), cur_(nullptr) {}
        reference operator*() const { return *cur_; }
        pointer operator->() const { return cur_; }

        iterator& operator++() { cur_ = owner_->next(); return *this; }
        void operator++(int) { ++(*this); }

        bool operator==(const iterator& o) const { return cur_ == o.cur_; }
        bool operator!=(const iterator& o) const { return cur_ != o.cur_; }

    private:
        Iter* owner_;
        pointer cur_;
        iterator(Iter* o, pointer c) noexcept : owner_(o), cur_(c) {}
    };

    Iter(tree_type root, Direction dir) : root_(std::move(root)), dir_(dir) {
        work_.push_back(Item{ root_, false });
    }

    // Next entry in walk order, or nullptr once exhausted. The pointer stays valid while this
    // iterator (and so the snapshot) is alive.
    const value_type* next() {
        while (!work_.empty()) {
            Item item = std::move(work_.back());
            work_.pop_back();
            if (!item.tree) continue;
            if (item.yield) return &item.tree->entry;
            // work_ is a stack: push in reverse visiting order
            if (dir_ == Direction::fwd) {
                work_.push_back(Item{ item.tree->right, false });
                work_.push_back(Item{ item.tree, true });
                work_.push_back(Item{ item.tree->left, false });
            } else {
                work_.push_back(Item{ item.tree->left, false });
                work_.push_back(Item{ item.tree, true });
                work_.push_back(Item{ item.tree->right, false });
            }
        }
        return nullptr;
    }

    iterator begin() { return iterator(this, next()); }
    iterator end() noexcept { return iterator(this, nullptr); }

    Direction direction() const noexcept { return dir_; }

private:
    struct Item {
        tree_type tree;
        bool yield;
    };

    tree_type root_;
    Direction dir_;
    std::vector<Item> work_;
};

template <typename K, typename V>
Iter<K, V> iter(const Tree<K, V>& t, Direction dir) {
    return Iter<K, V>(t, dir);
}

// ---------------------------
// Size, shape and folds
// ---------------------------

template <typename K, typename V>
std::size_t size(const Tree<K, V>& t) {
    if (!t) return 0;
    return prbt::size(t->left) + 1 + prbt::size(t->right);
}

template <typename K, typename V>
std::size_t height(const Tree<K, V>& t) {
    if (!t) return 0;
    std::size_t l = prbt::height(t->left);
    std::size_t r = prbt::height(t->right);
    return 1 + (l > r ? l : r);
}

// Black nodes on the leftmost path. Equals the black-height of every path in a valid tree.
template <typename K, typename V>
std::size_t black_height(const Tree<K, V>& t) {
    std::size_t bh = 0;
    for (const Node<K, V>* x = t.get(); x; x = x->left.get()) {
        if (x->color == BLACK) ++bh;
    }
    return bh;
}

// Ascending fold: acc = f(acc, key, value).
template <typename K, typename V, typename A, typename F>
A fold_left(const Tree<K, V>& t, A init, F f) {
    return detail::TreeOps<K, V>::fold_left(t, std::move(init), f);
}

// Descending fold: acc = f(key, value, acc).
template <typename K, typename V, typename A, typename F>
A fold_right(const Tree<K, V>& t, A init, F f) {
    return detail::TreeOps<K, V>::fold_right(t, std::move(init), f);
}

// Same shape and colors, values replaced by f(key, value).
template <typename K, typename V, typename F>
auto map_values(const Tree<K, V>& t, F f)
    -> Tree<K, std::decay_t<std::invoke_result_t<F&, const K&, const V&>>> {
    using W = std::decay_t<std::invoke_result_t<F&, const K&, const V&>>;
    return detail::map_values_rec<K, V, W>(t, f);
}

// Same key set with equal values; shapes may differ.
template <typename K, typename V, typename Compare, typename ValueEq = std::equal_to<V>>
bool equal(const Tree<K, V>& a, const Tree<K, V>& b, const Compare& cmp, ValueEq value_eq = ValueEq()) {
    if (a == b) return true;
    Iter<K, V> ia(a, Direction::fwd);
    Iter<K, V> ib(b, Direction::fwd);
    for (;;) {
        const auto* x = ia.next();
        const auto* y = ib.next();
        if (!x || !y) return !x && !y;
        if (cmp(x->first, y->first) != Order::equal) return false;
        if (!value_eq(x->second, y->second)) return false;
    }
}

// ---------------------------
// Diagnostics
// ---------------------------

// validate:
// Checks the red-black invariants of a snapshot and produces structured JSON diagnostics.
// Returns true if they hold.
//
// JSON structure:
// {
//   "valid": true|false,
//   "size": n,
//   "height": h,
//   "black_height": bh,
//   "issues": [ "..." , ... ],
//   "nodes": [
//       { "key": "...", "color":"RED"|"BLACK", "left":"..."|null, "right":"..."|null, "addr": "0x..." },
//       ...
//   ]
// }
template <typename K, typename V, typename Compare>
bool validate(const Tree<K, V>& root, const Compare& cmp, std::string& out_json) {
    using node_type = Node<K, V>;
    std::vector<std::string> issues;
    bool valid = true;
    long root_black_height = 0;

    if (root && root->color != BLACK) {
        issues.push_back("root is not black");
        valid = false;
    }

    // returns the black-height of node, or -1 once an issue was recorded
    std::function<long(const node_type*, const K*, const K*)> validate_node;
    validate_node = [&](const node_type* node, const K* min_key, const K* max_key) -> long {
        if (!node) return 0;
        const K& key = node->entry.first;

        // strict BST order
        if (min_key && cmp(key, *min_key) != Order::greater) {
            std::ostringstream oss;
            oss << "BST violation: node " << detail::key_to_string(key) << " not above lower bound "
                << detail::key_to_string(*min_key);
            issues.push_back(oss.str());
            return -1;
        }
        if (max_key && cmp(key, *max_key) != Order::less) {
            std::ostringstream oss;
            oss << "BST violation: node " << detail::key_to_string(key) << " not below upper bound "
                << detail::key_to_string(*max_key);
            issues.push_back(oss.str());
            return -1;
        }

        // red property
        if (node->color == RED) {
            if (node->left && node->left->color == RED) {
                std::ostringstream oss;
                oss << "Red violation: node " << detail::key_to_string(key) << " and left child both red";
                issues.push_back(oss.str());
                return -1;
            }
            if (node->right && node->right->color == RED) {
                std::ostringstream oss;
                oss << "Red violation: node " << detail::key_to_string(key) << " and right child both red";
                issues.push_back(oss.str());
                return -1;
            }
        }

        long left = validate_node(node->left.get(), min_key, &key);
        if (left < 0) return -1;
        long right = validate_node(node->right.get(), &key, max_key);
        if (right < 0) return -1;

        if (left != right) {
            std::ostringstream oss;
            oss << "Black-height mismatch at key " << detail::key_to_string(key)
                << " left_bh=" << left << " right_bh=" << right;
            issues.push_back(oss.str());
            return -1;
        }
        return left + (node->color == BLACK ? 1 : 0);
    };

    long bh = validate_node(root.get(), nullptr, nullptr);
    if (bh < 0) valid = false;
    else root_black_height = bh;

    // Build node list (BFS for deterministic ordering)
    std::vector<std::string> node_jsons;
    std::size_t counted = 0;
    if (root) {
        std::queue<const node_type*> q;
        q.push(root.get());
        while (!q.empty()) {
            const node_type* n = q.front(); q.pop();
            ++counted;
            std::ostringstream nj;
            nj << "{";
            nj << "\"key\":" << detail::json_escape_and_quote(detail::key_to_string(n->entry.first)) << ",";
            nj << "\"color\":\"" << (n->color == RED ? "RED" : "BLACK") << "\",";
            if (n->left) nj << "\"left\":" << detail::json_escape_and_quote(detail::key_to_string(n->left->entry.first)) << ",";
            else nj << "\"left\":null,";
            if (n->right) nj << "\"right\":" << detail::json_escape_and_quote(detail::key_to_string(n->right->entry.first)) << ",";
            else nj << "\"right\":null,";
            // pointer address, shows which subtrees two snapshots share
            nj << "\"addr\":\"" << detail::pointer_to_hex(n) << "\"";
            nj << "}";
            node_jsons.push_back(nj.str());
            if (n->left) q.push(n->left.get());
            if (n->right) q.push(n->right.get());
        }
    }

    std::ostringstream out;
    out << "{";
    out << "\"valid\":" << (valid ? "true" : "false") << ",";
    out << "\"size\":" << counted << ",";
    out << "\"height\":" << prbt::height(root) << ",";
    out << "\"black_height\":" << root_black_height << ",";
    out << "\"issues\":[";
    for (std::size_t i = 0; i < issues.size(); ++i) {
        out << detail::json_escape_and_quote(issues[i]);
        if (i + 1 < issues.size()) out << ",";
    }
    out << "],";
    out << "\"nodes\":[";
    for (std::size_t i = 0; i < node_jsons.size(); ++i) {
        out << node_jsons[i];
        if (i + 1 < node_jsons.size()) out << ",";
    }
    out << "]";
    out << "}";
    out_json = out.str();
    return valid && issues.empty();
}

// Pretty-print a snapshot with indentation. show_addresses adds node addresses, which makes
// structural sharing between snapshots visible.
template <typename K, typename V>
void dump(const Tree<K, V>& root, std::ostream& os, bool show_addresses = false) {
    using node_type = Node<K, V>;
    if (!root) {
        os << "<empty tree>\n";
        return;
    }
    std::function<void(const node_type*, const std::string&)> print_node =
        [&](const node_type* n, const std::string& indent) {
            if (!n) {
                os << indent << "(leaf)\n";
                return;
            }
            os << indent << (n->color == RED ? "R " : "B ");
            os << detail::key_to_string(n->entry.first);
            if (show_addresses) os << " @" << detail::pointer_to_hex(n);
            os << "\n";
            print_node(n->left.get(), indent + "  L-");
            print_node(n->right.get(), indent + "  R-");
        };
    print_node(root.get(), "");
}

} // namespace prbt

#endif // PERSISTENT_RB_TREE_HPP
