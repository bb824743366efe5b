// Examples for PersistentRBMap.
//
// Example 1: put / remove / get and ordered iteration.
// Example 2: a shared snapshot does not see later mutations of the map.
// Example 3: structural sharing, shown with node addresses in the tree dump.

#include <iostream>
#include <string>

#include "persistent_rb_map.hpp"

namespace {

template <typename K, typename V>
void print_entries(const char* label, prbt::Iter<K, V> it) {
    std::cout << label << ":";
    for (const auto& kv : it) std::cout << " (" << kv.first << "," << kv.second << ")";
    std::cout << "\n";
}

} // namespace

int main() {
    using Map = prbt::PersistentRBMap<int, std::string>;
    {
        std::cout << "Example 1: put / remove / get\n";
        Map m;
        m.put(1, "one");
        m.put(2, "two");
        m.put(3, "three");
        print_entries("entries", m.entries());

        auto removed = m.remove(2);
        std::cout << "remove(2) -> " << (removed ? *removed : std::string("<none>")) << "\n";
        print_entries("entries", m.entries());
        print_entries("entries_rev", m.entries_rev());
        std::cout << "get(2) -> " << (m.get(2) ? *m.get(2) : std::string("<none>")) << "\n";
    }

    {
        std::cout << "\nExample 2: snapshot isolation\n";
        Map m;
        for (int i = 1; i <= 5; ++i) m.put(i, "v" + std::to_string(i));
        auto before = m.share();
        m.put(6, "v6");
        m.erase(1);
        print_entries("snapshot", prbt::iter(before, prbt::Direction::fwd));
        print_entries("current ", m.entries());
        std::cout << "size(snapshot)=" << prbt::size(before) << " size(current)=" << m.size() << "\n";
    }

    {
        std::cout << "\nExample 3: structural sharing\n";
        Map m;
        for (int i = 0; i < 7; ++i) m.put(i, std::to_string(i));
        auto before = m.share();
        m.put(6, "six");
        std::cout << "before:\n";
        prbt::dump(before, std::cout, true);
        std::cout << "after put(6):\n";
        m.tree_dump(std::cout, true);

        std::string diag;
        bool ok = m.validate_invariants(&diag);
        std::cout << "invariants hold? " << (ok ? "yes" : "no") << "\n";
        if (!ok) {
            std::cout << diag;
            return 1;
        }
    }

    return 0;
}
