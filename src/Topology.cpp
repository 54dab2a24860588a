#include "Topology.hpp"
#include <string>
#include <unordered_map>

namespace wattsim {

DisjointSet build_topology(const CircuitGraph& graph) {
    const auto& components = graph.components();
    DisjointSet sets(static_cast<int>(components.size() * 2));

    std::unordered_map<std::string, std::size_t> position;
    position.reserve(components.size());
    for (std::size_t i = 0; i < components.size(); ++i) {
        position.emplace(components[i].id, i);
    }

    auto key_of = [&](const TerminalRef& ref) -> int {
        auto it = position.find(ref.component_id);
        if (it == position.end() || (ref.terminal != 0 && ref.terminal != 1)) return -1;
        return terminal_key(it->second, ref.terminal);
    };

    for (const auto& w : graph.wires()) {
        int a = key_of(w.start);
        int b = key_of(w.end);
        if (a < 0 || b < 0) continue;
        sets.unite(a, b);
    }
    return sets;
}

} // namespace wattsim
