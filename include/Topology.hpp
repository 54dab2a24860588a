#ifndef TOPOLOGY_HPP
#define TOPOLOGY_HPP

#include "CircuitGraph.hpp"
#include "DisjointSet.hpp"
#include <cstddef>

namespace wattsim {

// Terminal t of the component stored at position i owns set id 2*i + t
inline int terminal_key(std::size_t component_index, int terminal) {
    return static_cast<int>(component_index) * 2 + terminal;
}

// One set per terminal, merged across every wire.
// Wires naming a component that is not in the graph are ignored.
DisjointSet build_topology(const CircuitGraph& graph);

} // namespace wattsim

#endif // TOPOLOGY_HPP
