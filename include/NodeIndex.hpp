#ifndef NODEINDEX_HPP
#define NODEINDEX_HPP

#include "CircuitGraph.hpp"
#include "DisjointSet.hpp"
#include <array>
#include <cstddef>
#include <vector>

namespace wattsim {

// Maps every terminal of one solve to a dense matrix index.
// Ground is the node under the first battery's negative pole, or the first
// node seen when the graph has no battery; it maps to kGroundNode.
class NodeIndex {
public:
    NodeIndex(const CircuitGraph& graph, DisjointSet& sets);

    int node_of(std::size_t component_index, int terminal) const {
        return terminal_nodes_[component_index * 2 + terminal];
    }
    std::array<int, 2> nodes_of(std::size_t component_index) const {
        return {{node_of(component_index, 0), node_of(component_index, 1)}};
    }

    int free_node_count() const { return free_nodes_; }
    int distinct_node_count() const { return distinct_nodes_; }
    int ground_root() const { return ground_root_; }

private:
    std::vector<int> terminal_nodes_;
    int free_nodes_ = 0;
    int distinct_nodes_ = 0;
    int ground_root_ = -1;
};

} // namespace wattsim

#endif // NODEINDEX_HPP
