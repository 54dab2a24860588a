#include "NodeIndex.hpp"
#include "Topology.hpp"
#include <unordered_map>
#include <unordered_set>

namespace wattsim {

NodeIndex::NodeIndex(const CircuitGraph& graph, DisjointSet& sets) {
    const auto& components = graph.components();
    terminal_nodes_.assign(components.size() * 2, kGroundNode);
    if (components.empty()) return;

    // Distinct roots in first-encountered order
    std::vector<int> roots;
    std::unordered_set<int> seen;
    for (std::size_t i = 0; i < components.size(); ++i) {
        for (int t = 0; t < 2; ++t) {
            int root = sets.find(terminal_key(i, t));
            if (seen.insert(root).second) {
                roots.push_back(root);
            }
        }
    }
    distinct_nodes_ = static_cast<int>(roots.size());

    ground_root_ = roots.front();
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (components[i].type() == ComponentType::Battery) {
            int negative = components[i].props<BatteryProps>().negative_terminal;
            ground_root_ = sets.find(terminal_key(i, negative));
            break;
        }
    }

    std::unordered_map<int, int> matrix_index;
    for (int root : roots) {
        matrix_index[root] = (root == ground_root_) ? kGroundNode : free_nodes_++;
    }

    for (std::size_t i = 0; i < components.size(); ++i) {
        for (int t = 0; t < 2; ++t) {
            terminal_nodes_[terminal_key(i, t)] = matrix_index[sets.find(terminal_key(i, t))];
        }
    }
}

} // namespace wattsim
