#ifndef MNASOLVER_HPP
#define MNASOLVER_HPP

#include "CircuitGraph.hpp"
#include "LinearSolver.hpp"
#include "NodeIndex.hpp"
#include "SolverOptions.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace wattsim {

struct StepReport {
    int distinct_nodes = 0;
    int free_nodes = 0;
    int active_sources = 0;
    int matrix_size = 0;
    int ground_root = -1;
    int singular_columns = 0;
    bool solved = false; // false when the graph has no free node and assembly was skipped
    std::vector<double> node_voltages; // indexed by free node index; ground is 0 V

    double voltage_at(int node) const { return node == kGroundNode ? 0.0 : node_voltages[node]; }
    nlohmann::json to_json() const;
};

// One simulation step over a circuit graph: topology, node indexing, MNA assembly,
// dense solve and state update. Raises no exceptions for any graph shape.
class MNASolver {
public:
    explicit MNASolver(CircuitGraph& graph, const SolverOptions& options = SolverOptions());

    StepReport solve();

    // Unknowns: free node voltages, then one branch current per non-burnt battery
    // in stored order. Exposed for tests and diagnostics.
    void assemble_system(const NodeIndex& nodes, LinearSolver::Matrix& A, LinearSolver::Vector& b) const;
    int get_matrix_size(const NodeIndex& nodes) const;

    const SolverOptions& options() const { return options_; }
    void set_options(const SolverOptions& options) { options_ = options; }

private:
    // Row of each battery's branch current, -1 for everything else
    std::vector<int> source_rows(const NodeIndex& nodes) const;

    CircuitGraph& graph_;
    SolverOptions options_;
};

} // namespace wattsim

#endif // MNASOLVER_HPP
