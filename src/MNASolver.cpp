#include "MNASolver.hpp"
#include "ComponentModel.hpp"
#include "Topology.hpp"
#include <utility>

namespace wattsim {

nlohmann::json StepReport::to_json() const {
    nlohmann::json j;
    j["distinctNodes"] = distinct_nodes;
    j["freeNodes"] = free_nodes;
    j["activeSources"] = active_sources;
    j["matrixSize"] = matrix_size;
    j["singularColumns"] = singular_columns;
    j["solved"] = solved;
    j["nodeVoltages"] = node_voltages;
    return j;
}

MNASolver::MNASolver(CircuitGraph& graph, const SolverOptions& options)
    : graph_(graph), options_(options) {}

std::vector<int> MNASolver::source_rows(const NodeIndex& nodes) const {
    const auto& components = graph_.components();
    std::vector<int> rows(components.size(), -1);
    int next = nodes.free_node_count();
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (components[i].type() == ComponentType::Battery && !components[i].state.burnt) {
            rows[i] = next++;
        }
    }
    return rows;
}

int MNASolver::get_matrix_size(const NodeIndex& nodes) const {
    int size = nodes.free_node_count();
    for (const auto& c : graph_.components()) {
        if (c.type() == ComponentType::Battery && !c.state.burnt) size++;
    }
    return size;
}

void MNASolver::assemble_system(const NodeIndex& nodes, LinearSolver::Matrix& A, LinearSolver::Vector& b) const {
    int n = get_matrix_size(nodes);
    A.assign(n, LinearSolver::Vector(n, 0.0));
    b.assign(n, 0.0);

    const auto& components = graph_.components();
    std::vector<int> rows = source_rows(nodes);
    for (std::size_t i = 0; i < components.size(); ++i) {
        stamp_component(components[i], nodes.nodes_of(i), rows[i], A, b, options_);
    }

    // Leakage to ground keeps floating nodes from making the matrix singular
    for (int i = 0; i < nodes.free_node_count(); ++i) {
        A[i][i] += options_.leakage_conductance;
    }
}

StepReport MNASolver::solve() {
    StepReport report;
    auto& components = graph_.components();
    if (components.empty()) return report;

    DisjointSet sets = build_topology(graph_);
    NodeIndex nodes(graph_, sets);

    report.distinct_nodes = nodes.distinct_node_count();
    report.free_nodes = nodes.free_node_count();
    report.ground_root = nodes.ground_root();

    if (nodes.free_node_count() == 0) {
        // Everything sits on one node: no potential difference anywhere
        for (std::size_t i = 0; i < components.size(); ++i) {
            components[i].state.current = 0.0;
            components[i].state.voltage_drop = 0.0;
            components[i].state.node_indices = nodes.nodes_of(i);
        }
        return report;
    }

    LinearSolver::Matrix A;
    LinearSolver::Vector b;
    assemble_system(nodes, A, b);
    report.matrix_size = static_cast<int>(A.size());
    report.active_sources = report.matrix_size - report.free_nodes;

    LinearSolver::Solution solution = LinearSolver::solve(std::move(A), std::move(b), options_.pivot_tolerance);
    report.singular_columns = solution.singular_columns;
    report.solved = true;

    std::vector<int> rows = source_rows(nodes);
    for (std::size_t i = 0; i < components.size(); ++i) {
        update_component(components[i], nodes.nodes_of(i), rows[i], solution.x, options_);
    }

    report.node_voltages.assign(solution.x.begin(), solution.x.begin() + report.free_nodes);
    return report;
}

} // namespace wattsim
