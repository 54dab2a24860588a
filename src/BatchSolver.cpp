#include "BatchSolver.hpp"
#include <omp.h>

namespace wattsim {

std::vector<StepReport> solve_batch(std::vector<CircuitGraph>& graphs, int steps, const SolverOptions& options) {
    std::vector<StepReport> results(graphs.size());
    const int count = static_cast<int>(graphs.size());

    // Embarrassingly Parallel Loop
    // Each graph is stepped by its own solver on one thread; solves of one graph stay sequential
    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < count; ++i) {
        CircuitGraph& graph = graphs[i];
        MNASolver solver(graph, graph.solver_options ? *graph.solver_options : options);
        for (int s = 0; s < steps; ++s) {
            results[i] = solver.solve();
        }
    }

    return results;
}

} // namespace wattsim
