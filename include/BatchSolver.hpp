#ifndef BATCHSOLVER_HPP
#define BATCHSOLVER_HPP

#include "MNASolver.hpp"
#include <vector>

namespace wattsim {

// Batched stepping
// Runs `steps` solves on every graph, graphs in parallel with OpenMP.
// Returns the report of the last step of each graph, in input order.
std::vector<StepReport> solve_batch(std::vector<CircuitGraph>& graphs, int steps,
                                    const SolverOptions& options = SolverOptions());

} // namespace wattsim

#endif // BATCHSOLVER_HPP
