#ifndef COMPONENTMODEL_HPP
#define COMPONENTMODEL_HPP

#include "Component.hpp"
#include "LinearSolver.hpp"
#include "SolverOptions.hpp"
#include <array>
#include <optional>

namespace wattsim {

// Resistance a component presents to the next solve.
// Switch: configured resistance when closed, options.switch_open_resistance when open.
// Diode: forward resistance if the previous voltage drop exceeded forwardVoltage, else reverse.
// Passive results are clamped to options.min_resistance. Battery: its internal resistance.
double effective_resistance(const Component& c, const SolverOptions& options);

// Configured power rating of the types that can overload
std::optional<double> power_rating(const Component& c);

// Adds g between two nodes; kGroundNode rows and columns are omitted
void stamp_conductance(LinearSolver::Matrix& A, int n1, int n2, double g);

// Adds the component's linear contribution. source_row is the row of the battery's
// branch current and is ignored for other types. Burnt components add nothing.
void stamp_component(const Component& c, const std::array<int, 2>& nodes, int source_row,
                     LinearSolver::Matrix& A, LinearSolver::Vector& b, const SolverOptions& options);

// Writes current, voltage drop and power from the solution and applies the overload transition
void update_component(Component& c, const std::array<int, 2>& nodes, int source_row,
                      const LinearSolver::Vector& x, const SolverOptions& options);

// Signed current flowing from the node into the component through the given terminal
double terminal_current(const Component& c, int terminal);

} // namespace wattsim

#endif // COMPONENTMODEL_HPP
