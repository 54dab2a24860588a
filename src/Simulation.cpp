#include "Simulation.hpp"
#include <utility>

namespace wattsim {

Simulation::Simulation(const SolverOptions& options, std::shared_ptr<IdGenerator> ids)
    : graph_(std::move(ids)), solver_(graph_, options) {}

Simulation::Simulation(CircuitGraph graph, const SolverOptions& options)
    : graph_(std::move(graph)), solver_(graph_, options) {}

StepReport Simulation::step() {
    std::lock_guard<std::mutex> lock(mutex_);
    StepReport report = solver_.solve();
    ticks_++;
    return report;
}

std::vector<Component> Simulation::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.components();
}

unsigned long Simulation::ticks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticks_;
}

} // namespace wattsim
