#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "CircuitGraph.hpp"
#include "MNASolver.hpp"
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace wattsim {

// Owns a circuit graph and steps it once per tick.
// Edits and solves are serialized on one mutex, so readers never see a half-updated graph.
class Simulation {
public:
    explicit Simulation(const SolverOptions& options = SolverOptions(),
                        std::shared_ptr<IdGenerator> ids = std::make_shared<SequentialIdGenerator>());
    explicit Simulation(CircuitGraph graph, const SolverOptions& options = SolverOptions());

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    StepReport step();

    template <typename Fn>
    auto edit(Fn&& fn) -> decltype(fn(std::declval<CircuitGraph&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(graph_);
    }

    std::vector<Component> snapshot() const;
    unsigned long ticks() const;

private:
    mutable std::mutex mutex_;
    CircuitGraph graph_;
    MNASolver solver_;
    unsigned long ticks_ = 0;
};

} // namespace wattsim

#endif // SIMULATION_HPP
