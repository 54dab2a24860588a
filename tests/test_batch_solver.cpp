#include <catch2/catch.hpp>
#include "BatchSolver.hpp"
#include "CircuitFixtures.hpp"
#include <cmath>

using namespace wattsim;
using namespace wattsim::testing;

TEST_CASE("Batch matches sequential solves", "[batch]") {
    std::vector<CircuitGraph> graphs;
    for (int i = 1; i <= 16; ++i) {
        graphs.push_back(series_loop(10.0 * i, 100.0));
    }
    graphs.emplace_back(); // empty graph in the middle of a batch is fine
    graphs.push_back(series_loop(50.0, 100.0));

    std::vector<StepReport> reports = solve_batch(graphs, 3);
    REQUIRE(reports.size() == graphs.size());

    for (int i = 1; i <= 16; ++i) {
        const CircuitGraph& g = graphs[i - 1];
        CHECK(reports[i - 1].solved);
        CHECK(g.at("B1").state.current == Approx(9.0 / (1.5 + 10.0 * i)));
    }
    CHECK_FALSE(reports[16].solved);
    CHECK(graphs.back().at("B1").state.current == Approx(9.0 / 51.5));
}

TEST_CASE("Batch honours per-graph solver options", "[batch]") {
    std::vector<CircuitGraph> graphs(2);
    for (auto& g : graphs) {
        g.add_component("B1", battery(9.0, 1.5));
        g.add_component("S1", SwitchProps{});
        g.connect(term("B1", 1), term("S1", 0));
        g.connect(term("S1", 1), term("B1", 0));
    }
    SolverOptions loose;
    loose.switch_open_resistance = 1000.0;
    graphs[1].solver_options = loose;

    solve_batch(graphs, 1);
    CHECK(std::abs(graphs[0].at("B1").state.current) < 1e-7);
    CHECK(graphs[1].at("B1").state.current == Approx(9.0 / 1001.5));
}
