#include <catch2/catch.hpp>
#include "Simulation.hpp"
#include "CircuitFixtures.hpp"
#include <cmath>
#include <thread>

using namespace wattsim;
using namespace wattsim::testing;

TEST_CASE("Simulation steps its own graph", "[simulation]") {
    Simulation sim(series_loop());
    CHECK(sim.ticks() == 0);

    StepReport report = sim.step();
    CHECK(report.solved);
    CHECK(sim.ticks() == 1);

    std::vector<Component> state = sim.snapshot();
    REQUIRE(state.size() == 2);
    CHECK(state[0].state.current == Approx(9.0 / 101.5));

    SECTION("Edits become visible on the next step") {
        sim.edit([](CircuitGraph& g) { g.set_properties("B1", battery(4.5, 1.5)); });
        CHECK(sim.snapshot()[0].state.current == Approx(9.0 / 101.5));

        sim.step();
        CHECK(sim.snapshot()[0].state.current == Approx(4.5 / 101.5));
    }

    SECTION("edit returns the callback's result") {
        std::string id = sim.edit([](CircuitGraph& g) { return g.add_component(FanProps{}); });
        CHECK(id == "fan_1");
    }
}

TEST_CASE("Simulation builds graphs from scratch", "[simulation]") {
    Simulation sim;
    CHECK_FALSE(sim.step().solved);

    sim.edit([](CircuitGraph& g) {
        std::string b = g.add_component(battery(9.0, 1.5));
        std::string r = g.add_component(resistor(100.0, 10.0));
        g.connect(term(b, 1), term(r, 0));
        g.connect(term(r, 1), term(b, 0));
    });
    CHECK(sim.step().solved);
}

TEST_CASE("Edits and steps from two threads", "[simulation]") {
    Simulation sim(series_loop());

    std::thread editor([&] {
        for (int i = 0; i < 200; ++i) {
            sim.edit([i](CircuitGraph& g) {
                g.set_properties("R1", resistor(i % 2 == 0 ? 100.0 : 200.0, 10.0));
            });
        }
    });
    for (int i = 0; i < 200; ++i) {
        sim.step();
    }
    editor.join();

    CHECK(sim.ticks() == 200);
    for (const auto& c : sim.snapshot()) {
        CHECK(std::isfinite(c.state.current));
    }
}
