#include <catch2/catch.hpp>
#include "CircuitGraph.hpp"
#include "CircuitFixtures.hpp"
#include <filesystem>
#include <fstream>

using namespace wattsim;
using namespace wattsim::testing;

TEST_CASE("Generated ids are deterministic", "[graph]") {
    CircuitGraph a(std::make_shared<SequentialIdGenerator>());
    CircuitGraph b(std::make_shared<SequentialIdGenerator>());

    CHECK(a.add_component(BatteryProps{}) == "battery_1");
    CHECK(a.add_component(ResistorProps{}) == "resistor_2");
    CHECK(b.add_component(BatteryProps{}) == "battery_1");

    SECTION("Ids already in use are skipped") {
        CircuitGraph c(std::make_shared<SequentialIdGenerator>());
        c.add_component("light_1", LightProps{});
        CHECK(c.add_component(LightProps{}) == "light_2");
    }
}

TEST_CASE("Graph editing", "[graph]") {
    CircuitGraph graph = series_loop();

    SECTION("Lookup") {
        CHECK(graph.find("B1") != nullptr);
        CHECK(graph.find("nope") == nullptr);
        CHECK(graph.at("R1").type() == ComponentType::Resistor);
        CHECK_THROWS_AS(graph.at("nope"), std::out_of_range);
    }

    SECTION("Duplicate ids are rejected") {
        CHECK_THROWS_AS(graph.add_component("B1", ResistorProps{}), std::invalid_argument);
        CHECK_THROWS_AS(graph.add_component("", ResistorProps{}), std::invalid_argument);
    }

    SECTION("Removing a component removes its wires") {
        graph.add_component("R2", resistor(10.0, 1.0));
        graph.connect(term("R2", 0), term("B1", 1));
        REQUIRE(graph.wires().size() == 3);

        CHECK(graph.remove_component("R1"));
        CHECK(graph.wires().size() == 1);
        CHECK(graph.components().size() == 2);
        CHECK_FALSE(graph.remove_component("R1"));
    }

    SECTION("Wires are validated") {
        CHECK_THROWS_AS(graph.connect(term("B1", 0), term("ghost", 1)), std::invalid_argument);
        CHECK_THROWS_AS(graph.connect(term("B1", 2), term("R1", 0)), std::invalid_argument);
        CHECK(graph.wires().size() == 2);
    }

    SECTION("Disconnect matches either orientation") {
        CHECK(graph.disconnect(term("R1", 0), term("B1", 1)));
        CHECK(graph.wires().size() == 1);
        CHECK_FALSE(graph.disconnect(term("R1", 0), term("B1", 1)));
    }

    SECTION("Property edits keep the type") {
        graph.set_properties("R1", resistor(47.0, 2.0));
        CHECK(graph.at("R1").props<ResistorProps>().resistance == 47.0);
        CHECK_THROWS_AS(graph.set_properties("R1", FanProps{}), std::invalid_argument);
    }

    SECTION("Toggle and repair") {
        graph.add_component("S1", SwitchProps{});
        graph.toggle_switch("S1");
        CHECK(graph.at("S1").props<SwitchProps>().closed);
        graph.toggle_switch("S1");
        CHECK_FALSE(graph.at("S1").props<SwitchProps>().closed);
        CHECK_THROWS_AS(graph.toggle_switch("R1"), std::invalid_argument);

        Component& r1 = graph.at("R1");
        r1.state.burnt = true;
        r1.state.power = 4.0;
        graph.repair("R1");
        CHECK_FALSE(r1.state.burnt);
        CHECK(r1.state.power == 0.0);
    }

    SECTION("Clear") {
        graph.clear();
        CHECK(graph.empty());
        CHECK(graph.wires().empty());
    }
}

TEST_CASE("Battery polarity is validated", "[graph]") {
    CircuitGraph graph;
    BatteryProps bad;
    bad.negative_terminal = 2;
    CHECK_THROWS_AS(graph.add_component(bad), std::invalid_argument);

    BatteryProps negative_r;
    negative_r.internal_resistance = -1.0;
    CHECK_THROWS_AS(graph.add_component("B1", negative_r), std::invalid_argument);
    CHECK(graph.empty());
}

TEST_CASE("Circuit file format", "[graph][json]") {
    json doc = json::parse(R"({
        "name": "demo",
        "components": [
            {"id": "b", "type": "battery", "x": 10, "y": 20, "rotation": 1,
             "properties": {"voltage": 12, "internalResistance": 0.5}},
            {"id": "l", "type": "light", "x": 40, "y": 20, "rotation": 0,
             "properties": {"resistance": 30, "powerRating": 5, "maxLumens": 250}},
            {"id": "s", "type": "switch", "properties": {"closed": true}},
            {"id": "d", "type": "diode", "properties": {}},
            {"id": "x", "type": "capacitor", "properties": {}}
        ],
        "wires": [
            {"startCompId": "b", "startTermId": 1, "endCompId": "s", "endTermId": 0},
            {"startComponentId": "s", "startTerminal": 1, "endComponentId": "l", "endTerminal": 0},
            {"startCompId": "l", "startTermId": 1, "endCompId": "b", "endTermId": 0},
            {"startCompId": "x", "startTermId": 0, "endCompId": "b", "endTermId": 0},
            {"startCompId": "l", "startTermId": 3, "endCompId": "b", "endTermId": 0}
        ],
        "camera": {"x": 0, "y": 0, "zoom": 1},
        "solver": {"leakageConductance": 1e-8}
    })");

    CircuitGraph graph;
    REQUIRE(graph.from_json(doc));

    CHECK(graph.name == "demo");
    CHECK(graph.components().size() == 4); // capacitor skipped
    CHECK(graph.wires().size() == 3);      // dangling and out-of-range wires skipped

    const Component& b = graph.at("b");
    CHECK(b.props<BatteryProps>().voltage == 12.0);
    CHECK(b.props<BatteryProps>().internal_resistance == 0.5);
    CHECK(b.props<BatteryProps>().negative_terminal == 0);
    CHECK(b.placement.x == 10.0);
    CHECK(b.placement.rotation == 1);

    CHECK(graph.at("l").props<LightProps>().max_lumens == 250.0);
    CHECK(graph.at("s").props<SwitchProps>().closed);
    CHECK(graph.at("s").props<SwitchProps>().resistance == Approx(0.01));
    CHECK(graph.at("d").props<DiodeProps>().forward_voltage == Approx(0.7));

    REQUIRE(graph.solver_options.has_value());
    CHECK(graph.solver_options->leakage_conductance == 1e-8);
    CHECK(graph.solver_options->pivot_tolerance == 1e-10);

    SECTION("Save then load keeps the circuit") {
        CircuitGraph copy;
        REQUIRE(copy.from_json(graph.to_json()));
        CHECK(copy.to_json() == graph.to_json());
    }

    SECTION("State export") {
        graph.at("l").state.current = 0.25;
        json states = graph.state_to_json();
        REQUIRE(states.size() == 4);
        CHECK(states[1]["id"].get<std::string>() == "l");
        CHECK(states[1]["type"].get<std::string>() == "light");
        CHECK(states[1]["current"].get<double>() == 0.25);
        CHECK(states[1]["burnt"].get<bool>() == false);
        CHECK(states[1]["nodeIndices"][0].get<int>() == kGroundNode);
    }
}

TEST_CASE("Loading from disk", "[graph][json]") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "wattsim_graph_tests";
    fs::create_directories(dir);

    SECTION("Missing file") {
        CircuitGraph graph;
        CHECK_FALSE(graph.load_from_json((dir / "does_not_exist.json").string()));
    }

    SECTION("Malformed JSON") {
        fs::path bad = dir / "bad.json";
        std::ofstream(bad) << "{ \"components\": [ ";
        CircuitGraph graph;
        CHECK_FALSE(graph.load_from_json(bad.string()));
    }

    SECTION("Wrong types") {
        fs::path bad = dir / "types.json";
        std::ofstream(bad) << R"({"components": [{"id": "r", "type": "resistor", "properties": {"resistance": "big"}}]})";
        CircuitGraph graph;
        CHECK_FALSE(graph.load_from_json(bad.string()));
    }

    SECTION("Round trip through a file") {
        CircuitGraph graph = series_loop();
        fs::path path = dir / "series.json";
        REQUIRE(graph.save_to_json(path.string()));

        CircuitGraph loaded;
        REQUIRE(loaded.load_from_json(path.string()));
        CHECK(loaded.components().size() == 2);
        CHECK(loaded.wires().size() == 2);
        CHECK(loaded.at("R1").props<ResistorProps>().power_rating == 10.0);
    }
}
