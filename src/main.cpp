#include "MNASolver.hpp"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

using namespace wattsim;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <circuit_json_file> [--steps N] [--config solver.json] [--out dir]"
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string filepath;
    std::string config_path;
    std::string output_dir = "circuit_results";
    int steps = 1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--steps" && i + 1 < argc) {
            steps = std::atoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (filepath.empty()) {
            filepath = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (filepath.empty() || steps < 1) {
        print_usage(argv[0]);
        return 1;
    }

    CircuitGraph graph;
    if (!graph.load_from_json(filepath)) {
        return 1;
    }

    SolverOptions options = graph.solver_options ? *graph.solver_options : SolverOptions();
    if (!config_path.empty() && !options.load_from_json(config_path)) {
        return 1;
    }

    try {
        MNASolver solver(graph, options);
        StepReport report;
        for (int s = 0; s < steps; ++s) {
            report = solver.solve();
        }

        std::cout << "Simulation Results for " << graph.name << " after " << steps << " step(s):" << std::endl;
        std::cout << "  Nodes: " << report.distinct_nodes << " (" << report.free_nodes << " free), "
                  << "sources: " << report.active_sources << std::endl;
        if (report.singular_columns > 0) {
            std::cout << "  Warning: " << report.singular_columns << " singular pivot column(s) left at 0" << std::endl;
        }

        // Helper to round small floating point errors
        auto round_val = [](double val) {
            const double multiplier = 1e9;
            return std::round(val * multiplier) / multiplier;
        };

        std::cout << "  Voltages:" << std::endl;
        std::cout << "    Node ground: " << std::fixed << std::setprecision(4) << 0.0 << " V" << std::endl;
        for (std::size_t i = 0; i < report.node_voltages.size(); ++i) {
            std::cout << "    Node " << i << ": "
                      << std::fixed << std::setprecision(4) << report.node_voltages[i] << " V" << std::endl;
        }

        std::cout << "  Components:" << std::endl;
        for (const auto& c : graph.components()) {
            std::cout << "    " << c.id << " (" << type_name(c.type()) << "): "
                      << std::fixed << std::setprecision(4)
                      << c.state.current << " A, " << c.state.voltage_drop << " V, "
                      << c.state.power << " W" << (c.state.burnt ? " [BURNT]" : "") << std::endl;
        }

        json solution_json;
        solution_json["circuit_name"] = graph.name;
        solution_json["steps"] = steps;
        solution_json["report"] = report.to_json();
        solution_json["components"] = graph.state_to_json();
        for (auto& item : solution_json["components"]) {
            for (const char* key : {"current", "voltageDrop", "power"}) {
                item[key] = round_val(item[key].get<double>());
            }
        }

        // Input: path/to/filename.json -> Output: <dir>/filename_sol.json
        std::filesystem::path input_path(filepath);
        std::filesystem::path output_path = output_dir;
        std::filesystem::create_directories(output_path);
        output_path /= (input_path.stem().string() + "_sol.json");

        std::cout << "Exporting solution to: " << output_path << std::endl;

        std::ofstream out_file(output_path);
        if (out_file.is_open()) {
            out_file << solution_json.dump(2) << std::endl;
        } else {
            std::cerr << "Failed to write solution file to " << output_path << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Solver Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
