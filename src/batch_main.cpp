#include "BatchSolver.hpp"
#include "CircuitGraph.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace wattsim;

namespace fs = std::filesystem;

void save_results(const std::vector<StepReport>& results, const std::vector<CircuitGraph>& graphs,
                  const std::string& output_dir) {
    if (!fs::exists(output_dir)) {
        fs::create_directories(output_dir);
    }

    // Results match the input order (guaranteed by the parallel loop)
    for (std::size_t i = 0; i < results.size(); ++i) {
        const CircuitGraph& graph = graphs[i];

        json j;
        j["name"] = graph.name;
        j["report"] = results[i].to_json();
        j["components"] = graph.state_to_json();

        std::string filename = output_dir + "/" + graph.name + "_sol.json";
        std::ofstream out(filename);
        if (out.is_open()) {
            out << j.dump(4);
        } else {
            std::cerr << "Failed to write " << filename << std::endl;
        }
    }
    std::cout << "Saved " << results.size() << " results to " << output_dir << "/" << std::endl;
}

int main(int argc, char** argv) {
    int steps = 1;
    std::string circuits_dir;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--steps" && i + 1 < argc) {
            steps = std::atoi(argv[++i]);
        } else if (arg == "--dir" && i + 1 < argc) {
            circuits_dir = argv[++i];
        }
    }
    if (steps < 1) {
        std::cerr << "Error: --steps must be at least 1." << std::endl;
        return 1;
    }

    if (circuits_dir.empty()) {
        circuits_dir = "circuits";
        if (!fs::exists(circuits_dir)) {
            circuits_dir = "../circuits";
        }
    }
    if (!fs::exists(circuits_dir)) {
        std::cerr << "Error: '" << circuits_dir << "' directory not found." << std::endl;
        return 1;
    }

    std::vector<CircuitGraph> batch;

    std::cout << "Loading circuits from " << circuits_dir << "..." << std::endl;
    for (const auto& entry : fs::directory_iterator(circuits_dir)) {
        if (entry.path().extension() == ".json") {
            CircuitGraph graph;
            if (graph.load_from_json(entry.path().string())) {
                if (graph.name == "circuit") {
                    graph.name = entry.path().stem().string();
                }
                std::cout << "  Loaded " << graph.name << std::endl;
                batch.push_back(std::move(graph));
            }
        }
    }

    std::cout << "Stepping batch of " << batch.size() << " circuits " << steps << " time(s)..." << std::endl;

    try {
        auto start_time = std::chrono::high_resolution_clock::now();
        std::vector<StepReport> results = solve_batch(batch, steps);
        auto end_time = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end_time - start_time;

        std::cout << "Batch solved in " << elapsed.count() << " ms" << std::endl;

        std::cout << "[Verification]" << std::endl;
        for (std::size_t i = 0; i < results.size(); ++i) {
            std::cout << "  " << batch[i].name << ": " << results[i].distinct_nodes << " nodes, "
                      << results[i].matrix_size << " unknowns solved." << std::endl;
        }

        save_results(results, batch, "../results");
    } catch (const std::exception& e) {
        std::cerr << "Solver Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
