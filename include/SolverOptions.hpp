#ifndef SOLVEROPTIONS_HPP
#define SOLVEROPTIONS_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace wattsim {

// Numerical constants of the solver loop.
// Every field can be overridden from JSON; missing keys keep these defaults.
struct SolverOptions {
    double leakage_conductance = 1e-9;     // added to every free node's diagonal
    double pivot_tolerance = 1e-10;        // below this a pivot column is treated as singular
    double switch_open_resistance = 1e9;
    double diode_forward_resistance = 0.1;
    double diode_reverse_resistance = 1e7;
    double overload_factor = 1.5;          // burn when power > factor * powerRating
    double min_resistance = 1e-6;          // clamp for zero/negative configured resistances

    static SolverOptions from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Reads a standalone options file. Returns false and prints the reason on failure.
    bool load_from_json(const std::string& filepath);
};

} // namespace wattsim

#endif // SOLVEROPTIONS_HPP
