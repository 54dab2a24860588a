#include "SolverOptions.hpp"
#include <fstream>
#include <iostream>

namespace wattsim {

SolverOptions SolverOptions::from_json(const nlohmann::json& j) {
    SolverOptions opts;
    if (!j.is_object()) return opts;

    opts.leakage_conductance = j.value("leakageConductance", opts.leakage_conductance);
    opts.pivot_tolerance = j.value("pivotTolerance", opts.pivot_tolerance);
    opts.switch_open_resistance = j.value("switchOpenResistance", opts.switch_open_resistance);
    opts.diode_forward_resistance = j.value("diodeForwardResistance", opts.diode_forward_resistance);
    opts.diode_reverse_resistance = j.value("diodeReverseResistance", opts.diode_reverse_resistance);
    opts.overload_factor = j.value("overloadFactor", opts.overload_factor);
    opts.min_resistance = j.value("minResistance", opts.min_resistance);
    return opts;
}

nlohmann::json SolverOptions::to_json() const {
    nlohmann::json j;
    j["leakageConductance"] = leakage_conductance;
    j["pivotTolerance"] = pivot_tolerance;
    j["switchOpenResistance"] = switch_open_resistance;
    j["diodeForwardResistance"] = diode_forward_resistance;
    j["diodeReverseResistance"] = diode_reverse_resistance;
    j["overloadFactor"] = overload_factor;
    j["minResistance"] = min_resistance;
    return j;
}

bool SolverOptions::load_from_json(const std::string& filepath) {
    std::ifstream f(filepath);
    if (!f.is_open()) {
        std::cerr << "Failed to open file: " << filepath << std::endl;
        return false;
    }

    try {
        nlohmann::json data = nlohmann::json::parse(f);
        // Accept either a bare options object or a circuit file carrying a "solver" section
        if (data.contains("solver")) {
            *this = from_json(data["solver"]);
        } else {
            *this = from_json(data);
        }
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const nlohmann::json::type_error& e) {
        std::cerr << "Invalid solver options in " << filepath << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace wattsim
