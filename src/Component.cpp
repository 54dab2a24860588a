#include "Component.hpp"
#include <stdexcept>

namespace wattsim {

const char* type_name(ComponentType type) {
    switch (type) {
        case ComponentType::Battery: return "battery";
        case ComponentType::Resistor: return "resistor";
        case ComponentType::Light: return "light";
        case ComponentType::Switch: return "switch";
        case ComponentType::Fan: return "fan";
        case ComponentType::Diode: return "diode";
    }
    return "unknown";
}

std::optional<ComponentType> parse_type(const std::string& name) {
    if (name == "battery") return ComponentType::Battery;
    if (name == "resistor") return ComponentType::Resistor;
    if (name == "light") return ComponentType::Light;
    if (name == "switch") return ComponentType::Switch;
    if (name == "fan") return ComponentType::Fan;
    if (name == "diode") return ComponentType::Diode;
    return std::nullopt;
}

ComponentProperties default_properties(ComponentType type) {
    switch (type) {
        case ComponentType::Battery: return BatteryProps{};
        case ComponentType::Resistor: return ResistorProps{};
        case ComponentType::Light: return LightProps{};
        case ComponentType::Switch: return SwitchProps{};
        case ComponentType::Fan: return FanProps{};
        case ComponentType::Diode: return DiodeProps{};
    }
    throw std::invalid_argument("Unknown component type");
}

bool can_overload(ComponentType type) {
    return type == ComponentType::Resistor || type == ComponentType::Light || type == ComponentType::Fan;
}

void validate_properties(const ComponentProperties& props) {
    if (const auto* battery = std::get_if<BatteryProps>(&props)) {
        if (battery->negative_terminal != 0 && battery->negative_terminal != 1) {
            throw std::invalid_argument("Battery negative terminal must be 0 or 1");
        }
        if (battery->internal_resistance < 0.0) {
            throw std::invalid_argument("Battery internal resistance must not be negative");
        }
    }
}

} // namespace wattsim
