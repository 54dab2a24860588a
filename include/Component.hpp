#ifndef COMPONENT_HPP
#define COMPONENT_HPP

#include <array>
#include <optional>
#include <string>
#include <variant>

namespace wattsim {

// Node index of the ground reference in ComponentState::node_indices
constexpr int kGroundNode = -1;

enum class ComponentType { Battery, Resistor, Light, Switch, Fan, Diode };

// Property records, one fixed struct per component type.
// Defaults are the values a freshly placed part gets in the editor.

struct BatteryProps {
    double voltage = 9.0;
    double internal_resistance = 1.5;
    int negative_terminal = 0; // the other terminal is the positive pole
};

struct ResistorProps {
    double resistance = 100.0;
    double power_rating = 0.5;
};

struct LightProps {
    double resistance = 50.0;
    double power_rating = 1.0;
    double max_lumens = 100.0;
};

struct SwitchProps {
    bool closed = false;
    double resistance = 0.01; // used when closed
};

struct FanProps {
    double resistance = 20.0;
    double power_rating = 2.0;
};

struct DiodeProps {
    double forward_voltage = 0.7;
    double breakdown_voltage = 50.0;
};

// Alternative order matches ComponentType
using ComponentProperties =
    std::variant<BatteryProps, ResistorProps, LightProps, SwitchProps, FanProps, DiodeProps>;

struct ComponentState {
    double current = 0.0;      // signed, see terminal_current() for orientation
    double voltage_drop = 0.0; // V(terminal 1) - V(terminal 0), battery: V(+) - V(-)
    double power = 0.0;
    bool burnt = false;
    std::array<int, 2> node_indices{{kGroundNode, kGroundNode}}; // diagnostic, from the last solve
};

// Editor layout. Carried through load/save only.
struct Placement {
    double x = 0.0;
    double y = 0.0;
    int rotation = 0; // quarter turns
};

struct Component {
    std::string id;
    ComponentProperties properties;
    ComponentState state;
    Placement placement;

    ComponentType type() const { return static_cast<ComponentType>(properties.index()); }

    template <typename Props>
    Props& props() { return std::get<Props>(properties); }

    template <typename Props>
    const Props& props() const { return std::get<Props>(properties); }
};

const char* type_name(ComponentType type);
std::optional<ComponentType> parse_type(const std::string& name);
ComponentProperties default_properties(ComponentType type);

// Only resistors, lights and fans can burn out
bool can_overload(ComponentType type);

// Throws std::invalid_argument when a record breaks a construction invariant
// (battery polarity outside {0,1}, negative internal resistance).
void validate_properties(const ComponentProperties& props);

} // namespace wattsim

#endif // COMPONENT_HPP
