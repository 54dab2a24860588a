#include "ComponentModel.hpp"
#include <algorithm>
#include <variant>

namespace wattsim {

namespace {

struct ResistanceRule {
    const ComponentState& state;
    const SolverOptions& options;

    double operator()(const BatteryProps& p) const { return p.internal_resistance; }

    double operator()(const SwitchProps& p) const {
        return clamp(p.closed ? p.resistance : options.switch_open_resistance);
    }

    // Decided by the drop of the previous solve, so the diode settles over several steps
    double operator()(const DiodeProps& p) const {
        return state.voltage_drop > p.forward_voltage ? clamp(options.diode_forward_resistance)
                                                      : clamp(options.diode_reverse_resistance);
    }

    // Resistor, light, fan
    template <typename Props>
    double operator()(const Props& p) const { return clamp(p.resistance); }

    double clamp(double r) const { return std::max(r, options.min_resistance); }
};

struct RatingRule {
    std::optional<double> operator()(const ResistorProps& p) const { return p.power_rating; }
    std::optional<double> operator()(const LightProps& p) const { return p.power_rating; }
    std::optional<double> operator()(const FanProps& p) const { return p.power_rating; }

    template <typename Props>
    std::optional<double> operator()(const Props&) const { return std::nullopt; }
};

double node_voltage(const LinearSolver::Vector& x, int node) {
    return node == kGroundNode ? 0.0 : x[node];
}

struct Stamper {
    const Component& c;
    const std::array<int, 2>& nodes;
    int source_row;
    LinearSolver::Matrix& A;
    LinearSolver::Vector& b;
    const SolverOptions& options;

    // Branch current I flows from the negative to the positive pole inside the source.
    // Constraint row: V(+) - V(-) + I * Rint = E
    void operator()(const BatteryProps& p) const {
        int s = source_row;
        int neg = nodes[p.negative_terminal];
        int pos = nodes[1 - p.negative_terminal];

        if (neg != kGroundNode) {
            A[s][neg] -= 1.0;
            A[neg][s] += 1.0; // leaves the negative node
        }
        if (pos != kGroundNode) {
            A[s][pos] += 1.0;
            A[pos][s] -= 1.0; // enters the positive node
        }
        A[s][s] += p.internal_resistance;
        b[s] = p.voltage;
    }

    template <typename Props>
    void operator()(const Props& p) const {
        double r = ResistanceRule{c.state, options}(p);
        stamp_conductance(A, nodes[0], nodes[1], 1.0 / r);
    }
};

struct Updater {
    Component& c;
    const std::array<int, 2>& nodes;
    int source_row;
    const LinearSolver::Vector& x;
    const SolverOptions& options;

    void operator()(const BatteryProps& p) const {
        double v_neg = node_voltage(x, nodes[p.negative_terminal]);
        double v_pos = node_voltage(x, nodes[1 - p.negative_terminal]);
        double current = x[source_row];

        c.state.current = current;
        c.state.voltage_drop = v_pos - v_neg;
        // Heat in the internal resistance, not the power delivered to the load
        c.state.power = current * current * p.internal_resistance;
    }

    template <typename Props>
    void operator()(const Props& p) const {
        // Same rule as the stamp, evaluated before the drop is overwritten
        double r = ResistanceRule{c.state, options}(p);
        double v = node_voltage(x, nodes[1]) - node_voltage(x, nodes[0]);
        double current = v / r;

        c.state.current = current;
        c.state.voltage_drop = v;
        c.state.power = current * current * r;

        std::optional<double> rating = RatingRule{}(p);
        if (rating && c.state.power > *rating * options.overload_factor) {
            c.state.burnt = true;
        }
    }
};

} // namespace

double effective_resistance(const Component& c, const SolverOptions& options) {
    return std::visit(ResistanceRule{c.state, options}, c.properties);
}

std::optional<double> power_rating(const Component& c) {
    return std::visit(RatingRule{}, c.properties);
}

void stamp_conductance(LinearSolver::Matrix& A, int n1, int n2, double g) {
    if (n1 != kGroundNode) A[n1][n1] += g;
    if (n2 != kGroundNode) A[n2][n2] += g;
    if (n1 != kGroundNode && n2 != kGroundNode) {
        A[n1][n2] -= g;
        A[n2][n1] -= g;
    }
}

void stamp_component(const Component& c, const std::array<int, 2>& nodes, int source_row,
                     LinearSolver::Matrix& A, LinearSolver::Vector& b, const SolverOptions& options) {
    if (c.state.burnt) return; // open circuit
    std::visit(Stamper{c, nodes, source_row, A, b, options}, c.properties);
}

void update_component(Component& c, const std::array<int, 2>& nodes, int source_row,
                      const LinearSolver::Vector& x, const SolverOptions& options) {
    c.state.node_indices = nodes;
    if (c.state.burnt) {
        c.state.current = 0.0;
        c.state.power = 0.0;
        return;
    }
    std::visit(Updater{c, nodes, source_row, x, options}, c.properties);
}

double terminal_current(const Component& c, int terminal) {
    if (c.type() == ComponentType::Battery) {
        // Enters at the negative pole
        return terminal == c.props<BatteryProps>().negative_terminal ? c.state.current : -c.state.current;
    }
    // Positive current runs from terminal 1 to terminal 0 through a passive part
    return terminal == 1 ? c.state.current : -c.state.current;
}

} // namespace wattsim
