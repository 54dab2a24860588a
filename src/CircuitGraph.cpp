#include "CircuitGraph.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace wattsim {

namespace {

ComponentProperties properties_from_json(ComponentType type, const json& p) {
    ComponentProperties props = default_properties(type);
    if (!p.is_object()) return props;

    switch (type) {
        case ComponentType::Battery: {
            auto& b = std::get<BatteryProps>(props);
            b.voltage = p.value("voltage", b.voltage);
            b.internal_resistance = p.value("internalResistance", b.internal_resistance);
            b.negative_terminal = p.value("negativeTerminal", b.negative_terminal);
            break;
        }
        case ComponentType::Resistor: {
            auto& r = std::get<ResistorProps>(props);
            r.resistance = p.value("resistance", r.resistance);
            r.power_rating = p.value("powerRating", r.power_rating);
            break;
        }
        case ComponentType::Light: {
            auto& l = std::get<LightProps>(props);
            l.resistance = p.value("resistance", l.resistance);
            l.power_rating = p.value("powerRating", l.power_rating);
            l.max_lumens = p.value("maxLumens", l.max_lumens);
            break;
        }
        case ComponentType::Switch: {
            auto& s = std::get<SwitchProps>(props);
            s.closed = p.value("closed", s.closed);
            s.resistance = p.value("resistance", s.resistance);
            break;
        }
        case ComponentType::Fan: {
            auto& f = std::get<FanProps>(props);
            f.resistance = p.value("resistance", f.resistance);
            f.power_rating = p.value("powerRating", f.power_rating);
            break;
        }
        case ComponentType::Diode: {
            auto& d = std::get<DiodeProps>(props);
            d.forward_voltage = p.value("forwardVoltage", d.forward_voltage);
            d.breakdown_voltage = p.value("breakdownVoltage", d.breakdown_voltage);
            break;
        }
    }
    return props;
}

json properties_to_json(const Component& c) {
    json p = json::object();
    switch (c.type()) {
        case ComponentType::Battery: {
            const auto& b = c.props<BatteryProps>();
            p["voltage"] = b.voltage;
            p["internalResistance"] = b.internal_resistance;
            p["negativeTerminal"] = b.negative_terminal;
            break;
        }
        case ComponentType::Resistor: {
            const auto& r = c.props<ResistorProps>();
            p["resistance"] = r.resistance;
            p["powerRating"] = r.power_rating;
            break;
        }
        case ComponentType::Light: {
            const auto& l = c.props<LightProps>();
            p["resistance"] = l.resistance;
            p["powerRating"] = l.power_rating;
            p["maxLumens"] = l.max_lumens;
            break;
        }
        case ComponentType::Switch: {
            const auto& s = c.props<SwitchProps>();
            p["closed"] = s.closed;
            p["resistance"] = s.resistance;
            break;
        }
        case ComponentType::Fan: {
            const auto& f = c.props<FanProps>();
            p["resistance"] = f.resistance;
            p["powerRating"] = f.power_rating;
            break;
        }
        case ComponentType::Diode: {
            const auto& d = c.props<DiodeProps>();
            p["forwardVoltage"] = d.forward_voltage;
            p["breakdownVoltage"] = d.breakdown_voltage;
            break;
        }
    }
    return p;
}

// Wire endpoints as written by the editor, with the long key names as fallback
TerminalRef terminal_from_json(const json& w, const char* comp_key, const char* comp_alias,
                               const char* term_key, const char* term_alias) {
    TerminalRef ref;
    ref.component_id = w.contains(comp_key) ? w[comp_key].get<std::string>()
                                            : w.value(comp_alias, std::string());
    ref.terminal = w.contains(term_key) ? w[term_key].get<int>() : w.value(term_alias, -1);
    return ref;
}

} // namespace

CircuitGraph::CircuitGraph(std::shared_ptr<IdGenerator> ids) : ids_(std::move(ids)) {
    if (!ids_) {
        ids_ = std::make_shared<SequentialIdGenerator>();
    }
}

std::string CircuitGraph::add_component(const ComponentProperties& props, const Placement& placement) {
    const char* prefix = type_name(static_cast<ComponentType>(props.index()));
    std::string id = ids_->next(prefix);
    // Loaded files may already use ids the generator hands out
    while (find(id) != nullptr) {
        id = ids_->next(prefix);
    }
    add_component(id, props, placement);
    return id;
}

Component& CircuitGraph::add_component(const std::string& id, const ComponentProperties& props,
                                       const Placement& placement) {
    if (id.empty()) {
        throw std::invalid_argument("Component id must not be empty");
    }
    if (find(id) != nullptr) {
        throw std::invalid_argument("Duplicate component id: " + id);
    }
    validate_properties(props);

    Component c;
    c.id = id;
    c.properties = props;
    c.placement = placement;
    components_.push_back(std::move(c));
    return components_.back();
}

bool CircuitGraph::remove_component(const std::string& id) {
    std::ptrdiff_t idx = index_of(id);
    if (idx < 0) return false;

    // id may alias the erased component's own field
    const std::string removed = id;
    components_.erase(components_.begin() + idx);
    wires_.erase(std::remove_if(wires_.begin(), wires_.end(),
                                [&](const Wire& w) {
                                    return w.start.component_id == removed || w.end.component_id == removed;
                                }),
                 wires_.end());
    return true;
}

void CircuitGraph::connect(const TerminalRef& a, const TerminalRef& b) {
    check_terminal(a);
    check_terminal(b);
    wires_.push_back(Wire{a, b});
}

bool CircuitGraph::disconnect(const TerminalRef& a, const TerminalRef& b) {
    auto same = [](const TerminalRef& x, const TerminalRef& y) {
        return x.component_id == y.component_id && x.terminal == y.terminal;
    };
    auto it = std::find_if(wires_.begin(), wires_.end(), [&](const Wire& w) {
        return (same(w.start, a) && same(w.end, b)) || (same(w.start, b) && same(w.end, a));
    });
    if (it == wires_.end()) return false;
    wires_.erase(it);
    return true;
}

void CircuitGraph::set_properties(const std::string& id, const ComponentProperties& props) {
    Component& c = at(id);
    if (props.index() != c.properties.index()) {
        throw std::invalid_argument("Property record does not match the type of " + id);
    }
    validate_properties(props);
    c.properties = props;
}

void CircuitGraph::toggle_switch(const std::string& id) {
    Component& c = at(id);
    if (c.type() != ComponentType::Switch) {
        throw std::invalid_argument("Not a switch: " + id);
    }
    c.props<SwitchProps>().closed = !c.props<SwitchProps>().closed;
}

void CircuitGraph::repair(const std::string& id) {
    Component& c = at(id);
    c.state.burnt = false;
    c.state.power = 0.0;
}

void CircuitGraph::clear() {
    components_.clear();
    wires_.clear();
}

Component* CircuitGraph::find(const std::string& id) {
    std::ptrdiff_t idx = index_of(id);
    return idx < 0 ? nullptr : &components_[idx];
}

const Component* CircuitGraph::find(const std::string& id) const {
    std::ptrdiff_t idx = index_of(id);
    return idx < 0 ? nullptr : &components_[idx];
}

Component& CircuitGraph::at(const std::string& id) {
    Component* c = find(id);
    if (c == nullptr) throw std::out_of_range("Component not found: " + id);
    return *c;
}

const Component& CircuitGraph::at(const std::string& id) const {
    const Component* c = find(id);
    if (c == nullptr) throw std::out_of_range("Component not found: " + id);
    return *c;
}

void CircuitGraph::check_terminal(const TerminalRef& ref) const {
    if (find(ref.component_id) == nullptr) {
        throw std::invalid_argument("Wire references unknown component: " + ref.component_id);
    }
    if (ref.terminal != 0 && ref.terminal != 1) {
        throw std::invalid_argument("Terminal index must be 0 or 1, got " + std::to_string(ref.terminal));
    }
}

std::ptrdiff_t CircuitGraph::index_of(const std::string& id) const {
    for (std::size_t i = 0; i < components_.size(); ++i) {
        if (components_[i].id == id) return static_cast<std::ptrdiff_t>(i);
    }
    return -1;
}

bool CircuitGraph::load_from_json(const std::string& filepath) {
    std::ifstream f(filepath);
    if (!f.is_open()) {
        std::cerr << "Failed to open file: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(f);
        return from_json(data);
    } catch (const json::parse_error& e) {
        std::cerr << "JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool CircuitGraph::from_json(const json& data) {
    clear();
    solver_options.reset();

    try {
        name = data.value("name", std::string("circuit"));

        if (data.contains("components")) {
            for (const auto& item : data["components"]) {
                std::string type_str = item.value("type", std::string());
                auto type = parse_type(type_str);
                if (!type) {
                    std::cerr << "Skipping component with unknown type '" << type_str << "'" << std::endl;
                    continue;
                }

                Placement placement;
                placement.x = item.value("x", 0.0);
                placement.y = item.value("y", 0.0);
                placement.rotation = item.value("rotation", 0);

                ComponentProperties props =
                    properties_from_json(*type, item.contains("properties") ? item["properties"] : json());
                std::string id = item.value("id", std::string());
                try {
                    if (id.empty()) {
                        add_component(props, placement);
                    } else {
                        add_component(id, props, placement);
                    }
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Skipping component '" << id << "': " << e.what() << std::endl;
                }
            }
        }

        if (data.contains("wires")) {
            for (const auto& w : data["wires"]) {
                TerminalRef a = terminal_from_json(w, "startCompId", "startComponentId", "startTermId", "startTerminal");
                TerminalRef b = terminal_from_json(w, "endCompId", "endComponentId", "endTermId", "endTerminal");
                try {
                    connect(a, b);
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Skipping wire: " << e.what() << std::endl;
                }
            }
        }

        if (data.contains("solver")) {
            solver_options = SolverOptions::from_json(data["solver"]);
        }
    } catch (const json::type_error& e) {
        std::cerr << "Invalid circuit description: " << e.what() << std::endl;
        return false;
    }
    return true;
}

json CircuitGraph::to_json() const {
    json data;
    data["name"] = name;
    data["components"] = json::array();
    for (const auto& c : components_) {
        json item;
        item["id"] = c.id;
        item["type"] = type_name(c.type());
        item["x"] = c.placement.x;
        item["y"] = c.placement.y;
        item["rotation"] = c.placement.rotation;
        item["properties"] = properties_to_json(c);
        data["components"].push_back(item);
    }

    data["wires"] = json::array();
    for (const auto& w : wires_) {
        data["wires"].push_back({{"startCompId", w.start.component_id},
                                 {"startTermId", w.start.terminal},
                                 {"endCompId", w.end.component_id},
                                 {"endTermId", w.end.terminal}});
    }

    if (solver_options) {
        data["solver"] = solver_options->to_json();
    }
    return data;
}

bool CircuitGraph::save_to_json(const std::string& filepath) const {
    std::ofstream out(filepath);
    if (!out.is_open()) {
        std::cerr << "Failed to write " << filepath << std::endl;
        return false;
    }
    out << to_json().dump(2) << std::endl;
    return true;
}

json CircuitGraph::state_to_json() const {
    json states = json::array();
    for (const auto& c : components_) {
        json s;
        s["id"] = c.id;
        s["type"] = type_name(c.type());
        s["current"] = c.state.current;
        s["voltageDrop"] = c.state.voltage_drop;
        s["power"] = c.state.power;
        s["burnt"] = c.state.burnt;
        s["nodeIndices"] = {c.state.node_indices[0], c.state.node_indices[1]};
        states.push_back(s);
    }
    return states;
}

} // namespace wattsim
