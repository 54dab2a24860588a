#ifndef CIRCUIT_GRAPH_HPP
#define CIRCUIT_GRAPH_HPP

#include "Component.hpp"
#include "IdGenerator.hpp"
#include "SolverOptions.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wattsim {

using json = nlohmann::json;

struct TerminalRef {
    std::string component_id;
    int terminal; // 0 or 1
};

// Ideal zero-resistance connection between two terminals
struct Wire {
    TerminalRef start;
    TerminalRef end;
};

// Components in stored order plus the wires between them.
// Wires refer to components by id; removing a component removes its wires.
class CircuitGraph {
public:
    std::string name = "circuit";
    std::optional<SolverOptions> solver_options; // "solver" section of a loaded file

    explicit CircuitGraph(std::shared_ptr<IdGenerator> ids = std::make_shared<SequentialIdGenerator>());

    // Generates an id of the form "<type>_<n>" and returns it
    std::string add_component(const ComponentProperties& props, const Placement& placement = Placement());
    // Throws std::invalid_argument if the id is empty or already used
    Component& add_component(const std::string& id, const ComponentProperties& props,
                             const Placement& placement = Placement());
    bool remove_component(const std::string& id);

    void connect(const TerminalRef& a, const TerminalRef& b);
    bool disconnect(const TerminalRef& a, const TerminalRef& b);

    void set_properties(const std::string& id, const ComponentProperties& props);
    void toggle_switch(const std::string& id);
    void repair(const std::string& id);
    void clear();

    Component* find(const std::string& id);
    const Component* find(const std::string& id) const;
    Component& at(const std::string& id);
    const Component& at(const std::string& id) const;

    std::vector<Component>& components() { return components_; }
    const std::vector<Component>& components() const { return components_; }
    const std::vector<Wire>& wires() const { return wires_; }
    bool empty() const { return components_.empty(); }

    bool load_from_json(const std::string& filepath);
    bool from_json(const json& data);
    json to_json() const;
    bool save_to_json(const std::string& filepath) const;

    // Per-component electrical state, for result export
    json state_to_json() const;

private:
    void check_terminal(const TerminalRef& ref) const;
    std::ptrdiff_t index_of(const std::string& id) const;

    std::shared_ptr<IdGenerator> ids_;
    std::vector<Component> components_;
    std::vector<Wire> wires_;
};

} // namespace wattsim

#endif // CIRCUIT_GRAPH_HPP
