#pragma once
#include "../core/constants.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cairn::io {

struct SpeciesFraction {
  std::string species;
  double value;
};

// Ordered as declared in the composition string
using Composition = std::vector<SpeciesFraction>;

// Numeric free-form properties (mass_flow_rate, valve_coeff, ...)
using PropertyMap = std::map<std::string, double>;

enum class NodeKind {
  Reservoir,
  IdealGasReactor,
  IdealGasMoleReactor,
  IdealGasConstPressureReactor,
  IdealGasConstPressureMoleReactor
};

enum class ConnectionKind { MassFlowController, Valve, PressureController, Wall };

[[nodiscard]] constexpr auto to_string(NodeKind kind) noexcept -> std::string_view {
  switch (kind) {
  case NodeKind::Reservoir:
    return "Reservoir";
  case NodeKind::IdealGasReactor:
    return "IdealGasReactor";
  case NodeKind::IdealGasMoleReactor:
    return "IdealGasMoleReactor";
  case NodeKind::IdealGasConstPressureReactor:
    return "IdealGasConstPressureReactor";
  case NodeKind::IdealGasConstPressureMoleReactor:
    return "IdealGasConstPressureMoleReactor";
  }
  return "Unknown";
}

[[nodiscard]] constexpr auto to_string(ConnectionKind kind) noexcept -> std::string_view {
  switch (kind) {
  case ConnectionKind::MassFlowController:
    return "MassFlowController";
  case ConnectionKind::Valve:
    return "Valve";
  case ConnectionKind::PressureController:
    return "PressureController";
  case ConnectionKind::Wall:
    return "Wall";
  }
  return "Unknown";
}

// A reservoir holds its state fixed; every other kind is solved
[[nodiscard]] constexpr auto is_reservoir(NodeKind kind) noexcept -> bool {
  switch (kind) {
  case NodeKind::Reservoir:
    return true;
  case NodeKind::IdealGasReactor:
  case NodeKind::IdealGasMoleReactor:
  case NodeKind::IdealGasConstPressureReactor:
  case NodeKind::IdealGasConstPressureMoleReactor:
    return false;
  }
  return false;
}

struct InitialState {
  double temperature = constants::defaults::temperature;
  double pressure = constants::defaults::pressure;
  Composition composition;
};

struct NodeConfig {
  std::string id;
  NodeKind kind = NodeKind::IdealGasReactor;
  std::optional<std::string> group;
  InitialState initial;
  std::optional<double> volume;
  PropertyMap properties;
};

struct MechanismSwitchConfig {
  double htol = constants::tolerance::switch_enthalpy;
  double Xtol = constants::tolerance::switch_mole_fraction;
};

struct ConnectionConfig {
  std::string id;
  std::string source;
  std::string target;
  ConnectionKind kind = ConnectionKind::MassFlowController;
  PropertyMap properties;
  std::optional<MechanismSwitchConfig> mechanism_switch;

  [[nodiscard]] auto mass_flow_rate() const -> std::optional<double> {
    if (auto it = properties.find("mass_flow_rate"); it != properties.end()) {
      return it->second;
    }
    return std::nullopt;
  }
};

struct GroupConfig {
  enum class Solve { SteadyState, Advance };
  std::optional<std::string> mechanism;
  Solve solve = Solve::SteadyState;
  double advance_time = constants::defaults::advance_time;
};

struct OutputConfig {
  std::string output_directory = "cairn_outputs";
  std::string case_name = "simulation";
  bool write_csv = true;
  bool write_hdf5 = true;
};

struct SolverConfig {
  int advance_substeps = constants::defaults::advance_substeps;
};

struct NetworkConfig {
  std::string default_mechanism = constants::defaults::mechanism;

  // Declaration order is kept; stage ordering never depends on it
  std::vector<std::pair<std::string, GroupConfig>> groups;
  std::vector<NodeConfig> nodes;
  std::vector<ConnectionConfig> connections;

  OutputConfig output;
  SolverConfig solver;

  [[nodiscard]] auto find_node(std::string_view id) const -> const NodeConfig* {
    auto it = std::ranges::find(nodes, id, &NodeConfig::id);
    return it == nodes.end() ? nullptr : &*it;
  }

  [[nodiscard]] auto find_group(std::string_view id) const -> const GroupConfig* {
    auto it = std::ranges::find_if(groups, [id](const auto& entry) { return entry.first == id; });
    return it == groups.end() ? nullptr : &it->second;
  }
};

} // namespace cairn::io
