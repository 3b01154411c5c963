#pragma once
#include "../io/config_types.hpp"
#include <format>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cairn::staging {

// Solve directives
struct SteadyState {};

struct AdvanceFixedDuration {
  double duration;
};

using SolveDirective = std::variant<SteadyState, AdvanceFixedDuration>;

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

[[nodiscard]] inline auto describe(const SolveDirective& directive) -> std::string {
  return std::visit(overloaded{[](const SteadyState&) { return std::string("steady-state"); },
                               [](const AdvanceFixedDuration& a) { return std::format("advance {} s", a.duration); }},
                    directive);
}

// Species -> mole fraction removed by a mechanism switch
using SpeciesLosses = std::map<std::string, double>;

/**
 * @brief Thermodynamic state of one reactor visit
 *
 * Compositions are aligned with `species`. `mass_fractions` is empty when
 * the producer does not know them. `time` is the local residence time
 * within the owning stage, NaN when unknown.
 */
struct ThermoState {
  std::string mechanism;
  double temperature = 0.0;
  double pressure = 0.0;
  std::vector<std::string> species;
  std::vector<double> mole_fractions;
  std::vector<double> mass_fractions;
  double time = std::numeric_limits<double>::quiet_NaN();

  [[nodiscard]] auto species_index(std::string_view name) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < species.size(); ++i) {
      if (species[i] == name) {
        return i;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] auto mole_fraction(std::string_view name) const -> std::optional<double> {
    auto idx = species_index(name);
    if (!idx || *idx >= mole_fractions.size()) {
      return std::nullopt;
    }
    return mole_fractions[*idx];
  }

  [[nodiscard]] auto mass_fraction(std::string_view name) const -> std::optional<double> {
    auto idx = species_index(name);
    if (!idx || *idx >= mass_fractions.size()) {
      return std::nullopt;
    }
    return mass_fractions[*idx];
  }

  [[nodiscard]] auto has_mass_fractions() const noexcept -> bool {
    return !mass_fractions.empty() && mass_fractions.size() == species.size();
  }
};

struct InterStageConnection {
  std::string id;
  std::string source_node;
  std::string target_node;
  std::string source_stage;
  std::string target_stage;
  io::ConnectionKind kind = io::ConnectionKind::MassFlowController;
  io::PropertyMap properties;
  // Set exactly when the two stages use different mechanisms
  std::optional<io::MechanismSwitchConfig> mechanism_switch;
};

struct Stage {
  std::string id;
  std::string mechanism;
  SolveDirective directive = SteadyState{};
  std::vector<std::string> node_ids;
  std::vector<io::ConnectionConfig> intra_connections;
  std::vector<InterStageConnection> inter_connections_in;
  std::vector<InterStageConnection> inter_connections_out;
};

struct StageExecutionPlan {
  std::vector<Stage> ordered_stages;
  std::vector<InterStageConnection> all_inter_connections;
  std::map<std::string, std::string> node_to_stage;

  [[nodiscard]] auto find_stage(std::string_view id) const -> const Stage* {
    for (const auto& stage : ordered_stages) {
      if (stage.id == id) {
        return &stage;
      }
    }
    return nullptr;
  }

  [[nodiscard]] auto stage_of(std::string_view node_id) const -> std::optional<std::string> {
    if (auto it = node_to_stage.find(std::string(node_id)); it != node_to_stage.end()) {
      return it->second;
    }
    return std::nullopt;
  }
};

} // namespace cairn::staging
