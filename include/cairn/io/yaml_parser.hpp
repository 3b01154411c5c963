#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <cctype>
#include <concepts>
#include <expected>
#include <format>
#include <source_location>
#include <string_view>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace cairn::io {

/**
 * @brief Loads a reactor-network YAML file into a NetworkConfig
 *
 * Nodes and connections are accepted in both layouts:
 *   - id: r1                         - id: r1
 *     IdealGasReactor:                 type: IdealGasReactor
 *       temperature: 1200              properties:
 *                                        temperature: 1200
 * `components` is accepted as an alias of `nodes`.
 */
class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  template <typename T>
  [[nodiscard]] auto extract_optional(const YAML::Node& node, std::string_view key) const
      -> std::expected<std::optional<T>, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  [[nodiscard]] auto parse_default_mechanism(const YAML::Node& node) const
      -> std::expected<std::string, core::ConfigurationError>;

  [[nodiscard]] auto parse_groups(const YAML::Node& node) const
      -> std::expected<std::vector<std::pair<std::string, GroupConfig>>, core::ConfigurationError>;

  [[nodiscard]] auto parse_node(const YAML::Node& node) const -> std::expected<NodeConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_connection(const YAML::Node& node) const -> std::expected<ConnectionConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_composition_field(const YAML::Node& node) const
      -> std::expected<Composition, core::ConfigurationError>;

  [[nodiscard]] auto parse_mechanism_switch(const YAML::Node& node) const
      -> std::expected<MechanismSwitchConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_output_config(const YAML::Node& node) const -> std::expected<OutputConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_solver_config(const YAML::Node& node) const -> std::expected<SolverConfig, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  // In-memory document, used instead of load()
  [[nodiscard]] auto load_string(std::string_view content) -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<NetworkConfig, core::ConfigurationError>;
};

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(std::format("Required field '{}' is missing", key)));
    }
    return node[std::string(key)].as<T>();
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename T>
auto YamlParser::extract_optional(const YAML::Node& node, std::string_view key) const
    -> std::expected<std::optional<T>, core::ConfigurationError> {
  if (!node || !node.IsMap() || !node[std::string(key)]) {
    return std::optional<T>{};
  }
  auto value = extract_value<T>(node, key);
  if (!value) {
    return std::unexpected(value.error());
  }
  return std::optional<T>{std::move(value.value())};
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }

  auto str_value = str_result.value();
  std::ranges::transform(str_value, str_value.begin(), ::tolower);

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::string valid_options;
    for (const auto& [option, _] : mapping) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", str_value, key, valid_options)));
  }

  return it->second;
}

// Enum mappings (keys lower-case)
namespace enum_mappings {

inline const std::unordered_map<std::string, NodeKind> node_kinds = {
    {"reservoir", NodeKind::Reservoir},
    {"idealgasreactor", NodeKind::IdealGasReactor},
    {"idealgasmolereactor", NodeKind::IdealGasMoleReactor},
    {"idealgasconstpressurereactor", NodeKind::IdealGasConstPressureReactor},
    {"idealgasconstpressuremolereactor", NodeKind::IdealGasConstPressureMoleReactor}};

inline const std::unordered_map<std::string, ConnectionKind> connection_kinds = {
    {"massflowcontroller", ConnectionKind::MassFlowController},
    {"valve", ConnectionKind::Valve},
    {"pressurecontroller", ConnectionKind::PressureController},
    {"wall", ConnectionKind::Wall}};

inline const std::unordered_map<std::string, GroupConfig::Solve> solve_modes = {
    {"advance_to_steady_state", GroupConfig::Solve::SteadyState},
    {"steady_state", GroupConfig::Solve::SteadyState},
    {"advance", GroupConfig::Solve::Advance}};

} // namespace enum_mappings

} // namespace cairn::io
