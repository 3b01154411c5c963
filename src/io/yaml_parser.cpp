#include "cairn/io/yaml_parser.hpp"
#include "cairn/core/constants.hpp"
#include "cairn/io/composition_parser.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace cairn::io {

namespace {

const std::set<std::string> node_standard_fields = {"id", "metadata", "group"};
const std::set<std::string> connection_standard_fields = {"id", "source", "target", "metadata", "mechanism_switch"};
const std::set<std::string> node_reserved_properties = {"temperature", "pressure", "composition", "volume", "group"};

template <typename EnumType>
auto lookup_kind(std::string name, const std::unordered_map<std::string, EnumType>& mapping, std::string_view owner)
    -> std::expected<EnumType, core::ConfigurationError> {
  std::ranges::transform(name, name.begin(), ::tolower);
  auto it = mapping.find(name);
  if (it == mapping.end()) {
    return std::unexpected(core::ConfigurationError(std::format("{}: unsupported type '{}'", owner, name)));
  }
  return it->second;
}

// Type and property block for either layout
struct TypedEntry {
  std::string type;
  YAML::Node properties;
};

auto split_typed_entry(const YAML::Node& node, const std::set<std::string>& standard_fields, std::string_view owner)
    -> std::expected<TypedEntry, core::ConfigurationError> {
  if (node["type"]) {
    return TypedEntry{node["type"].as<std::string>(), node["properties"]};
  }
  for (const auto& kv : node) {
    auto key = kv.first.as<std::string>();
    if (!standard_fields.contains(key)) {
      return TypedEntry{key, kv.second};
    }
  }
  return std::unexpected(core::ConfigurationError(std::format("{} declares no type", owner)));
}

void collect_numeric_properties(const YAML::Node& properties, const std::set<std::string>& reserved,
                                PropertyMap& out) {
  if (!properties || !properties.IsMap()) {
    return;
  }
  for (const auto& kv : properties) {
    auto key = kv.first.as<std::string>();
    double value = 0.0;
    if (reserved.contains(key) || !kv.second.IsScalar() || !YAML::convert<double>::decode(kv.second, value)) {
      continue;
    }
    out.emplace(std::move(key), value);
  }
}

} // namespace

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::load_string(std::string_view content) -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::Load(std::string(content));
    return {};
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<NetworkConfig, core::ConfigurationError> {
  try {
    if (!root_ || root_.IsNull()) {
      return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
    }

    NetworkConfig config;

    auto mechanism_result = parse_default_mechanism(root_);
    if (!mechanism_result)
      return std::unexpected(mechanism_result.error());
    config.default_mechanism = mechanism_result.value();

    if (root_["groups"]) {
      auto groups_result = parse_groups(root_["groups"]);
      if (!groups_result)
        return std::unexpected(groups_result.error());
      config.groups = std::move(groups_result.value());
    }

    auto nodes_node = root_["nodes"] ? root_["nodes"] : root_["components"];
    if (!nodes_node || !nodes_node.IsSequence()) {
      return std::unexpected(core::ConfigurationError("Missing required 'nodes' (or 'components') sequence"));
    }
    for (const auto& item : nodes_node) {
      auto node_result = parse_node(item);
      if (!node_result)
        return std::unexpected(node_result.error());
      config.nodes.push_back(std::move(node_result.value()));
    }

    if (auto connections_node = root_["connections"]) {
      if (!connections_node.IsSequence()) {
        return std::unexpected(core::ConfigurationError("'connections' must be a sequence"));
      }
      for (const auto& item : connections_node) {
        auto connection_result = parse_connection(item);
        if (!connection_result)
          return std::unexpected(connection_result.error());
        config.connections.push_back(std::move(connection_result.value()));
      }
    }

    if (root_["output"]) {
      auto output_result = parse_output_config(root_["output"]);
      if (!output_result)
        return std::unexpected(output_result.error());
      config.output = std::move(output_result.value());
    }

    if (root_["solver"]) {
      auto solver_result = parse_solver_config(root_["solver"]);
      if (!solver_result)
        return std::unexpected(solver_result.error());
      config.solver = solver_result.value();
    }

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("YAML error: {}", e.what())));
  }
}

auto YamlParser::parse_default_mechanism(const YAML::Node& node) const
    -> std::expected<std::string, core::ConfigurationError> {
  auto phases = node["phases"];
  if (!phases || !phases["gas"]) {
    return std::string(constants::defaults::mechanism);
  }
  auto mechanism = extract_optional<std::string>(phases["gas"], "mechanism");
  if (!mechanism) {
    return std::unexpected(
        core::ConfigurationError(std::format("In 'phases.gas' section: {}", mechanism.error().message())));
  }
  return mechanism.value().value_or(constants::defaults::mechanism);
}

auto YamlParser::parse_groups(const YAML::Node& node) const
    -> std::expected<std::vector<std::pair<std::string, GroupConfig>>, core::ConfigurationError> {
  if (!node.IsMap()) {
    return std::unexpected(core::ConfigurationError("'groups' must be a mapping of group id to settings"));
  }

  std::vector<std::pair<std::string, GroupConfig>> groups;
  for (const auto& kv : node) {
    auto id = kv.first.as<std::string>();
    const auto& settings = kv.second;
    GroupConfig group;

    if (settings && settings.IsMap()) {
      auto mechanism = extract_optional<std::string>(settings, "mechanism");
      if (!mechanism)
        return std::unexpected(mechanism.error());
      group.mechanism = mechanism.value();

      if (settings["solve"]) {
        auto solve = extract_enum(settings, "solve", enum_mappings::solve_modes);
        if (!solve) {
          return std::unexpected(
              core::ConfigurationError(std::format("In group '{}': {}", id, solve.error().message())));
        }
        group.solve = solve.value();
      }

      auto advance_time = extract_optional<double>(settings, "advance_time");
      if (!advance_time)
        return std::unexpected(advance_time.error());
      group.advance_time = advance_time.value().value_or(constants::defaults::advance_time);
    }

    groups.emplace_back(std::move(id), std::move(group));
  }
  return groups;
}

auto YamlParser::parse_composition_field(const YAML::Node& node) const
    -> std::expected<Composition, core::ConfigurationError> {
  if (node.IsScalar()) {
    return parse_composition(node.as<std::string>());
  }
  if (node.IsMap()) {
    Composition composition;
    for (const auto& kv : node) {
      double value = 0.0;
      if (!YAML::convert<double>::decode(kv.second, value) || !std::isfinite(value) || value < 0.0) {
        return std::unexpected(core::ConfigurationError(
            std::format("invalid fraction for species '{}' in composition", kv.first.as<std::string>())));
      }
      composition.push_back({kv.first.as<std::string>(), value});
    }
    if (composition.empty()) {
      return std::unexpected(core::ConfigurationError("composition is empty"));
    }
    return composition;
  }
  return std::unexpected(core::ConfigurationError("composition must be a string or a species mapping"));
}

auto YamlParser::parse_node(const YAML::Node& node) const -> std::expected<NodeConfig, core::ConfigurationError> {
  NodeConfig config;

  auto id_result = extract_value<std::string>(node, "id");
  if (!id_result)
    return std::unexpected(core::ConfigurationError(std::format("In 'nodes' entry: {}", id_result.error().message())));
  config.id = id_result.value();

  const auto owner = std::format("node '{}'", config.id);
  auto entry = split_typed_entry(node, node_standard_fields, owner);
  if (!entry)
    return std::unexpected(entry.error());

  auto kind = lookup_kind(entry->type, enum_mappings::node_kinds, owner);
  if (!kind)
    return std::unexpected(kind.error());
  config.kind = kind.value();

  const auto& props = entry->properties;

  // Group may sit at the node top level or among its properties
  if (node["group"]) {
    config.group = node["group"].as<std::string>();
  } else if (props && props.IsMap() && props["group"]) {
    config.group = props["group"].as<std::string>();
  }
  if (config.group && config.group->empty()) {
    config.group.reset();
  }

  auto temperature = extract_optional<double>(props, "temperature");
  if (!temperature)
    return std::unexpected(core::ConfigurationError(std::format("In {}: {}", owner, temperature.error().message())));
  config.initial.temperature = temperature.value().value_or(constants::defaults::temperature);

  auto pressure = extract_optional<double>(props, "pressure");
  if (!pressure)
    return std::unexpected(core::ConfigurationError(std::format("In {}: {}", owner, pressure.error().message())));
  config.initial.pressure = pressure.value().value_or(constants::defaults::pressure);

  if (!(config.initial.temperature > 0.0) || !(config.initial.pressure > 0.0)) {
    return std::unexpected(core::ValidationError(owner, "temperature and pressure must be positive"));
  }

  if (props && props.IsMap() && props["composition"]) {
    auto composition = parse_composition_field(props["composition"]);
    if (!composition)
      return std::unexpected(core::ConfigurationError(std::format("In {}: {}", owner, composition.error().message())));
    config.initial.composition = std::move(composition.value());
  }

  auto volume = extract_optional<double>(props, "volume");
  if (!volume)
    return std::unexpected(core::ConfigurationError(std::format("In {}: {}", owner, volume.error().message())));
  config.volume = volume.value();
  if (config.volume && !(*config.volume > 0.0)) {
    return std::unexpected(core::ValidationError(owner, "volume must be positive"));
  }

  collect_numeric_properties(props, node_reserved_properties, config.properties);
  return config;
}

auto YamlParser::parse_mechanism_switch(const YAML::Node& node) const
    -> std::expected<MechanismSwitchConfig, core::ConfigurationError> {
  MechanismSwitchConfig config;
  if (!node.IsMap()) {
    return config;
  }

  auto htol = extract_optional<double>(node, "htol");
  if (!htol)
    return std::unexpected(htol.error());
  config.htol = htol.value().value_or(constants::tolerance::switch_enthalpy);

  auto xtol = extract_optional<double>(node, "Xtol");
  if (!xtol)
    return std::unexpected(xtol.error());
  config.Xtol = xtol.value().value_or(constants::tolerance::switch_mole_fraction);

  if (config.htol < 0.0 || config.Xtol < 0.0) {
    return std::unexpected(core::ConfigurationError("mechanism_switch tolerances must be non-negative"));
  }
  return config;
}

auto YamlParser::parse_connection(const YAML::Node& node) const
    -> std::expected<ConnectionConfig, core::ConfigurationError> {
  ConnectionConfig config;

  for (auto [field, target] : {std::pair{"id", &config.id}, std::pair{"source", &config.source},
                               std::pair{"target", &config.target}}) {
    auto value = extract_value<std::string>(node, field);
    if (!value)
      return std::unexpected(
          core::ConfigurationError(std::format("In 'connections' entry: {}", value.error().message())));
    *target = value.value();
  }

  const auto owner = std::format("connection '{}'", config.id);
  auto entry = split_typed_entry(node, connection_standard_fields, owner);
  if (entry) {
    auto kind = lookup_kind(entry->type, enum_mappings::connection_kinds, owner);
    if (!kind)
      return std::unexpected(kind.error());
    config.kind = kind.value();
  } else {
    config.kind = ConnectionKind::MassFlowController;
  }

  YAML::Node props = entry ? entry->properties : YAML::Node();
  collect_numeric_properties(props, {}, config.properties);

  YAML::Node switch_node = node["mechanism_switch"];
  if (!switch_node && props && props.IsMap()) {
    switch_node = props["mechanism_switch"];
  }
  if (switch_node) {
    auto switch_config = parse_mechanism_switch(switch_node);
    if (!switch_config)
      return std::unexpected(
          core::ConfigurationError(std::format("In {}: {}", owner, switch_config.error().message())));
    config.mechanism_switch = switch_config.value();
  }

  if (auto mdot = config.mass_flow_rate(); mdot && *mdot < 0.0) {
    return std::unexpected(core::ValidationError(owner, "mass_flow_rate must be non-negative"));
  }
  return config;
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {
  OutputConfig config;

  try {
    if (auto directory = node["directory"] ? node["directory"] : node["output_directory"]) {
      config.output_directory = directory.as<std::string>();
    }

    auto case_name = extract_optional<std::string>(node, "case_name");
    if (!case_name)
      return std::unexpected(case_name.error());
    if (case_name.value()) {
      config.case_name = *case_name.value();
    }

    if (auto formats = node["formats"]) {
      config.write_csv = false;
      config.write_hdf5 = false;
      for (const auto& item : formats) {
        auto format = item.as<std::string>();
        std::ranges::transform(format, format.begin(), ::tolower);
        if (format == "csv") {
          config.write_csv = true;
        } else if (format == "hdf5" || format == "h5") {
          config.write_hdf5 = true;
        } else {
          return std::unexpected(core::ConfigurationError(
              std::format("Invalid output format '{}'. Valid options: csv, hdf5", format)));
        }
      }
    }

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'output' section: {}", e.what())));
  }
}

auto YamlParser::parse_solver_config(const YAML::Node& node) const
    -> std::expected<SolverConfig, core::ConfigurationError> {
  SolverConfig config;

  auto substeps = extract_optional<int>(node, "advance_substeps");
  if (!substeps)
    return std::unexpected(core::ConfigurationError(std::format("In 'solver' section: {}", substeps.error().message())));
  config.advance_substeps = substeps.value().value_or(constants::defaults::advance_substeps);

  if (config.advance_substeps <= 0) {
    return std::unexpected(core::ValidationError("solver.advance_substeps", "must be positive"));
  }
  return config;
}

} // namespace cairn::io
