#include "cairn/core/configuration_loader.hpp"
#include "cairn/core/constants.hpp"
#include "cairn/io/config_manager.hpp"
#include <format>
#include <iomanip>
#include <iostream>

namespace cairn::core {

namespace colors = constants::string_processing::colors;

auto ConfigurationLoader::load_configuration(const std::string& config_file) 
  -> std::expected<LoadResult, ApplicationError> {

  std::cout << "Loading configuration from: " << config_file << std::endl;

  io::ConfigurationManager config_manager;
  auto config_result = config_manager.load(config_file);
  if (!config_result) {
    return std::unexpected(ApplicationError{
      "Failed to load config: " + config_result.error().message(),
      constants::indexing::second
    });
  }

  std::cout << colors::green << "✓ Configuration loaded successfully" << colors::reset << std::endl;

  LoadResult result{std::move(config_result.value()), config_manager.config_file_path()};
  display_configuration_info(result.config);
  return result;
}

auto ConfigurationLoader::display_configuration_info(const io::NetworkConfig& config) const -> void {
  display_network_info(config);
  display_group_info(config);
}

auto ConfigurationLoader::display_network_info(const io::NetworkConfig& config) const -> void {
  std::size_t reservoirs = 0;
  for (const auto& node : config.nodes) {
    if (io::is_reservoir(node.kind)) {
      ++reservoirs;
    }
  }
  std::size_t switches = 0;
  for (const auto& connection : config.connections) {
    if (connection.mechanism_switch) {
      ++switches;
    }
  }

  std::cout << "\n" << colors::cyan 
            << "┌─ NETWORK SETUP ───────────────────────────┐" 
            << colors::reset << std::endl;
  std::cout << "│ Default mech.   : " << std::setw(22) << std::left << config.default_mechanism << " │" << std::endl;
  std::cout << "│ Groups          : " << std::setw(22) << std::left
            << (config.groups.empty() ? std::string("none (single stage)") : std::to_string(config.groups.size()))
            << " │" << std::endl;
  std::cout << "│ Nodes           : " << std::setw(22) << std::left
            << std::format("{} ({} reservoirs)", config.nodes.size(), reservoirs) << " │" << std::endl;
  std::cout << "│ Connections     : " << std::setw(22) << std::left
            << std::format("{} ({} switches)", config.connections.size(), switches) << " │" << std::endl;
  std::cout << "│ Advance substeps: " << std::setw(22) << std::left << config.solver.advance_substeps << " │" << std::endl;
  std::cout << colors::cyan 
            << "└───────────────────────────────────────────┘" 
            << colors::reset << std::endl;
}

auto ConfigurationLoader::display_group_info(const io::NetworkConfig& config) const -> void {
  if (config.groups.empty()) {
    return;
  }

  std::cout << "\nDeclared groups:" << std::endl;
  for (const auto& [id, group] : config.groups) {
    const auto& mechanism = group.mechanism ? *group.mechanism : config.default_mechanism;
    const auto directive = group.solve == io::GroupConfig::Solve::Advance
                               ? std::format("advance {} s", group.advance_time)
                               : std::string("steady-state");
    std::cout << std::format("  {:<16} {:<12} {}", id, mechanism, directive) << std::endl;
  }
}

} // namespace cairn::core
