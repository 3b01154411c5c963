#pragma once
#include "../io/config_types.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace cairn::core {

class ConfigurationLoader {
public:
  struct LoadResult {
    io::NetworkConfig config;
    std::filesystem::path config_path;
  };

  // Load and validate the network description
  [[nodiscard]] auto load_configuration(const std::string& config_file) 
    -> std::expected<LoadResult, ApplicationError>;

  // Display configuration information
  auto display_configuration_info(const io::NetworkConfig& config) const -> void;

private:
  // Display network setup
  auto display_network_info(const io::NetworkConfig& config) const -> void;

  // Display declared groups
  auto display_group_info(const io::NetworkConfig& config) const -> void;
};

} // namespace cairn::core
