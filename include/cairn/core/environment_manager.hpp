#pragma once
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace cairn::core {

class EnvironmentManager {
public:
  // Configure environment for the application
  [[nodiscard]] auto configure_environment(const std::filesystem::path& executable_path) 
    -> std::expected<void, ApplicationError>;

private:
  // Point Mutation++ at its data directory
  [[nodiscard]] auto configure_mutation_pp(const std::filesystem::path& exe_path) 
    -> std::expected<void, ApplicationError>;
};

} // namespace cairn::core
