#include "cairn/core/environment_manager.hpp"
#include "cairn/core/constants.hpp"
#include <cstdlib>
#include <iostream>

namespace cairn::core {

auto EnvironmentManager::configure_environment(const std::filesystem::path& executable_path) 
  -> std::expected<void, ApplicationError> {
  return configure_mutation_pp(executable_path);
}

auto EnvironmentManager::configure_mutation_pp(const std::filesystem::path& exe_path) 
  -> std::expected<void, ApplicationError> {

  // An explicit setting always wins over the bundled data tree
  if (const char* env_mpp = std::getenv("MPP_DATA_DIRECTORY")) {
    std::cout << "Using existing MPP_DATA_DIRECTORY: " << env_mpp << std::endl;
    return {};
  }

  std::error_code ec;
  const auto mpp_data_path = exe_path / "libs" / "mutationpp" / "data";
  if (!std::filesystem::exists(mpp_data_path, ec)) {
    std::cerr << constants::string_processing::colors::yellow
              << "Warning: MPP_DATA_DIRECTORY not set and no data directory at " << mpp_data_path.string()
              << ". Mechanism loading may fail." << constants::string_processing::colors::reset << std::endl;
    return {};
  }

  const auto canonical = std::filesystem::canonical(mpp_data_path, ec);
  if (ec) {
    return std::unexpected(ApplicationError{
      "Cannot resolve Mutation++ data directory " + mpp_data_path.string() + ": " + ec.message(),
      constants::indexing::second
    });
  }

  if (setenv("MPP_DATA_DIRECTORY", canonical.c_str(), constants::indexing::second) != 0) {
    return std::unexpected(ApplicationError{
      "Failed to set MPP_DATA_DIRECTORY",
      constants::indexing::second
    });
  }
  std::cout << "MPP_DATA_DIRECTORY auto-set to: " << canonical.string() << std::endl;
  return {};
}

} // namespace cairn::core
