#pragma once
#include "../io/config_types.hpp"
#include "../io/output/output_writer.hpp"
#include "application_types.hpp"
#include "simulation_runner.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cairn::core {

class OutputManager {
public:
  using ProgressCallback = std::function<void(double, const std::string&)>;

  // Initialize output system; a command-line case name overrides the network file's
  [[nodiscard]] auto initialize_output_system(const io::NetworkConfig& config,
                                              const std::optional<std::string>& case_name) 
    -> std::expected<void, ApplicationError>;

  // Write the (possibly partial) trajectory of a run
  [[nodiscard]] auto write_simulation_results(
    const SimulationRunner::SimulationResult& result,
    const io::NetworkConfig& config,
    const std::filesystem::path& network_file,
    PerformanceMetrics& metrics) 
    -> std::expected<std::vector<std::filesystem::path>, ApplicationError>;

  // Display planned output files
  auto display_planned_outputs() const -> void;

private:
  std::unique_ptr<io::output::OutputWriter> output_writer_;

  // Report the HDF5 library in use
  auto display_hdf5_version() const -> void;

  // Progress callback for output operations
  auto create_progress_callback() const -> ProgressCallback;
};

} // namespace cairn::core
