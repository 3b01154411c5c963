#pragma once
#include "../../core/constants.hpp"
#include "../../core/exceptions.hpp"
#include "../../staging/lagrangian_trajectory.hpp"
#include "../config_types.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>

namespace cairn::io::output {

// Output format enumeration
enum class OutputFormat { CSV, HDF5 };

[[nodiscard]] constexpr auto to_string(OutputFormat format) noexcept -> std::string_view {
  switch (format) {
  case OutputFormat::CSV:
    return "csv";
  case OutputFormat::HDF5:
    return "hdf5";
  }
  return "unknown";
}

// Output configuration
struct OutputConfig {
  std::filesystem::path base_directory = "cairn_outputs";
  std::string case_name = "simulation";
  std::vector<OutputFormat> formats = {OutputFormat::HDF5};
  bool save_metadata = true;

  // Time stamping
  bool include_timestamp = true;
};

// Metadata container
struct SimulationMetadata {
  std::string cairn_version = constants::io::default_cairn_version;
  std::chrono::system_clock::time_point creation_time;
  std::string network_file;
  std::string default_mechanism;

  struct StageInfo {
    std::string id;
    std::string mechanism;
    std::string directive;
    std::vector<std::string> node_ids;
  };
  std::vector<StageInfo> stages;
};

// Complete output dataset
struct OutputDataset {
  SimulationMetadata metadata;
  staging::LagrangianTrajectory trajectory;
};

// Progress callback for large outputs
using ProgressCallback = std::function<void(double progress, const std::string& stage)>;

// Output error types
class OutputError : public core::CairnException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : CairnException(std::format("Output Error: {}", message), location) {}
};

class FileWriteError : public OutputError {
private:
  std::filesystem::path file_path_;

public:
  explicit FileWriteError(const std::filesystem::path& path, std::string_view message,
                          std::source_location location = std::source_location::current())
      : OutputError(std::format("File '{}': {}", path.string(), message), location), file_path_(path) {}

  [[nodiscard]] auto file_path() const noexcept -> const std::filesystem::path& { return file_path_; }
};

class UnsupportedFormatError : public OutputError {
public:
  explicit UnsupportedFormatError(OutputFormat format, std::source_location location = std::source_location::current())
      : OutputError(std::format("Unsupported output format: {}", to_string(format)), location) {}
};

} // namespace cairn::io::output
