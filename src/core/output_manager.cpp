#include "cairn/core/output_manager.hpp"
#include "cairn/core/constants.hpp"
#include "cairn/io/output/hdf5_writer.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace cairn::core {

namespace colors = constants::string_processing::colors;

auto OutputManager::initialize_output_system(const io::NetworkConfig& config,
                                             const std::optional<std::string>& case_name) 
  -> std::expected<void, ApplicationError> {

  std::cout << "\nInitializing output system..." << std::endl;

  auto output_config = io::output::make_output_config(config.output);
  if (case_name) {
    output_config.case_name = *case_name;
  }

  if (std::ranges::find(output_config.formats, io::output::OutputFormat::HDF5) != output_config.formats.end()) {
    display_hdf5_version();
  }

  output_writer_ = std::make_unique<io::output::OutputWriter>(std::move(output_config));

  if (output_writer_->writer_count() == 0) {
    std::cout << colors::yellow << "No output format enabled, results will not be written" << colors::reset
              << std::endl;
    return {};
  }

  if (auto validation = output_writer_->validate_config(); !validation) {
    return std::unexpected(ApplicationError{
      "Output configuration error: " + validation.error().message(),
      constants::indexing::second
    });
  }

  std::cout << colors::green << "✓ Output system configured" << colors::reset << std::endl;
  display_planned_outputs();
  return {};
}

auto OutputManager::write_simulation_results(
  const SimulationRunner::SimulationResult& result,
  const io::NetworkConfig& config,
  const std::filesystem::path& network_file,
  PerformanceMetrics& metrics) 
  -> std::expected<std::vector<std::filesystem::path>, ApplicationError> {

  if (!output_writer_ || output_writer_->writer_count() == 0) {
    return std::vector<std::filesystem::path>{};
  }
  if (result.trajectory.empty()) {
    std::cout << colors::yellow << "No completed stage, nothing to write" << colors::reset << std::endl;
    return std::vector<std::filesystem::path>{};
  }

  std::cout << "\n=== WRITING OUTPUT FILES ===" << std::endl;

  io::output::SimulationMetadata metadata;
  metadata.network_file = network_file.string();
  metadata.default_mechanism = config.default_mechanism;
  metadata.stages = io::output::describe_stages(result.plan);

  auto output_start = std::chrono::high_resolution_clock::now();
  auto output_result = output_writer_->write_trajectory(result.trajectory, std::move(metadata),
                                                        create_progress_callback());
  auto output_end = std::chrono::high_resolution_clock::now();

  metrics.output_time = std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);

  std::cout << std::endl; // New line after progress

  if (!output_result) {
    return std::unexpected(ApplicationError{
      "Failed to write output: " + output_result.error().message(),
      constants::indexing::second
    });
  }

  auto output_files = std::move(output_result.value());
  metrics.output_files = output_files;

  std::cout << colors::green << "✓ Output written successfully!" << colors::reset << std::endl;
  std::cout << "  Output time: " << metrics.output_time.count() << " ms" << std::endl;
  std::cout << "\nGenerated files:" << std::endl;

  for (const auto& file_path : output_files) {
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(file_path, ec);
    std::cout << "  " << file_path.filename().string();
    if (!ec) {
      std::cout << " (" << std::setprecision(constants::string_processing::float_precision_2) << std::fixed
                << (file_size / constants::io::bytes_to_kb) << " KB)" << std::defaultfloat;
    }
    std::cout << std::endl;
  }

  return output_files;
}

auto OutputManager::display_planned_outputs() const -> void {
  const auto& config = output_writer_->get_config();
  std::cout << "\nPlanned output files:" << std::endl;

  for (auto format : config.formats) {
    auto writer = io::output::WriterFactory::create_writer(format);
    if (!writer) {
      continue;
    }
    std::cout << "  " << io::output::to_string(format) << ": "
              << (config.base_directory / (config.case_name + std::string((*writer)->get_extension()))).string();
    if (config.include_timestamp) {
      std::cout << " (timestamp will be set at write time)";
    }
    std::cout << std::endl;
  }
}

auto OutputManager::display_hdf5_version() const -> void {
  if (auto version = io::output::hdf5::check_version()) {
    std::cout << colors::green << "✓ HDF5 library version: " << colors::reset << version.value() << std::endl;
  } else {
    std::cerr << "Warning: " << version.error().message() << std::endl;
  }
}

auto OutputManager::create_progress_callback() const -> ProgressCallback {
  return [](double progress, const std::string& stage) {
    std::cout << "\r" << std::setw(60) << std::left
              << ("  " + stage + " [" + std::to_string(static_cast<int>(progress * constants::conversion::to_percentage)) + "%]") 
              << std::right << std::flush;
  };
}

} // namespace cairn::core
