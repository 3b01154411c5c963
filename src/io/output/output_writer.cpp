#include "cairn/io/output/output_writer.hpp"
#include "cairn/io/output/csv_writer.hpp"
#include "cairn/io/output/hdf5_writer.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace cairn::io::output {

// WriterFactory implementation
auto WriterFactory::create_writer(OutputFormat format)
    -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError> {

  switch (format) {
  case OutputFormat::CSV:
    return std::make_unique<CSVWriter>();
  case OutputFormat::HDF5:
    return std::make_unique<HDF5Writer>();
  }
  return std::unexpected(UnsupportedFormatError(format));
}

auto WriterFactory::get_available_formats() noexcept -> std::vector<OutputFormat> {
  return {OutputFormat::CSV, OutputFormat::HDF5};
}

// OutputWriter implementation
OutputWriter::OutputWriter(OutputConfig config) : config_(std::move(config)) {
  initialize_writers();
}

auto OutputWriter::initialize_writers() -> void {
  writers_.clear();

  for (auto format : config_.formats) {
    if (auto writer = WriterFactory::create_writer(format)) {
      writers_.push_back(std::move(writer.value()));
    }
  }
}

auto OutputWriter::write_trajectory(const staging::LagrangianTrajectory& trajectory, SimulationMetadata metadata,
                                    ProgressCallback progress)
    -> std::expected<std::vector<std::filesystem::path>, OutputError> {

  if (writers_.empty()) {
    return std::unexpected(OutputError("No output format selected"));
  }

  if (auto valid = validate_config(); !valid) {
    return std::unexpected(valid.error());
  }

  OutputDataset dataset{std::move(metadata), trajectory};
  if (dataset.metadata.creation_time == std::chrono::system_clock::time_point{}) {
    dataset.metadata.creation_time = std::chrono::system_clock::now();
  }

  auto file_paths = generate_file_paths(config_.case_name, dataset.metadata.creation_time);

  std::vector<std::filesystem::path> written_files;
  written_files.reserve(writers_.size());

  for (std::size_t i = 0; i < writers_.size() && i < file_paths.size(); ++i) {
    auto& writer = writers_[i];
    const auto& file_path = file_paths[i];

    if (progress) {
      progress(static_cast<double>(i) / writers_.size(), std::format("Writing {}", file_path.filename().string()));
    }

    if (auto write_result = writer->write(file_path, dataset, config_, progress); !write_result) {
      return std::unexpected(FileWriteError(file_path, write_result.error().message()));
    }

    written_files.push_back(file_path);
  }

  if (progress) {
    progress(1.0, "Output complete");
  }

  return written_files;
}

auto OutputWriter::generate_file_paths(const std::string& case_name,
                                       const std::chrono::system_clock::time_point& timestamp) const
    -> std::vector<std::filesystem::path> {

  std::vector<std::filesystem::path> paths;
  paths.reserve(writers_.size());

  std::string timestamp_str;
  if (config_.include_timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto tm = *std::localtime(&time_t);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    timestamp_str = "_" + oss.str();
  }

  for (const auto& writer : writers_) {
    auto filename = case_name + timestamp_str + std::string(writer->get_extension());
    paths.push_back(config_.base_directory / filename);
  }

  return paths;
}

auto OutputWriter::validate_config() const -> std::expected<void, OutputError> {
  if (config_.case_name.empty()) {
    return std::unexpected(OutputError("Case name must not be empty"));
  }

  if (!std::filesystem::exists(config_.base_directory)) {
    std::error_code ec;
    std::filesystem::create_directories(config_.base_directory, ec);
    if (ec) {
      return std::unexpected(OutputError(
          std::format("Cannot create output directory '{}': {}", config_.base_directory.string(), ec.message())));
    }
  }

  return {};
}

auto make_output_config(const io::OutputConfig& network_output) -> OutputConfig {
  OutputConfig config;
  config.base_directory = network_output.output_directory;
  config.case_name = network_output.case_name;
  config.formats.clear();
  if (network_output.write_hdf5) {
    config.formats.push_back(OutputFormat::HDF5);
  }
  if (network_output.write_csv) {
    config.formats.push_back(OutputFormat::CSV);
  }
  return config;
}

auto describe_stages(const staging::StageExecutionPlan& plan) -> std::vector<SimulationMetadata::StageInfo> {
  std::vector<SimulationMetadata::StageInfo> stages;
  stages.reserve(plan.ordered_stages.size());
  for (const auto& stage : plan.ordered_stages) {
    stages.push_back({stage.id, stage.mechanism, staging::describe(stage.directive), stage.node_ids});
  }
  return stages;
}

} // namespace cairn::io::output
