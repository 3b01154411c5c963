#pragma once
#include "output_writer.hpp"
#include <fstream>
#include <iomanip>

namespace cairn::io::output {

// CSV-specific configuration
struct CSVConfig {
    char delimiter = ',';
    int precision = 10;
    std::string line_ending = "\n";

    // Companion file with one row per stage next to the trajectory table
    bool write_stage_file = true;
};

// CSV writer for simple data analysis
class CSVWriter : public FormatWriter {
private:
    CSVConfig csv_config_;

    [[nodiscard]] auto write_trajectory_table(
        const std::filesystem::path& file_path,
        const staging::LagrangianTrajectory& trajectory
    ) const -> std::expected<void, OutputError>;

    [[nodiscard]] auto write_stage_file(
        const std::filesystem::path& file_path,
        const OutputDataset& dataset
    ) const -> std::expected<void, OutputError>;

    [[nodiscard]] auto format_value(double value) const -> std::string;

public:
    explicit CSVWriter(CSVConfig config = {}) : csv_config_(std::move(config)) {}

    [[nodiscard]] auto write(
        const std::filesystem::path& file_path,
        const OutputDataset& dataset,
        const OutputConfig& config,
        ProgressCallback progress = nullptr
    ) const -> std::expected<void, OutputError> override;

    [[nodiscard]] auto get_extension() const noexcept -> std::string_view override {
        return ".csv";
    }

    [[nodiscard]] auto supports_metadata() const noexcept -> bool override {
        return true;
    }

    // Path of the per-stage companion file for a given trajectory file
    [[nodiscard]] static auto stage_file_path(const std::filesystem::path& file_path)
        -> std::filesystem::path;

    auto set_csv_config(CSVConfig config) -> void {
        csv_config_ = std::move(config);
    }

    [[nodiscard]] auto get_csv_config() const noexcept -> const CSVConfig& {
        return csv_config_;
    }
};

} // namespace cairn::io::output
