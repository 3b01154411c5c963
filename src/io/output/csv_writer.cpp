#include "cairn/io/output/csv_writer.hpp"
#include "cairn/core/constants.hpp"
#include <cmath>
#include <sstream>

namespace cairn::io::output {

auto CSVWriter::write(
    const std::filesystem::path& file_path,
    const OutputDataset& dataset,
    const OutputConfig& config,
    ProgressCallback progress
) const -> std::expected<void, OutputError> {

    if (progress) {
        progress(0.0, "Writing trajectory table");
    }

    if (auto result = write_trajectory_table(file_path, dataset.trajectory); !result) {
        return std::unexpected(result.error());
    }

    if (config.save_metadata && csv_config_.write_stage_file) {
        if (progress) {
            progress(0.7, "Writing stage summary");
        }
        if (auto result = write_stage_file(stage_file_path(file_path), dataset); !result) {
            return std::unexpected(result.error());
        }
    }

    if (progress) {
        progress(1.0, "CSV write complete");
    }
    return {};
}

auto CSVWriter::stage_file_path(const std::filesystem::path& file_path) -> std::filesystem::path {
    auto stage_path = file_path;
    stage_path.replace_filename(file_path.stem().string() + "_stages" + file_path.extension().string());
    return stage_path;
}

auto CSVWriter::write_trajectory_table(
    const std::filesystem::path& file_path,
    const staging::LagrangianTrajectory& trajectory
) const -> std::expected<void, OutputError> {

    std::ofstream file(file_path);
    if (!file.is_open()) {
        return std::unexpected(FileWriteError(file_path, "Cannot open file for writing"));
    }

    trajectory.to_table().write_csv(file, csv_config_.delimiter, csv_config_.precision);

    if (!file.good()) {
        return std::unexpected(FileWriteError(file_path, "Error occurred while writing"));
    }
    return {};
}

auto CSVWriter::write_stage_file(
    const std::filesystem::path& file_path,
    const OutputDataset& dataset
) const -> std::expected<void, OutputError> {

    std::ofstream file(file_path);
    if (!file.is_open()) {
        return std::unexpected(FileWriteError(file_path, "Cannot open file for writing"));
    }

    const char d = csv_config_.delimiter;
    file << "stage" << d << "mechanism" << d << "directive" << d << "t_offset" << d << "duration" << d
         << "n_points" << d << "lost_species" << csv_config_.line_ending;

    for (const auto& segment : dataset.trajectory.segments()) {
        std::string directive;
        for (const auto& stage : dataset.metadata.stages) {
            if (stage.id == segment.stage_id) {
                directive = stage.directive;
                break;
            }
        }

        // Species lost on entry, as "name:fraction" pairs separated by spaces
        std::string losses;
        if (segment.mapping_losses) {
            for (const auto& [species, value] : *segment.mapping_losses) {
                if (!losses.empty()) {
                    losses += ' ';
                }
                losses += species + ":" + format_value(value);
            }
        }

        file << segment.stage_id << d << segment.mechanism << d << directive << d << format_value(segment.t_offset)
             << d << format_value(segment.duration()) << d << segment.size() << d << losses
             << csv_config_.line_ending;
    }

    if (!file.good()) {
        return std::unexpected(FileWriteError(file_path, "Error occurred while writing"));
    }
    return {};
}

auto CSVWriter::format_value(double value) const -> std::string {
    if (std::isnan(value)) {
        return constants::io::missing_value;
    }
    std::ostringstream oss;
    oss << std::setprecision(csv_config_.precision) << value;
    return oss.str();
}

} // namespace cairn::io::output
