#pragma once
#include "output_types.hpp"
#include "../../staging/stage_types.hpp"
#include <expected>
#include <memory>

namespace cairn::io::output {

// Abstract base class for format-specific writers
class FormatWriter {
public:
    virtual ~FormatWriter() = default;

    [[nodiscard]] virtual auto write(
        const std::filesystem::path& file_path,
        const OutputDataset& dataset,
        const OutputConfig& config,
        ProgressCallback progress = nullptr
    ) const -> std::expected<void, OutputError> = 0;

    [[nodiscard]] virtual auto get_extension() const noexcept -> std::string_view = 0;
    [[nodiscard]] virtual auto supports_metadata() const noexcept -> bool = 0;
};

// Factory for creating format-specific writers
class WriterFactory {
public:
    [[nodiscard]] static auto create_writer(OutputFormat format)
        -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError>;

    [[nodiscard]] static auto get_available_formats() noexcept
        -> std::vector<OutputFormat>;
};

// Main output writer class
class OutputWriter {
private:
    OutputConfig config_;
    std::vector<std::unique_ptr<FormatWriter>> writers_;

    // Generate output file paths
    [[nodiscard]] auto generate_file_paths(
        const std::string& case_name,
        const std::chrono::system_clock::time_point& timestamp
    ) const -> std::vector<std::filesystem::path>;

public:
    explicit OutputWriter(OutputConfig config = {});

    // Main interface - write a complete trajectory with every configured writer
    [[nodiscard]] auto write_trajectory(
        const staging::LagrangianTrajectory& trajectory,
        SimulationMetadata metadata,
        ProgressCallback progress = nullptr
    ) -> std::expected<std::vector<std::filesystem::path>, OutputError>;

    // Utility functions
    [[nodiscard]] auto get_config() const noexcept -> const OutputConfig& {
        return config_;
    }

    auto set_config(OutputConfig config) -> void {
        config_ = std::move(config);
        initialize_writers();
    }

    [[nodiscard]] auto writer_count() const noexcept -> std::size_t {
        return writers_.size();
    }

    // Validation
    [[nodiscard]] auto validate_config() const -> std::expected<void, OutputError>;

private:
    auto initialize_writers() -> void;
};

// Output settings derived from the network file's output section
[[nodiscard]] auto make_output_config(const io::OutputConfig& network_output) -> OutputConfig;

// Stage summary recorded in the output metadata
[[nodiscard]] auto describe_stages(const staging::StageExecutionPlan& plan)
    -> std::vector<SimulationMetadata::StageInfo>;

} // namespace cairn::io::output
