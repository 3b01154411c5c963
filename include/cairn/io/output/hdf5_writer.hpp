#pragma once
#include "../../core/constants.hpp"
#include "output_writer.hpp"
#include <hdf5.h>
#include <memory>
#include <string_view>

namespace cairn::io::output {

// HDF5-specific configuration
struct HDF5Config {
  int compression_level = constants::io::default_hdf5_compression; // 0-9, higher = better compression
  bool use_shuffle_filter = true;                                  // Reorder bytes for better compression
  std::size_t chunk_size = constants::io::default_hdf5_chunk_size; // Chunk size for datasets
};

// RAII wrapper for HDF5 handles
template <typename HandleType, auto CloseFunc> class HDF5Handle {
private:
  HandleType handle_;

public:
  explicit HDF5Handle(HandleType handle) : handle_(handle) {
    if (handle_ < 0) {
      throw OutputError("Invalid HDF5 handle");
    }
  }

  ~HDF5Handle() {
    if (handle_ >= 0) {
      CloseFunc(handle_);
    }
  }

  // Move semantics only
  HDF5Handle(HDF5Handle&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

  HDF5Handle& operator=(HDF5Handle&& other) noexcept {
    if (this != &other) {
      if (handle_ >= 0) {
        CloseFunc(handle_);
      }
      handle_ = other.handle_;
      other.handle_ = -1;
    }
    return *this;
  }

  HDF5Handle(const HDF5Handle&) = delete;
  HDF5Handle& operator=(const HDF5Handle&) = delete;

  [[nodiscard]] auto get() const noexcept -> HandleType { return handle_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return handle_ >= 0; }

  // Implicit conversion for C API
  operator HandleType() const noexcept { return handle_; }
};

// Type aliases for HDF5 handles
using FileHandle = HDF5Handle<hid_t, H5Fclose>;
using GroupHandle = HDF5Handle<hid_t, H5Gclose>;
using DatasetHandle = HDF5Handle<hid_t, H5Dclose>;
using DataspaceHandle = HDF5Handle<hid_t, H5Sclose>;
using PropertyHandle = HDF5Handle<hid_t, H5Pclose>;
using TypeHandle = HDF5Handle<hid_t, H5Tclose>;
using AttributeHandle = HDF5Handle<hid_t, H5Aclose>;

/**
 * @brief HDF5 implementation of FormatWriter
 *
 * Layout:
 *   /metadata                      attributes + stage_ids, stage_mechanisms, stage_directives
 *   /segments/<idx>_<stage>        temperature, pressure, time, species, mole_fractions,
 *                                  mass_fractions, t_offset, mapping_losses/{species, mole_fractions}
 *   /trajectory                    temperature, pressure, time, stage
 */
class HDF5Writer : public FormatWriter {
private:
  HDF5Config hdf5_config_;

  [[nodiscard]] auto
  create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError>;

  [[nodiscard]] auto write_metadata(FileHandle& file,
                                    const SimulationMetadata& metadata) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_segments(FileHandle& file, const staging::LagrangianTrajectory& trajectory,
                                    ProgressCallback progress) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_segment_data(GroupHandle& segment_group,
                                        const staging::TrajectorySegment& segment) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_concatenated(FileHandle& file, const staging::LagrangianTrajectory& trajectory) const
      -> std::expected<void, OutputError>;

  // Utility functions for HDF5 operations
  [[nodiscard]] auto create_group(hid_t parent,
                                  const std::string& name) const -> std::expected<GroupHandle, OutputError>;

  [[nodiscard]] auto write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                                  const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_scalar(hid_t parent, const std::string& name, double value,
                                  const std::string& units = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_string(hid_t parent, const std::string& name,
                                  const std::string& value) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto
  write_string_array(hid_t parent, const std::string& name,
                     const std::vector<std::string>& values) const -> std::expected<void, OutputError>;

  // Property list creation
  [[nodiscard]] auto create_chunked_properties(std::size_t rows, std::size_t cols) const
      -> std::expected<PropertyHandle, OutputError>;

public:
  explicit HDF5Writer(HDF5Config config = {}) : hdf5_config_(config) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                           const OutputConfig& config,
                           ProgressCallback progress = nullptr) const -> std::expected<void, OutputError> override;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".h5"; }

  [[nodiscard]] auto supports_metadata() const noexcept -> bool override { return true; }

  auto set_hdf5_config(HDF5Config config) noexcept -> void { hdf5_config_ = config; }

  [[nodiscard]] auto get_hdf5_config() const noexcept -> const HDF5Config& { return hdf5_config_; }
};

// HDF5 reader for post-processing analysis
class HDF5Reader {
private:
  FileHandle file_;

public:
  explicit HDF5Reader(const std::filesystem::path& file_path);

  // True when every component of the slash-separated path exists
  [[nodiscard]] auto has_object(const std::string& path) const -> bool;

  [[nodiscard]] auto read_vector(const std::string& path) const -> std::expected<std::vector<double>, OutputError>;

  [[nodiscard]] auto read_matrix(const std::string& path) const -> std::expected<core::Matrix<double>, OutputError>;

  [[nodiscard]] auto read_string_array(const std::string& path) const
      -> std::expected<std::vector<std::string>, OutputError>;

  [[nodiscard]] auto read_string_attribute(const std::string& object_path, const std::string& name) const
      -> std::expected<std::string, OutputError>;

  // Names of the members of a group, in HDF5 name order
  [[nodiscard]] auto list_group(const std::string& path) const -> std::expected<std::vector<std::string>, OutputError>;
};

// Convenience functions for HDF5
namespace hdf5 {

[[nodiscard]] auto check_version() -> std::expected<std::string, OutputError>;

[[nodiscard]] auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError>;

} // namespace hdf5

} // namespace cairn::io::output
