#include "cairn/io/output/hdf5_writer.hpp"
#include "cairn/core/expected_utils.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <ranges>
#include <sstream>
#include <vector>

namespace cairn::io::output {

namespace {
// Group names cannot contain the HDF5 path separator
[[nodiscard]] auto segment_group_name(std::size_t index, const std::string& stage_id) -> std::string {
  std::string safe = stage_id;
  std::ranges::replace(safe, '/', '_');
  return std::format("{:03d}_{}", index, safe);
}
} // namespace

// HDF5Writer implementation
auto HDF5Writer::write(const std::filesystem::path& file_path, const OutputDataset& dataset, const OutputConfig& config,
                       ProgressCallback progress) const -> std::expected<void, OutputError> {

  try {
    if (progress)
      progress(0.0, "Creating HDF5 file");

    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (config.save_metadata) {
      if (progress)
        progress(0.1, "Writing metadata");

      if (auto meta_result = write_metadata(file, dataset.metadata); !meta_result) {
        return std::unexpected(meta_result.error());
      }
    }

    if (progress)
      progress(0.2, "Writing segments");

    if (auto segments_result = write_segments(file, dataset.trajectory, progress); !segments_result) {
      return std::unexpected(segments_result.error());
    }

    if (progress)
      progress(0.9, "Writing concatenated trajectory");

    if (auto concat_result = write_concatenated(file, dataset.trajectory); !concat_result) {
      return std::unexpected(concat_result.error());
    }

    if (progress)
      progress(1.0, "HDF5 write complete");

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.what())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {

  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }

  H5Pset_fclose_degree(fapl, H5F_CLOSE_STRONG);

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl);
  H5Pclose(fapl);

  if (file_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create HDF5 file: {}", file_path.string())));
  }

  try {
    return FileHandle(file_id);
  } catch (const std::exception& e) {
    H5Fclose(file_id);
    return std::unexpected(OutputError(e.what()));
  }
}

auto HDF5Writer::write_metadata(FileHandle& file,
                                const SimulationMetadata& metadata) const -> std::expected<void, OutputError> {

  auto metadata_group_result = create_group(file, "metadata");
  if (!metadata_group_result) {
    return std::unexpected(metadata_group_result.error());
  }
  auto metadata_group = std::move(metadata_group_result.value());

  if (auto result = write_string(metadata_group, "cairn_version", metadata.cairn_version); !result) {
    return std::unexpected(result.error());
  }

  auto time_t = std::chrono::system_clock::to_time_t(metadata.creation_time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  if (auto result = write_string(metadata_group, "creation_time", oss.str()); !result) {
    return std::unexpected(result.error());
  }

  if (auto result = write_string(metadata_group, "network_file", metadata.network_file); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(metadata_group, "default_mechanism", metadata.default_mechanism); !result) {
    return std::unexpected(result.error());
  }

  // Stage table in execution order
  std::vector<std::string> ids, mechanisms, directives;
  for (const auto& stage : metadata.stages) {
    ids.push_back(stage.id);
    mechanisms.push_back(stage.mechanism);
    directives.push_back(stage.directive);
  }
  if (auto result = write_string_array(metadata_group, "stage_ids", ids); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string_array(metadata_group, "stage_mechanisms", mechanisms); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string_array(metadata_group, "stage_directives", directives); !result) {
    return std::unexpected(result.error());
  }

  return {};
}

auto HDF5Writer::write_segments(FileHandle& file, const staging::LagrangianTrajectory& trajectory,
                                ProgressCallback progress) const -> std::expected<void, OutputError> {

  auto segments_group_result = create_group(file, "segments");
  if (!segments_group_result) {
    return std::unexpected(segments_group_result.error());
  }
  auto segments_group = std::move(segments_group_result.value());

  const auto& segments = trajectory.segments();
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (progress) {
      double segment_progress = 0.2 + 0.7 * (static_cast<double>(i) / segments.size());
      progress(segment_progress, std::format("Writing segment '{}'", segments[i].stage_id));
    }

    auto segment_group_result = create_group(segments_group, segment_group_name(i, segments[i].stage_id));
    if (!segment_group_result) {
      return std::unexpected(segment_group_result.error());
    }
    auto segment_group = std::move(segment_group_result.value());

    if (auto result = write_segment_data(segment_group, segments[i]); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_segment_data(GroupHandle& segment_group, const staging::TrajectorySegment& segment) const
    -> std::expected<void, OutputError> {

  if (auto result = write_string(segment_group, "stage_id", segment.stage_id); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(segment_group, "mechanism", segment.mechanism); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(segment_group, "t_offset", segment.t_offset, "s"); !result) {
    return std::unexpected(result.error());
  }

  std::vector<double> temperature, pressure, time;
  temperature.reserve(segment.size());
  pressure.reserve(segment.size());
  time.reserve(segment.size());
  for (const auto& state : segment.states) {
    temperature.push_back(state.temperature);
    pressure.push_back(state.pressure);
    time.push_back(state.time);
  }

  if (auto result = write_vector(segment_group, "temperature", temperature, "K", "Temperature"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(segment_group, "pressure", pressure, "Pa", "Pressure"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(segment_group, "time", time, "s", "Local residence time within the stage");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string_array(segment_group, "species", segment.species); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_matrix(segment_group, "mole_fractions", segment.mole_fraction_matrix(),
                                 "Species mole fractions [n_states x n_species]");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_matrix(segment_group, "mass_fractions", segment.mass_fraction_matrix(),
                                 "Species mass fractions [n_states x n_species], NaN when unknown");
      !result) {
    return std::unexpected(result.error());
  }

  if (segment.mapping_losses) {
    auto losses_group_result = create_group(segment_group, "mapping_losses");
    if (!losses_group_result) {
      return std::unexpected(losses_group_result.error());
    }
    auto losses_group = std::move(losses_group_result.value());

    std::vector<std::string> species;
    std::vector<double> values;
    for (const auto& [name, value] : *segment.mapping_losses) {
      species.push_back(name);
      values.push_back(value);
    }
    if (auto result = write_string_array(losses_group, "species", species); !result) {
      return std::unexpected(result.error());
    }
    if (auto result = write_vector(losses_group, "mole_fractions", values, "", "Mole fraction dropped on entry");
        !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_concatenated(FileHandle& file, const staging::LagrangianTrajectory& trajectory) const
    -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "trajectory");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  CAIRN_TRY_VOID(write_vector(group, "temperature", trajectory.temperature(), "K"));
  CAIRN_TRY_VOID(write_vector(group, "pressure", trajectory.pressure(), "Pa"));
  CAIRN_TRY_VOID(write_vector(group, "time", trajectory.time(), "s", "Global residence time"));
  CAIRN_TRY_VOID(write_string_array(group, "stage", trajectory.stage_labels()));

  return {};
}

// Utility function implementations
auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {

  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }

  try {
    return GroupHandle(group_id);
  } catch (const std::exception& e) {
    H5Gclose(group_id);
    return std::unexpected(OutputError(e.what()));
  }
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.empty()) {
    return {}; // Skip empty datasets
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties(data.size(), 1);
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.rows() == 0 || data.cols() == 0) {
    return {}; // Skip empty matrices
  }

  hsize_t dims[2] = {static_cast<hsize_t>(data.rows()), static_cast<hsize_t>(data.cols())};
  auto space_id = H5Screate_simple(2, dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for matrix '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties(data.rows(), data.cols());
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  // Eigen matrices are column-major, HDF5 expects row-major
  std::vector<double> row_major_data(data.rows() * data.cols());
  for (std::size_t i = 0; i < data.rows(); ++i) {
    for (std::size_t j = 0; j < data.cols(); ++j) {
      row_major_data[i * data.cols() + j] = data(i, j);
    }
  }

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, row_major_data.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write matrix data for '{}'", name)));
  }

  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::create_chunked_properties(std::size_t rows, std::size_t cols) const
    -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  if (hdf5_config_.compression_level <= 0) {
    return props;
  }

  // Chunk sizes must be <= data sizes and at least 1
  const int rank = cols > 1 ? 2 : 1;
  hsize_t chunk_dims[2];
  chunk_dims[0] = std::max<hsize_t>(1, std::min(rows, hdf5_config_.chunk_size));
  chunk_dims[1] = std::max<hsize_t>(1, std::min(cols, hdf5_config_.chunk_size));

  if (H5Pset_chunk(props, rank, chunk_dims) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }

  if (hdf5_config_.use_shuffle_filter) {
    H5Pset_shuffle(props);
  }
  H5Pset_deflate(props, static_cast<unsigned>(hdf5_config_.compression_level));

  return props;
}

auto HDF5Writer::write_scalar(hid_t parent, const std::string& name, double value,
                              const std::string& units) const -> std::expected<void, OutputError> {

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value);
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write scalar value for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name,
                              const std::string& value) const -> std::expected<void, OutputError> {

  // Written as an attribute of the parent group or dataset
  H5I_type_t obj_type = H5Iget_type(parent);
  if (obj_type != H5I_DATASET && obj_type != H5I_GROUP) {
    return std::unexpected(OutputError(std::format("Cannot attach string attribute '{}' to this object", name)));
  }

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  H5Tset_size(string_type, value.length() + 1);
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);

  if (H5Awrite(attribute, string_type, value.c_str()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }

  return {};
}

auto HDF5Writer::write_string_array(hid_t parent, const std::string& name,
                                    const std::vector<std::string>& values) const -> std::expected<void, OutputError> {

  if (values.empty()) {
    return {}; // Skip empty arrays
  }

  std::size_t max_len = 0;
  for (const auto& str : values) {
    max_len = std::max(max_len, str.length());
  }
  ++max_len; // For null terminator

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  H5Tset_size(string_type, max_len);
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  hsize_t dims = values.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string array '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string array dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  std::vector<char> buffer(values.size() * max_len, '\0');
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::strncpy(&buffer[i * max_len], values[i].c_str(), max_len - 1);
  }

  auto status = H5Dwrite(dataset, string_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string array data for '{}'", name)));
  }

  return {};
}

// HDF5Reader implementation
namespace {
[[nodiscard]] auto open_for_reading(const std::filesystem::path& file_path) -> hid_t {
  auto file_id = H5Fopen(file_path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (file_id < 0) {
    throw OutputError(std::format("Failed to open HDF5 file: {}", file_path.string()));
  }
  return file_id;
}
} // namespace

HDF5Reader::HDF5Reader(const std::filesystem::path& file_path) : file_(open_for_reading(file_path)) {}

auto HDF5Reader::has_object(const std::string& path) const -> bool {
  std::string partial;
  for (auto part : path | std::views::split('/')) {
    std::string component(part.begin(), part.end());
    if (component.empty()) {
      continue;
    }
    partial += "/" + component;
    if (H5Lexists(file_, partial.c_str(), H5P_DEFAULT) <= 0) {
      return false;
    }
  }
  return !partial.empty();
}

auto HDF5Reader::read_vector(const std::string& path) const -> std::expected<std::vector<double>, OutputError> {
  if (!has_object(path)) {
    return std::unexpected(OutputError(std::format("No dataset '{}'", path)));
  }

  try {
    DatasetHandle dataset(H5Dopen2(file_, path.c_str(), H5P_DEFAULT));
    DataspaceHandle space(H5Dget_space(dataset));

    const auto n = H5Sget_simple_extent_npoints(space);
    if (n < 0) {
      return std::unexpected(OutputError(std::format("Cannot size dataset '{}'", path)));
    }

    std::vector<double> data(static_cast<std::size_t>(n));
    if (H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
      return std::unexpected(OutputError(std::format("Failed to read dataset '{}'", path)));
    }
    return data;

  } catch (const OutputError& e) {
    return std::unexpected(e);
  }
}

auto HDF5Reader::read_matrix(const std::string& path) const -> std::expected<core::Matrix<double>, OutputError> {
  if (!has_object(path)) {
    return std::unexpected(OutputError(std::format("No dataset '{}'", path)));
  }

  try {
    DatasetHandle dataset(H5Dopen2(file_, path.c_str(), H5P_DEFAULT));
    DataspaceHandle space(H5Dget_space(dataset));

    if (H5Sget_simple_extent_ndims(space) != 2) {
      return std::unexpected(OutputError(std::format("Dataset '{}' is not two-dimensional", path)));
    }
    hsize_t dims[2];
    H5Sget_simple_extent_dims(space, dims, nullptr);

    std::vector<double> row_major(dims[0] * dims[1]);
    if (H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, row_major.data()) < 0) {
      return std::unexpected(OutputError(std::format("Failed to read dataset '{}'", path)));
    }

    core::Matrix<double> matrix(dims[0], dims[1]);
    for (std::size_t i = 0; i < dims[0]; ++i) {
      for (std::size_t j = 0; j < dims[1]; ++j) {
        matrix(i, j) = row_major[i * dims[1] + j];
      }
    }
    return matrix;

  } catch (const OutputError& e) {
    return std::unexpected(e);
  }
}

auto HDF5Reader::read_string_array(const std::string& path) const
    -> std::expected<std::vector<std::string>, OutputError> {
  if (!has_object(path)) {
    return std::unexpected(OutputError(std::format("No dataset '{}'", path)));
  }

  try {
    DatasetHandle dataset(H5Dopen2(file_, path.c_str(), H5P_DEFAULT));
    DataspaceHandle space(H5Dget_space(dataset));
    TypeHandle string_type(H5Dget_type(dataset));

    const auto n = static_cast<std::size_t>(H5Sget_simple_extent_npoints(space));
    const auto width = H5Tget_size(string_type);

    std::vector<char> buffer(n * width + 1, '\0');
    if (H5Dread(dataset, string_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) < 0) {
      return std::unexpected(OutputError(std::format("Failed to read string array '{}'", path)));
    }

    std::vector<std::string> values;
    values.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      const char* begin = &buffer[i * width];
      values.emplace_back(begin, strnlen(begin, width));
    }
    return values;

  } catch (const OutputError& e) {
    return std::unexpected(e);
  }
}

auto HDF5Reader::read_string_attribute(const std::string& object_path, const std::string& name) const
    -> std::expected<std::string, OutputError> {

  if (H5Aexists_by_name(file_, object_path.c_str(), name.c_str(), H5P_DEFAULT) <= 0) {
    return std::unexpected(OutputError(std::format("No attribute '{}' on '{}'", name, object_path)));
  }

  try {
    AttributeHandle attribute(H5Aopen_by_name(file_, object_path.c_str(), name.c_str(), H5P_DEFAULT, H5P_DEFAULT));
    TypeHandle string_type(H5Aget_type(attribute));

    const auto width = H5Tget_size(string_type);
    std::vector<char> buffer(width + 1, '\0');
    if (H5Aread(attribute, string_type, buffer.data()) < 0) {
      return std::unexpected(OutputError(std::format("Failed to read attribute '{}'", name)));
    }
    return std::string(buffer.data(), strnlen(buffer.data(), width));

  } catch (const OutputError& e) {
    return std::unexpected(e);
  }
}

auto HDF5Reader::list_group(const std::string& path) const -> std::expected<std::vector<std::string>, OutputError> {
  if (path != "/" && !has_object(path)) {
    return std::unexpected(OutputError(std::format("No group '{}'", path)));
  }

  try {
    GroupHandle group(H5Gopen2(file_, path.c_str(), H5P_DEFAULT));

    H5G_info_t info;
    if (H5Gget_info(group, &info) < 0) {
      return std::unexpected(OutputError(std::format("Failed to query group '{}'", path)));
    }

    std::vector<std::string> names;
    names.reserve(info.nlinks);
    for (hsize_t i = 0; i < info.nlinks; ++i) {
      auto length = H5Lget_name_by_idx(group, ".", H5_INDEX_NAME, H5_ITER_INC, i, nullptr, 0, H5P_DEFAULT);
      if (length < 0) {
        return std::unexpected(OutputError(std::format("Failed to read member {} of '{}'", i, path)));
      }
      std::vector<char> buffer(static_cast<std::size_t>(length) + 1, '\0');
      H5Lget_name_by_idx(group, ".", H5_INDEX_NAME, H5_ITER_INC, i, buffer.data(), buffer.size(), H5P_DEFAULT);
      names.emplace_back(buffer.data());
    }
    return names;

  } catch (const OutputError& e) {
    return std::unexpected(e);
  }
}

// HDF5 convenience functions
namespace hdf5 {

auto check_version() -> std::expected<std::string, OutputError> {
  unsigned majnum, minnum, relnum;
  if (H5get_libversion(&majnum, &minnum, &relnum) < 0) {
    return std::unexpected(OutputError("Failed to get HDF5 version"));
  }

  return std::format("{}.{}.{}", majnum, minnum, relnum);
}

auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError> {

  if (!std::filesystem::exists(file_path)) {
    return std::unexpected(OutputError(std::format("File does not exist: {}", file_path.string())));
  }

  auto result = H5Fis_hdf5(file_path.c_str());
  if (result <= 0) {
    return std::unexpected(OutputError(std::format("Not a valid HDF5 file: {}", file_path.string())));
  }

  return {};
}

} // namespace hdf5

} // namespace cairn::io::output
