#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "../io/config_types.hpp"
#include "stage_types.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::staging {

// Results of one stage, immutable once appended
struct TrajectorySegment {
  std::string stage_id;
  std::string mechanism;
  std::vector<std::string> species;
  std::vector<ThermoState> states;
  double t_offset = 0.0;
  std::optional<SpeciesLosses> mapping_losses;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return states.size(); }

  // Local time of the last state, 0 when unknown or empty
  [[nodiscard]] auto duration() const noexcept -> double;

  // [n_states x n_species] mole fractions, NaN where a state lacks a species
  [[nodiscard]] auto mole_fraction_matrix() const -> core::Matrix<double>;
  [[nodiscard]] auto mass_fraction_matrix() const -> core::Matrix<double>;
};

// Converged network kept for visualization, never solved
struct VizNode {
  std::string id;
  std::string stage_id;
  io::NodeKind kind = io::NodeKind::IdealGasReactor;
  ThermoState state;
};

struct VizConnection {
  std::string id;
  std::string source;
  std::string target;
  io::ConnectionKind kind = io::ConnectionKind::MassFlowController;
  io::PropertyMap properties;
  bool inter_stage = false;
};

struct VizNetwork {
  std::vector<VizNode> nodes;
  std::vector<VizConnection> connections;

  [[nodiscard]] auto find_node(std::string_view id) const -> const VizNode*;
};

// Tabular view: the stage column is kept apart from the numeric block
struct TrajectoryTable {
  std::vector<std::string> columns; // "stage", "t", "T", "P", "X_<sp>"..., "Y_<sp>"...
  std::vector<std::string> stage;   // one entry per row
  core::Matrix<double> values;      // rows x (columns.size() - 1)

  [[nodiscard]] auto rows() const noexcept -> std::size_t { return stage.size(); }

  void write_csv(std::ostream& out, char delimiter = ',', int precision = 10) const;
};

/**
 * @brief Lagrangian record of a parcel travelling through all stages
 *
 * Segments are appended in stage execution order. Each segment is placed on
 * a global time axis through its offset, the running sum of the previous
 * segments' durations.
 */
class LagrangianTrajectory {
public:
  LagrangianTrajectory() = default;

  // `species` is the mechanism species list; species found only in the states are appended to it
  auto add_segment(std::string stage_id, std::string mechanism, std::vector<ThermoState> states,
                   std::optional<SpeciesLosses> mapping_losses = std::nullopt,
                   std::vector<std::string> species = {}) -> const TrajectorySegment&;

  [[nodiscard]] auto segments() const noexcept -> const std::vector<TrajectorySegment>& { return segments_; }
  [[nodiscard]] auto empty() const noexcept -> bool { return segments_.empty(); }

  // Total number of states across segments
  [[nodiscard]] auto size() const noexcept -> std::size_t;

  [[nodiscard]] auto viz_network() const noexcept -> const std::optional<VizNetwork>& { return viz_network_; }
  void set_viz_network(VizNetwork network) { viz_network_ = std::move(network); }

  // Concatenated views in segment-then-flow order
  [[nodiscard]] auto temperature() const -> std::vector<double>;
  [[nodiscard]] auto pressure() const -> std::vector<double>;
  [[nodiscard]] auto time() const -> std::vector<double>;
  [[nodiscard]] auto stage_labels() const -> std::vector<std::string>;
  [[nodiscard]] auto mole_fraction(std::string_view species) const -> std::vector<double>;
  [[nodiscard]] auto mass_fraction(std::string_view species) const -> std::vector<double>;

  [[nodiscard]] auto species_union() const -> std::vector<std::string>;

  [[nodiscard]] auto to_table() const -> TrajectoryTable;
  [[nodiscard]] auto to_csv(const std::filesystem::path& path) const -> std::expected<void, core::FileError>;

  [[nodiscard]] auto summary() const -> std::string;

private:
  std::vector<TrajectorySegment> segments_;
  std::optional<VizNetwork> viz_network_;
};

} // namespace cairn::staging
