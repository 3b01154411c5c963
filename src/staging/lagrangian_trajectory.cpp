#include "cairn/staging/lagrangian_trajectory.hpp"
#include "cairn/core/constants.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

namespace cairn::staging {

namespace {

constexpr double nan = std::numeric_limits<double>::quiet_NaN();

auto collect_species(std::vector<std::string> species, const std::vector<ThermoState>& states)
    -> std::vector<std::string> {
  std::set<std::string> seen(species.begin(), species.end());
  for (const auto& state : states) {
    for (const auto& name : state.species) {
      if (seen.insert(name).second) {
        species.push_back(name);
      }
    }
  }
  return species;
}

template <typename Getter>
auto fraction_matrix(const TrajectorySegment& segment, Getter&& getter) -> core::Matrix<double> {
  core::Matrix<double> matrix(segment.states.size(), segment.species.size());
  for (std::size_t i = 0; i < segment.states.size(); ++i) {
    for (std::size_t j = 0; j < segment.species.size(); ++j) {
      matrix(i, j) = getter(segment.states[i], segment.species[j]).value_or(nan);
    }
  }
  return matrix;
}

} // namespace

auto TrajectorySegment::duration() const noexcept -> double {
  if (states.empty() || std::isnan(states.back().time)) {
    return 0.0;
  }
  return states.back().time;
}

auto TrajectorySegment::mole_fraction_matrix() const -> core::Matrix<double> {
  return fraction_matrix(*this, [](const ThermoState& s, const std::string& sp) { return s.mole_fraction(sp); });
}

auto TrajectorySegment::mass_fraction_matrix() const -> core::Matrix<double> {
  return fraction_matrix(*this, [](const ThermoState& s, const std::string& sp) { return s.mass_fraction(sp); });
}

auto VizNetwork::find_node(std::string_view id) const -> const VizNode* {
  for (const auto& node : nodes) {
    if (node.id == id) {
      return &node;
    }
  }
  return nullptr;
}

void TrajectoryTable::write_csv(std::ostream& out, char delimiter, int precision) const {
  for (std::size_t c = 0; c < columns.size(); ++c) {
    if (c > 0) {
      out << delimiter;
    }
    out << columns[c];
  }
  out << '\n';

  out << std::setprecision(precision);
  for (std::size_t r = 0; r < rows(); ++r) {
    out << stage[r];
    for (std::size_t c = 0; c < values.cols(); ++c) {
      out << delimiter;
      const double v = values(r, c);
      if (std::isnan(v)) {
        out << constants::io::missing_value;
      } else {
        out << v;
      }
    }
    out << '\n';
  }
}

auto LagrangianTrajectory::add_segment(std::string stage_id, std::string mechanism, std::vector<ThermoState> states,
                                       std::optional<SpeciesLosses> mapping_losses, std::vector<std::string> species)
    -> const TrajectorySegment& {
  TrajectorySegment segment;
  segment.t_offset = segments_.empty() ? 0.0 : segments_.back().t_offset + segments_.back().duration();
  segment.stage_id = std::move(stage_id);
  segment.mechanism = std::move(mechanism);
  segment.species = collect_species(std::move(species), states);
  segment.states = std::move(states);
  segment.mapping_losses = std::move(mapping_losses);

  segments_.push_back(std::move(segment));
  return segments_.back();
}

auto LagrangianTrajectory::size() const noexcept -> std::size_t {
  std::size_t n = 0;
  for (const auto& segment : segments_) {
    n += segment.size();
  }
  return n;
}

auto LagrangianTrajectory::temperature() const -> std::vector<double> {
  std::vector<double> values;
  values.reserve(size());
  for (const auto& segment : segments_) {
    for (const auto& state : segment.states) {
      values.push_back(state.temperature);
    }
  }
  return values;
}

auto LagrangianTrajectory::pressure() const -> std::vector<double> {
  std::vector<double> values;
  values.reserve(size());
  for (const auto& segment : segments_) {
    for (const auto& state : segment.states) {
      values.push_back(state.pressure);
    }
  }
  return values;
}

auto LagrangianTrajectory::time() const -> std::vector<double> {
  std::vector<double> values;
  values.reserve(size());
  for (const auto& segment : segments_) {
    for (const auto& state : segment.states) {
      // NaN local time propagates
      values.push_back(segment.t_offset + state.time);
    }
  }
  return values;
}

auto LagrangianTrajectory::stage_labels() const -> std::vector<std::string> {
  std::vector<std::string> labels;
  labels.reserve(size());
  for (const auto& segment : segments_) {
    labels.insert(labels.end(), segment.states.size(), segment.stage_id);
  }
  return labels;
}

auto LagrangianTrajectory::mole_fraction(std::string_view species) const -> std::vector<double> {
  std::vector<double> values;
  values.reserve(size());
  for (const auto& segment : segments_) {
    for (const auto& state : segment.states) {
      values.push_back(state.mole_fraction(species).value_or(nan));
    }
  }
  return values;
}

auto LagrangianTrajectory::mass_fraction(std::string_view species) const -> std::vector<double> {
  std::vector<double> values;
  values.reserve(size());
  for (const auto& segment : segments_) {
    for (const auto& state : segment.states) {
      values.push_back(state.mass_fraction(species).value_or(nan));
    }
  }
  return values;
}

auto LagrangianTrajectory::species_union() const -> std::vector<std::string> {
  std::vector<std::string> species;
  std::set<std::string> seen;
  for (const auto& segment : segments_) {
    for (const auto& name : segment.species) {
      if (seen.insert(name).second) {
        species.push_back(name);
      }
    }
  }
  return species;
}

auto LagrangianTrajectory::to_table() const -> TrajectoryTable {
  const auto species = species_union();
  const auto t = time();
  const auto T = temperature();
  const auto P = pressure();

  TrajectoryTable table;
  table.columns = {"stage", "t", "T", "P"};
  for (const auto& sp : species) {
    table.columns.push_back("X_" + sp);
  }
  for (const auto& sp : species) {
    table.columns.push_back("Y_" + sp);
  }

  table.stage = stage_labels();
  table.values = core::Matrix<double>(t.size(), 3 + 2 * species.size());

  for (std::size_t r = 0; r < t.size(); ++r) {
    table.values(r, 0) = t[r];
    table.values(r, 1) = T[r];
    table.values(r, 2) = P[r];
  }

  for (std::size_t j = 0; j < species.size(); ++j) {
    const auto x = mole_fraction(species[j]);
    const auto y = mass_fraction(species[j]);
    for (std::size_t r = 0; r < t.size(); ++r) {
      table.values(r, 3 + j) = x[r];
      table.values(r, 3 + species.size() + j) = y[r];
    }
  }
  return table;
}

auto LagrangianTrajectory::to_csv(const std::filesystem::path& path) const -> std::expected<void, core::FileError> {
  std::ofstream file(path);
  if (!file.is_open()) {
    return std::unexpected(core::FileError("cannot open file for writing", path.string()));
  }

  to_table().write_csv(file);

  if (!file) {
    return std::unexpected(core::FileError("write failed", path.string()));
  }
  return {};
}

auto LagrangianTrajectory::summary() const -> std::string {
  std::ostringstream out;
  out << "LagrangianTrajectory(" << segments_.size() << " segments, " << size() << " points)";
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    const auto& segment = segments_[i];
    out << "\n  [" << i << "] " << segment.stage_id << " (" << segment.mechanism << "): " << segment.size()
        << " states, t_offset = " << segment.t_offset << " s";
    if (segment.mapping_losses) {
      out << ", " << segment.mapping_losses->size() << " species lost at inlet";
    }
  }
  return out.str();
}

} // namespace cairn::staging
