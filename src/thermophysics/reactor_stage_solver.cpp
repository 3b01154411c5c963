#include "cairn/thermophysics/reactor_stage_solver.hpp"
#include "cairn/core/constants.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numeric>

namespace cairn::thermophysics {

namespace {

[[nodiscard]] auto node_error(const staging::StageSolveRequest& request, const io::NodeConfig& node,
                              std::string_view message) -> staging::SolveError {
  return staging::SolveError(request.stage_id, std::format("node '{}': {}", node.id, message));
}

[[nodiscard]] auto carries_mass(io::ConnectionKind kind) noexcept -> bool {
  return kind != io::ConnectionKind::Wall;
}

// Initial composition of a node as mass fractions over the mechanism species
[[nodiscard]] auto initial_mass_fractions(const MechanismInterface& mechanism, const staging::StageSolveRequest& request,
                                          const io::NodeConfig& node)
    -> std::expected<std::vector<double>, staging::SolveError> {

  if (node.initial.composition.empty()) {
    return std::unexpected(node_error(request, node, "no composition declared and no inflow to take one from"));
  }

  std::vector<double> x(mechanism.n_species(), 0.0);
  for (const auto& [species, value] : node.initial.composition) {
    std::size_t index = 0;
    while (index < x.size() && mechanism.species_name(index) != species) {
      ++index;
    }
    if (index == x.size()) {
      return std::unexpected(node_error(
          request, node, std::format("species '{}' is not part of mechanism '{}'", species, mechanism.name())));
    }
    x[index] += value;
  }

  const double total = std::accumulate(x.begin(), x.end(), 0.0);
  if (total <= constants::tolerance::negligible_fraction) {
    return std::unexpected(node_error(request, node, "initial composition sums to zero"));
  }
  for (auto& value : x) {
    value /= total;
  }

  auto y = mechanism.mole_to_mass_fractions(x);
  if (!y) {
    return std::unexpected(node_error(request, node, y.error().message()));
  }
  return std::move(y.value());
}

void renormalize(std::vector<double>& fractions) {
  for (auto& value : fractions) {
    value = std::max(value, 0.0);
  }
  const double total = std::accumulate(fractions.begin(), fractions.end(), 0.0);
  if (total > constants::tolerance::negligible_fraction) {
    for (auto& value : fractions) {
      value /= total;
    }
  }
}

} // namespace

ReactorStageSolver::ReactorStageSolver(MechanismLibrary& library, io::SolverConfig numerics)
    : library_(library), numerics_(numerics) {}

auto ReactorStageSolver::inflow_streams(const staging::StageSolveRequest& request, const io::NodeConfig& node,
                                        const std::map<std::string, staging::NodeSolution>& solved) const
    -> std::vector<Stream> {

  std::vector<Stream> streams;
  for (const auto& connection : request.connections) {
    if (connection.target != node.id || !carries_mass(connection.kind)) {
      continue;
    }
    auto source = solved.find(connection.source);
    if (source == solved.end() || !source->second.state.has_mass_fractions()) {
      continue;
    }
    const auto rate = connection.mass_flow_rate();
    streams.push_back(Stream{source->second.state.mass_fractions, rate.value_or(1.0), rate.has_value()});
  }
  return streams;
}

auto ReactorStageSolver::initial_mixture(const MechanismInterface& mechanism,
                                         const staging::StageSolveRequest& request, const io::NodeConfig& node,
                                         const std::map<std::string, staging::NodeSolution>& solved) const
    -> std::expected<Mixture, staging::SolveError> {

  Mixture mixture{node.initial.temperature, node.initial.pressure, {}, 0.0};

  auto streams = io::is_reservoir(node.kind) ? std::vector<Stream>{} : inflow_streams(request, node, solved);

  if (streams.empty()) {
    auto y = initial_mass_fractions(mechanism, request, node);
    if (!y) {
      return std::unexpected(y.error());
    }
    mixture.mass_fractions = std::move(y.value());
    return mixture;
  }

  // A seeded inlet joins the intra-stage streams
  if (request.inlet_states.contains(node.id)) {
    auto y = initial_mass_fractions(mechanism, request, node);
    if (!y) {
      return std::unexpected(y.error());
    }
    streams.push_back(Stream{std::move(y.value()), 1.0, false});
  }

  double total_flow = 0.0;
  mixture.mass_fractions.assign(mechanism.n_species(), 0.0);
  for (const auto& stream : streams) {
    for (std::size_t i = 0; i < mixture.mass_fractions.size(); ++i) {
      mixture.mass_fractions[i] += stream.mass_flow * stream.mass_fractions[i];
    }
    total_flow += stream.mass_flow;
    if (stream.declared) {
      mixture.mass_flow_in += stream.mass_flow;
    }
  }
  if (total_flow <= 0.0) {
    return std::unexpected(node_error(request, node, "inflows carry no mass"));
  }
  for (auto& value : mixture.mass_fractions) {
    value /= total_flow;
  }
  renormalize(mixture.mass_fractions);
  return mixture;
}

auto ReactorStageSolver::make_state(const MechanismInterface& mechanism, const std::string& mechanism_name,
                                    double temperature, double pressure, std::vector<double> mass_fractions) const
    -> std::expected<staging::ThermoState, ThermophysicsError> {

  auto x = mechanism.mass_to_mole_fractions(mass_fractions);
  if (!x) {
    return std::unexpected(x.error());
  }

  staging::ThermoState state;
  state.mechanism = mechanism_name;
  state.temperature = temperature;
  state.pressure = pressure;
  state.species = mechanism.species_names();
  state.mole_fractions = std::move(x.value());
  state.mass_fractions = std::move(mass_fractions);
  return state;
}

auto ReactorStageSolver::equilibrate(const MechanismInterface& mechanism, const staging::StageSolveRequest& request,
                                     const io::NodeConfig& node, const Mixture& mixture) const
    -> std::expected<staging::NodeSolution, staging::SolveError> {

  auto x_in = mechanism.mass_to_mole_fractions(mixture.mass_fractions);
  if (!x_in) {
    return std::unexpected(node_error(request, node, x_in.error().message()));
  }

  auto x_eq = mechanism.equilibrium_composition(mixture.temperature, mixture.pressure, x_in.value());
  if (!x_eq) {
    return std::unexpected(node_error(request, node, x_eq.error().message()));
  }

  auto y_eq = mechanism.mole_to_mass_fractions(x_eq.value());
  if (!y_eq) {
    return std::unexpected(node_error(request, node, y_eq.error().message()));
  }

  auto rho = mechanism.density(y_eq.value(), mixture.temperature, mixture.pressure);
  if (!rho) {
    return std::unexpected(node_error(request, node, rho.error().message()));
  }

  // Inflow rate, or the first declared outflow for a node fed from another stage
  double mass_flow = mixture.mass_flow_in;
  if (mass_flow <= 0.0) {
    for (const auto& connection : request.connections) {
      if (connection.source == node.id && carries_mass(connection.kind) && connection.mass_flow_rate()) {
        mass_flow = *connection.mass_flow_rate();
        break;
      }
    }
  }

  staging::NodeSolution solution;
  if (node.volume && mass_flow > 0.0) {
    solution.residence_time = *node.volume * rho.value() / mass_flow;
  }

  auto state = make_state(mechanism, request.mechanism, mixture.temperature, mixture.pressure,
                          std::move(y_eq.value()));
  if (!state) {
    return std::unexpected(node_error(request, node, state.error().message()));
  }
  solution.state = std::move(state.value());
  return solution;
}

auto ReactorStageSolver::advance(const MechanismInterface& mechanism, const staging::StageSolveRequest& request,
                                 const io::NodeConfig& node, const Mixture& mixture, double duration) const
    -> std::expected<staging::NodeSolution, staging::SolveError> {

  const double temperature = mixture.temperature;
  double pressure = mixture.pressure;
  auto y = mixture.mass_fractions;

  auto rho_result = mechanism.density(y, temperature, pressure);
  if (!rho_result) {
    return std::unexpected(node_error(request, node, rho_result.error().message()));
  }
  double rho = rho_result.value();

  const int steps = std::max(numerics_.advance_substeps, 1);
  const double dt = duration / steps;
  const bool constant_pressure = is_constant_pressure(node.kind);

  std::vector<double> partial_densities(y.size());
  for (int step = 0; step < steps; ++step) {
    for (std::size_t i = 0; i < y.size(); ++i) {
      partial_densities[i] = rho * y[i];
    }

    auto omega = mechanism.production_rates(partial_densities, temperature);
    if (!omega) {
      return std::unexpected(
          node_error(request, node, std::format("step {}/{}: {}", step + 1, steps, omega.error().message())));
    }

    for (std::size_t i = 0; i < y.size(); ++i) {
      y[i] += dt * omega.value()[i] / rho;
    }
    renormalize(y);

    if (constant_pressure) {
      auto updated = mechanism.density(y, temperature, pressure);
      if (!updated) {
        return std::unexpected(node_error(request, node, updated.error().message()));
      }
      rho = updated.value();
    } else {
      // p = rho R T / M_mix
      double inverse_mw = 0.0;
      for (std::size_t i = 0; i < y.size(); ++i) {
        inverse_mw += y[i] / mechanism.species_molecular_weight(i);
      }
      pressure = rho * constants::physical::universal_gas_constant * temperature * inverse_mw;
    }

    if (!std::isfinite(rho) || !std::isfinite(pressure)) {
      return std::unexpected(node_error(request, node, std::format("integration diverged at step {}", step + 1)));
    }
  }

  auto state = make_state(mechanism, request.mechanism, temperature, pressure, std::move(y));
  if (!state) {
    return std::unexpected(node_error(request, node, state.error().message()));
  }
  return staging::NodeSolution{std::move(state.value()), duration};
}

auto ReactorStageSolver::solve(const staging::StageSolveRequest& request)
    -> std::expected<staging::StageSolveResult, staging::SolveError> {

  auto loaded = library_.get(request.mechanism);
  if (!loaded) {
    return std::unexpected(staging::SolveError(request.stage_id, loaded.error().message()));
  }
  const auto& mechanism = *loaded.value();

  staging::StageSolveResult result;
  result.species = mechanism.species_names();
  for (const auto& node : request.nodes) {
    auto mixture = initial_mixture(mechanism, request, node, result.nodes);
    if (!mixture) {
      return std::unexpected(mixture.error());
    }

    std::expected<staging::NodeSolution, staging::SolveError> solution;
    if (io::is_reservoir(node.kind)) {
      auto state = make_state(mechanism, request.mechanism, mixture->temperature, mixture->pressure,
                              std::move(mixture->mass_fractions));
      if (!state) {
        return std::unexpected(node_error(request, node, state.error().message()));
      }
      solution = staging::NodeSolution{std::move(state.value()), std::numeric_limits<double>::quiet_NaN()};
    } else {
      solution = std::visit(
          staging::overloaded{
              [&](const staging::SteadyState&) { return equilibrate(mechanism, request, node, mixture.value()); },
              [&](const staging::AdvanceFixedDuration& a) {
                return advance(mechanism, request, node, mixture.value(), a.duration);
              }},
          request.directive);
    }

    if (!solution) {
      return std::unexpected(solution.error());
    }
    result.nodes.insert_or_assign(node.id, std::move(solution.value()));
  }
  return result;
}

} // namespace cairn::thermophysics
