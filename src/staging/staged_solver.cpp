#include "cairn/staging/staged_solver.hpp"
#include "cairn/staging/topological_order.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace cairn::staging {

namespace {

void merge_losses(std::optional<SpeciesLosses>& into, const std::optional<SpeciesLosses>& from) {
  if (!from) {
    return;
  }
  if (!into) {
    into = *from;
    return;
  }
  for (const auto& [species, lost] : *from) {
    auto [it, inserted] = into->emplace(species, lost);
    if (!inserted) {
      it->second = std::max(it->second, lost);
    }
  }
}

} // namespace

auto flow_order(const Stage& stage) -> std::vector<std::string> {
  std::vector<DirectedEdge> edges;
  edges.reserve(stage.intra_connections.size());
  for (const auto& connection : stage.intra_connections) {
    edges.emplace_back(connection.source, connection.target);
  }

  auto order = kahn_order(stage.node_ids, edges);
  auto nodes = std::move(order.ordered);
  nodes.insert(nodes.end(), order.unresolved.begin(), order.unresolved.end());
  return nodes;
}

auto seed_from_state(const io::NodeConfig& node, const ThermoState& state) -> io::NodeConfig {
  auto seeded = node;
  seeded.initial.temperature = state.temperature;
  seeded.initial.pressure = state.pressure;
  seeded.initial.composition.clear();
  for (std::size_t i = 0; i < state.species.size() && i < state.mole_fractions.size(); ++i) {
    if (state.mole_fractions[i] > 0.0) {
      seeded.initial.composition.push_back({state.species[i], state.mole_fractions[i]});
    }
  }
  return seeded;
}

auto StagedSolver::failure(const Stage& stage, StagedSolveError::Cause cause, std::string_view message) const
    -> StagedSolveError {
  return StagedSolveError(stage.id, cause, message, trajectory_);
}

auto StagedSolver::prepare_request(const Stage& stage, const io::NetworkConfig& config,
                                   std::optional<SpeciesLosses>& inlet_losses)
    -> std::expected<StageSolveRequest, StagedSolveError> {

  StageSolveRequest request;
  request.stage_id = stage.id;
  request.mechanism = stage.mechanism;
  request.directive = stage.directive;
  request.connections = stage.intra_connections;

  for (const auto& node_id : flow_order(stage)) {
    const auto* node = config.find_node(node_id);
    if (node == nullptr) {
      return std::unexpected(failure(stage, StagedSolveError::Cause::SolveFailed,
                                     std::format("node '{}' is not part of the network configuration", node_id)));
    }

    auto pending = pending_inlets_.find(node_id);
    if (pending == pending_inlets_.end()) {
      request.nodes.push_back(*node);
      continue;
    }

    // Direct state copy, consumed exactly once
    request.nodes.push_back(seed_from_state(*node, pending->second.state));
    request.inlet_states.emplace(node_id, pending->second.state);
    merge_losses(inlet_losses, pending->second.losses);
    pending_inlets_.erase(pending);
  }
  return request;
}

auto StagedSolver::hand_off_outlets(const Stage& stage, const StageExecutionPlan& plan,
                                    const StageSolveResult& result) -> std::expected<void, StagedSolveError> {

  for (const auto& connection : stage.inter_connections_out) {
    auto source = result.nodes.find(connection.source_node);
    if (source == result.nodes.end()) {
      return std::unexpected(failure(stage, StagedSolveError::Cause::SolveFailed,
                                     std::format("no outlet state reported for node '{}' feeding connection '{}'",
                                                 connection.source_node, connection.id)));
    }

    const auto* target_stage = plan.find_stage(connection.target_stage);
    if (target_stage == nullptr) {
      return std::unexpected(failure(stage, StagedSolveError::Cause::SolveFailed,
                                     std::format("connection '{}' targets unknown stage '{}'", connection.id,
                                                 connection.target_stage)));
    }

    ThermoState outlet = source->second.state;
    outlet.mechanism = stage.mechanism;
    outlet.time = std::numeric_limits<double>::quiet_NaN();

    PendingInlet pending;
    if (stage.mechanism == target_stage->mechanism) {
      pending.state = std::move(outlet);
    } else {
      const auto tolerances = connection.mechanism_switch.value_or(io::MechanismSwitchConfig{});
      auto switched = apply_mechanism_switch(outlet, target_stage->mechanism, tolerances, switcher_);
      if (!switched) {
        const auto cause = switched.error().reason() == MechanismSwitchError::Reason::PluginMissing
                               ? StagedSolveError::Cause::PluginMissing
                               : StagedSolveError::Cause::MechanismSwitchFailed;
        return std::unexpected(failure(stage, cause,
                                       std::format("connection '{}' ({} -> {}): {}", connection.id,
                                                   connection.source_node, connection.target_node,
                                                   switched.error().message())));
      }
      pending.state = std::move(switched->state);
      pending.losses = std::move(switched->losses);
    }

    // Several connections into one node: the last one handed off wins
    pending_inlets_.insert_or_assign(connection.target_node, std::move(pending));
  }
  return {};
}

auto StagedSolver::collect_segment_states(const Stage& stage, const StageSolveRequest& request,
                                          const StageSolveResult& result)
    -> std::expected<std::vector<ThermoState>, StagedSolveError> {

  std::vector<ThermoState> states;
  states.reserve(request.nodes.size());
  double t_cumulative = 0.0;

  for (const auto& node : request.nodes) {
    auto solution = result.nodes.find(node.id);
    if (solution == result.nodes.end()) {
      return std::unexpected(failure(stage, StagedSolveError::Cause::SolveFailed,
                                     std::format("solver returned no state for node '{}'", node.id)));
    }

    auto state = solution->second.state;
    if (state.mechanism.empty()) {
      state.mechanism = stage.mechanism;
    }
    final_states_.insert_or_assign(node.id, FinalState{stage.id, state});

    if (io::is_reservoir(node.kind)) {
      continue;
    }

    if (!std::isnan(solution->second.residence_time)) {
      t_cumulative += solution->second.residence_time;
    }
    state.time = t_cumulative;
    states.push_back(std::move(state));
  }
  return states;
}

auto StagedSolver::build_viz_network(const StageExecutionPlan& plan, const io::NetworkConfig& config) const
    -> VizNetwork {
  VizNetwork network;

  for (const auto& node : config.nodes) {
    auto it = final_states_.find(node.id);
    if (it == final_states_.end()) {
      continue;
    }
    network.nodes.push_back(VizNode{node.id, it->second.stage_id, node.kind, it->second.state});
  }

  for (const auto& connection : config.connections) {
    auto source = final_states_.find(connection.source);
    auto target = final_states_.find(connection.target);
    if (source == final_states_.end() || target == final_states_.end()) {
      continue;
    }
    network.connections.push_back(VizConnection{connection.id, connection.source, connection.target, connection.kind,
                                                connection.properties,
                                                plan.stage_of(connection.source) != plan.stage_of(connection.target)});
  }
  return network;
}

auto StagedSolver::solve(const StageExecutionPlan& plan, const io::NetworkConfig& config)
    -> std::expected<LagrangianTrajectory, StagedSolveError> {

  pending_inlets_.clear();
  final_states_.clear();
  trajectory_ = LagrangianTrajectory{};

  const std::size_t total = plan.ordered_stages.size();
  std::size_t done = 0;

  for (const auto& stage : plan.ordered_stages) {
    std::optional<SpeciesLosses> inlet_losses;

    auto request = prepare_request(stage, config, inlet_losses);
    if (!request) {
      return std::unexpected(request.error());
    }

    auto result = solver_.solve(request.value());
    if (!result) {
      return std::unexpected(failure(stage, StagedSolveError::Cause::SolveFailed, result.error().message()));
    }

    if (auto handed_off = hand_off_outlets(stage, plan, result.value()); !handed_off) {
      return std::unexpected(handed_off.error());
    }

    auto states = collect_segment_states(stage, request.value(), result.value());
    if (!states) {
      return std::unexpected(states.error());
    }

    trajectory_.add_segment(stage.id, stage.mechanism, std::move(states.value()), std::move(inlet_losses),
                            std::move(result->species));

    ++done;
    if (options_.progress) {
      options_.progress(stage.id, done, total);
    }
  }

  if (options_.build_viz_network) {
    trajectory_.set_viz_network(build_viz_network(plan, config));
  }
  return std::move(trajectory_);
}

auto solve_staged(const StageExecutionPlan& plan, const io::NetworkConfig& config, StageSolverInterface& solver,
                  const MechanismSwitchInterface* switcher, const StagedSolveOptions& options)
    -> std::expected<LagrangianTrajectory, StagedSolveError> {
  StagedSolver staged(solver, switcher, options);
  return staged.solve(plan, config);
}

} // namespace cairn::staging
