#include "cairn/staging/stage_graph_builder.hpp"
#include "cairn/staging/topological_order.hpp"
#include <format>
#include <set>

namespace cairn::staging {

namespace {

auto join_ids(const std::vector<std::string>& ids) -> std::string {
  std::string joined;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      joined.append(", ");
    }
    joined.append(ids[i]);
  }
  return joined;
}

} // namespace

auto StageGraphBuilder::make_stage(const std::string& id, const io::GroupConfig& group) const
    -> std::expected<Stage, core::ConfigurationError> {

  Stage stage;
  stage.id = id;
  stage.mechanism = group.mechanism.value_or(config_.default_mechanism);

  switch (group.solve) {
  case io::GroupConfig::Solve::SteadyState:
    stage.directive = SteadyState{};
    break;
  case io::GroupConfig::Solve::Advance:
    if (!(group.advance_time > 0.0)) {
      return std::unexpected(core::ConfigurationError(
          std::format("group '{}' advance_time must be positive (got {})", id, group.advance_time)));
    }
    stage.directive = AdvanceFixedDuration{group.advance_time};
    break;
  }
  return stage;
}

auto StageGraphBuilder::make_inter_connection(const io::ConnectionConfig& connection, const Stage& source,
                                              const Stage& target) const -> InterStageConnection {
  InterStageConnection inter;
  inter.id = connection.id;
  inter.source_node = connection.source;
  inter.target_node = connection.target;
  inter.source_stage = source.id;
  inter.target_stage = target.id;
  inter.kind = connection.kind;
  inter.properties = connection.properties;

  if (source.mechanism != target.mechanism) {
    inter.mechanism_switch = connection.mechanism_switch.value_or(io::MechanismSwitchConfig{});
  }
  return inter;
}

auto StageGraphBuilder::build() const -> std::expected<StageExecutionPlan, core::ConfigurationError> {

  // Stages from declared groups
  std::map<std::string, Stage> stages;
  std::vector<std::string> stage_ids;
  for (const auto& [id, group] : config_.groups) {
    if (stages.contains(id)) {
      return std::unexpected(core::ConfigurationError(std::format("group '{}' is declared more than once", id)));
    }
    auto stage_result = make_stage(id, group);
    if (!stage_result) {
      return std::unexpected(stage_result.error());
    }
    stages.emplace(id, std::move(stage_result.value()));
    stage_ids.push_back(id);
  }

  // Node membership
  StageExecutionPlan plan;
  std::set<std::string> seen_nodes;
  for (const auto& node : config_.nodes) {
    if (!seen_nodes.insert(node.id).second) {
      return std::unexpected(core::ConfigurationError(std::format("node id '{}' is declared more than once", node.id)));
    }
    if (!node.group) {
      continue;
    }
    auto it = stages.find(*node.group);
    if (it == stages.end()) {
      return std::unexpected(core::ConfigurationError(
          std::format("node '{}' references unknown group '{}'", node.id, *node.group)));
    }
    it->second.node_ids.push_back(node.id);
    plan.node_to_stage.emplace(node.id, *node.group);
  }

  // Connection partition
  std::vector<DirectedEdge> stage_edges;
  for (const auto& connection : config_.connections) {
    auto source_stage = plan.node_to_stage.find(connection.source);
    auto target_stage = plan.node_to_stage.find(connection.target);
    if (source_stage == plan.node_to_stage.end() || target_stage == plan.node_to_stage.end()) {
      continue;
    }

    auto& source = stages.at(source_stage->second);
    auto& target = stages.at(target_stage->second);
    if (source.id == target.id) {
      source.intra_connections.push_back(connection);
      continue;
    }

    auto inter = make_inter_connection(connection, source, target);
    source.inter_connections_out.push_back(inter);
    target.inter_connections_in.push_back(inter);
    plan.all_inter_connections.push_back(std::move(inter));
    stage_edges.emplace_back(source.id, target.id);
  }

  // Deterministic ordering
  auto order = kahn_order(stage_ids, stage_edges);
  if (!order.complete()) {
    return std::unexpected(core::ConfigurationError(
        std::format("cycle detected in stage dependency graph; stages that could not be ordered: {}",
                    join_ids(order.unresolved))));
  }

  plan.ordered_stages.reserve(order.ordered.size());
  for (const auto& id : order.ordered) {
    plan.ordered_stages.push_back(std::move(stages.at(id)));
  }
  return plan;
}

auto build_stage_graph(const io::NetworkConfig& config) -> std::expected<StageExecutionPlan, core::ConfigurationError> {
  return StageGraphBuilder(config).build();
}

} // namespace cairn::staging
