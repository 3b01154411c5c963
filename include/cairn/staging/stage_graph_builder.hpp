#pragma once
#include "../core/exceptions.hpp"
#include "../io/config_types.hpp"
#include "stage_types.hpp"
#include <expected>

namespace cairn::staging {

/**
 * @brief Partitions a reactor network into ordered stages
 *
 * One stage per declared group. Nodes without a group are left out of staged
 * execution. Connections are split into intra-stage and inter-stage sets and
 * the stage order is a topological sort of the inter-stage dependencies.
 */
class StageGraphBuilder {
public:
  explicit StageGraphBuilder(const io::NetworkConfig& config) : config_(config) {}

  [[nodiscard]] auto build() const -> std::expected<StageExecutionPlan, core::ConfigurationError>;

private:
  const io::NetworkConfig& config_;

  [[nodiscard]] auto make_stage(const std::string& id, const io::GroupConfig& group) const
      -> std::expected<Stage, core::ConfigurationError>;

  [[nodiscard]] auto make_inter_connection(const io::ConnectionConfig& connection, const Stage& source,
                                           const Stage& target) const -> InterStageConnection;
};

[[nodiscard]] auto build_stage_graph(const io::NetworkConfig& config)
    -> std::expected<StageExecutionPlan, core::ConfigurationError>;

} // namespace cairn::staging
