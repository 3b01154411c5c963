#pragma once
#include "../io/config_types.hpp"
#include "../staging/lagrangian_trajectory.hpp"
#include "../staging/stage_types.hpp"
#include "application_types.hpp"
#include <expected>
#include <optional>
#include <string>

namespace cairn::core {

class SimulationRunner {
public:
  struct SimulationResult {
    staging::StageExecutionPlan plan;
    staging::LagrangianTrajectory trajectory;
    // Set when a stage failed; the trajectory then holds the completed stages only
    std::optional<ApplicationError> failure;
  };

  // Build the stage plan and run every stage in order
  [[nodiscard]] auto run_simulation(const io::NetworkConfig& config, PerformanceMetrics& metrics) 
    -> std::expected<SimulationResult, ApplicationError>;

  // Display simulation results
  auto display_simulation_results(const SimulationResult& result,
                                  const PerformanceMetrics& metrics) const -> void;

private:
  [[nodiscard]] auto build_plan(const io::NetworkConfig& config) const
    -> std::expected<staging::StageExecutionPlan, ApplicationError>;

  auto display_plan(const staging::StageExecutionPlan& plan) const -> void;

  auto display_final_state(const staging::LagrangianTrajectory& trajectory) const -> void;
};

// A network without groups runs as one stage holding every node
[[nodiscard]] auto with_implicit_stage(io::NetworkConfig config) -> io::NetworkConfig;

} // namespace cairn::core
