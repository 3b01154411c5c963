#pragma once
#include "../io/config_types.hpp"
#include "lagrangian_trajectory.hpp"
#include "mechanism_switch.hpp"
#include "stage_solver_interface.hpp"
#include "stage_types.hpp"
#include "staging_errors.hpp"
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::staging {

/**
 * @brief Failure of a staged run
 *
 * Carries the trajectory assembled before the failing stage. A segment is
 * only ever present when its stage completed, outlet hand-off included.
 */
class StagedSolveError : public SolveError {
public:
  enum class Cause { SolveFailed, PluginMissing, MechanismSwitchFailed };

private:
  Cause cause_;
  LagrangianTrajectory partial_trajectory_;

public:
  StagedSolveError(std::string stage_id, Cause cause, std::string_view message, LagrangianTrajectory partial,
                   std::source_location location = std::source_location::current())
      : SolveError(std::move(stage_id), message, location), cause_(cause), partial_trajectory_(std::move(partial)) {}

  [[nodiscard]] auto cause() const noexcept -> Cause { return cause_; }
  [[nodiscard]] auto partial_trajectory() const noexcept -> const LagrangianTrajectory& { return partial_trajectory_; }
};

using StageProgressCallback = std::function<void(std::string_view stage_id, std::size_t done, std::size_t total)>;

struct StagedSolveOptions {
  bool build_viz_network = true;
  StageProgressCallback progress;
};

/**
 * @brief Runs the stages of a plan one after the other
 *
 * Each stage is solved as an isolated sub-network. Outlet states crossing a
 * stage boundary are stored in a pending inlet table keyed by target node,
 * remapped first when the downstream mechanism differs, and consumed once by
 * the downstream stage.
 */
class StagedSolver {
public:
  StagedSolver(StageSolverInterface& solver, const MechanismSwitchInterface* switcher = nullptr,
               StagedSolveOptions options = {})
      : solver_(solver), switcher_(switcher), options_(std::move(options)) {}

  [[nodiscard]] auto solve(const StageExecutionPlan& plan, const io::NetworkConfig& config)
      -> std::expected<LagrangianTrajectory, StagedSolveError>;

private:
  struct PendingInlet {
    ThermoState state;
    std::optional<SpeciesLosses> losses;
  };

  struct FinalState {
    std::string stage_id;
    ThermoState state;
  };

  StageSolverInterface& solver_;
  const MechanismSwitchInterface* switcher_;
  StagedSolveOptions options_;

  // Per-run state
  std::map<std::string, PendingInlet> pending_inlets_;
  std::map<std::string, FinalState> final_states_;
  LagrangianTrajectory trajectory_;

  [[nodiscard]] auto prepare_request(const Stage& stage, const io::NetworkConfig& config,
                                     std::optional<SpeciesLosses>& inlet_losses)
      -> std::expected<StageSolveRequest, StagedSolveError>;

  [[nodiscard]] auto hand_off_outlets(const Stage& stage, const StageExecutionPlan& plan,
                                      const StageSolveResult& result) -> std::expected<void, StagedSolveError>;

  [[nodiscard]] auto collect_segment_states(const Stage& stage, const StageSolveRequest& request,
                                            const StageSolveResult& result)
      -> std::expected<std::vector<ThermoState>, StagedSolveError>;

  [[nodiscard]] auto build_viz_network(const StageExecutionPlan& plan, const io::NetworkConfig& config) const
      -> VizNetwork;

  [[nodiscard]] auto failure(const Stage& stage, StagedSolveError::Cause cause, std::string_view message) const
      -> StagedSolveError;
};

// Order of the nodes within a stage: topological over intra-stage flow,
// unplaced nodes (isolated or on a cycle) appended in id order
[[nodiscard]] auto flow_order(const Stage& stage) -> std::vector<std::string>;

// Seeds a node's initial state from an upstream thermodynamic state
[[nodiscard]] auto seed_from_state(const io::NodeConfig& node, const ThermoState& state) -> io::NodeConfig;

[[nodiscard]] auto solve_staged(const StageExecutionPlan& plan, const io::NetworkConfig& config,
                                StageSolverInterface& solver, const MechanismSwitchInterface* switcher = nullptr,
                                const StagedSolveOptions& options = {})
    -> std::expected<LagrangianTrajectory, StagedSolveError>;

} // namespace cairn::staging
