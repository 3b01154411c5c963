#pragma once
#include "../io/config_types.hpp"
#include "stage_types.hpp"
#include "staging_errors.hpp"
#include <expected>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace cairn::staging {

// Isolated sub-network handed to the solve capability
struct StageSolveRequest {
  std::string stage_id;
  std::string mechanism;
  SolveDirective directive = SteadyState{};
  // Stage nodes in flow order, inlet nodes already seeded from upstream states
  std::vector<io::NodeConfig> nodes;
  // Intra-stage connections only
  std::vector<io::ConnectionConfig> connections;
  // Upstream states keyed by the node they feed, restricted to this stage
  std::map<std::string, ThermoState> inlet_states;
};

// `state` is expressed over the full species list of the stage mechanism,
// zeros included; a species missing from it reads as unknown downstream
struct NodeSolution {
  ThermoState state;
  double residence_time = std::numeric_limits<double>::quiet_NaN();
};

struct StageSolveResult {
  std::map<std::string, NodeSolution> nodes;
  // Species list of the stage mechanism; left empty, the species found in the states are used
  std::vector<std::string> species;
};

// External chemistry capability solving one stage at a time
class StageSolverInterface {
public:
  virtual ~StageSolverInterface() = default;

  [[nodiscard]] virtual auto solve(const StageSolveRequest& request) -> std::expected<StageSolveResult, SolveError> = 0;
};

} // namespace cairn::staging
