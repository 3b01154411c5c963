#pragma once
#include "../io/config_types.hpp"
#include "../staging/stage_solver_interface.hpp"
#include "mechanism_library.hpp"
#include <map>
#include <string>
#include <vector>

namespace cairn::thermophysics {

/**
 * @brief Reference stage solve capability built on a MechanismInterface
 *
 * Nodes are visited in the flow order of the request. Reservoirs report
 * their (possibly seeded) initial state. A reactor takes its composition
 * from the mass-weighted mixture of its intra-stage inflows, or from its
 * initial composition when it has none, and is held at its initial
 * temperature and pressure:
 *   - SteadyState: chemical equilibrium at (T, P) with the elements of the
 *     mixture conserved. Residence time is volume * rho / mdot when both are
 *     known, NaN otherwise.
 *   - AdvanceFixedDuration: explicit integration of dY/dt = omega / rho over
 *     the duration in `advance_substeps` steps. Constant-pressure kinds
 *     update the density, constant-volume kinds update the pressure.
 *     Residence time is the duration.
 */
class ReactorStageSolver final : public staging::StageSolverInterface {
private:
  MechanismLibrary& library_;
  io::SolverConfig numerics_;

  struct Stream {
    std::vector<double> mass_fractions;
    double mass_flow = 1.0;
    bool declared = false;
  };

  struct Mixture {
    double temperature;
    double pressure;
    std::vector<double> mass_fractions;
    double mass_flow_in = 0.0; // declared inflow only
  };

  [[nodiscard]] auto inflow_streams(const staging::StageSolveRequest& request, const io::NodeConfig& node,
                                    const std::map<std::string, staging::NodeSolution>& solved) const
      -> std::vector<Stream>;

  [[nodiscard]] auto initial_mixture(const MechanismInterface& mechanism, const staging::StageSolveRequest& request,
                                     const io::NodeConfig& node,
                                     const std::map<std::string, staging::NodeSolution>& solved) const
      -> std::expected<Mixture, staging::SolveError>;

  [[nodiscard]] auto equilibrate(const MechanismInterface& mechanism, const staging::StageSolveRequest& request,
                                 const io::NodeConfig& node, const Mixture& mixture) const
      -> std::expected<staging::NodeSolution, staging::SolveError>;

  [[nodiscard]] auto advance(const MechanismInterface& mechanism, const staging::StageSolveRequest& request,
                             const io::NodeConfig& node, const Mixture& mixture, double duration) const
      -> std::expected<staging::NodeSolution, staging::SolveError>;

  [[nodiscard]] auto make_state(const MechanismInterface& mechanism, const std::string& mechanism_name,
                                double temperature, double pressure, std::vector<double> mass_fractions) const
      -> std::expected<staging::ThermoState, ThermophysicsError>;

public:
  explicit ReactorStageSolver(MechanismLibrary& library, io::SolverConfig numerics = {});

  [[nodiscard]] auto solve(const staging::StageSolveRequest& request)
      -> std::expected<staging::StageSolveResult, staging::SolveError> override;
};

[[nodiscard]] constexpr auto is_constant_pressure(io::NodeKind kind) noexcept -> bool {
  switch (kind) {
  case io::NodeKind::IdealGasConstPressureReactor:
  case io::NodeKind::IdealGasConstPressureMoleReactor:
    return true;
  case io::NodeKind::Reservoir:
  case io::NodeKind::IdealGasReactor:
  case io::NodeKind::IdealGasMoleReactor:
    return false;
  }
  return false;
}

} // namespace cairn::thermophysics
