#pragma once
#include "../staging/mechanism_switch.hpp"
#include "mechanism_interface.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace cairn::thermophysics {

using MechanismFactory =
    std::function<std::expected<std::unique_ptr<MechanismInterface>, ThermophysicsError>(const std::string&)>;

/**
 * @brief Lazily loaded set of mechanisms shared by every stage of a run
 *
 * Mechanisms are created on first use through the factory and cached under
 * their resolved name, so "air_5" and "/data/mixtures/air_5.xml" share one
 * instance. Also acts as the mechanism-switch capability of the staged
 * solver: it provides species sets and checks the enthalpy of a remapped
 * state against `htol`.
 */
class MechanismLibrary final : public staging::MechanismSwitchInterface {
private:
  MechanismFactory factory_;
  bool enforce_enthalpy_;
  mutable std::map<std::string, std::unique_ptr<MechanismInterface>, std::less<>> cache_;

  [[nodiscard]] auto evaluate_enthalpy(const staging::ThermoState& state) const
      -> std::expected<double, ThermophysicsError>;

public:
  // With enforce_enthalpy an htol violation fails the switch, otherwise it is only reported
  explicit MechanismLibrary(MechanismFactory factory, bool enforce_enthalpy = false);

  [[nodiscard]] auto get(std::string_view mechanism) const
      -> std::expected<const MechanismInterface*, ThermophysicsError>;

  [[nodiscard]] auto loaded_count() const noexcept -> std::size_t { return cache_.size(); }

  // File stem of the mechanism path
  [[nodiscard]] auto resolve(std::string_view mechanism) const -> std::string override;

  [[nodiscard]] auto species_names(std::string_view mechanism) const
      -> std::expected<std::vector<std::string>, staging::MechanismSwitchError> override;

  [[nodiscard]] auto check_switch(const staging::ThermoState& before, const staging::ThermoState& after,
                                  const io::MechanismSwitchConfig& tolerances) const
      -> std::expected<void, staging::MechanismSwitchError> override;
};

// Mole fractions of `state` expressed over the species of `mechanism`, renormalized
[[nodiscard]] auto aligned_mole_fractions(const MechanismInterface& mechanism, const staging::ThermoState& state)
    -> std::expected<std::vector<double>, ThermophysicsError>;

} // namespace cairn::thermophysics
