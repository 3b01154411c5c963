#pragma once
#include "../io/config_types.hpp"
#include "stage_types.hpp"
#include "staging_errors.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::staging {

// Capability that knows the species set of each mechanism
class MechanismSwitchInterface {
public:
  virtual ~MechanismSwitchInterface() = default;

  // Canonical name used to decide whether two mechanisms are the same
  [[nodiscard]] virtual auto resolve(std::string_view mechanism) const -> std::string { return std::string(mechanism); }

  [[nodiscard]] virtual auto species_names(std::string_view mechanism) const
      -> std::expected<std::vector<std::string>, MechanismSwitchError> = 0;

  // Consistency check on a completed remap (enthalpy against htol)
  [[nodiscard]] virtual auto check_switch(const ThermoState& /*before*/, const ThermoState& /*after*/,
                                          const io::MechanismSwitchConfig& /*tolerances*/) const
      -> std::expected<void, MechanismSwitchError> {
    return {};
  }
};

struct SwitchResult {
  ThermoState state;
  std::optional<SpeciesLosses> losses;
};

/**
 * @brief Remaps a state onto the species set of another mechanism
 *
 * Species absent from the target set are dropped and their mole fractions
 * recorded as losses. A retained species whose mole fraction, renormalized
 * over the retained set, is below Xtol is dropped and recorded the same way.
 * Kept mole (and mass, when known) fractions are renormalized to one. Temperature and pressure are carried unchanged and the
 * result is expressed over the target species list.
 *
 * Without a switcher only identical mechanism names are accepted; anything
 * else yields PluginMissingError.
 */
[[nodiscard]] auto apply_mechanism_switch(const ThermoState& state, std::string_view target_mechanism,
                                          const io::MechanismSwitchConfig& tolerances,
                                          const MechanismSwitchInterface* switcher)
    -> std::expected<SwitchResult, MechanismSwitchError>;

} // namespace cairn::staging
