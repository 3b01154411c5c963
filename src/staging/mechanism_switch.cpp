#include "cairn/staging/mechanism_switch.hpp"
#include "cairn/core/constants.hpp"
#include <format>
#include <set>
#include <vector>

namespace cairn::staging {

auto apply_mechanism_switch(const ThermoState& state, std::string_view target_mechanism,
                            const io::MechanismSwitchConfig& tolerances, const MechanismSwitchInterface* switcher)
    -> std::expected<SwitchResult, MechanismSwitchError> {

  if (switcher == nullptr) {
    if (state.mechanism == target_mechanism) {
      return SwitchResult{state, std::nullopt};
    }
    return std::unexpected(PluginMissingError(state.mechanism, target_mechanism));
  }

  if (switcher->resolve(state.mechanism) == switcher->resolve(target_mechanism)) {
    auto same = state;
    same.mechanism = std::string(target_mechanism);
    return SwitchResult{std::move(same), std::nullopt};
  }

  auto target_species_result = switcher->species_names(target_mechanism);
  if (!target_species_result) {
    return std::unexpected(target_species_result.error());
  }
  auto& target_species = target_species_result.value();
  if (target_species.empty()) {
    return std::unexpected(MechanismSwitchError(MechanismSwitchError::Reason::SpeciesSetUnavailable,
                                                std::format("mechanism '{}' has no species", target_mechanism)));
  }

  const std::set<std::string> target_set(target_species.begin(), target_species.end());
  const bool with_mass = state.has_mass_fractions();
  const auto mole_fraction_at = [&](std::size_t i) {
    return i < state.mole_fractions.size() ? state.mole_fractions[i] : 0.0;
  };

  double retained_x = 0.0;
  SpeciesLosses losses;
  for (std::size_t i = 0; i < state.species.size(); ++i) {
    if (target_set.contains(state.species[i])) {
      retained_x += mole_fraction_at(i);
    } else {
      losses[state.species[i]] = mole_fraction_at(i);
    }
  }

  if (retained_x <= constants::tolerance::negligible_fraction) {
    return std::unexpected(MechanismSwitchError(
        MechanismSwitchError::Reason::CompositionVanished,
        std::format("no part of the '{}' composition exists in '{}'", state.mechanism, target_mechanism)));
  }

  // Retained species whose renormalized mole fraction falls below Xtol are dropped as well
  std::vector<bool> kept(state.species.size(), false);
  double kept_x = 0.0;
  double kept_y = 0.0;
  for (std::size_t i = 0; i < state.species.size(); ++i) {
    if (!target_set.contains(state.species[i])) {
      continue;
    }
    const double x = mole_fraction_at(i);
    if (x > 0.0 && x / retained_x < tolerances.Xtol) {
      losses[state.species[i]] = x;
      continue;
    }
    kept[i] = true;
    kept_x += x;
    if (with_mass) {
      kept_y += state.mass_fractions[i];
    }
  }

  if (kept_x <= constants::tolerance::negligible_fraction) {
    return std::unexpected(MechanismSwitchError(
        MechanismSwitchError::Reason::CompositionVanished,
        std::format("every species of the '{}' composition retained in '{}' is below Xtol = {:.1e}", state.mechanism,
                    target_mechanism, tolerances.Xtol)));
  }

  ThermoState switched;
  switched.mechanism = std::string(target_mechanism);
  switched.temperature = state.temperature;
  switched.pressure = state.pressure;
  switched.species = target_species;
  switched.mole_fractions.assign(target_species.size(), 0.0);

  const bool renormalize_mass = with_mass && kept_y > constants::tolerance::negligible_fraction;
  if (renormalize_mass) {
    switched.mass_fractions.assign(target_species.size(), 0.0);
  }

  for (std::size_t j = 0; j < target_species.size(); ++j) {
    auto idx = state.species_index(target_species[j]);
    if (!idx || !kept[*idx]) {
      continue;
    }
    switched.mole_fractions[j] = mole_fraction_at(*idx) / kept_x;
    if (renormalize_mass) {
      switched.mass_fractions[j] = state.mass_fractions[*idx] / kept_y;
    }
  }

  if (auto check = switcher->check_switch(state, switched, tolerances); !check) {
    return std::unexpected(check.error());
  }

  std::optional<SpeciesLosses> recorded;
  if (!losses.empty()) {
    recorded = std::move(losses);
  }
  return SwitchResult{std::move(switched), std::move(recorded)};
}

} // namespace cairn::staging
