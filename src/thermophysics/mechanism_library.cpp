#include "cairn/thermophysics/mechanism_library.hpp"
#include "cairn/core/constants.hpp"
#include "cairn/core/expected_utils.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <format>
#include <iostream>
#include <numeric>

namespace cairn::thermophysics {

MechanismLibrary::MechanismLibrary(MechanismFactory factory, bool enforce_enthalpy)
    : factory_(std::move(factory)), enforce_enthalpy_(enforce_enthalpy) {}

auto MechanismLibrary::resolve(std::string_view mechanism) const -> std::string {
  const std::filesystem::path path(mechanism);
  auto stem = path.stem().string();
  return stem.empty() ? std::string(mechanism) : stem;
}

auto MechanismLibrary::get(std::string_view mechanism) const
    -> std::expected<const MechanismInterface*, ThermophysicsError> {

  const auto key = resolve(mechanism);
  if (auto it = cache_.find(key); it != cache_.end()) {
    return it->second.get();
  }

  if (!factory_) {
    return std::unexpected(ThermophysicsError(std::format("No mechanism factory to load '{}'", mechanism)));
  }

  auto created = factory_(std::string(mechanism));
  if (!created) {
    return std::unexpected(created.error());
  }
  if (!created.value()) {
    return std::unexpected(ThermophysicsError(std::format("Mechanism factory returned nothing for '{}'", mechanism)));
  }

  auto [it, inserted] = cache_.emplace(key, std::move(created.value()));
  return it->second.get();
}

auto MechanismLibrary::species_names(std::string_view mechanism) const
    -> std::expected<std::vector<std::string>, staging::MechanismSwitchError> {

  auto loaded = get(mechanism);
  if (!loaded) {
    return std::unexpected(staging::MechanismSwitchError(staging::MechanismSwitchError::Reason::SpeciesSetUnavailable,
                                                         loaded.error().message()));
  }
  return loaded.value()->species_names();
}

auto MechanismLibrary::evaluate_enthalpy(const staging::ThermoState& state) const
    -> std::expected<double, ThermophysicsError> {

  auto loaded = get(state.mechanism);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }
  const auto& mechanism = *loaded.value();

  std::vector<double> x;
  CAIRN_TRY_ASSIGN(x, aligned_mole_fractions(mechanism, state));

  std::vector<double> y;
  CAIRN_TRY_ASSIGN_CTX(y, mechanism.mole_to_mass_fractions(x), ThermophysicsError,
                       std::format("state of mechanism '{}'", mechanism.name()));
  return mechanism.mixture_enthalpy(y, state.temperature, state.pressure);
}

auto MechanismLibrary::check_switch(const staging::ThermoState& before, const staging::ThermoState& after,
                                    const io::MechanismSwitchConfig& tolerances) const
    -> std::expected<void, staging::MechanismSwitchError> {

  using Reason = staging::MechanismSwitchError::Reason;

  auto h_before = evaluate_enthalpy(before);
  if (!h_before) {
    return std::unexpected(staging::MechanismSwitchError(
        Reason::PropertyEvaluationFailed,
        std::format("enthalpy of the '{}' state: {}", before.mechanism, h_before.error().message())));
  }
  auto h_after = evaluate_enthalpy(after);
  if (!h_after) {
    return std::unexpected(staging::MechanismSwitchError(
        Reason::PropertyEvaluationFailed,
        std::format("enthalpy of the '{}' state: {}", after.mechanism, h_after.error().message())));
  }

  const double scale = std::max(std::abs(h_before.value()), 1.0);
  const double deviation = std::abs(h_after.value() - h_before.value()) / scale;
  if (deviation <= tolerances.htol) {
    return {};
  }

  const auto message =
      std::format("'{}' -> '{}' changes the mixture enthalpy by {:.3e} (relative), above htol = {:.3e}",
                  before.mechanism, after.mechanism, deviation, tolerances.htol);
  if (enforce_enthalpy_) {
    return std::unexpected(staging::MechanismSwitchError(Reason::EnthalpyMismatch, message));
  }
  namespace colors = constants::string_processing::colors;
  std::cerr << colors::yellow << "Warning: " << message << colors::reset << std::endl;
  return {};
}

auto aligned_mole_fractions(const MechanismInterface& mechanism, const staging::ThermoState& state)
    -> std::expected<std::vector<double>, ThermophysicsError> {

  std::vector<double> x(mechanism.n_species(), 0.0);
  for (std::size_t i = 0; i < x.size(); ++i) {
    if (auto value = state.mole_fraction(mechanism.species_name(i))) {
      x[i] = std::max(*value, 0.0);
    }
  }

  const double total = std::accumulate(x.begin(), x.end(), 0.0);
  if (total <= constants::tolerance::negligible_fraction) {
    return std::unexpected(ThermophysicsError(
        std::format("state has no species in common with mechanism '{}'", mechanism.name())));
  }
  for (auto& value : x) {
    value /= total;
  }
  return x;
}

} // namespace cairn::thermophysics
