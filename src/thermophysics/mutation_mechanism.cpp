#include "cairn/thermophysics/mutation_mechanism.hpp"
#include "cairn/core/expected_utils.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace cairn::thermophysics {

// Macro to eliminate repetitive try/catch blocks when calling Mutation++ library
#define MUTATION_CALL(expression, error_message)                                                                       \
  try {                                                                                                                \
    return expression;                                                                                                 \
  } catch (const std::exception& e) {                                                                                  \
    return std::unexpected(ThermophysicsError(std::format(error_message ": {}", e.what())));                           \
  }

namespace {
// Single-temperature finite-rate chemistry is all a stage reactor needs
[[nodiscard]] auto create_mutation_mixture(const std::string& name) -> std::unique_ptr<Mutation::Mixture> {
  Mutation::MixtureOptions opts(name);
  opts.setStateModel("ChemNonEq1T");
  opts.setThermodynamicDatabase("RRHO");
  return std::make_unique<Mutation::Mixture>(opts);
}

std::unique_ptr<Mutation::Mixture> create_mixture_or_throw(const std::string& name) {
  try {
    return create_mutation_mixture(name);
  } catch (const std::exception& e) {
    throw ThermophysicsError(std::format("Failed to load Mutation++ mixture '{}': {}", name, e.what()));
  }
}
} // anonymous namespace

MutationMechanism::MutationMechanism(std::string name)
    : name_(std::move(name)), mixture_(create_mixture_or_throw(name_)), n_species_(mixture_->nSpecies()) {

  try {
    species_mw_.reserve(n_species_);
    species_names_.reserve(n_species_);

    for (std::size_t i = 0; i < n_species_; ++i) {
      species_mw_.push_back(mixture_->speciesMw(i));
      species_names_.emplace_back(mixture_->speciesName(i));
    }

  } catch (const std::exception& e) {
    throw ThermophysicsError(std::format("Failed to initialize species cache: {}", e.what()));
  }
}

auto MutationMechanism::validate_composition(std::span<const double> fractions) const
    -> std::expected<void, ThermophysicsError> {

  if (fractions.size() != n_species_) {
    return std::unexpected(
        ThermophysicsError(std::format("Invalid composition size: {} (expected {})", fractions.size(), n_species_)));
  }

  const double sum = std::accumulate(fractions.begin(), fractions.end(), 0.0);
  constexpr double tolerance = 1e-6;

  if (std::abs(sum - 1.0) > tolerance) {
    return std::unexpected(ThermophysicsError(std::format("Fractions sum to {} (should be 1.0)", sum)));
  }

  return {};
}

auto MutationMechanism::mole_to_mass_fractions(std::span<const double> mole_fractions) const
    -> std::expected<std::vector<double>, ThermophysicsError> {

  CAIRN_TRY_VOID(validate_composition(mole_fractions));

  try {
    std::vector<double> x_mole(mole_fractions.begin(), mole_fractions.end());
    std::vector<double> y_mass(n_species_);
    mixture_->convert<Mutation::Thermodynamics::X_TO_Y>(x_mole.data(), y_mass.data());
    return y_mass;

  } catch (const std::exception& e) {
    return std::unexpected(
        ThermophysicsError(std::format("Failed to convert mole fractions to mass fractions: {}", e.what())));
  }
}

auto MutationMechanism::mass_to_mole_fractions(std::span<const double> mass_fractions) const
    -> std::expected<std::vector<double>, ThermophysicsError> {

  CAIRN_TRY_VOID(validate_composition(mass_fractions));

  try {
    std::vector<double> y_mass(mass_fractions.begin(), mass_fractions.end());
    std::vector<double> x_mole(n_species_);
    mixture_->convert<Mutation::Thermodynamics::Y_TO_X>(y_mass.data(), x_mole.data());
    return x_mole;

  } catch (const std::exception& e) {
    return std::unexpected(
        ThermophysicsError(std::format("Failed to convert mass fractions to mole fractions: {}", e.what())));
  }
}

auto MutationMechanism::set_state(std::span<const double> mass_fractions, double temperature,
                                  double pressure) const -> std::expected<void, ThermophysicsError> {

  CAIRN_TRY_VOID(validate_composition(mass_fractions));

  if (temperature <= 0.0 || pressure <= 0.0) {
    return std::unexpected(ThermophysicsError(std::format("Invalid state: T={}, P={}", temperature, pressure)));
  }

  try {
    std::vector<double> c_vec(mass_fractions.begin(), mass_fractions.end());

    // Variable set 2: {P, T}
    double vars[2] = {pressure, temperature};
    mixture_->setState(c_vec.data(), vars, 2);

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(ThermophysicsError(std::format("Failed to set state: {}", e.what())));
  }
}

auto MutationMechanism::density(std::span<const double> mass_fractions, double temperature,
                                double pressure) const -> std::expected<double, ThermophysicsError> {

  CAIRN_TRY_VOID(set_state(mass_fractions, temperature, pressure));

  MUTATION_CALL(mixture_->density(), "Failed to compute density");
}

auto MutationMechanism::mixture_enthalpy(std::span<const double> mass_fractions, double temperature,
                                         double pressure) const -> std::expected<double, ThermophysicsError> {

  CAIRN_TRY_VOID(set_state(mass_fractions, temperature, pressure));

  MUTATION_CALL(mixture_->mixtureHMass(), "Failed to compute enthalpy");
}

auto MutationMechanism::equilibrium_composition(double temperature, double pressure,
                                                std::span<const double> mole_fractions) const
    -> std::expected<std::vector<double>, ThermophysicsError> {

  if (temperature <= 0.0 || pressure <= 0.0) {
    return std::unexpected(ThermophysicsError("Invalid T,P for equilibrium"));
  }

  CAIRN_TRY_VOID(validate_composition(mole_fractions));

  try {
    // Elemental fractions of the incoming mixture fix the equilibrium constraint
    std::vector<double> x_in(mole_fractions.begin(), mole_fractions.end());
    std::vector<double> x_elements(mixture_->nElements());
    mixture_->convert<Mutation::Thermodynamics::X_TO_XE>(x_in.data(), x_elements.data());

    std::vector<double> x_mole(n_species_);
    mixture_->equilibriumComposition(temperature, pressure, x_elements.data(), x_mole.data());

    return x_mole;

  } catch (const std::exception& e) {
    return std::unexpected(ThermophysicsError(std::format("Failed to compute equilibrium: {}", e.what())));
  }
}

auto MutationMechanism::production_rates(std::span<const double> partial_densities, double temperature) const
    -> std::expected<std::vector<double>, ThermophysicsError> {

  if (partial_densities.size() != n_species_) {
    return std::unexpected(ThermophysicsError("Invalid partial densities size"));
  }

  if (temperature <= 0.0) {
    return std::unexpected(ThermophysicsError("Invalid temperature"));
  }

  try {
    std::vector<double> rho_vec(partial_densities.begin(), partial_densities.end());

    mixture_->setState(rho_vec.data(), &temperature, 1);

    std::vector<double> wi(n_species_);
    mixture_->netProductionRates(wi.data());

    return wi;

  } catch (const std::exception& e) {
    return std::unexpected(ThermophysicsError(std::format("Failed to compute production rates: {}", e.what())));
  }
}

auto create_mechanism(const std::string& name)
    -> std::expected<std::unique_ptr<MechanismInterface>, ThermophysicsError> {

  try {
    return std::make_unique<MutationMechanism>(name);
  } catch (const ThermophysicsError& e) {
    return std::unexpected(e);
  } catch (const std::exception& e) {
    return std::unexpected(ThermophysicsError(std::format("Failed to create mechanism: {}", e.what())));
  }
}

} // namespace cairn::thermophysics
