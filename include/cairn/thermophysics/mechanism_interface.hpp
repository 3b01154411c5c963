#pragma once
#include "../core/exceptions.hpp"
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::thermophysics {

// Error type for thermophysics operations
class ThermophysicsError : public core::CairnException {
public:
  explicit ThermophysicsError(std::string_view message, std::source_location location = std::source_location::current())
      : CairnException(std::format("Thermophysics Error: {}", message), location) {}
};

// Abstract interface for one chemical mechanism (species set + kinetics)
class MechanismInterface {
public:
  virtual ~MechanismInterface() = default;

  // Species information
  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
  [[nodiscard]] virtual auto n_species() const noexcept -> std::size_t = 0;
  [[nodiscard]] virtual auto species_name(std::size_t index) const noexcept -> std::string_view = 0;
  [[nodiscard]] virtual auto species_molecular_weight(std::size_t index) const noexcept -> double = 0;

  // Composition conversions
  [[nodiscard]] virtual auto mole_to_mass_fractions(std::span<const double> mole_fractions) const
      -> std::expected<std::vector<double>, ThermophysicsError> = 0;

  [[nodiscard]] virtual auto mass_to_mole_fractions(std::span<const double> mass_fractions) const
      -> std::expected<std::vector<double>, ThermophysicsError> = 0;

  // Thermodynamic properties
  [[nodiscard]] virtual auto density(std::span<const double> mass_fractions, double temperature,
                                     double pressure) const -> std::expected<double, ThermophysicsError> = 0;

  [[nodiscard]] virtual auto mixture_enthalpy(std::span<const double> mass_fractions, double temperature,
                                              double pressure) const -> std::expected<double, ThermophysicsError> = 0;

  // Equilibrium at fixed T and P, conserving the elements of `mole_fractions`
  [[nodiscard]] virtual auto equilibrium_composition(double temperature, double pressure,
                                                     std::span<const double> mole_fractions) const
      -> std::expected<std::vector<double>, ThermophysicsError> = 0;

  // Net mass production rates [kg/(m^3 s)]
  [[nodiscard]] virtual auto production_rates(std::span<const double> partial_densities, double temperature) const
      -> std::expected<std::vector<double>, ThermophysicsError> = 0;

  [[nodiscard]] auto species_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(n_species());
    for (std::size_t i = 0; i < n_species(); ++i) {
      names.emplace_back(species_name(i));
    }
    return names;
  }
};

// Factory creating the Mutation++ implementation
[[nodiscard]] auto create_mechanism(const std::string& name)
    -> std::expected<std::unique_ptr<MechanismInterface>, ThermophysicsError>;

} // namespace cairn::thermophysics
