#pragma once
#include "mechanism_interface.hpp"
#include <memory>
#include <mutation++/mutation++.h>
#include <vector>

namespace cairn::thermophysics {

// Concrete implementation using Mutation++
class MutationMechanism final : public MechanismInterface {
private:
  std::string name_;
  std::unique_ptr<Mutation::Mixture> mixture_;
  const std::size_t n_species_;

  // Cached data
  std::vector<std::string> species_names_;
  std::vector<double> species_mw_;

  [[nodiscard]] auto
  validate_composition(std::span<const double> fractions) const -> std::expected<void, ThermophysicsError>;

  [[nodiscard]] auto set_state(std::span<const double> mass_fractions, double temperature,
                               double pressure) const -> std::expected<void, ThermophysicsError>;

public:
  explicit MutationMechanism(std::string name);
  ~MutationMechanism() override = default;

  MutationMechanism(const MutationMechanism&) = delete;
  MutationMechanism& operator=(const MutationMechanism&) = delete;

  [[nodiscard]] auto name() const noexcept -> std::string_view override { return name_; }
  [[nodiscard]] auto n_species() const noexcept -> std::size_t override { return n_species_; }

  [[nodiscard]] auto species_name(std::size_t index) const noexcept -> std::string_view override {
    return species_names_[index];
  }

  [[nodiscard]] auto species_molecular_weight(std::size_t index) const noexcept -> double override {
    return species_mw_[index];
  }

  [[nodiscard]] auto mole_to_mass_fractions(std::span<const double> mole_fractions) const
      -> std::expected<std::vector<double>, ThermophysicsError> override;

  [[nodiscard]] auto mass_to_mole_fractions(std::span<const double> mass_fractions) const
      -> std::expected<std::vector<double>, ThermophysicsError> override;

  [[nodiscard]] auto density(std::span<const double> mass_fractions, double temperature,
                             double pressure) const -> std::expected<double, ThermophysicsError> override;

  [[nodiscard]] auto mixture_enthalpy(std::span<const double> mass_fractions, double temperature,
                                      double pressure) const -> std::expected<double, ThermophysicsError> override;

  [[nodiscard]] auto equilibrium_composition(double temperature, double pressure,
                                             std::span<const double> mole_fractions) const
      -> std::expected<std::vector<double>, ThermophysicsError> override;

  [[nodiscard]] auto production_rates(std::span<const double> partial_densities, double temperature) const
      -> std::expected<std::vector<double>, ThermophysicsError> override;
};

} // namespace cairn::thermophysics
