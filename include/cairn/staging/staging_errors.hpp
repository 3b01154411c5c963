#pragma once
#include "../core/exceptions.hpp"
#include <source_location>
#include <string>
#include <string_view>

namespace cairn::staging {

class SolveError : public core::CairnException {
private:
  std::string stage_id_;

public:
  explicit SolveError(std::string_view message, std::source_location location = std::source_location::current())
      : CairnException(std::format("Solve Error: {}", message), location) {}

  SolveError(std::string stage_id, std::string_view message,
             std::source_location location = std::source_location::current())
      : CairnException(std::format("Solve Error [stage '{}']: {}", stage_id, message), location),
        stage_id_(std::move(stage_id)) {}

  // Empty when the failure is not tied to a stage
  [[nodiscard]] auto stage_id() const noexcept -> const std::string& { return stage_id_; }
};

class MechanismSwitchError : public core::CairnException {
public:
  enum class Reason { PluginMissing, SpeciesSetUnavailable, CompositionVanished, EnthalpyMismatch, PropertyEvaluationFailed };

private:
  Reason reason_;

public:
  MechanismSwitchError(Reason reason, std::string_view message,
                       std::source_location location = std::source_location::current())
      : CairnException(std::format("Mechanism Switch Error: {}", message), location), reason_(reason) {}

  [[nodiscard]] auto reason() const noexcept -> Reason { return reason_; }
};

class PluginMissingError : public MechanismSwitchError {
public:
  PluginMissingError(std::string_view source_mechanism, std::string_view target_mechanism,
                     std::source_location location = std::source_location::current())
      : MechanismSwitchError(Reason::PluginMissing,
                             std::format("switching from '{}' to '{}' requires a mechanism-switch capability, "
                                         "none was supplied",
                                         source_mechanism, target_mechanism),
                             location) {}
};

} // namespace cairn::staging
