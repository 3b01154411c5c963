#include "cairn/staging/mechanism_switch.hpp"
#include "test_support.hpp"
#include <numeric>

using namespace cairn;
using cairn::test::make_state;
using cairn::test::MockSwitcher;

namespace {

auto make_switcher() -> MockSwitcher {
  MockSwitcher switcher;
  switcher.species_by_mechanism["air_11"] = {"N2", "O2", "NO", "N", "O"};
  switcher.species_by_mechanism["air_5"] = {"N", "O", "NO", "N2", "O2"};
  switcher.species_by_mechanism["N2_O2"] = {"O2", "N2", "Ar"};
  return switcher;
}

auto sum(const std::vector<double>& values) -> double { return std::accumulate(values.begin(), values.end(), 0.0); }

void test_identity_without_capability() {
  auto state = make_state("air_5", {"N2", "O2"}, {0.79, 0.21});
  auto result = staging::apply_mechanism_switch(state, "air_5", {}, nullptr);
  REQUIRE(result.has_value(), "same mechanism needs no capability");
  REQUIRE(!result->losses.has_value(), "no-op switch reports no losses");
  REQUIRE(result->state.mole_fractions == state.mole_fractions, "composition untouched");
  std::cout << "[PASS] identity without capability\n";
}

void test_plugin_missing() {
  auto state = make_state("air_11", {"N2", "O2"}, {0.79, 0.21});
  auto result = staging::apply_mechanism_switch(state, "air_5", {}, nullptr);
  REQUIRE(!result.has_value(), "different mechanisms without capability must fail");
  REQUIRE(result.error().reason() == staging::MechanismSwitchError::Reason::PluginMissing, "reason is plugin missing");
  REQUIRE(result.error().message().find("air_11") != std::string::npos, "message names the source mechanism");
  std::cout << "[PASS] plugin missing\n";
}

void test_losses_and_renormalization() {
  auto switcher = make_switcher();
  auto state = make_state("air_11", {"N2", "O2", "NO", "N", "O"}, {0.70, 0.20, 0.05, 0.02, 0.03}, 2500.0, 5000.0);
  state.mass_fractions = {0.68, 0.22, 0.06, 0.01, 0.03};
  state.time = 0.4;

  auto result = staging::apply_mechanism_switch(state, "N2_O2", {}, &switcher);
  REQUIRE(result.has_value(), "switch succeeds");

  const auto& out = result->state;
  REQUIRE(out.mechanism == "N2_O2", "state now belongs to the target mechanism");
  REQUIRE((out.species == std::vector<std::string>{"O2", "N2", "Ar"}), "target species order");
  REQUIRE(out.temperature == 2500.0 && out.pressure == 5000.0, "T and P carried unchanged");
  REQUIRE(std::isnan(out.time), "local time does not cross the stage boundary");

  REQUIRE_NEAR(sum(out.mole_fractions), 1.0, 1e-12, "mole fractions renormalized");
  REQUIRE_NEAR(*out.mole_fraction("N2"), 0.70 / 0.90, 1e-12, "N2 rescaled");
  REQUIRE_NEAR(*out.mole_fraction("O2"), 0.20 / 0.90, 1e-12, "O2 rescaled");
  REQUIRE(*out.mole_fraction("Ar") == 0.0, "species new to the target start at zero");

  REQUIRE(out.has_mass_fractions(), "mass fractions carried");
  REQUIRE_NEAR(sum(out.mass_fractions), 1.0, 1e-12, "mass fractions renormalized");
  REQUIRE_NEAR(*out.mass_fraction("N2"), 0.68 / 0.90, 1e-12, "N2 mass fraction rescaled");

  REQUIRE(result->losses.has_value(), "dropped species recorded");
  const auto& losses = *result->losses;
  REQUIRE(losses.size() == 3, "NO, N and O dropped");
  REQUIRE_NEAR(losses.at("NO"), 0.05, 1e-15, "NO loss");
  double lost = 0.0;
  for (const auto& [species, x] : losses) {
    lost += x;
  }
  REQUIRE_NEAR(lost, 1.0 - 0.90, 1e-12, "losses account for the removed fraction");
  std::cout << "[PASS] losses and renormalization\n";
}

void test_reordered_superset_has_no_losses() {
  auto switcher = make_switcher();
  auto state = make_state("air_11", {"N2", "O2", "NO", "N", "O"}, {0.6, 0.2, 0.1, 0.05, 0.05});
  auto result = staging::apply_mechanism_switch(state, "air_5", {}, &switcher);
  REQUIRE(result.has_value(), "switch succeeds");
  REQUIRE(!result->losses.has_value(), "nothing dropped");
  REQUIRE_NEAR(*result->state.mole_fraction("NO"), 0.1, 1e-12, "values follow species names, not positions");
  REQUIRE(result->state.species.front() == "N", "target order applied");
  std::cout << "[PASS] reordered superset\n";
}

void test_resolved_aliases_are_identity() {
  auto switcher = make_switcher();
  switcher.aliases["./mech/air_5.yaml"] = "air_5";
  auto state = make_state("./mech/air_5.yaml", {"N2", "O2"}, {0.79, 0.21});
  auto result = staging::apply_mechanism_switch(state, "air_5", {}, &switcher);
  REQUIRE(result.has_value(), "aliases resolve to the same mechanism");
  REQUIRE(!result->losses.has_value(), "identity switch");
  REQUIRE(result->state.species.size() == 2, "species untouched");
  std::cout << "[PASS] resolved aliases\n";
}

void test_vanishing_composition() {
  auto switcher = make_switcher();
  auto state = make_state("air_11", {"N2", "O2", "NO", "N", "O"}, {0.0, 0.0, 0.5, 0.25, 0.25});
  auto result = staging::apply_mechanism_switch(state, "N2_O2", {}, &switcher);
  REQUIRE(!result.has_value(), "nothing survives the switch");
  REQUIRE(result.error().reason() == staging::MechanismSwitchError::Reason::CompositionVanished, "reason");
  std::cout << "[PASS] vanishing composition\n";
}

void test_trace_composition_switches() {
  auto switcher = make_switcher();
  auto trace = make_state("air_11", {"N2", "NO"}, {5e-5, 1.0 - 5e-5});
  trace.mass_fractions = {4.7e-5, 1.0 - 4.7e-5};

  auto result = staging::apply_mechanism_switch(trace, "N2_O2", {}, &switcher);
  REQUIRE(result.has_value(), "a trace of retained species is still a valid inlet");
  REQUIRE_NEAR(sum(result->state.mole_fractions), 1.0, 1e-12, "mole fractions renormalized");
  REQUIRE_NEAR(*result->state.mole_fraction("N2"), 1.0, 1e-12, "all retained mass is N2");
  REQUIRE_NEAR(*result->state.mass_fraction("N2"), 1.0, 1e-12, "mass fractions renormalized");
  REQUIRE(result->losses.has_value() && result->losses->size() == 1, "NO recorded as lost");
  REQUIRE_NEAR(result->losses->at("NO"), 1.0 - 5e-5, 1e-15, "losses are one minus the retained fraction");
  std::cout << "[PASS] trace composition switches\n";
}

void test_retained_species_below_xtol_dropped() {
  auto switcher = make_switcher();
  auto state = make_state("air_11", {"N2", "O2", "NO"}, {0.7, 2e-5, 0.3 - 2e-5});
  state.mass_fractions = {0.68, 2.2e-5, 0.32 - 2.2e-5};

  auto result = staging::apply_mechanism_switch(state, "N2_O2", {}, &switcher);
  REQUIRE(result.has_value(), "switch succeeds");
  REQUIRE(*result->state.mole_fraction("O2") == 0.0, "O2 below Xtol after renormalization is cut");
  REQUIRE_NEAR(*result->state.mole_fraction("N2"), 1.0, 1e-12, "N2 carries the kept composition");
  REQUIRE_NEAR(*result->state.mass_fraction("N2"), 1.0, 1e-12, "mass fractions follow the cut");

  const auto& losses = *result->losses;
  REQUIRE(losses.size() == 2, "NO and O2 recorded");
  REQUIRE_NEAR(losses.at("O2"), 2e-5, 1e-18, "cut species recorded with its upstream fraction");
  double lost = 0.0;
  for (const auto& [species, x] : losses) {
    lost += x;
  }
  REQUIRE_NEAR(lost, 1.0 - 0.7, 1e-12, "losses account for everything not kept");

  io::MechanismSwitchConfig exact{1e-4, 0.0};
  auto uncut = staging::apply_mechanism_switch(state, "N2_O2", exact, &switcher);
  REQUIRE(uncut.has_value() && !uncut->losses->contains("O2"), "Xtol = 0 keeps every retained species");
  REQUIRE_NEAR(*uncut->state.mole_fraction("O2"), 2e-5 / 0.70002, 1e-12, "O2 rescaled");
  std::cout << "[PASS] retained species below Xtol dropped\n";
}

void test_capability_errors_propagate() {
  auto switcher = make_switcher();
  auto state = make_state("air_11", {"N2", "O2"}, {0.79, 0.21});

  auto unknown = staging::apply_mechanism_switch(state, "nonexistent", {}, &switcher);
  REQUIRE(!unknown.has_value(), "unknown target mechanism");
  REQUIRE(unknown.error().reason() == staging::MechanismSwitchError::Reason::SpeciesSetUnavailable, "reason");

  switcher.reject_enthalpy = true;
  auto rejected = staging::apply_mechanism_switch(state, "N2_O2", {}, &switcher);
  REQUIRE(!rejected.has_value(), "consistency check failure propagates");
  REQUIRE(rejected.error().reason() == staging::MechanismSwitchError::Reason::EnthalpyMismatch, "reason");
  std::cout << "[PASS] capability errors propagate\n";
}

} // namespace

int main() {
  test_identity_without_capability();
  test_plugin_missing();
  test_losses_and_renormalization();
  test_reordered_superset_has_no_losses();
  test_resolved_aliases_are_identity();
  test_vanishing_composition();
  test_trace_composition_switches();
  test_retained_species_below_xtol_dropped();
  test_capability_errors_propagate();
  return 0;
}
