#include "cairn/core/simulation_runner.hpp"
#include "cairn/core/constants.hpp"
#include "cairn/staging/stage_graph_builder.hpp"
#include "cairn/staging/staged_solver.hpp"
#include "cairn/thermophysics/mechanism_library.hpp"
#include "cairn/thermophysics/reactor_stage_solver.hpp"
#include <algorithm>
#include <chrono>
#include <format>
#include <iomanip>
#include <iostream>
#include <numeric>

namespace cairn::core {

namespace colors = constants::string_processing::colors;

auto with_implicit_stage(io::NetworkConfig config) -> io::NetworkConfig {
  if (!config.groups.empty()) {
    return config;
  }
  const std::string stage_id = constants::defaults::implicit_stage;
  config.groups.emplace_back(stage_id, io::GroupConfig{});
  for (auto& node : config.nodes) {
    node.group = stage_id;
  }
  return config;
}

auto SimulationRunner::run_simulation(const io::NetworkConfig& config, PerformanceMetrics& metrics) 
  -> std::expected<SimulationResult, ApplicationError> {

  const auto network = with_implicit_stage(config);
  if (config.groups.empty()) {
    std::cout << "No groups declared: running the network as stage '" << constants::defaults::implicit_stage << "'"
              << std::endl;
  }

  auto plan_result = build_plan(network);
  if (!plan_result) {
    return std::unexpected(plan_result.error());
  }
  SimulationResult result;
  result.plan = std::move(plan_result.value());
  display_plan(result.plan);

  thermophysics::MechanismLibrary library(thermophysics::create_mechanism);
  thermophysics::ReactorStageSolver solver(library, network.solver);

  staging::StagedSolveOptions options;
  options.progress = [](std::string_view stage_id, std::size_t done, std::size_t total) {
    std::cout << colors::green << "✓ Stage '" << stage_id << "' solved" << colors::reset
              << " (" << done << "/" << total << ")" << std::endl;
  };

  std::cout << "\n=== STARTING STAGED SOLUTION ===" << std::endl;

  auto solve_start = std::chrono::high_resolution_clock::now();
  auto trajectory = staging::solve_staged(result.plan, network, solver, &library, options);
  auto solve_end = std::chrono::high_resolution_clock::now();

  metrics.solve_time = std::chrono::duration_cast<std::chrono::milliseconds>(solve_end - solve_start);

  if (!trajectory) {
    const auto& error = trajectory.error();
    std::cerr << colors::red << "✗ Stage '" << error.stage_id() << "' failed" << colors::reset << std::endl;
    result.trajectory = error.partial_trajectory();
    result.failure = ApplicationError{"Staged solve failed: " + error.message(), constants::indexing::second};
    return result;
  }

  result.trajectory = std::move(trajectory.value());
  std::cout << colors::green << "✓ Staged solution completed successfully!" << colors::reset << std::endl;
  std::cout << "  Mechanisms loaded: " << library.loaded_count() << std::endl;
  std::cout << "  Solve time: " << metrics.solve_time.count() << " ms" << std::endl;

  return result;
}

auto SimulationRunner::build_plan(const io::NetworkConfig& config) const
  -> std::expected<staging::StageExecutionPlan, ApplicationError> {

  auto plan = staging::build_stage_graph(config);
  if (!plan) {
    return std::unexpected(ApplicationError{
      "Failed to build stage graph: " + plan.error().message(),
      constants::indexing::second
    });
  }

  std::cout << colors::green << "✓ Stage graph built (" << plan->ordered_stages.size() << " stages)"
            << colors::reset << std::endl;
  return std::move(plan.value());
}

auto SimulationRunner::display_plan(const staging::StageExecutionPlan& plan) const -> void {
  std::cout << "\nExecution order:" << std::endl;
  for (std::size_t i = 0; i < plan.ordered_stages.size(); ++i) {
    const auto& stage = plan.ordered_stages[i];
    std::cout << std::format("  [{:2}] {:<16} {:<12} {:<18} {} node(s)", i, stage.id, stage.mechanism,
                             staging::describe(stage.directive), stage.node_ids.size())
              << std::endl;
  }
  if (!plan.all_inter_connections.empty()) {
    std::cout << "  Inter-stage connections: " << plan.all_inter_connections.size() << std::endl;
  }
}

auto SimulationRunner::display_simulation_results(const SimulationResult& result,
                                                  const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== TRAJECTORY SUMMARY ===" << std::endl;
  if (result.failure) {
    std::cout << colors::yellow << "Partial trajectory (run stopped early)" << colors::reset << std::endl;
  }
  std::cout << result.trajectory.summary() << std::endl;

  display_final_state(result.trajectory);
  std::cout << "\nSolve time: " << metrics.solve_time.count() << " ms" << std::endl;
}

auto SimulationRunner::display_final_state(const staging::LagrangianTrajectory& trajectory) const -> void {
  if (trajectory.empty() || trajectory.segments().back().states.empty()) {
    return;
  }

  const auto& segment = trajectory.segments().back();
  const auto& state = segment.states.back();

  std::cout << "\nFinal state (" << segment.stage_id << "):" << std::endl;
  std::cout << "  T = " << std::fixed << std::setprecision(constants::string_processing::float_precision_2)
            << state.temperature << " K" << std::endl;
  std::cout << "  P = " << state.pressure << " Pa" << std::endl;

  std::vector<std::size_t> order(state.species.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::ranges::sort(order, [&](std::size_t a, std::size_t b) {
    return state.mole_fractions[a] > state.mole_fractions[b];
  });

  constexpr std::size_t max_listed = 8;
  std::cout << "  Major species (mole fraction):" << std::endl;
  for (std::size_t i = 0; i < std::min(max_listed, order.size()); ++i) {
    const auto idx = order[i];
    std::cout << "    " << std::setw(constants::string_processing::medium_field_width) << std::left
              << state.species[idx] << std::right << std::scientific
              << std::setprecision(constants::string_processing::float_precision_4) << state.mole_fractions[idx]
              << std::endl;
  }
  std::cout << std::defaultfloat;
}

} // namespace cairn::core
