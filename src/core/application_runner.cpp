#include "cairn/core/application_runner.hpp"
#include "cairn/core/constants.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>

namespace cairn::core {

ApplicationRunner::ApplicationRunner()
  : environment_manager_(std::make_unique<EnvironmentManager>())
  , config_loader_(std::make_unique<ConfigurationLoader>())
  , output_manager_(std::make_unique<OutputManager>())
  , simulation_runner_(std::make_unique<SimulationRunner>()) {
}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  auto start_time = std::chrono::high_resolution_clock::now();
  PerformanceMetrics metrics;

  try {
    // Parse command line arguments
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argc > 0 ? argv[constants::indexing::first] : "cairn");
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[constants::indexing::first]);
      return {true, constants::indexing::first, "Help displayed"};
    }

    display_header();

    // Configure environment
    std::error_code ec;
    auto exe_path = std::filesystem::canonical(argv[constants::indexing::first], ec).parent_path();
    if (ec) {
      exe_path = std::filesystem::current_path();
    }
    if (auto env_result = environment_manager_->configure_environment(exe_path); !env_result) {
      return handle_error(env_result.error());
    }

    // Load the network description
    auto config_result = config_loader_->load_configuration(args.config_file);
    if (!config_result) {
      return handle_error(config_result.error());
    }
    const auto& [config, config_path] = config_result.value();

    // Initialize output system
    if (auto output_init = output_manager_->initialize_output_system(config, args.case_name); !output_init) {
      return handle_error(output_init.error());
    }

    // Run the staged solve
    auto simulation_result = simulation_runner_->run_simulation(config, metrics);
    if (!simulation_result) {
      return handle_error(simulation_result.error());
    }
    const auto& result = simulation_result.value();

    // Completed stages are written even when a later stage failed
    auto output_result = output_manager_->write_simulation_results(result, config, config_path, metrics);

    auto end_time = std::chrono::high_resolution_clock::now();
    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    simulation_runner_->display_simulation_results(result, metrics);

    if (result.failure) {
      return handle_error(*result.failure);
    }
    if (!output_result) {
      return handle_error(output_result.error());
    }

    display_performance_summary(metrics);
    display_completion_message();

    return {true, constants::indexing::first, "Success"};

  } catch (const std::exception& e) {
    return handle_error(ApplicationError{"Unexpected error: " + std::string(e.what()), constants::indexing::second});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[]) 
  -> std::expected<CommandLineArgs, ApplicationError> {

  constexpr int min_required_args = 2;
  constexpr int case_name_arg_index = 2;

  if (argc < min_required_args) {
    return std::unexpected(ApplicationError{
      "Insufficient arguments provided",
      constants::indexing::second
    });
  }

  CommandLineArgs args;
  const std::string_view first_arg = argv[constants::indexing::second];
  if (first_arg == "-h" || first_arg == "--help") {
    args.help_requested = true;
    return args;
  }

  args.config_file = first_arg;
  if (argc > case_name_arg_index) {
    args.case_name = argv[case_name_arg_index];
  }

  return args;
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <network.yaml> [case_name]\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== CAIRN Staged Reactor Network Solver ===" << std::endl;
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;

  if (metrics.total_time.count() > 0) {
    const auto share = [&](std::chrono::milliseconds part) {
      return constants::conversion::to_percentage * part.count() / metrics.total_time.count();
    };
    std::cout << "  Solution: " << metrics.solve_time.count() << " ms (" << std::setprecision(1) << std::fixed
              << share(metrics.solve_time) << "%)" << std::endl;
    std::cout << "  Output: " << metrics.output_time.count() << " ms (" << share(metrics.output_time) << "%)"
              << std::defaultfloat << std::endl;
  }
}

auto ApplicationRunner::display_completion_message() const -> void {
  std::cout << "\n=== CALCULATION COMPLETED SUCCESSFULLY ===" << std::endl;
  std::cout << "\nPost-processing recommendations:" << std::endl;
  std::cout << "  • Open .h5 files with HDFView or Python (h5py, pandas)" << std::endl;
  std::cout << "  • The <case>_stages.csv file lists the stage boundaries of the .csv table" << std::endl;
}

auto ApplicationRunner::handle_error(const ApplicationError& error) const -> ApplicationResult {
  std::cerr << constants::string_processing::colors::red << "Error: " << error.message
            << constants::string_processing::colors::reset << std::endl;
  return {false, error.exit_code, error.message};
}

} // namespace cairn::core
