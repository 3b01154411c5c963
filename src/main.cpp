#include "cairn/core/application_runner.hpp"

int main(int argc, char* argv[]) {
  cairn::core::ApplicationRunner runner;
  const auto result = runner.run(argc, argv);
  return result.exit_code;
}
