#include "cairn/staging/lagrangian_trajectory.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <limits>

using namespace cairn;
using cairn::test::make_state;

namespace {

constexpr double nan = std::numeric_limits<double>::quiet_NaN();

auto timed(staging::ThermoState state, double t) -> staging::ThermoState {
  state.time = t;
  return state;
}

// psr (air_11, 2 states) -> pfr (air_5, 3 states) -> quench (N2_O2, 1 state)
auto three_segment_trajectory() -> staging::LagrangianTrajectory {
  staging::LagrangianTrajectory trajectory;
  trajectory.add_segment("psr", "air_11",
                         {timed(make_state("air_11", {"N2", "O2", "NO"}, {0.7, 0.2, 0.1}, 2000.0), 0.1),
                          timed(make_state("air_11", {"N2", "O2", "NO"}, {0.72, 0.2, 0.08}, 2100.0), 0.3)});
  trajectory.add_segment("pfr", "air_5",
                         {timed(make_state("air_5", {"N2", "O2", "O"}, {0.75, 0.2, 0.05}, 1900.0), 0.2),
                          timed(make_state("air_5", {"N2", "O2", "O"}, {0.76, 0.2, 0.04}, 1800.0), 0.4),
                          timed(make_state("air_5", {"N2", "O2", "O"}, {0.77, 0.2, 0.03}, 1700.0), 0.5)},
                         staging::SpeciesLosses{{"NO", 0.08}});
  trajectory.add_segment("quench", "N2_O2", {timed(make_state("N2_O2", {"N2", "O2"}, {0.8, 0.2}, 600.0), 0.05)});
  return trajectory;
}

void test_offsets_and_time_axis() {
  auto trajectory = three_segment_trajectory();
  const auto& segments = trajectory.segments();
  REQUIRE(segments.size() == 3, "three segments");
  REQUIRE(segments[0].t_offset == 0.0, "first offset is zero");
  REQUIRE_NEAR(segments[1].t_offset, 0.3, 1e-12, "second offset is the first segment's last local time");
  REQUIRE_NEAR(segments[2].t_offset, 0.8, 1e-12, "offsets accumulate");

  auto t = trajectory.time();
  REQUIRE(t.size() == 6, "one time per state");
  for (std::size_t i = 1; i < t.size(); ++i) {
    REQUIRE(t[i] >= t[i - 1], "time is monotonic at index " << i);
  }
  REQUIRE_NEAR(t.back(), 0.85, 1e-12, "global time of the last state");
  std::cout << "[PASS] offsets and time axis\n";
}

void test_missing_local_time() {
  staging::LagrangianTrajectory trajectory;
  trajectory.add_segment("a", "m", {timed(make_state("m", {"N2"}, {1.0}), 0.2)});
  trajectory.add_segment("b", "m", {timed(make_state("m", {"N2"}, {1.0}), nan)});
  trajectory.add_segment("c", "m", {timed(make_state("m", {"N2"}, {1.0}), 0.1)});

  const auto& segments = trajectory.segments();
  REQUIRE_NEAR(segments[1].t_offset, 0.2, 1e-12, "offset after a timed segment");
  REQUIRE_NEAR(segments[2].t_offset, 0.2, 1e-12, "unknown last time counts as zero");
  REQUIRE(std::isnan(trajectory.time()[1]), "unknown local time stays unknown on the global axis");
  std::cout << "[PASS] missing local time\n";
}

void test_concatenated_views() {
  auto trajectory = three_segment_trajectory();
  REQUIRE(trajectory.size() == 6, "six states");
  REQUIRE((trajectory.temperature() == std::vector<double>{2000.0, 2100.0, 1900.0, 1800.0, 1700.0, 600.0}),
          "segment-then-flow order");
  REQUIRE(trajectory.pressure().size() == 6, "pressure per state");

  auto no = trajectory.mole_fraction("NO");
  REQUIRE_NEAR(no[0], 0.1, 1e-15, "NO in psr");
  for (std::size_t i = 2; i < no.size(); ++i) {
    REQUIRE(std::isnan(no[i]), "NO absent downstream is NaN, not zero");
  }

  auto o2_mass = trajectory.mass_fraction("O2");
  REQUIRE(std::isnan(o2_mass[0]), "mass fractions unknown in these states");

  REQUIRE((trajectory.species_union() == std::vector<std::string>{"N2", "O2", "NO", "O"}), "first-seen union");
  REQUIRE((trajectory.stage_labels()[2] == "pfr"), "stage label per row");
  REQUIRE(trajectory.segments()[1].mapping_losses->at("NO") == 0.08, "losses kept on the downstream segment");
  REQUIRE(!trajectory.segments()[0].mapping_losses.has_value(), "first segment has no losses");

  auto x = trajectory.segments()[1].mole_fraction_matrix();
  REQUIRE(x.rows() == 3 && x.cols() == 3, "segment matrix shape");
  REQUIRE_NEAR(x(2, 2), 0.03, 1e-15, "segment matrix value");
  std::cout << "[PASS] concatenated views\n";
}

void test_table_and_csv() {
  auto trajectory = three_segment_trajectory();
  auto table = trajectory.to_table();
  REQUIRE(table.rows() == 6, "one row per reactor visit");
  REQUIRE(table.columns.size() == 4 + 2 * 4, "stage, t, T, P plus X and Y per species");
  REQUIRE(table.columns[4] == "X_N2" && table.columns[8] == "Y_N2", "column naming");
  REQUIRE(table.values.cols() == table.columns.size() - 1, "numeric block excludes the stage column");
  REQUIRE(std::isnan(table.values(5, 3 + 2)), "X_NO absent in quench");
  REQUIRE_NEAR(table.values(0, 1), 2000.0, 1e-12, "T column");

  auto path = std::filesystem::temp_directory_path() / "cairn_test_trajectory.csv";
  auto written = trajectory.to_csv(path);
  REQUIRE(written.has_value(), "csv written");

  std::ifstream in(path);
  std::string header;
  std::getline(in, header);
  REQUIRE(header.rfind("stage,t,T,P,X_N2", 0) == 0, "csv header: " << header);
  std::size_t rows = 0;
  std::string line;
  std::string last_row;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      ++rows;
      last_row = line;
    }
  }
  REQUIRE(rows == 6, "csv rows");
  REQUIRE(last_row.rfind("quench,", 0) == 0, "last row belongs to quench: " << last_row);
  REQUIRE(last_row.find("nan") != std::string::npos, "missing cells written as nan");
  in.close();
  std::filesystem::remove(path);

  auto unwritable = trajectory.to_csv(std::filesystem::path("/nonexistent_cairn_dir") / "out.csv");
  REQUIRE(!unwritable.has_value(), "unwritable path reported");
  std::cout << "[PASS] table and csv\n";
}

void test_empty_trajectory() {
  staging::LagrangianTrajectory trajectory;
  REQUIRE(trajectory.empty() && trajectory.size() == 0, "empty");
  REQUIRE(trajectory.to_table().rows() == 0, "empty table");
  REQUIRE(trajectory.species_union().empty(), "no species");
  REQUIRE(!trajectory.viz_network().has_value(), "no viz network");
  REQUIRE(trajectory.summary().find("0 segments") != std::string::npos, "summary");
  std::cout << "[PASS] empty trajectory\n";
}

void test_mechanism_species_list() {
  staging::LagrangianTrajectory trajectory;
  const auto& feed = trajectory.add_segment("feed", "air_5", {}, std::nullopt, {"N2", "O2", "NO", "N", "O"});
  REQUIRE((feed.species == std::vector<std::string>{"N2", "O2", "NO", "N", "O"}), "stateless segment keeps its species");
  REQUIRE(trajectory.species_union().size() == 5, "stateless segment contributes species");

  const auto& torch = trajectory.add_segment(
      "torch", "N2_O2", {timed(make_state("N2_O2", {"O2", "N2"}, {0.0, 1.0}, 800.0), 0.1)}, std::nullopt,
      {"N2", "O2"});
  REQUIRE((torch.species == std::vector<std::string>{"N2", "O2"}), "mechanism order kept over state order");

  auto o2 = trajectory.mole_fraction("O2");
  REQUIRE(o2.size() == 1 && o2[0] == 0.0, "zero fraction stays zero");
  auto n = trajectory.mole_fraction("N");
  REQUIRE(std::isnan(n[0]), "species outside the torch mechanism reads NaN");
  std::cout << "[PASS] mechanism species list\n";
}

} // namespace

int main() {
  test_offsets_and_time_axis();
  test_missing_local_time();
  test_concatenated_views();
  test_table_and_csv();
  test_empty_trajectory();
  test_mechanism_species_list();
  return 0;
}
