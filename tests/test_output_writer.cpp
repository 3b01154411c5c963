#include "cairn/io/output/csv_writer.hpp"
#include "cairn/io/output/hdf5_writer.hpp"
#include "cairn/io/output/output_writer.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>

using namespace cairn;
namespace output = cairn::io::output;

namespace {

auto scratch_directory(std::string_view name) -> std::filesystem::path {
  auto dir = std::filesystem::temp_directory_path() / std::format("cairn_output_{}", name);
  std::filesystem::remove_all(dir);
  return dir;
}

auto two_stage_trajectory() -> staging::LagrangianTrajectory {
  staging::LagrangianTrajectory trajectory;

  auto torch = test::make_state("air_3", {"N2", "N", "O2"}, {0.5, 0.3, 0.2}, 5000.0);
  torch.mass_fractions = {0.56, 0.17, 0.27};
  torch.time = 2e-4;
  trajectory.add_segment("torch", "air_3", {torch});

  auto cell1 = test::make_state("air_2", {"N2", "N"}, {0.625, 0.375}, 4000.0);
  cell1.time = 1e-3;
  auto cell2 = test::make_state("air_2", {"N2", "N"}, {0.7, 0.3}, 3000.0);
  cell2.time = 2e-3;
  trajectory.add_segment("quench", "air_2", {cell1, cell2}, staging::SpeciesLosses{{"O2", 0.2}});
  return trajectory;
}

auto metadata() -> output::SimulationMetadata {
  output::SimulationMetadata meta;
  meta.network_file = "staged_psr_pfr.yaml";
  meta.default_mechanism = "air_3";
  meta.stages = {{"torch", "air_3", "steady-state", {"feed", "torch"}},
                 {"quench", "air_2", "advance 0.002 s", {"cell1", "cell2"}}};
  return meta;
}

auto read_lines(const std::filesystem::path& path) -> std::vector<std::string> {
  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

void test_network_output_section() {
  io::OutputConfig network_output;
  network_output.output_directory = "results";
  network_output.case_name = "torch_case";
  network_output.write_csv = true;
  network_output.write_hdf5 = false;

  auto config = output::make_output_config(network_output);
  REQUIRE(config.base_directory == std::filesystem::path("results"), "directory carried");
  REQUIRE(config.case_name == "torch_case", "case name carried");
  REQUIRE(config.formats.size() == 1 && config.formats[0] == output::OutputFormat::CSV, "only csv selected");
  REQUIRE(output::WriterFactory::get_available_formats().size() == 2, "csv and hdf5 available");
  std::cout << "[PASS] network output section\n";
}

void test_csv_and_hdf5_written() {
  const auto dir = scratch_directory("both");
  output::OutputConfig config;
  config.base_directory = dir;
  config.case_name = "run";
  config.formats = {output::OutputFormat::HDF5, output::OutputFormat::CSV};
  config.include_timestamp = false;

  output::OutputWriter writer(config);
  REQUIRE(writer.writer_count() == 2, "one writer per format");

  double last_progress = -1.0;
  auto written = writer.write_trajectory(two_stage_trajectory(), metadata(),
                                         [&](double progress, const std::string&) { last_progress = progress; });
  REQUIRE(written.has_value(), "outputs written: " << (written ? "" : written.error().message()));
  REQUIRE(written->size() == 2, "two files reported");
  REQUIRE((*written)[0] == dir / "run.h5" && (*written)[1] == dir / "run.csv", "file names follow the case name");
  REQUIRE(last_progress == 1.0, "progress completes");

  auto table = read_lines(dir / "run.csv");
  REQUIRE(table.size() == 4, "header plus one row per state");
  REQUIRE(table[0].starts_with("stage,t,T,P"), "table header");
  REQUIRE(table[3].starts_with("quench,"), "rows in trajectory order");

  auto stages = read_lines(output::CSVWriter::stage_file_path(dir / "run.csv"));
  REQUIRE(stages.size() == 3, "header plus one row per segment");
  REQUIRE(stages[1].starts_with("torch,air_3,steady-state,0,"), "first stage row");
  REQUIRE(stages[2].find("O2:0.2") != std::string::npos, "lost species listed");

  std::filesystem::remove_all(dir);
  std::cout << "[PASS] csv and hdf5 written\n";
}

void test_hdf5_layout() {
  const auto dir = scratch_directory("layout");
  output::OutputConfig config;
  config.base_directory = dir;
  config.case_name = "layout";
  config.formats = {output::OutputFormat::HDF5};
  config.include_timestamp = false;

  output::OutputWriter writer(config);
  auto written = writer.write_trajectory(two_stage_trajectory(), metadata());
  REQUIRE(written.has_value(), "hdf5 written");
  const auto path = written->front();
  REQUIRE(output::hdf5::validate_file(path).has_value(), "valid HDF5 file");

  output::HDF5Reader reader(path);
  auto version = reader.read_string_attribute("/metadata", "cairn_version");
  REQUIRE(version.has_value() && *version == "1.0.0", "version attribute");
  auto stage_ids = reader.read_string_array("/metadata/stage_ids");
  REQUIRE(stage_ids.has_value() && *stage_ids == std::vector<std::string>({"torch", "quench"}), "stage table");

  auto groups = reader.list_group("/segments");
  REQUIRE(groups.has_value() && *groups == std::vector<std::string>({"000_torch", "001_quench"}),
          "one group per segment in execution order");

  auto mechanism = reader.read_string_attribute("/segments/001_quench", "mechanism");
  REQUIRE(mechanism.has_value() && *mechanism == "air_2", "segment mechanism");

  auto x = reader.read_matrix("/segments/001_quench/mole_fractions");
  REQUIRE(x.has_value() && x->rows() == 2 && x->cols() == 2, "state x species matrix");
  REQUIRE_NEAR((*x)(1, 0), 0.7, 1e-15, "row-major order preserved");

  auto y = reader.read_matrix("/segments/001_quench/mass_fractions");
  REQUIRE(y.has_value() && std::isnan((*y)(0, 0)), "unknown mass fractions stored as NaN");

  auto offset = reader.read_vector("/segments/001_quench/t_offset");
  REQUIRE(offset.has_value() && offset->size() == 1, "scalar offset");
  REQUIRE_NEAR(offset->front(), 2e-4, 1e-18, "offset is the torch duration");

  auto lost = reader.read_string_array("/segments/001_quench/mapping_losses/species");
  REQUIRE(lost.has_value() && *lost == std::vector<std::string>({"O2"}), "mapping losses recorded");
  REQUIRE(!reader.has_object("/segments/000_torch/mapping_losses"), "no losses on the first segment");

  auto time = reader.read_vector("/trajectory/time");
  REQUIRE(time.has_value() && time->size() == 3, "concatenated time axis");
  REQUIRE_NEAR((*time)[2], 2e-4 + 2e-3, 1e-15, "global time");
  auto labels = reader.read_string_array("/trajectory/stage");
  REQUIRE(labels.has_value() && (*labels)[1] == "quench", "stage labels");

  REQUIRE(!reader.read_vector("/trajectory/missing").has_value(), "missing dataset reported");

  std::filesystem::remove_all(dir);
  std::cout << "[PASS] hdf5 layout\n";
}

void test_output_errors() {
  output::OutputConfig none;
  none.formats.clear();
  output::OutputWriter idle(none);
  auto result = idle.write_trajectory(two_stage_trajectory(), metadata());
  REQUIRE(!result.has_value(), "no format selected");

  const auto blocker = std::filesystem::temp_directory_path() / "cairn_output_blocker";
  {
    std::ofstream out(blocker);
    out << "not a directory";
  }
  output::OutputConfig blocked;
  blocked.base_directory = blocker / "sub";
  blocked.formats = {output::OutputFormat::CSV};
  output::OutputWriter writer(blocked);
  result = writer.write_trajectory(two_stage_trajectory(), metadata());
  REQUIRE(!result.has_value(), "uncreatable directory reported");
  REQUIRE(result.error().message().find("Cannot create output directory") != std::string::npos, "message explains");
  std::filesystem::remove(blocker);
  std::cout << "[PASS] output errors\n";
}

} // namespace

int main() {
  test_network_output_section();
  test_csv_and_hdf5_written();
  test_hdf5_layout();
  test_output_errors();
  return 0;
}
