#include "cairn/io/composition_parser.hpp"
#include "cairn/io/config_manager.hpp"
#include "cairn/io/yaml_parser.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>

using namespace cairn;

namespace {

constexpr const char* stone_network = R"(
phases:
  gas:
    mechanism: air_11
groups:
  psr:
    mechanism: air_11
    solve: advance_to_steady_state
  pfr:
    mechanism: air_5
    solve: advance
    advance_time: 0.002
components:
  - id: feed
    Reservoir:
      temperature: 300
      pressure: 101325
      composition: "N2:0.79, O2:0.21"
      group: psr
  - id: torch
    group: psr
    IdealGasReactor:
      temperature: 6000
      volume: 0.001
      composition: {N2: 0.79, O2: 0.21}
  - id: cell1
    type: IdealGasConstPressureReactor
    properties:
      group: pfr
      volume: 0.0005
      wall_area: 0.02
      label: downstream
  - id: probe
    IdealGasReactor:
      temperature: 500
connections:
  - id: mfc_feed
    source: feed
    target: torch
    MassFlowController:
      mass_flow_rate: 0.01
  - id: transfer
    source: torch
    target: cell1
    type: MassFlowController
    properties:
      mass_flow_rate: 0.01
    mechanism_switch:
      htol: 0.001
      Xtol: 0.0001
  - id: leak
    source: cell1
    target: probe
output:
  directory: results
  case_name: torch_case
  formats: [csv]
solver:
  advance_substeps: 500
)";

auto parse_text(std::string_view text) -> std::expected<io::NetworkConfig, core::ConfigurationError> {
  io::YamlParser parser("<memory>");
  auto loaded = parser.load_string(text);
  REQUIRE(loaded.has_value(), "document loads");
  return parser.parse();
}

void test_composition_strings() {
  auto parsed = io::parse_composition(" N2:0.79 , O2 : 0.21 ");
  REQUIRE(parsed.has_value(), "well-formed composition");
  REQUIRE(parsed->size() == 2, "two species");
  REQUIRE((*parsed)[0].species == "N2" && (*parsed)[1].species == "O2", "declaration order kept");
  REQUIRE_NEAR((*parsed)[1].value, 0.21, 1e-15, "value parsed");
  REQUIRE(io::format_composition(*parsed) == "N2:0.79, O2:0.21", "formatting round trip");

  REQUIRE(!io::parse_composition("").has_value(), "empty rejected");
  REQUIRE(!io::parse_composition("N2").has_value(), "missing colon rejected");
  REQUIRE(!io::parse_composition("N2:abc").has_value(), "non-numeric rejected");
  REQUIRE(!io::parse_composition("N2:-0.1, O2:1").has_value(), "negative rejected");
  REQUIRE(!io::parse_composition("N2:0.5, N2:0.5").has_value(), "duplicate rejected");
  REQUIRE(!io::parse_composition("N2:0, O2:0").has_value(), "zero total rejected");
  std::cout << "[PASS] composition strings\n";
}

void test_stone_and_normalized_layouts() {
  auto config = parse_text(stone_network);
  REQUIRE(config.has_value(), "network parses: " << (config ? "" : config.error().message()));

  REQUIRE(config->default_mechanism == "air_11", "phases.gas.mechanism is the default");
  REQUIRE(config->groups.size() == 2, "two groups");
  const auto* pfr = config->find_group("pfr");
  REQUIRE(pfr && pfr->solve == io::GroupConfig::Solve::Advance, "advance directive");
  REQUIRE_NEAR(pfr->advance_time, 0.002, 1e-15, "advance time");
  REQUIRE(config->find_group("psr")->solve == io::GroupConfig::Solve::SteadyState, "steady directive");

  REQUIRE(config->nodes.size() == 4, "components alias accepted");
  const auto* feed = config->find_node("feed");
  REQUIRE(feed && feed->kind == io::NodeKind::Reservoir, "STONE type key");
  REQUIRE(feed->group == "psr", "group inside properties");
  REQUIRE(feed->initial.composition.size() == 2, "composition string");

  const auto* torch = config->find_node("torch");
  REQUIRE(torch->group == "psr", "group at node top level");
  REQUIRE(torch->initial.temperature == 6000.0, "temperature");
  REQUIRE(torch->initial.pressure == 101325.0, "pressure defaults to one atmosphere");
  REQUIRE(torch->initial.composition.size() == 2, "composition mapping");
  REQUIRE(torch->volume && *torch->volume == 0.001, "volume");

  const auto* cell = config->find_node("cell1");
  REQUIRE(cell->kind == io::NodeKind::IdealGasConstPressureReactor, "normalized type");
  REQUIRE(cell->group == "pfr", "normalized group");
  REQUIRE(cell->properties.at("wall_area") == 0.02, "numeric property kept");
  REQUIRE(!cell->properties.contains("label"), "non-numeric property ignored");
  REQUIRE(!cell->properties.contains("volume"), "volume is not a free property");

  REQUIRE(!config->find_node("probe")->group.has_value(), "ungrouped node");
  std::cout << "[PASS] STONE and normalized layouts\n";
}

void test_connections_output_solver() {
  auto config = parse_text(stone_network);
  REQUIRE(config.has_value(), "network parses");
  REQUIRE(config->connections.size() == 3, "three connections");

  const auto& feed = config->connections[0];
  REQUIRE(feed.kind == io::ConnectionKind::MassFlowController, "STONE connection type");
  REQUIRE(feed.mass_flow_rate() == 0.01, "mass flow rate");
  REQUIRE(!feed.mechanism_switch.has_value(), "no switch block");

  const auto& transfer = config->connections[1];
  REQUIRE(transfer.mechanism_switch.has_value(), "switch block parsed");
  REQUIRE_NEAR(transfer.mechanism_switch->htol, 1e-3, 1e-15, "htol");
  REQUIRE_NEAR(transfer.mechanism_switch->Xtol, 1e-4, 1e-15, "Xtol");

  const auto& leak = config->connections[2];
  REQUIRE(leak.kind == io::ConnectionKind::MassFlowController, "untyped connection defaults to a flow controller");
  REQUIRE(!leak.mass_flow_rate().has_value(), "no flow rate declared");

  REQUIRE(config->output.output_directory == "results", "output directory");
  REQUIRE(config->output.case_name == "torch_case", "case name");
  REQUIRE(config->output.write_csv && !config->output.write_hdf5, "formats list");
  REQUIRE(config->solver.advance_substeps == 500, "solver substeps");
  std::cout << "[PASS] connections, output and solver sections\n";
}

void test_invalid_documents() {
  REQUIRE(!parse_text("groups: {a: {}}\n").has_value(), "nodes are required");

  auto bad_type = parse_text("nodes:\n  - id: r\n    FancyReactor: {}\n");
  REQUIRE(!bad_type.has_value(), "unknown reactor type rejected");
  REQUIRE(bad_type.error().message().find("fancyreactor") != std::string::npos, "message names the type");

  REQUIRE(!parse_text("nodes:\n  - IdealGasReactor: {}\n").has_value(), "node id required");
  REQUIRE(!parse_text("nodes:\n  - id: r\n    IdealGasReactor: {temperature: -5}\n").has_value(),
          "negative temperature rejected");
  REQUIRE(!parse_text("groups:\n  g: {solve: sideways}\nnodes:\n  - id: r\n    IdealGasReactor: {}\n").has_value(),
          "unknown solve mode rejected");
  REQUIRE(!parse_text("nodes:\n  - id: r\n    IdealGasReactor: {}\noutput: {formats: [vtk]}\n").has_value(),
          "unknown output format rejected");
  REQUIRE(!parse_text("nodes:\n  - id: r\n    IdealGasReactor: {}\nsolver: {advance_substeps: 0}\n").has_value(),
          "non-positive substeps rejected");

  auto defaults = parse_text("nodes:\n  - id: r\n    IdealGasReactor: {}\n");
  REQUIRE(defaults.has_value(), "minimal network");
  REQUIRE(defaults->default_mechanism == "air_5", "built-in default mechanism");
  REQUIRE(defaults->output.write_csv && defaults->output.write_hdf5, "all formats by default");

  io::YamlParser unloaded("<none>");
  REQUIRE(!unloaded.parse().has_value(), "parse before load fails");
  std::cout << "[PASS] invalid documents\n";
}

void test_configuration_manager() {
  auto path = std::filesystem::temp_directory_path() / "cairn_test_network.yaml";
  {
    std::ofstream out(path);
    out << stone_network;
  }

  io::ConfigurationManager manager;
  auto config = manager.load(path.string());
  REQUIRE(config.has_value(), "file loads");
  REQUIRE(config->nodes.size() == 4, "same content as the in-memory parse");
  REQUIRE(manager.config_file_path().is_absolute(), "absolute path recorded");
  std::filesystem::remove(path);

  auto missing = manager.load("/nonexistent/cairn_network.yaml");
  REQUIRE(!missing.has_value(), "missing file reported");
  REQUIRE(missing.error().message().find("could not locate") != std::string::npos, "message explains");
  std::cout << "[PASS] configuration manager\n";
}

} // namespace

int main() {
  test_composition_strings();
  test_stone_and_normalized_layouts();
  test_connections_output_solver();
  test_invalid_documents();
  test_configuration_manager();
  return 0;
}
