#include "cairn/staging/stage_graph_builder.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace cairn;
using cairn::test::make_connection;
using cairn::test::make_group;
using cairn::test::make_node;

namespace {

auto stage_ids(const staging::StageExecutionPlan& plan) -> std::vector<std::string> {
  std::vector<std::string> ids;
  for (const auto& stage : plan.ordered_stages) {
    ids.push_back(stage.id);
  }
  return ids;
}

// A -> B -> C chain with two reactors in B
auto chain_config() -> io::NetworkConfig {
  io::NetworkConfig config;
  config.default_mechanism = "air_5";
  config.groups = {{"C", make_group()}, {"A", make_group("air_11")}, {"B", make_group()}};
  config.nodes = {make_node("feed", "A", io::NodeKind::Reservoir), make_node("a1", "A"), make_node("b1", "B"),
                  make_node("b2", "B"), make_node("c1", "C")};
  config.connections = {make_connection("m0", "feed", "a1"), make_connection("m1", "a1", "b1"),
                        make_connection("m2", "b1", "b2"), make_connection("m3", "b2", "c1")};
  return config;
}

void test_chain_ordering_and_partition() {
  auto plan = staging::build_stage_graph(chain_config());
  REQUIRE(plan.has_value(), "chain network should build");

  REQUIRE((stage_ids(*plan) == std::vector<std::string>{"A", "B", "C"}), "stages follow the flow");
  REQUIRE(plan->all_inter_connections.size() == 2, "two connections cross stage boundaries");
  REQUIRE(plan->node_to_stage.size() == 5, "every grouped node is mapped");
  REQUIRE(plan->node_to_stage.at("b2") == "B", "b2 belongs to B");

  const auto* a = plan->find_stage("A");
  const auto* b = plan->find_stage("B");
  REQUIRE(a && b, "stages are retrievable");
  REQUIRE(a->intra_connections.size() == 1 && a->intra_connections[0].id == "m0", "A keeps feed -> a1 internal");
  REQUIRE(b->intra_connections.size() == 1 && b->intra_connections[0].id == "m2", "B keeps b1 -> b2 internal");
  REQUIRE(b->inter_connections_in.size() == 1 && b->inter_connections_in[0].id == "m1", "B is fed by m1");
  REQUIRE(b->inter_connections_out.size() == 1 && b->inter_connections_out[0].id == "m3", "B feeds m3");

  for (const auto& inter : plan->all_inter_connections) {
    REQUIRE(inter.source_stage != inter.target_stage, "inter-stage connection spans two stages");
  }

  // Source stage precedes target stage for every inter-stage connection
  auto ids = stage_ids(*plan);
  for (const auto& inter : plan->all_inter_connections) {
    auto src = std::ranges::find(ids, inter.source_stage);
    auto tgt = std::ranges::find(ids, inter.target_stage);
    REQUIRE(src < tgt, "topological order respects " << inter.id);
  }
  std::cout << "[PASS] chain ordering and connection partition\n";
}

void test_mechanism_defaults_and_switch_block() {
  auto plan = staging::build_stage_graph(chain_config());
  REQUIRE(plan.has_value(), "chain network should build");

  REQUIRE(plan->find_stage("A")->mechanism == "air_11", "explicit group mechanism kept");
  REQUIRE(plan->find_stage("B")->mechanism == "air_5", "network default mechanism applied");

  const auto& m1 = plan->find_stage("B")->inter_connections_in[0];
  REQUIRE(m1.mechanism_switch.has_value(), "air_11 -> air_5 carries switch tolerances");
  REQUIRE_NEAR(m1.mechanism_switch->Xtol, 1e-4, 1e-15, "default Xtol");
  REQUIRE_NEAR(m1.mechanism_switch->htol, 1e-4, 1e-15, "default htol");

  const auto& m3 = plan->find_stage("C")->inter_connections_in[0];
  REQUIRE(!m3.mechanism_switch.has_value(), "same mechanism carries no switch block");
  REQUIRE(m3.properties.at("mass_flow_rate") == 1.0, "properties retained on inter-stage connection");
  std::cout << "[PASS] mechanism defaults and switch blocks\n";
}

void test_solve_directives() {
  io::NetworkConfig config;
  config.groups = {{"psr", make_group()}, {"pfr", make_group(std::nullopt, io::GroupConfig::Solve::Advance, 0.25)}};
  config.nodes = {make_node("r1", "psr"), make_node("r2", "pfr")};
  config.connections = {make_connection("c", "r1", "r2")};

  auto plan = staging::build_stage_graph(config);
  REQUIRE(plan.has_value(), "directive network should build");
  REQUIRE(std::holds_alternative<staging::SteadyState>(plan->find_stage("psr")->directive), "default is steady state");
  const auto* advance = std::get_if<staging::AdvanceFixedDuration>(&plan->find_stage("pfr")->directive);
  REQUIRE(advance && advance->duration == 0.25, "advance duration propagated");

  config.groups[1].second.advance_time = 0.0;
  auto bad = staging::build_stage_graph(config);
  REQUIRE(!bad.has_value(), "non-positive advance time rejected");
  std::cout << "[PASS] solve directives\n";
}

void test_cycle_detection() {
  io::NetworkConfig config;
  config.groups = {{"A", make_group()}, {"B", make_group()}, {"Z", make_group()}};
  config.nodes = {make_node("a", "A"), make_node("b", "B"), make_node("z", "Z")};
  config.connections = {make_connection("ab", "a", "b"), make_connection("ba", "b", "a")};

  auto plan = staging::build_stage_graph(config);
  REQUIRE(!plan.has_value(), "A <-> B must be rejected");
  const auto& message = plan.error().message();
  REQUIRE(message.find("cycle") != std::string::npos, "message names the cycle: " << message);
  REQUIRE(message.find("A, B") != std::string::npos, "message lists the unplaced stages: " << message);
  REQUIRE(message.find("Z") == std::string::npos, "placed stage not listed: " << message);
  std::cout << "[PASS] cycle detection\n";
}

void test_unknown_group() {
  io::NetworkConfig config;
  config.groups = {{"A", make_group()}};
  config.nodes = {make_node("a", "A"), make_node("x", "missing")};

  auto plan = staging::build_stage_graph(config);
  REQUIRE(!plan.has_value(), "unknown group must be rejected");
  REQUIRE(plan.error().message().find("missing") != std::string::npos, "message names the group");
  std::cout << "[PASS] unknown group\n";
}

void test_determinism_under_permutation() {
  auto reference = staging::build_stage_graph(chain_config());
  REQUIRE(reference.has_value(), "reference builds");

  auto permuted_config = chain_config();
  std::ranges::reverse(permuted_config.groups);
  std::ranges::reverse(permuted_config.nodes);
  std::ranges::reverse(permuted_config.connections);

  for (int repeat = 0; repeat < 3; ++repeat) {
    auto plan = staging::build_stage_graph(permuted_config);
    REQUIRE(plan.has_value(), "permuted config builds");
    REQUIRE(stage_ids(*plan) == stage_ids(*reference), "stage order independent of declaration order");
  }
  std::cout << "[PASS] determinism under permutation\n";
}

void test_single_stage_degeneracy() {
  io::NetworkConfig config;
  config.groups = {{"only", make_group()}};
  config.nodes = {make_node("feed", "only", io::NodeKind::Reservoir), make_node("r1", "only"),
                  make_node("r2", "only")};
  config.connections = {make_connection("c1", "feed", "r1"), make_connection("c2", "r1", "r2")};

  auto plan = staging::build_stage_graph(config);
  REQUIRE(plan.has_value(), "single stage builds");
  REQUIRE(plan->ordered_stages.size() == 1, "one stage");
  REQUIRE(plan->all_inter_connections.empty(), "no inter-stage connections");
  REQUIRE(plan->ordered_stages[0].intra_connections.size() == 2, "all connections intra-stage");
  std::cout << "[PASS] single-stage degeneracy\n";
}

void test_ungrouped_nodes_pass_through() {
  io::NetworkConfig config;
  config.groups = {{"A", make_group()}};
  config.nodes = {make_node("a", "A"), make_node("loose", std::nullopt)};
  config.connections = {make_connection("c", "a", "loose")};

  auto plan = staging::build_stage_graph(config);
  REQUIRE(plan.has_value(), "ungrouped node is not an error");
  REQUIRE(!plan->node_to_stage.contains("loose"), "ungrouped node not mapped");
  REQUIRE(plan->ordered_stages[0].node_ids.size() == 1, "ungrouped node not in stage");
  REQUIRE(plan->ordered_stages[0].intra_connections.empty(), "connection to ungrouped node left untouched");
  REQUIRE(plan->all_inter_connections.empty(), "connection to ungrouped node is not inter-stage");
  std::cout << "[PASS] ungrouped nodes pass through\n";
}

void test_parallel_edges_and_lexicographic_ties() {
  io::NetworkConfig config;
  // Diamond A -> {C, B} -> D plus two parallel A -> B connections and a free stage M
  config.groups = {{"D", make_group()}, {"M", make_group()}, {"C", make_group()}, {"B", make_group()},
                   {"A", make_group()}};
  config.nodes = {make_node("a1", "A"), make_node("a2", "A"), make_node("b", "B"),
                  make_node("c", "C"), make_node("d", "D"), make_node("m", "M")};
  config.connections = {make_connection("ac", "a1", "c"), make_connection("ab1", "a1", "b"),
                        make_connection("ab2", "a2", "b"), make_connection("bd", "b", "d"),
                        make_connection("cd", "c", "d")};

  auto plan = staging::build_stage_graph(config);
  REQUIRE(plan.has_value(), "diamond builds");
  REQUIRE((stage_ids(*plan) == std::vector<std::string>{"A", "B", "C", "D", "M"}),
          "ties broken in ascending lexicographic order");
  REQUIRE(plan->all_inter_connections.size() == 5, "parallel connections are all retained");
  REQUIRE(plan->find_stage("B")->inter_connections_in.size() == 2, "B sees both parallel inlets");
  std::cout << "[PASS] parallel edges and lexicographic ties\n";
}

} // namespace

int main() {
  test_chain_ordering_and_partition();
  test_mechanism_defaults_and_switch_block();
  test_solve_directives();
  test_cycle_detection();
  test_unknown_group();
  test_determinism_under_permutation();
  test_single_stage_degeneracy();
  test_ungrouped_nodes_pass_through();
  test_parallel_edges_and_lexicographic_ties();
  return 0;
}
