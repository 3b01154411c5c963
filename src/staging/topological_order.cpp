#include "cairn/staging/topological_order.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace cairn::staging {

auto kahn_order(const std::vector<std::string>& vertices, const std::vector<DirectedEdge>& edges)
    -> TopologicalOrder {

  std::map<std::string, int> in_degree;
  std::map<std::string, std::set<std::string>> successors;
  for (const auto& v : vertices) {
    in_degree.emplace(v, 0);
    successors.emplace(v, std::set<std::string>{});
  }

  for (const auto& [from, to] : edges) {
    if (from == to || !in_degree.contains(from) || !in_degree.contains(to)) {
      continue;
    }
    if (successors[from].insert(to).second) {
      ++in_degree[to];
    }
  }

  std::vector<std::string> ready;
  for (const auto& [v, degree] : in_degree) {
    if (degree == 0) {
      ready.push_back(v);
    }
  }
  std::ranges::sort(ready);

  TopologicalOrder result;
  result.ordered.reserve(in_degree.size());

  while (!ready.empty()) {
    auto current = std::move(ready.front());
    ready.erase(ready.begin());

    for (const auto& next : successors[current]) {
      if (--in_degree[next] == 0) {
        ready.push_back(next);
        std::ranges::sort(ready);
      }
    }
    result.ordered.push_back(std::move(current));
  }

  for (const auto& [v, degree] : in_degree) {
    if (degree > 0) {
      result.unresolved.push_back(v);
    }
  }
  return result;
}

} // namespace cairn::staging
