#pragma once
#include <string>
#include <utility>
#include <vector>

namespace cairn::staging {

struct TopologicalOrder {
  std::vector<std::string> ordered;
  // Vertices never reaching in-degree zero (on or downstream of a cycle), sorted
  std::vector<std::string> unresolved;

  [[nodiscard]] auto complete() const noexcept -> bool { return unresolved.empty(); }
};

using DirectedEdge = std::pair<std::string, std::string>;

// Kahn's algorithm. Parallel edges count once, self loops and edges touching
// unknown vertices are ignored. The ready set is always drained in ascending
// lexicographic order so the result is independent of declaration order.
[[nodiscard]] auto kahn_order(const std::vector<std::string>& vertices,
                              const std::vector<DirectedEdge>& edges) -> TopologicalOrder;

} // namespace cairn::staging
