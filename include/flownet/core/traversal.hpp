/* Unweighted traversals over a Graph: BFS, DFS and acyclicity checks. */
#pragma once

#include <vector>

#include "flownet/core/graph.hpp"
#include "flownet/core/vertex.hpp"

namespace flownet::core {

// Path with the fewest edges from start to target, as the ordered vertex
// sequence [start, ..., target]. Empty if target is unreachable; [start] if
// start == target. Edge weights are ignored.
[[nodiscard]] std::vector<Vertex> bfs(const Graph& g, const Vertex& start, const Vertex& target);

// Some path from start to target (no length guarantee), or empty.
[[nodiscard]] std::vector<Vertex> dfs(const Graph& g, const Vertex& start, const Vertex& target);

// Throws NotADag if the subgraph reachable from source contains a cycle.
void verify_dag(const Graph& g, const Vertex& source);
[[nodiscard]] bool is_dag_from(const Graph& g, const Vertex& source);

} // namespace flownet::core
