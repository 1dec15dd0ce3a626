/* Single-source shortest paths (Dijkstra, Bellman-Ford) and negative cycles. */
#pragma once

#include <functional>
#include <optional>
#include <queue>
#include <unordered_map>
#include <utility>
#include <vector>

#include "flownet/core/graph.hpp"
#include "flownet/core/types.hpp"
#include "flownet/core/vertex.hpp"

namespace flownet::core {

// Distance from the search source to every vertex of the graph; unreached
// vertices hold kInfiniteDistance.
using DistanceMap = std::unordered_map<Vertex, Weight>;
// Vertex -> its predecessor on a shortest path. Only reached vertices appear.
using PredecessorMap = std::unordered_map<Vertex, Vertex>;
// Lazy min-heap of (tentative distance, vertex); stale entries are skipped.
using QItem = std::pair<Weight, Vertex>;
using VertexQueue = std::priority_queue<QItem, std::vector<QItem>, std::greater<QItem>>;

struct ShortestPaths {
  DistanceMap distances;
  PredecessorMap predecessors;
};

// Outcome of Bellman-Ford: exactly one of the two members is engaged.
// negative_cycle is closed (front() == back()) and listed in traversal
// order, i.e. every consecutive pair is an edge of the graph.
struct BellmanFordResult {
  std::optional<std::vector<Vertex>> negative_cycle;
  std::optional<ShortestPaths> paths;
};

// d[v] <- d[u] + w(u,v) when that is shorter. Records u as v's predecessor and
// pushes (d[v], v) onto queue when those are given. Returns true if d[v]
// decreased. Relaxing from an unreached u does nothing.
// Throws EdgeNotFound if (u,v) is not an edge of g.
bool relax(const Graph& g, const Vertex& u, const Vertex& v,
           DistanceMap& distances,
           PredecessorMap* predecessors = nullptr,
           VertexQueue* queue = nullptr);

// Dijkstra with a lazy priority queue. The subgraph reachable from source
// must be acyclic (checked first, NotADag otherwise); under that condition
// negative edge weights are handled correctly. predecessors[source] == source.
[[nodiscard]] ShortestPaths dijkstra_sssp(const Graph& g, const Vertex& source);

// Bellman-Ford: up to |V| rounds of relaxation over every edge, stopping early
// once a round changes nothing. If round |V| still relaxes an edge, the
// negative cycle it exposes is returned instead of the distance/predecessor
// maps.
[[nodiscard]] BellmanFordResult bellman_ford_sssp(const Graph& g, const Vertex& source);

// Any negative-weight cycle in g, regardless of reachability (every vertex
// starts at distance 0), or nullopt.
[[nodiscard]] std::optional<std::vector<Vertex>> find_negative_cycle(const Graph& g);

// Vertex sequence source -> target following predecessors; empty if target
// was not reached.
[[nodiscard]] std::vector<Vertex> resolve_path(const PredecessorMap& predecessors,
                                               const Vertex& source, const Vertex& target);

} // namespace flownet::core
