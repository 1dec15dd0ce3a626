/*
  shortest_paths: relaxation-based SSSP over a Graph.

  Features:
    - Dijkstra with a lazy (possibly stale) priority queue, restricted to
      graphs whose reachable part is a DAG.
    - Bellman-Ford with negative-cycle detection. The cycle is recovered from
      the predecessor map of the last vertex relaxed in round |V|, walking
      back until a vertex repeats and trimming the lead-in.
    - A source-free variant (every vertex at distance 0) that finds negative
      cycles anywhere in the graph.
*/
#include "flownet/core/shortest_paths.hpp"
#include "flownet/core/error.hpp"
#include "flownet/core/traversal.hpp"

#include <algorithm>
#include <unordered_set>

namespace flownet::core {

namespace {

// Predecessor walk from v until a vertex repeats; returns the closed cycle in
// forward (edge) order.
std::vector<Vertex> extract_cycle(const Vertex& v, const PredecessorMap& p) {
  std::unordered_set<Vertex> seen;
  std::vector<Vertex> walk;
  Vertex cur = v;
  while (!seen.count(cur)) {
    seen.insert(cur);
    walk.push_back(cur);
    auto it = p.find(cur);
    if (it == p.end()) {
      throw InvariantViolation("predecessor chain from " + v.value() +
                               " ends at " + cur.value() + " without closing a cycle");
    }
    cur = it->second;
  }
  walk.push_back(cur);
  // Drop the vertices that only lead into the cycle.
  auto first = std::find(walk.begin(), walk.end(), cur);
  walk.erase(walk.begin(), first);
  // Predecessor order is backwards along the edges.
  std::reverse(walk.begin(), walk.end());
  return walk;
}

BellmanFordResult bellman_ford_core(const Graph& g, DistanceMap d, PredecessorMap p) {
  const std::size_t rounds = g.num_vertices();
  std::optional<Vertex> last_relaxed;
  for (std::size_t round = 0; round < rounds; ++round) {
    last_relaxed.reset();
    for (auto const& [u, adj] : g.edges()) {
      for (auto const& [v, w] : adj) {
        (void)w;
        if (relax(g, u, v, d, &p)) last_relaxed = v;
      }
    }
    // Converged early: no edge can relax any more.
    if (!last_relaxed) break;
  }

  BellmanFordResult result;
  if (last_relaxed) {
    // Still relaxing after |V| rounds: the predecessor graph holds a
    // negative cycle on the chain behind the last relaxed vertex.
    result.negative_cycle = extract_cycle(*last_relaxed, p);
  } else {
    result.paths = ShortestPaths{std::move(d), std::move(p)};
  }
  return result;
}

} // namespace

bool relax(const Graph& g, const Vertex& u, const Vertex& v,
           DistanceMap& distances,
           PredecessorMap* predecessors,
           VertexQueue* queue) {
  const Weight w = g.weight(u, v);
  auto du = distances.find(u);
  if (du == distances.end() || du->second == kInfiniteDistance) return false;
  const Weight candidate = du->second + w;
  auto [dv, inserted] = distances.try_emplace(v, kInfiniteDistance);
  (void)inserted;
  if (dv->second <= candidate) return false;
  dv->second = candidate;
  if (predecessors) predecessors->insert_or_assign(v, u);
  if (queue) queue->emplace(candidate, v);
  return true;
}

ShortestPaths dijkstra_sssp(const Graph& g, const Vertex& source) {
  verify_dag(g, source);

  ShortestPaths sp;
  for (auto const& v : g.vertices()) sp.distances.emplace(v, kInfiniteDistance);
  sp.distances.insert_or_assign(source, Weight{0});
  sp.predecessors.emplace(source, source);

  VertexQueue pq;
  pq.emplace(Weight{0}, source);
  while (!pq.empty()) {
    auto [d_u, u] = pq.top();
    pq.pop();
    if (d_u > sp.distances.at(u)) continue;  // stale entry
    for (auto const& [v, w] : g.children(u)) {
      (void)w;
      relax(g, u, v, sp.distances, &sp.predecessors, &pq);
    }
  }
  return sp;
}

BellmanFordResult bellman_ford_sssp(const Graph& g, const Vertex& source) {
  DistanceMap d;
  for (auto const& v : g.vertices()) d.emplace(v, kInfiniteDistance);
  d.insert_or_assign(source, Weight{0});
  return bellman_ford_core(g, std::move(d), {});
}

std::optional<std::vector<Vertex>> find_negative_cycle(const Graph& g) {
  DistanceMap d;
  for (auto const& v : g.vertices()) d.emplace(v, Weight{0});
  return bellman_ford_core(g, std::move(d), {}).negative_cycle;
}

std::vector<Vertex> resolve_path(const PredecessorMap& predecessors,
                                 const Vertex& source, const Vertex& target) {
  if (source == target) return {source};
  if (predecessors.find(target) == predecessors.end()) return {};
  std::vector<Vertex> path {target};
  std::unordered_set<Vertex> seen {target};
  Vertex cur = target;
  while (cur != source) {
    auto it = predecessors.find(cur);
    // A broken or cyclic chain means target is not on a path from source.
    if (it == predecessors.end() || !seen.insert(it->second).second) return {};
    cur = it->second;
    path.push_back(cur);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

} // namespace flownet::core
