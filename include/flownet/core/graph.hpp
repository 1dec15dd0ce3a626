/* Directed weighted graph keyed by Vertex, with adjacency-map storage. */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

#include "flownet/core/types.hpp"
#include "flownet/core/vertex.hpp"

namespace flownet::core {

// Neighbor -> weight for the outgoing edges of one vertex.
using Adjacency = std::map<Vertex, Weight>;
// u -> (v -> weight)
using EdgeMap = std::map<Vertex, Adjacency>;

// Graph stores the vertex set and the adjacency mapping u -> (v -> weight).
// Every vertex mentioned by an edge is also in the vertex set. An edge with
// weight 0 is present; "no edge" is represented only by absence.
//
// Ordered containers keep traversal deterministic: neighbors are always
// visited in ascending vertex order, so BFS/DFS/Bellman-Ford results are
// reproducible across runs and platforms.
class Graph {
public:
  Graph() = default;

  // Adds an isolated vertex (no-op if already present).
  void add_vertex(const Vertex& v);

  // Inserts (u,v) or overwrites its weight; adds u and v to the vertex set.
  void add_edge(const Vertex& u, const Vertex& v, Weight w = 0);

  // Erases (u,v). Throws EdgeNotFound if absent. Vertices are kept.
  void remove_edge(const Vertex& u, const Vertex& v);

  // Weight of (u,v). Throws EdgeNotFound if absent.
  [[nodiscard]] Weight weight(const Vertex& u, const Vertex& v) const;
  [[nodiscard]] std::optional<Weight> find_weight(const Vertex& u, const Vertex& v) const;

  [[nodiscard]] bool has_vertex(const Vertex& v) const { return vertices_.count(v) != 0; }
  [[nodiscard]] bool has_edge(const Vertex& u, const Vertex& v) const;

  // Outgoing neighbors of u; empty for a vertex with no outgoing edge.
  [[nodiscard]] const Adjacency& children(const Vertex& u) const;

  [[nodiscard]] const std::set<Vertex>& vertices() const noexcept { return vertices_; }
  [[nodiscard]] const EdgeMap& edges() const noexcept { return edges_; }
  [[nodiscard]] std::size_t num_vertices() const noexcept { return vertices_.size(); }
  [[nodiscard]] std::size_t num_edges() const noexcept;

  friend bool operator==(const Graph& a, const Graph& b) = default;

private:
  std::set<Vertex> vertices_ {};
  // Invariant: no Adjacency in edges_ is empty.
  EdgeMap edges_ {};
};

// Vertex from a JSON scalar: strings are taken verbatim, numbers and booleans
// by their JSON text. Throws SerializationError for arrays/objects/null.
[[nodiscard]] Vertex vertex_from_json(const nlohmann::json& j);

// JSON edge map {"u": {"v": w, ...}, ...}. Vertices without outgoing edges do
// not appear; pass them separately to graph_from_json. Malformed documents
// (non-object rows, non-integer weights) throw SerializationError.
[[nodiscard]] nlohmann::json graph_to_json(const Graph& g);
[[nodiscard]] Graph graph_from_json(const nlohmann::json& edges,
                                    const std::set<Vertex>& vertices = {});

} // namespace flownet::core
