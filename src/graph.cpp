/*
  Graph: vertex set plus ordered adjacency map.

  Edge storage never keeps an empty neighbor map around: removing the last
  outgoing edge of u drops u's row, so edges() only lists vertices that
  actually have children. Also provides the flat JSON edge-map codec used by
  FlowNetwork persistence.
*/
#include "flownet/core/graph.hpp"
#include "flownet/core/error.hpp"

#include <string>
#include <utility>

namespace flownet::core {

namespace {
const Adjacency kNoChildren {};

std::string edge_label(const Vertex& u, const Vertex& v) {
  return "(" + u.value() + ", " + v.value() + ")";
}
} // namespace

void Graph::add_vertex(const Vertex& v) {
  vertices_.insert(v);
}

void Graph::add_edge(const Vertex& u, const Vertex& v, Weight w) {
  edges_[u][v] = w;
  vertices_.insert(u);
  vertices_.insert(v);
}

void Graph::remove_edge(const Vertex& u, const Vertex& v) {
  auto row = edges_.find(u);
  if (row == edges_.end() || row->second.erase(v) == 0) {
    throw EdgeNotFound("edge not present in graph: " + edge_label(u, v));
  }
  if (row->second.empty()) edges_.erase(row);
}

Weight Graph::weight(const Vertex& u, const Vertex& v) const {
  auto w = find_weight(u, v);
  if (!w) {
    throw EdgeNotFound("edge not present in graph: " + edge_label(u, v));
  }
  return *w;
}

std::optional<Weight> Graph::find_weight(const Vertex& u, const Vertex& v) const {
  auto row = edges_.find(u);
  if (row == edges_.end()) return std::nullopt;
  auto it = row->second.find(v);
  if (it == row->second.end()) return std::nullopt;
  return it->second;
}

bool Graph::has_edge(const Vertex& u, const Vertex& v) const {
  return find_weight(u, v).has_value();
}

const Adjacency& Graph::children(const Vertex& u) const {
  auto row = edges_.find(u);
  return row == edges_.end() ? kNoChildren : row->second;
}

std::size_t Graph::num_edges() const noexcept {
  std::size_t m = 0;
  for (auto const& [u, adj] : edges_) m += adj.size();
  return m;
}

Vertex vertex_from_json(const nlohmann::json& j) {
  if (j.is_string()) return Vertex(j.get<std::string>());
  if (j.is_number() || j.is_boolean()) return Vertex(j.dump());
  throw SerializationError("vertex must be a JSON scalar, got: " + j.dump());
}

nlohmann::json graph_to_json(const Graph& g) {
  nlohmann::json out = nlohmann::json::object();
  for (auto const& [u, adj] : g.edges()) {
    auto& row = out[u.value()];
    row = nlohmann::json::object();
    for (auto const& [v, w] : adj) row[v.value()] = w;
  }
  return out;
}

Graph graph_from_json(const nlohmann::json& edges, const std::set<Vertex>& vertices) {
  if (!edges.is_object()) {
    throw SerializationError("edge map must be a JSON object");
  }
  Graph g;
  for (auto const& v : vertices) g.add_vertex(v);
  for (auto const& [ustr, row] : edges.items()) {
    if (!row.is_object()) {
      throw SerializationError("adjacency of '" + ustr + "' must be a JSON object");
    }
    Vertex u(ustr);
    g.add_vertex(u);
    for (auto const& [vstr, w] : row.items()) {
      if (!w.is_number_integer()) {
        throw SerializationError("weight of " + edge_label(u, Vertex(vstr)) + " must be an integer");
      }
      g.add_edge(u, Vertex(vstr), w.get<Weight>());
    }
  }
  return g;
}

} // namespace flownet::core
