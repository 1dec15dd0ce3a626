/*
  FlowNetwork persistence: flat JSON document holding every graph.

  Layout:
    "source", "sink"  : vertex strings
    "vertices"        : all vertices of the capacity graph
    "capacities", "flow", "residual", "residualCost" : {u: {v: int}} edge maps
    "cost"            : original per-edge costs, same edge-map shape
  Reading restores each graph as written; nothing is recomputed from the
  capacities, so a network saved mid-computation resumes where it stopped.
*/
#include "flownet/core/flow_network.hpp"
#include "flownet/core/error.hpp"

#include <fstream>
#include <set>
#include <utility>

#include "absl/log/log.h"

namespace flownet::core {

namespace {
const nlohmann::json& require(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) {
    throw SerializationError(std::string("flow network document is missing \"") + key + "\"");
  }
  return *it;
}
} // namespace

nlohmann::json FlowNetwork::to_json() const {
  nlohmann::json out;
  out["source"] = source_.value();
  out["sink"] = sink_.value();
  auto vertices = nlohmann::json::array();
  for (auto const& v : capacity_.vertices()) vertices.push_back(v.value());
  out["vertices"] = std::move(vertices);
  out["capacities"] = graph_to_json(capacity_);
  out["flow"] = graph_to_json(flow_);
  out["residual"] = graph_to_json(residual_);
  auto cost = nlohmann::json::object();
  for (auto const& [u, row] : costs_) {
    auto& jrow = cost[u.value()];
    jrow = nlohmann::json::object();
    for (auto const& [v, c] : row) jrow[v.value()] = c;
  }
  out["cost"] = std::move(cost);
  out["residualCost"] = graph_to_json(cost_graph_);
  return out;
}

FlowNetwork FlowNetwork::from_json(const nlohmann::json& j, FlowNetworkOptions options) {
  if (!j.is_object()) {
    throw SerializationError("flow network document must be a JSON object");
  }
  const auto& jvertices = require(j, "vertices");
  if (!jvertices.is_array()) {
    throw SerializationError("\"vertices\" must be a JSON array");
  }

  FlowNetwork net(vertex_from_json(require(j, "source")),
                  vertex_from_json(require(j, "sink")), options);
  std::set<Vertex> vertices {net.source_, net.sink_};
  for (auto const& jv : jvertices) vertices.insert(vertex_from_json(jv));

  net.capacity_ = graph_from_json(require(j, "capacities"), vertices);
  net.flow_ = graph_from_json(require(j, "flow"), vertices);
  net.residual_ = graph_from_json(require(j, "residual"), vertices);
  net.cost_graph_ = graph_from_json(require(j, "residualCost"), vertices);
  net.costs_ = graph_from_json(require(j, "cost")).edges();

  // Graphs may mention vertices that the capacity graph's list omitted.
  for (const Graph* g : {&net.flow_, &net.residual_, &net.cost_graph_}) {
    for (auto const& v : g->vertices()) vertices.insert(v);
  }
  for (auto const& v : vertices) net.add_vertex_everywhere(v);

  if (net.options_.check_invariants) {
    try {
      net.check_rep();
    } catch (const InvariantViolation& e) {
      LOG(WARNING) << "deserialized flow network is inconsistent: " << e.what();
      throw;
    }
  }
  return net;
}

void FlowNetwork::serialize_to_json(const std::string& path) const {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    throw SerializationError("cannot open " + path + " for writing");
  }
  out << to_json().dump(options_.json_indent);
  out.flush();
  if (!out) {
    throw SerializationError("failed writing flow network to " + path);
  }
  VLOG(1) << "wrote flow network (" << capacity_.num_vertices() << " vertices, "
          << capacity_.num_edges() << " edges) to " << path;
}

FlowNetwork FlowNetwork::deserialize(const std::string& path, FlowNetworkOptions options) {
  std::ifstream in(path);
  if (!in) {
    throw SerializationError("cannot open " + path + " for reading");
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw SerializationError("malformed JSON in " + path + ": " + e.what());
  }
  FlowNetwork net = from_json(j, options);
  VLOG(1) << "read flow network (" << net.capacity_.num_vertices() << " vertices, "
          << net.capacity_.num_edges() << " edges) from " << path;
  return net;
}

} // namespace flownet::core
