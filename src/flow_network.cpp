/*
  FlowNetwork: Edmonds-Karp max flow and cycle-canceling min-cost flow.

  Four graphs are owned independently and kept consistent by explicit sync
  steps after every flow change:
    capacity  : immutable topology + capacities (grows via add_edge only)
    flow      : current flow per capacity edge, zeros stored explicitly
    residual  : pushable amount per direction; never holds a 0 entry
    cost graph: cost of each residual edge whose cost is known
  The original cost map is the reference the cost graph is derived from.
*/
#include "flownet/core/flow_network.hpp"
#include "flownet/core/error.hpp"
#include "flownet/core/shortest_paths.hpp"
#include "flownet/core/traversal.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>

#include "absl/log/log.h"

namespace flownet::core {

namespace {
std::string edge_label(const Vertex& u, const Vertex& v) {
  return "(" + u.value() + ", " + v.value() + ")";
}

std::optional<Weight> lookup(const CostMap& m, const Vertex& u, const Vertex& v) {
  auto row = m.find(u);
  if (row == m.end()) return std::nullopt;
  auto it = row->second.find(v);
  if (it == row->second.end()) return std::nullopt;
  return it->second;
}
} // namespace

FlowNetwork::FlowNetwork(Vertex source, Vertex sink, FlowNetworkOptions options)
  : source_(std::move(source)), sink_(std::move(sink)), options_(options) {
  add_vertex_everywhere(source_);
  add_vertex_everywhere(sink_);
}

FlowNetwork FlowNetwork::from_capacities(Vertex source, Vertex sink,
                                         const Graph& capacities,
                                         const CostMap& costs,
                                         FlowNetworkOptions options) {
  for (auto const& [u, row] : costs) {
    for (auto const& [v, c] : row) {
      (void)c;
      if (!capacities.has_edge(u, v)) {
        throw ValueError("cost given for " + edge_label(u, v) + " which has no capacity");
      }
    }
  }
  FlowNetwork net(std::move(source), std::move(sink), options);
  for (auto const& v : capacities.vertices()) net.add_vertex_everywhere(v);
  for (auto const& [u, row] : capacities.edges()) {
    for (auto const& [v, cap] : row) {
      net.add_edge(u, v, cap, lookup(costs, u, v));
    }
  }
  return net;
}

void FlowNetwork::add_vertex_everywhere(const Vertex& v) {
  capacity_.add_vertex(v);
  flow_.add_vertex(v);
  residual_.add_vertex(v);
  cost_graph_.add_vertex(v);
}

void FlowNetwork::add_edge(const Vertex& u, const Vertex& v, Cap capacity,
                           std::optional<Cost> cost) {
  if (capacity < 0) {
    throw NegativeCapacity("capacity of " + edge_label(u, v) + " must be >= 0, got " +
                           std::to_string(capacity));
  }
  if (u == v) {
    throw ValueError("self-loop " + edge_label(u, v) + " cannot carry flow");
  }
  if (flow_.find_weight(u, v).value_or(0) != 0 || flow_.find_weight(v, u).value_or(0) != 0) {
    throw FlowConflict("edge " + edge_label(u, v) +
                       " already carries flow; call reset_flow() before changing it");
  }
  check_rep_if_enabled();

  add_vertex_everywhere(u);
  add_vertex_everywhere(v);
  capacity_.add_edge(u, v, capacity);
  flow_.add_edge(u, v, 0);
  // No flow on (u,v) or (v,u), so the forward residual is the capacity alone.
  if (capacity > 0) {
    residual_.add_edge(u, v, capacity);
  } else if (residual_.has_edge(u, v)) {
    residual_.remove_edge(u, v);
  }
  if (cost) costs_[u][v] = *cost;
  sync_cost_on_residual_change(u, v);

  check_rep_if_enabled();
}

std::optional<Cost> FlowNetwork::original_cost(const Vertex& u, const Vertex& v) const {
  return lookup(costs_, u, v);
}

std::optional<FlowNetwork::ResidualPart>
FlowNetwork::cheapest_residual_part(const Vertex& a, const Vertex& b) const {
  std::optional<ResidualPart> best;
  if (auto back = flow_.find_weight(b, a); back && *back > 0) {
    if (auto c = lookup(costs_, b, a)) best = ResidualPart{-*c, *back, true};
  }
  if (auto cap = capacity_.find_weight(a, b)) {
    const Flow room = *cap - flow_.find_weight(a, b).value_or(0);
    auto c = lookup(costs_, a, b);
    if (c && room > 0 && (!best || *c < best->cost)) best = ResidualPart{*c, room, false};
  }
  return best;
}

std::optional<Cost> FlowNetwork::residual_cost(const Vertex& a, const Vertex& b) const {
  if (auto part = cheapest_residual_part(a, b)) return part->cost;
  return std::nullopt;
}

std::vector<FlowNetwork::ResidualPart> FlowNetwork::cycle_parts(const std::vector<Vertex>& cycle) const {
  if (cycle.size() < 2 || cycle.front() != cycle.back()) {
    throw InvariantViolation("residual cycle must be closed and non-empty");
  }
  std::vector<ResidualPart> parts;
  parts.reserve(cycle.size() - 1);
  for (std::size_t i = 0; i + 1 < cycle.size(); ++i) {
    const Vertex& a = cycle[i];
    const Vertex& b = cycle[i + 1];
    auto part = residual_.has_edge(a, b) ? cheapest_residual_part(a, b) : std::nullopt;
    if (!part) {
      throw InvariantViolation("cycle edge " + edge_label(a, b) +
                               " is not a costed edge of the residual graph");
    }
    parts.push_back(*part);
  }
  return parts;
}

void FlowNetwork::sync_residual_on_flow_change(const Vertex& u, const Vertex& v, Flow delta) {
  const Flow forward = residual_.weight(u, v);
  if (forward == delta) {
    residual_.remove_edge(u, v);
  } else {
    residual_.add_edge(u, v, forward - delta);
  }
  residual_.add_edge(v, u, residual_.find_weight(v, u).value_or(0) + delta);
}

void FlowNetwork::sync_cost_on_residual_change(const Vertex& u, const Vertex& v) {
  if (!has_costs()) return;
  for (auto const& [a, b] : {std::pair<const Vertex&, const Vertex&>{u, v},
                             std::pair<const Vertex&, const Vertex&>{v, u}}) {
    auto c = residual_.has_edge(a, b) ? residual_cost(a, b) : std::nullopt;
    if (c) {
      cost_graph_.add_edge(a, b, *c);
    } else if (cost_graph_.has_edge(a, b)) {
      cost_graph_.remove_edge(a, b);
    }
  }
}

void FlowNetwork::rebuild_cost_graph() {
  Graph rebuilt;
  for (auto const& v : residual_.vertices()) rebuilt.add_vertex(v);
  for (auto const& [u, row] : residual_.edges()) {
    for (auto const& [v, r] : row) {
      (void)r;
      if (auto c = residual_cost(u, v)) rebuilt.add_edge(u, v, *c);
    }
  }
  cost_graph_ = std::move(rebuilt);
}

void FlowNetwork::reset_flow() {
  check_rep_if_enabled();
  Graph flow;
  Graph residual;
  for (auto const& v : capacity_.vertices()) {
    flow.add_vertex(v);
    residual.add_vertex(v);
  }
  for (auto const& [u, row] : capacity_.edges()) {
    for (auto const& [v, cap] : row) {
      flow.add_edge(u, v, 0);
      if (cap > 0) residual.add_edge(u, v, cap);
    }
  }
  flow_ = std::move(flow);
  residual_ = std::move(residual);
  rebuild_cost_graph();
  check_rep_if_enabled();
}

std::vector<Vertex> FlowNetwork::augmenting_path() const {
  if (source_ == sink_) return {};
  return bfs(residual_, source_, sink_);
}

std::optional<std::vector<Vertex>> FlowNetwork::negative_cost_residual_cycle() const {
  return bellman_ford_sssp(cost_graph_, sink_).negative_cycle;
}

Flow FlowNetwork::min_cap_along_aug_path(const std::vector<Vertex>& path) const {
  if (path.size() < 2) {
    throw InvariantViolation("augmenting path needs at least one edge");
  }
  Flow bottleneck = std::numeric_limits<Flow>::max();
  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    const Vertex& u = path[i];
    const Vertex& v = path[i + 1];
    auto cap = capacity_.find_weight(u, v);
    auto back_cap = capacity_.find_weight(v, u);
    if (!cap && !back_cap) {
      throw InvariantViolation("augmenting path uses " + edge_label(u, v) +
                               " which is not an edge of the network");
    }
    Flow room = 0;
    // Forward room on (u,v) plus flow on (v,u) that can be canceled.
    if (cap) room += *cap - flow_.weight(u, v);
    if (back_cap) room += flow_.weight(v, u);
    bottleneck = std::min(bottleneck, room);
  }
  return bottleneck;
}

Flow FlowNetwork::min_cap_along_res_cycle(const std::vector<Vertex>& cycle) const {
  // Room of the priced part only, so one cancellation never mixes the cost
  // of canceling (b,a) with the cost of sending over (a,b).
  Flow bottleneck = std::numeric_limits<Flow>::max();
  for (auto const& part : cycle_parts(cycle)) bottleneck = std::min(bottleneck, part.room);
  return bottleneck;
}

void FlowNetwork::push_augmenting_flow(const std::vector<Vertex>& path_or_cycle, bool costs_present) {
  std::vector<ResidualPart> parts;
  Flow delta = 0;
  if (costs_present) {
    parts = cycle_parts(path_or_cycle);
    delta = std::numeric_limits<Flow>::max();
    for (auto const& part : parts) delta = std::min(delta, part.room);
  } else {
    delta = min_cap_along_aug_path(path_or_cycle);
  }
  if (delta <= 0) {
    throw InvariantViolation("augmentation amount must be positive, got " + std::to_string(delta));
  }
  for (std::size_t i = 0; i + 1 < path_or_cycle.size(); ++i) {
    const Vertex& u = path_or_cycle[i];
    const Vertex& v = path_or_cycle[i + 1];
    const auto residual = residual_.find_weight(u, v);
    if (!residual || delta > *residual) {
      throw InvariantViolation("pushing " + std::to_string(delta) + " over " + edge_label(u, v) +
                               " exceeds its residual " + std::to_string(residual.value_or(0)));
    }

    // Cancel flow running against the push first, then send the rest
    // forward. A cycle edge priced at its forward cost only sends forward.
    Flow remaining = delta;
    const bool forward_only = costs_present && !parts[i].cancels;
    if (auto back = flow_.find_weight(v, u); back && !forward_only) {
      const Flow canceled = std::min(remaining, *back);
      flow_.add_edge(v, u, *back - canceled);
      remaining -= canceled;
    }
    if (remaining > 0) {
      auto cap = capacity_.find_weight(u, v);
      const Flow f = flow_.find_weight(u, v).value_or(0) + remaining;
      if (!cap || f > *cap) {
        throw InvariantViolation("flow on " + edge_label(u, v) + " would exceed its capacity");
      }
      flow_.add_edge(u, v, f);
    }

    sync_residual_on_flow_change(u, v, delta);
    sync_cost_on_residual_change(u, v);
  }
  VLOG(2) << (costs_present ? "canceled cycle of " : "augmented path of ")
          << (path_or_cycle.size() - 1) << " edges by " << delta;
}

Flow FlowNetwork::max_flow() {
  check_rep_if_enabled();
  std::size_t augmentations = 0;
  for (auto path = augmenting_path(); !path.empty(); path = augmenting_path()) {
    push_augmenting_flow(path, /*costs_present=*/false);
    ++augmentations;
  }
  check_rep_if_enabled();
  const Flow total = total_flow();
  VLOG(1) << "max flow " << source_.value() << " -> " << sink_.value() << ": " << total
          << " after " << augmentations << " augmentations";
  return total;
}

MinCostFlowResult FlowNetwork::min_cost_max_flow() {
  for (auto const& [u, row] : capacity_.edges()) {
    for (auto const& [v, cap] : row) {
      (void)cap;
      if (!original_cost(u, v)) {
        throw ValueError("min-cost query on a partially costed network: " +
                         edge_label(u, v) + " has no cost");
      }
    }
  }
  max_flow();

  std::size_t canceled = 0;
  for (auto cycle = negative_cost_residual_cycle(); cycle; cycle = negative_cost_residual_cycle()) {
    push_augmenting_flow(*cycle, /*costs_present=*/true);
    ++canceled;
  }
  check_rep_if_enabled();

  MinCostFlowResult result {total_cost(), total_flow()};
  VLOG(1) << "min-cost max flow " << source_.value() << " -> " << sink_.value() << ": flow "
          << result.flow << ", cost " << result.cost << " after canceling " << canceled
          << " cycles";
  return result;
}

Flow FlowNetwork::total_flow() const {
  Flow total = 0;
  for (auto const& [v, f] : flow_.children(source_)) {
    (void)v;
    total += f;
  }
  return total;
}

Cost FlowNetwork::total_cost() const {
  Cost total = 0;
  for (auto const& [u, row] : flow_.edges()) {
    for (auto const& [v, f] : row) {
      if (f == 0) continue;
      auto c = original_cost(u, v);
      if (!c) {
        throw ValueError("edge " + edge_label(u, v) + " carries flow but has no cost");
      }
      total += f * *c;
    }
  }
  return total;
}

std::vector<EdgeFlow> FlowNetwork::flow_assignment() const {
  std::vector<EdgeFlow> out;
  for (auto const& [u, row] : flow_.edges()) {
    for (auto const& [v, f] : row) {
      if (f > 0) out.push_back(EdgeFlow{u, v, f});
    }
  }
  return out;
}

void FlowNetwork::check_rep() const {
  for (const Graph* g : {&capacity_, &flow_, &residual_, &cost_graph_}) {
    if (!g->has_vertex(source_) || !g->has_vertex(sink_)) {
      throw InvariantViolation("source and sink must be vertices of every graph");
    }
  }

  // Invariant 1: flow edges == capacity edges, 0 <= flow <= capacity.
  if (flow_.num_edges() != capacity_.num_edges()) {
    throw InvariantViolation("flow graph and capacity graph have different edge sets");
  }
  for (auto const& [u, row] : capacity_.edges()) {
    for (auto const& [v, cap] : row) {
      if (cap < 0) {
        throw InvariantViolation("negative capacity on " + edge_label(u, v));
      }
      auto f = flow_.find_weight(u, v);
      if (!f) {
        throw InvariantViolation("capacity edge " + edge_label(u, v) + " has no flow entry");
      }
      if (*f < 0 || *f > cap) {
        throw InvariantViolation("flow " + std::to_string(*f) + " on " + edge_label(u, v) +
                                 " outside [0, " + std::to_string(cap) + "]");
      }
    }
  }

  // Invariants 2-4: each direction's residual is exactly what the capacity
  // edges between the pair leave pushable, and absent when that is 0.
  auto expected_residual = [this](const Vertex& a, const Vertex& b) -> std::optional<Flow> {
    auto cap = capacity_.find_weight(a, b);
    auto back_cap = capacity_.find_weight(b, a);
    if (!cap && !back_cap) return std::nullopt;
    Flow r = 0;
    if (cap) r += *cap - flow_.weight(a, b);
    if (back_cap) r += flow_.weight(b, a);
    return r;
  };
  for (auto const& [u, row] : capacity_.edges()) {
    for (auto const& [v, cap] : row) {
      (void)cap;
      for (auto const& [a, b] : {std::pair<const Vertex&, const Vertex&>{u, v},
                                 std::pair<const Vertex&, const Vertex&>{v, u}}) {
        const Flow expected = *expected_residual(a, b);
        const auto actual = residual_.find_weight(a, b);
        if (expected == 0 && actual) {
          throw InvariantViolation("residual edge " + edge_label(a, b) + " present with no room");
        }
        if (expected > 0 && actual != expected) {
          throw InvariantViolation("residual of " + edge_label(a, b) + " is " +
                                   (actual ? std::to_string(*actual) : std::string("missing")) +
                                   ", expected " + std::to_string(expected));
        }
      }
    }
  }
  for (auto const& [a, row] : residual_.edges()) {
    for (auto const& [b, r] : row) {
      (void)r;
      if (!expected_residual(a, b)) {
        throw InvariantViolation("residual edge " + edge_label(a, b) + " has no capacity edge");
      }
    }
  }

  // Invariant 5: conservation at internal vertices, source out == sink in.
  std::unordered_map<Vertex, Flow> net_out;
  for (auto const& [u, row] : flow_.edges()) {
    for (auto const& [v, f] : row) {
      net_out[u] += f;
      net_out[v] -= f;
    }
  }
  for (auto const& [v, net] : net_out) {
    if (v != source_ && v != sink_ && net != 0) {
      throw InvariantViolation("flow not conserved at " + v.value() + " (net out " +
                               std::to_string(net) + ")");
    }
  }
  if (source_ != sink_ && net_out[source_] != -net_out[sink_]) {
    throw InvariantViolation("flow out of source " + std::to_string(net_out[source_]) +
                             " != flow into sink " + std::to_string(-net_out[sink_]));
  }

  // Invariant 6: cost graph mirrors the costed residual edges.
  for (auto const& [u, row] : costs_) {
    for (auto const& [v, c] : row) {
      (void)c;
      if (!capacity_.has_edge(u, v)) {
        throw InvariantViolation("cost on " + edge_label(u, v) + " which has no capacity");
      }
    }
  }
  for (auto const& [a, row] : cost_graph_.edges()) {
    for (auto const& [b, c] : row) {
      if (!residual_.has_edge(a, b)) {
        throw InvariantViolation("cost graph edge " + edge_label(a, b) + " not in residual graph");
      }
      if (residual_cost(a, b) != c) {
        throw InvariantViolation("cost graph edge " + edge_label(a, b) +
                                 " disagrees with the original costs");
      }
    }
  }
  if (has_costs()) {
    for (auto const& [a, row] : residual_.edges()) {
      for (auto const& [b, r] : row) {
        (void)r;
        if (residual_cost(a, b) && !cost_graph_.has_edge(a, b)) {
          throw InvariantViolation("residual edge " + edge_label(a, b) + " missing from cost graph");
        }
      }
    }
  }
}

} // namespace flownet::core
