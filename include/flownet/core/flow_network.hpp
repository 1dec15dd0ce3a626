/*
  FlowNetwork: capacity, flow, residual and cost graphs kept in lockstep.

  Max flow by shortest augmenting paths (Edmonds-Karp) and min-cost max flow
  by cycle canceling, plus JSON persistence of the whole network state.

  Not thread-safe: the four graphs form one unit of mutation, and a reader
  observing them mid-augmentation would see a broken invariant. Callers that
  share a network across threads must serialize every call on it.
*/
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "flownet/core/graph.hpp"
#include "flownet/core/options.hpp"
#include "flownet/core/types.hpp"
#include "flownet/core/vertex.hpp"

namespace flownet::core {

// Original per-unit edge costs, u -> (v -> cost).
using CostMap = EdgeMap;

struct MinCostFlowResult {
  Cost cost {0};
  Flow flow {0};
};

// One entry of the final flow assignment.
struct EdgeFlow {
  Vertex from;
  Vertex to;
  Flow flow {0};
};

class FlowNetwork {
public:
  FlowNetwork(Vertex source, Vertex sink, FlowNetworkOptions options = {});

  // Network over an existing capacity graph; every edge starts with zero flow
  // and full residual. costs may only name edges of capacities.
  [[nodiscard]] static FlowNetwork from_capacities(Vertex source, Vertex sink,
                                                   const Graph& capacities,
                                                   const CostMap& costs = {},
                                                   FlowNetworkOptions options = {});

  // Adds (or re-capacitates) edge (u,v). Throws NegativeCapacity for
  // capacity < 0, FlowConflict if (u,v) or (v,u) currently carries flow, and
  // ValueError for a self-loop. Flow on every other edge is left untouched.
  void add_edge(const Vertex& u, const Vertex& v, Cap capacity,
                std::optional<Cost> cost = std::nullopt);

  // Pushes flow along shortest augmenting paths until none is left and
  // returns the total flow leaving the source. Calling it again on a
  // maximal network finds no path and changes nothing.
  Flow max_flow();

  // Maximum flow of minimum total cost. Requires a cost on every capacity
  // edge (ValueError otherwise, before anything is mutated).
  MinCostFlowResult min_cost_max_flow();

  // Zero flow everywhere, residual back to capacity, cost graph back to the
  // original costs.
  void reset_flow();

  // Verifies the structural invariant tying the four graphs together.
  // Throws InvariantViolation naming the first broken edge.
  void check_rep() const;

  // Algorithm steps, exposed for inspection and tests.
  [[nodiscard]] std::vector<Vertex> augmenting_path() const;
  [[nodiscard]] std::optional<std::vector<Vertex>> negative_cost_residual_cycle() const;
  [[nodiscard]] Flow min_cap_along_aug_path(const std::vector<Vertex>& path) const;
  [[nodiscard]] Flow min_cap_along_res_cycle(const std::vector<Vertex>& cycle) const;
  // Pushes the bottleneck amount along a source->sink path, or, when
  // costs_present, around a closed residual cycle. A path cancels reverse
  // flow before sending forward; a cycle moves each edge through the single
  // part its cost-graph price refers to.
  void push_augmenting_flow(const std::vector<Vertex>& path_or_cycle, bool costs_present);

  [[nodiscard]] const Vertex& source() const noexcept { return source_; }
  [[nodiscard]] const Vertex& sink() const noexcept { return sink_; }
  [[nodiscard]] const Graph& capacity_graph() const noexcept { return capacity_; }
  [[nodiscard]] const Graph& flow_graph() const noexcept { return flow_; }
  [[nodiscard]] const Graph& residual_graph() const noexcept { return residual_; }
  [[nodiscard]] const Graph& cost_graph() const noexcept { return cost_graph_; }
  [[nodiscard]] const CostMap& costs() const noexcept { return costs_; }
  [[nodiscard]] const FlowNetworkOptions& options() const noexcept { return options_; }
  [[nodiscard]] bool has_costs() const noexcept { return !costs_.empty(); }

  [[nodiscard]] Cap capacity(const Vertex& u, const Vertex& v) const { return capacity_.weight(u, v); }
  [[nodiscard]] Flow flow(const Vertex& u, const Vertex& v) const { return flow_.weight(u, v); }
  [[nodiscard]] std::optional<Cost> original_cost(const Vertex& u, const Vertex& v) const;

  // Sum of flow on the source's outgoing edges.
  [[nodiscard]] Flow total_flow() const;
  // Sum of flow(u,v) * cost(u,v) over edges with nonzero flow. Throws
  // ValueError if such an edge has no cost.
  [[nodiscard]] Cost total_cost() const;
  // (u, v, flow) for every edge with positive flow, in ascending (u, v).
  [[nodiscard]] std::vector<EdgeFlow> flow_assignment() const;

  // Persistence. Deserialization restores every graph verbatim (no
  // re-derivation) so a partially solved network can be resumed.
  [[nodiscard]] nlohmann::json to_json() const;
  [[nodiscard]] static FlowNetwork from_json(const nlohmann::json& j,
                                             FlowNetworkOptions options = {});
  void serialize_to_json(const std::string& path) const;
  [[nodiscard]] static FlowNetwork deserialize(const std::string& path,
                                               FlowNetworkOptions options = {});

  friend bool operator==(const FlowNetwork& a, const FlowNetwork& b) {
    return a.source_ == b.source_ && a.sink_ == b.sink_ &&
           a.capacity_ == b.capacity_ && a.flow_ == b.flow_ &&
           a.residual_ == b.residual_ && a.cost_graph_ == b.cost_graph_ &&
           a.costs_ == b.costs_;
  }

private:
  // residual(u,v) -= delta (erased at 0), residual(v,u) += delta.
  void sync_residual_on_flow_change(const Vertex& u, const Vertex& v, Flow delta);
  // Re-derives the cost graph entries of (u,v) and (v,u) from their presence
  // in the residual graph.
  void sync_cost_on_residual_change(const Vertex& u, const Vertex& v);
  // Residual edge (a,b) is up to two moves: more flow over capacity edge
  // (a,b) at cost(a,b), or canceling flow on (b,a) at -cost(b,a).
  struct ResidualPart {
    Cost cost {0};
    Flow room {0};
    bool cancels {false};
  };
  // Cheapest costed move over (a,b) with room left; ties prefer canceling.
  [[nodiscard]] std::optional<ResidualPart> cheapest_residual_part(const Vertex& a, const Vertex& b) const;
  // Cost of residual edge (a,b): the cost of its cheapest part.
  [[nodiscard]] std::optional<Cost> residual_cost(const Vertex& a, const Vertex& b) const;
  // Parts taken by each edge of a closed residual cycle, resolved before
  // any flow on it changes.
  [[nodiscard]] std::vector<ResidualPart> cycle_parts(const std::vector<Vertex>& cycle) const;
  void rebuild_cost_graph();
  void add_vertex_everywhere(const Vertex& v);
  void check_rep_if_enabled() const {
    if (options_.check_invariants) check_rep();
  }

  Vertex source_;
  Vertex sink_;
  FlowNetworkOptions options_ {};
  Graph capacity_ {};
  Graph flow_ {};
  Graph residual_ {};
  Graph cost_graph_ {};
  // Written only by add_edge / from_capacities / from_json.
  CostMap costs_ {};
};

} // namespace flownet::core
