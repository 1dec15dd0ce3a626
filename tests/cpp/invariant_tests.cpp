/**
 * Tests for FlowNetwork::check_rep.
 *
 * Valid networks pass at every stage; corrupted states are produced by
 * editing a JSON snapshot and loading it with automatic checks disabled,
 * since the public API cannot break the invariant.
 */

#include <gtest/gtest.h>

#include "flownet/core/error.hpp"
#include "flownet/core/flow_network.hpp"
#include "test_utils.hpp"

using namespace flownet::core;
using namespace flownet::core::test;

namespace {
FlowNetworkOptions unchecked_options() {
  FlowNetworkOptions opts;
  opts.check_invariants = false;
  return opts;
}

void expect_corrupt(const nlohmann::json& snapshot) {
  FlowNetwork loaded = FlowNetwork::from_json(snapshot, unchecked_options());
  EXPECT_THROW(loaded.check_rep(), InvariantViolation);
  EXPECT_THROW((void)FlowNetwork::from_json(snapshot, checked_options()), InvariantViolation)
    << "Checked loading rejects the same snapshot";
}
} // namespace

//=============================================================================
// SECTION 1: VALID STATES
//=============================================================================

TEST(CheckRep, ValidThroughoutMaxFlow) {
  auto net = make_sample_network(unchecked_options());
  EXPECT_NO_THROW(net.check_rep());
  for (auto path = net.augmenting_path(); !path.empty(); path = net.augmenting_path()) {
    net.push_augmenting_flow(path, false);
    EXPECT_NO_THROW(net.check_rep());
  }
  EXPECT_EQ(net.total_flow(), 5);
}

TEST(CheckRep, ValidThroughoutCycleCanceling) {
  auto net = make_costed_network(unchecked_options());
  net.max_flow();
  EXPECT_NO_THROW(net.check_rep());
  while (auto cycle = net.negative_cost_residual_cycle()) {
    net.push_augmenting_flow(*cycle, true);
    EXPECT_NO_THROW(net.check_rep());
  }
  EXPECT_EQ(net.total_cost(), 170);
}

TEST(CheckRep, ValidAfterResetAndRecapacitate) {
  auto net = make_costed_network(unchecked_options());
  net.min_cost_max_flow();
  net.reset_flow();
  EXPECT_NO_THROW(net.check_rep());
  net.add_edge(V("d"), V("t"), 8, 2);
  EXPECT_NO_THROW(net.check_rep());
}

TEST(CheckRep, DefaultOptionFollowsBuildConfiguration) {
  EXPECT_EQ(FlowNetworkOptions{}.check_invariants, kCheckRepByDefault);
}

//=============================================================================
// SECTION 2: CORRUPTED SNAPSHOTS
//=============================================================================

TEST(CheckRep, FlowAboveCapacity) {
  auto j = make_sample_network().to_json();
  j["flow"]["a"]["b"] = 3;
  expect_corrupt(j);
}

TEST(CheckRep, NegativeFlow) {
  auto j = make_sample_network().to_json();
  j["flow"]["a"]["b"] = -1;
  expect_corrupt(j);
}

TEST(CheckRep, MissingFlowEntry) {
  auto j = make_sample_network().to_json();
  j["flow"].erase("d");
  expect_corrupt(j);
}

TEST(CheckRep, ResidualNotUpdatedForFlow) {
  // Conserving flow a->b->d->e, but the residual graph still shows the
  // initial capacities and no reverse edges.
  auto j = make_sample_network().to_json();
  j["flow"]["a"]["b"] = 2;
  j["flow"]["b"]["d"] = 2;
  j["flow"]["d"]["e"] = 2;
  expect_corrupt(j);
}

TEST(CheckRep, MissingReverseResidual) {
  auto net = make_sample_network();
  net.max_flow();
  auto j = net.to_json();
  ASSERT_TRUE(j["residual"].contains("e"));
  j["residual"].erase("e");
  expect_corrupt(j);
}

TEST(CheckRep, ZeroResidualEntryStored) {
  FlowNetwork net(V("s"), V("t"));
  net.add_edge(V("s"), V("t"), 0);
  auto j = net.to_json();
  j["residual"]["s"]["t"] = 0;
  expect_corrupt(j);
}

TEST(CheckRep, ResidualWithoutCapacityEdge) {
  auto j = make_sample_network().to_json();
  j["residual"]["e"]["a"] = 1;
  expect_corrupt(j);
}

TEST(CheckRep, FlowNotConserved) {
  // Residuals agree with the flow on a->b, but nothing leaves b.
  auto j = make_sample_network().to_json();
  j["flow"]["a"]["b"] = 1;
  j["residual"]["a"]["b"] = 1;
  j["residual"]["b"]["a"] = 1;
  expect_corrupt(j);
}

TEST(CheckRep, CostOnMissingCapacityEdge) {
  auto j = make_costed_network().to_json();
  j["cost"]["t"]["a"] = 4;
  expect_corrupt(j);
}

TEST(CheckRep, CostGraphEdgeOutsideResidual) {
  auto j = make_costed_network().to_json();
  j["residualCost"]["t"]["e"] = -1;
  expect_corrupt(j);
}

TEST(CheckRep, CostGraphDisagreesWithOriginalCost) {
  auto j = make_costed_network().to_json();
  j["residualCost"]["a"]["b"] = 6;
  expect_corrupt(j);
}

TEST(CheckRep, CostGraphMissingCostedResidualEdge) {
  auto j = make_costed_network().to_json();
  j["residualCost"]["a"].erase("b");
  expect_corrupt(j);
}
