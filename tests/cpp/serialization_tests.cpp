#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "flownet/core/error.hpp"
#include "flownet/core/flow_network.hpp"
#include "test_utils.hpp"

using namespace flownet::core;
using namespace flownet::core::test;

namespace {
std::string read_file(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}
} // namespace

//=============================================================================
// SECTION 1: ROUND TRIP
//=============================================================================

TEST(Serialization, DocumentLayout) {
  auto net = make_costed_network();
  auto j = net.to_json();
  EXPECT_EQ(j.at("source"), "a");
  EXPECT_EQ(j.at("sink"), "t");
  EXPECT_EQ(j.at("vertices").size(), 6u);
  EXPECT_EQ(j.at("capacities").at("a").at("b"), 10);
  EXPECT_EQ(j.at("flow").at("a").at("b"), 0);
  EXPECT_EQ(j.at("residual").at("c").at("e"), 15);
  EXPECT_EQ(j.at("cost").at("c").at("e"), 7);
  EXPECT_EQ(j.at("residualCost").at("e").at("t"), 1);
}

TEST(Serialization, RoundTripFreshNetwork) {
  auto net = make_costed_network();
  EXPECT_EQ(FlowNetwork::from_json(net.to_json(), checked_options()), net);
}

TEST(Serialization, RoundTripSolvedNetworkThroughFile) {
  auto net = make_costed_network();
  net.min_cost_max_flow();
  TempJsonFile file("flownet_solved");
  net.serialize_to_json(file.path());
  auto loaded = FlowNetwork::deserialize(file.path(), checked_options());
  EXPECT_EQ(loaded, net);
  EXPECT_EQ(loaded.total_cost(), 170);
  EXPECT_EQ(loaded.total_flow(), 17);
}

TEST(Serialization, IsolatedVerticesSurvive) {
  FlowNetwork net(V("s"), V("t"), checked_options());
  net.add_edge(V("s"), V("a"), 1);
  auto loaded = FlowNetwork::from_json(net.to_json(), checked_options());
  EXPECT_TRUE(loaded.capacity_graph().has_vertex(V("t")));
  EXPECT_EQ(loaded, net);
}

TEST(Serialization, IndentOptionControlsLayout) {
  auto compact = make_sample_network();
  TempJsonFile compact_file("flownet_compact");
  compact.serialize_to_json(compact_file.path());
  EXPECT_EQ(read_file(compact_file.path()).find('\n'), std::string::npos);

  FlowNetworkOptions opts = checked_options();
  opts.json_indent = 2;
  auto pretty = make_sample_network(opts);
  TempJsonFile pretty_file("flownet_pretty");
  pretty.serialize_to_json(pretty_file.path());
  EXPECT_NE(read_file(pretty_file.path()).find('\n'), std::string::npos);
  EXPECT_EQ(FlowNetwork::deserialize(pretty_file.path()), compact);
}

//=============================================================================
// SECTION 2: RESUMING SAVED STATE
//=============================================================================

TEST(Serialization, ResumeMaxFlowFromPartialState) {
  auto net = make_sample_network();
  net.push_augmenting_flow(net.augmenting_path(), false);
  ASSERT_EQ(net.total_flow(), 3);

  TempJsonFile file("flownet_partial");
  net.serialize_to_json(file.path());
  auto resumed = FlowNetwork::deserialize(file.path(), checked_options());
  EXPECT_EQ(resumed.total_flow(), 3) << "Flow is restored, not recomputed";
  EXPECT_EQ(resumed.max_flow(), 5);
}

TEST(Serialization, ResumeMinCostFromMaxFlowState) {
  auto net = make_costed_network();
  net.max_flow();
  auto resumed = FlowNetwork::from_json(net.to_json(), checked_options());
  EXPECT_EQ(resumed.total_cost(), 174);
  auto result = resumed.min_cost_max_flow();
  EXPECT_EQ(result.cost, 170);
  EXPECT_EQ(result.flow, 17);
}

TEST(Serialization, ReadsHandWrittenDocument) {
  TempJsonFile file("flownet_hand");
  file.write(R"({
    "source": "a", "sink": "b", "vertices": ["a", "b"],
    "capacities": {"a": {"b": 3}}, "cost": {},
    "flow": {"a": {"b": 0}}, "residual": {"a": {"b": 3}}, "residualCost": {}
  })");
  auto net = FlowNetwork::deserialize(file.path(), checked_options());
  EXPECT_FALSE(net.has_costs());
  EXPECT_EQ(net.max_flow(), 3);
}

//=============================================================================
// SECTION 3: MALFORMED INPUT
//=============================================================================

TEST(Serialization, MissingFileThrows) {
  EXPECT_THROW((void)FlowNetwork::deserialize("/nonexistent-dir/flownet.json"), SerializationError);
}

TEST(Serialization, UnwritablePathThrows) {
  auto net = make_sample_network();
  EXPECT_THROW(net.serialize_to_json("/nonexistent-dir/flownet.json"), SerializationError);
}

TEST(Serialization, InvalidJsonThrows) {
  TempJsonFile file("flownet_garbage");
  file.write("{\"source\": \"a\", ");
  EXPECT_THROW((void)FlowNetwork::deserialize(file.path()), SerializationError);
}

TEST(Serialization, MissingKeyThrows) {
  auto j = make_sample_network().to_json();
  j.erase("residual");
  EXPECT_THROW((void)FlowNetwork::from_json(j), SerializationError);
}

TEST(Serialization, WrongShapesThrow) {
  EXPECT_THROW((void)FlowNetwork::from_json(nlohmann::json::array()), SerializationError);

  auto vertices_not_array = make_sample_network().to_json();
  vertices_not_array["vertices"] = "a";
  EXPECT_THROW((void)FlowNetwork::from_json(vertices_not_array), SerializationError);

  auto fractional_flow = make_sample_network().to_json();
  fractional_flow["flow"]["a"]["b"] = 0.5;
  EXPECT_THROW((void)FlowNetwork::from_json(fractional_flow), SerializationError);
}
