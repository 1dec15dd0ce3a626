/*
  Pybind11 module exposing FlowNet-Core C++ APIs to Python.

  Notes:
    - Vertices cross the boundary as Vertex objects; graphs come back as
      nested dicts {u: {v: weight}} keyed by Vertex.
    - FlowNetwork methods keep the GIL held: a network is one unit of
      mutation and must not be observed mid-augmentation from another thread.
    - Core exceptions map to Python subclasses of ValueError, KeyError and
      RuntimeError.
*/
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>

#include "flownet/core/error.hpp"
#include "flownet/core/flow_network.hpp"
#include "flownet/core/graph.hpp"
#include "flownet/core/options.hpp"
#include "flownet/core/shortest_paths.hpp"
#include "flownet/core/traversal.hpp"
#include "flownet/core/types.hpp"
#include "flownet/core/vertex.hpp"

namespace py = pybind11;
using namespace flownet::core;

// {u: {v: w}} keyed by Vertex.
static py::dict edges_to_dict(const EdgeMap& edges) {
  py::dict out;
  for (auto const& [u, adj] : edges) {
    py::dict row;
    for (auto const& [v, w] : adj) row[py::cast(v)] = w;
    out[py::cast(u)] = row;
  }
  return out;
}

// Distances use None for unreached vertices (instead of kInfiniteDistance).
static py::dict distances_to_dict(const DistanceMap& d) {
  py::dict out;
  for (auto const& [v, dist] : d) {
    if (dist == kInfiniteDistance) {
      out[py::cast(v)] = py::none();
    } else {
      out[py::cast(v)] = dist;
    }
  }
  return out;
}

static py::dict predecessors_to_dict(const PredecessorMap& p) {
  py::dict out;
  for (auto const& [v, u] : p) out[py::cast(v)] = py::cast(u);
  return out;
}

PYBIND11_MODULE(_flownet_core, m) {
  m.doc() = "FlowNet-Core C++ bindings";

  // Bases first: pybind11 tries translators in reverse registration order.
  auto value_error = py::register_exception<ValueError>(m, "ValueError", PyExc_ValueError);
  py::register_exception<NegativeCapacity>(m, "NegativeCapacity", value_error.ptr());
  py::register_exception<FlowConflict>(m, "FlowConflict", value_error.ptr());
  py::register_exception<NotADag>(m, "NotADag", value_error.ptr());
  py::register_exception<EdgeNotFound>(m, "EdgeNotFound", PyExc_KeyError);
  auto runtime_error = py::register_exception<RuntimeError>(m, "RuntimeError", PyExc_RuntimeError);
  py::register_exception<SerializationError>(m, "SerializationError", runtime_error.ptr());
  py::register_exception<InvariantViolation>(m, "InvariantViolation", PyExc_AssertionError);

  py::class_<Vertex>(m, "Vertex")
      .def(py::init<std::string>(), py::arg("value"))
      .def_property_readonly("value", &Vertex::value)
      .def("__eq__", [](const Vertex& a, const Vertex& b){ return a == b; })
      .def("__lt__", [](const Vertex& a, const Vertex& b){ return a < b; })
      .def("__hash__", [](const Vertex& v){ return std::hash<Vertex>{}(v); })
      .def("__str__", [](const Vertex& v){ return v.value(); })
      .def("__repr__", [](const Vertex& v){ return "Vertex(" + py::repr(py::str(v.value())).cast<std::string>() + ")"; });

  py::class_<Graph>(m, "Graph")
      .def(py::init<>())
      .def("add_vertex", &Graph::add_vertex, py::arg("v"))
      .def("add_edge", &Graph::add_edge, py::arg("u"), py::arg("v"), py::arg("weight") = 0)
      .def("remove_edge", &Graph::remove_edge, py::arg("u"), py::arg("v"))
      .def("weight", &Graph::weight, py::arg("u"), py::arg("v"))
      .def("has_edge", &Graph::has_edge, py::arg("u"), py::arg("v"))
      .def("__contains__", &Graph::has_vertex)
      .def("children", [](const Graph& g, const Vertex& u){
        py::list out; for (auto const& [v, w] : g.children(u)) { (void)w; out.append(py::cast(v)); } return out;
      }, py::arg("u"))
      .def_property_readonly("vertices", [](const Graph& g){
        py::list out; for (auto const& v : g.vertices()) out.append(py::cast(v)); return out;
      })
      .def_property_readonly("edges", [](const Graph& g){ return edges_to_dict(g.edges()); })
      .def("num_vertices", &Graph::num_vertices)
      .def("num_edges", &Graph::num_edges)
      .def("bfs", [](const Graph& g, const Vertex& s, const Vertex& t) -> py::object {
        auto path = bfs(g, s, t); if (path.empty()) return py::none(); return py::cast(path);
      }, py::arg("start"), py::arg("target"))
      .def("dfs", [](const Graph& g, const Vertex& s, const Vertex& t) -> py::object {
        auto path = dfs(g, s, t); if (path.empty()) return py::none(); return py::cast(path);
      }, py::arg("start"), py::arg("target"))
      .def("verify_dag", [](const Graph& g, const Vertex& s){ verify_dag(g, s); }, py::arg("source"))
      .def("dijkstra_sssp", [](const Graph& g, const Vertex& s){
        auto sp = dijkstra_sssp(g, s);
        return py::make_tuple(distances_to_dict(sp.distances), predecessors_to_dict(sp.predecessors));
      }, py::arg("source"))
      .def("bellman_ford_sssp", [](const Graph& g, const Vertex& s){
        auto r = bellman_ford_sssp(g, s);
        if (r.negative_cycle) return py::make_tuple(py::cast(*r.negative_cycle), py::none(), py::none());
        return py::make_tuple(py::none(), distances_to_dict(r.paths->distances), predecessors_to_dict(r.paths->predecessors));
      }, py::arg("source"))
      .def("__eq__", [](const Graph& a, const Graph& b){ return a == b; });

  py::class_<FlowNetworkOptions>(m, "FlowNetworkOptions")
      .def(py::init<>())
      .def(py::init([](bool check_invariants, int json_indent){
        FlowNetworkOptions o; o.check_invariants = check_invariants; o.json_indent = json_indent; return o;
      }),
        py::kw_only(),
        py::arg("check_invariants") = kCheckRepByDefault,
        py::arg("json_indent") = -1)
      .def_readwrite("check_invariants", &FlowNetworkOptions::check_invariants)
      .def_readwrite("json_indent", &FlowNetworkOptions::json_indent);

  py::class_<FlowNetwork>(m, "FlowNetwork")
      .def(py::init<Vertex, Vertex, FlowNetworkOptions>(),
           py::arg("source"), py::arg("sink"), py::arg("options") = FlowNetworkOptions{})
      .def("add_edge", &FlowNetwork::add_edge,
           py::arg("u"), py::arg("v"), py::arg("capacity"), py::arg("cost") = py::none())
      .def("max_flow", &FlowNetwork::max_flow)
      .def("min_cost_max_flow", [](FlowNetwork& net){
        auto r = net.min_cost_max_flow(); return py::make_tuple(r.cost, r.flow);
      })
      .def("reset_flow", &FlowNetwork::reset_flow)
      .def("check_rep", &FlowNetwork::check_rep)
      .def("flow_assignment", [](const FlowNetwork& net){
        py::list out;
        for (auto const& e : net.flow_assignment()) out.append(py::make_tuple(e.from, e.to, e.flow));
        return out;
      })
      .def_property_readonly("source", &FlowNetwork::source)
      .def_property_readonly("sink", &FlowNetwork::sink)
      .def_property_readonly("capacity_graph", [](const FlowNetwork& n){ return edges_to_dict(n.capacity_graph().edges()); })
      .def_property_readonly("flow_graph", [](const FlowNetwork& n){ return edges_to_dict(n.flow_graph().edges()); })
      .def_property_readonly("residual_graph", [](const FlowNetwork& n){ return edges_to_dict(n.residual_graph().edges()); })
      .def_property_readonly("cost_graph", [](const FlowNetwork& n){ return edges_to_dict(n.cost_graph().edges()); })
      .def("total_flow", &FlowNetwork::total_flow)
      .def("total_cost", &FlowNetwork::total_cost)
      .def("serialize_to_json", &FlowNetwork::serialize_to_json, py::arg("path"))
      .def_static("deserialize", &FlowNetwork::deserialize,
                  py::arg("path"), py::arg("options") = FlowNetworkOptions{})
      .def("__eq__", [](const FlowNetwork& a, const FlowNetwork& b){ return a == b; });
}
