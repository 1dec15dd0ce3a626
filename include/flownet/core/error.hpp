/* Exception taxonomy shared by the graph algorithms and the flow network. */
#pragma once

#include <stdexcept>
#include <string>

namespace flownet::core {

// Caller contract violations.
struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// FlowNetwork::add_edge with a capacity below zero.
struct NegativeCapacity : public ValueError {
  using ValueError::ValueError;
};

// FlowNetwork::add_edge over an edge pair that already carries flow.
struct FlowConflict : public ValueError {
  using ValueError::ValueError;
};

// Dijkstra (or verify_dag) on a subgraph that contains a cycle.
struct NotADag : public ValueError {
  using ValueError::ValueError;
};

// Weight lookup or removal of an edge that is not in the graph.
struct EdgeNotFound : public std::out_of_range {
  using std::out_of_range::out_of_range;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// File I/O failures and malformed network documents.
struct SerializationError : public RuntimeError {
  using RuntimeError::RuntimeError;
};

// Corrupted flow network state. Indicates a bug in the mutation logic, never
// an operating condition to recover from.
struct InvariantViolation : public std::logic_error {
  using std::logic_error::logic_error;
};

} // namespace flownet::core
