/* Option structs for FlowNetwork behavior and persistence. */
#pragma once

namespace flownet::core {

// Automatic invariant verification follows the build configuration:
// FLOWNET_CORE_CHECK_REP is defined for Debug builds by CMake.
#if defined(FLOWNET_CORE_CHECK_REP)
inline constexpr bool kCheckRepByDefault = true;
#else
inline constexpr bool kCheckRepByDefault = false;
#endif

struct FlowNetworkOptions {
  // Run check_rep() before and after every mutating operation (add_edge,
  // max_flow, min_cost_max_flow, reset_flow) and after deserialization.
  // O(V + E) per call; meant for development and property tests.
  bool check_invariants { kCheckRepByDefault };
  // Indentation passed to nlohmann::json::dump by serialize_to_json;
  // -1 writes the whole network on a single line.
  int json_indent { -1 };
};

} // namespace flownet::core
