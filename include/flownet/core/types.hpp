/* Core type aliases.
 *
 * For Python developers:
 * - Weight/Cap/Flow/Cost: int64 (capacities and flows are integral so that
 *   Edmonds-Karp terminates; costs may be negative)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <limits>

namespace flownet::core {

using Weight = std::int64_t;  // Generic edge weight
using Cap    = std::int64_t;  // Edge capacity
using Flow   = std::int64_t;  // Flow amount (same unit as capacity)
using Cost   = std::int64_t;  // Per-unit edge cost and accumulated totals

// Distance assigned to vertices not (yet) reached by a shortest-path search.
inline constexpr Weight kInfiniteDistance = std::numeric_limits<Weight>::max();

} // namespace flownet::core
