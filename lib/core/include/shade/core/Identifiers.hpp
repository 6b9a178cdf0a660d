#ifndef SHADE_CORE_IDENTIFIERS_HPP
#define SHADE_CORE_IDENTIFIERS_HPP

#include <cstdint>

namespace SHADE {

/// Host-assigned component id, unknown until the component is attached
using ComponentId = int64_t;

/// Timeline event sequence id, monotonic within one recording
using EventId = int64_t;

/// Render batch id, monotonic within one recording
using BatchId = int64_t;

/// Subject id for session-level events and for pending records
constexpr ComponentId kSessionComponentId = -1;

/// Returned by the recorder when nothing was recorded
constexpr EventId kNoEvent = -1;

/// Returned by the recorder when no batch was opened
constexpr BatchId kNoBatch = -1;

} // namespace SHADE

#endif // SHADE_CORE_IDENTIFIERS_HPP
