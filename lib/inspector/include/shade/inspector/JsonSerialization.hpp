#ifndef SHADE_INSPECTOR_JSON_SERIALIZATION_HPP
#define SHADE_INSPECTOR_JSON_SERIALIZATION_HPP

#include <vector>

#include <nlohmann/json.hpp>

#include "shade/timeline/TimelineTypes.hpp"
#include "shade/tracking/ComponentRegistry.hpp"
#include "shade/tracking/LifecycleMetrics.hpp"

namespace SHADE {
namespace Inspector {

// Enum values become strings here and nowhere else.

nlohmann::json ToJson(const Timeline::TimelineEvent &event);
nlohmann::json ToJson(const Timeline::RenderBatch &batch);
nlohmann::json ToJson(const Timeline::RecorderState &state);
nlohmann::json ToJson(const Timeline::RankedComponent &ranked);
nlohmann::json ToJson(const Tracking::ComponentCounts &counts);
nlohmann::json ToJson(const Tracking::ParameterValue &parameter);
nlohmann::json ToJson(const Tracking::InternalStateFlags &flags);
nlohmann::json ToJson(const Tracking::ComponentSummary &summary);

/// Raw observations plus derived statistics; unavailable ratios are null
nlohmann::json ToJson(const Tracking::LifecycleMetrics &metrics,
                      Tracking::LifecycleMetrics::Clock::time_point now);

template <typename T> nlohmann::json ToJsonArray(const std::vector<T> &items) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &item : items) {
    array.push_back(ToJson(item));
  }
  return array;
}

} // namespace Inspector
} // namespace SHADE

#endif // SHADE_INSPECTOR_JSON_SERIALIZATION_HPP
