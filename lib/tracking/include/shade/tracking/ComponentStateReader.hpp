#ifndef SHADE_TRACKING_COMPONENT_STATE_READER_HPP
#define SHADE_TRACKING_COMPONENT_STATE_READER_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "shade/core/ComponentTypeInfo.hpp"

namespace SHADE {
namespace Tracking {

/**
 * @brief One declared input of a component and its current value
 *
 * value is the host's text rendering of the value; absent for null.
 */
struct ParameterValue {
  std::string name;
  std::string type_name;
  std::optional<std::string> value;
  bool is_cascading = false;
};

/// Render bookkeeping flags kept by the host's component base
struct InternalStateFlags {
  bool has_never_rendered = false;
  bool has_pending_queued_render = false;
  bool has_called_post_render = false;
  bool is_initialized = false;
};

struct SourceLocation {
  std::string file;
  int line = 0;
};

/**
 * @brief Inspection data captured from a live component
 *
 * tracked_state holds only the fields the component opted into; a null
 * value means the field was null.
 */
struct ComponentDetails {
  std::vector<ParameterValue> parameters;
  std::map<std::string, std::optional<std::string>> tracked_state;
  std::optional<InternalStateFlags> internal_state;
  std::optional<SourceLocation> source;
};

/**
 * @brief Optional capability to read inspection data from host components
 *
 * Every method is best-effort: an implementation returns empty results for
 * components it cannot read and may throw when the host internals changed
 * shape. Callers treat a throw like an empty result.
 */
class IComponentStateReader {
public:
  virtual ~IComponentStateReader() = default;

  virtual std::vector<ParameterValue>
  ReadParameters(const std::shared_ptr<void> &instance) = 0;

  virtual std::map<std::string, std::optional<std::string>>
  ReadTrackedState(const std::shared_ptr<void> &instance) = 0;

  virtual std::optional<InternalStateFlags>
  ReadInternalState(const std::shared_ptr<void> &instance) = 0;

  /// Where the component type is declared, when build tooling recorded it
  virtual std::optional<SourceLocation> LocateSource(const ComponentTypeInfo &type) = 0;
};

} // namespace Tracking
} // namespace SHADE

#endif // SHADE_TRACKING_COMPONENT_STATE_READER_HPP
