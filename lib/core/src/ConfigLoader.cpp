#include "shade/core/ConfigLoader.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>

namespace SHADE {

namespace {

using Util::Error;

// Returns an empty string on success, otherwise the error message
std::string ReadUnsigned(const nlohmann::json &obj, const char *key,
                         uint32_t &target) {
  if (!obj.contains(key)) {
    return "";
  }
  const auto &value = obj.at(key);
  if (!value.is_number_unsigned()) {
    return std::string("'") + key + "' must be a non-negative integer";
  }
  target = value.get<uint32_t>();
  return "";
}

std::string ReadBool(const nlohmann::json &obj, const char *key, bool &target) {
  if (!obj.contains(key)) {
    return "";
  }
  const auto &value = obj.at(key);
  if (!value.is_boolean()) {
    return std::string("'") + key + "' must be a boolean";
  }
  target = value.get<bool>();
  return "";
}

std::string ReadString(const nlohmann::json &obj, const char *key,
                       std::string &target) {
  if (!obj.contains(key)) {
    return "";
  }
  const auto &value = obj.at(key);
  if (!value.is_string()) {
    return std::string("'") + key + "' must be a string";
  }
  target = value.get<std::string>();
  return "";
}

std::string ReadStringList(const nlohmann::json &obj, const char *key,
                           std::vector<std::string> &target) {
  if (!obj.contains(key)) {
    return "";
  }
  const auto &value = obj.at(key);
  if (!value.is_array()) {
    return std::string("'") + key + "' must be an array of strings";
  }
  std::vector<std::string> items;
  for (const auto &item : value) {
    if (!item.is_string()) {
      return std::string("'") + key + "' must be an array of strings";
    }
    items.push_back(item.get<std::string>());
  }
  target = std::move(items);
  return "";
}

std::string ReadSection(const nlohmann::json &root, const char *key,
                        const nlohmann::json *&section) {
  section = nullptr;
  if (!root.contains(key)) {
    return "";
  }
  if (!root.at(key).is_object()) {
    return std::string("'") + key + "' must be an object";
  }
  section = &root.at(key);
  return "";
}

std::string ParseTimeline(const nlohmann::json &obj, TimelineConfig &timeline) {
  std::string err;
  if (!(err = ReadUnsigned(obj, "max_events", timeline.max_events)).empty())
    return err;
  if (!(err = ReadUnsigned(obj, "max_batches", timeline.max_batches)).empty())
    return err;
  if (!(err = ReadBool(obj, "record_on_start", timeline.record_on_start))
           .empty())
    return err;
  if (timeline.max_batches == 0) {
    return "'max_batches' must be greater than zero";
  }
  return "";
}

std::string ParseInstrumentation(const nlohmann::json &obj,
                                 InstrumentationConfig &instr) {
  std::string err;
  if (!(err = ReadBool(obj, "timing_enabled", instr.timing_enabled)).empty())
    return err;

  if (obj.contains("min_duration_to_record_ms")) {
    const auto &value = obj.at("min_duration_to_record_ms");
    if (!value.is_number() || value.get<double>() < 0.0) {
      return "'min_duration_to_record_ms' must be a non-negative number";
    }
    instr.min_duration_to_record_ms = value.get<double>();
  }

  if (!(err = ReadStringList(obj, "excluded_component_types",
                             instr.excluded_component_types))
           .empty())
    return err;

  std::vector<std::string> kinds;
  if (!(err = ReadStringList(obj, "event_kind_filter", kinds)).empty())
    return err;
  if (obj.contains("event_kind_filter")) {
    instr.event_kind_filter.clear();
    for (const auto &name : kinds) {
      auto kind = EventKindFromString(name);
      if (!kind) {
        return "unknown event kind '" + name + "' in 'event_kind_filter'";
      }
      instr.event_kind_filter.push_back(*kind);
    }
  }
  return "";
}

std::string ParseInspector(const nlohmann::json &obj, InspectorConfig &insp) {
  std::string err;
  if (!(err = ReadBool(obj, "enabled", insp.enabled)).empty())
    return err;
  if (!(err = ReadString(obj, "endpoint", insp.endpoint)).empty())
    return err;
  if (!(err = ReadUnsigned(obj, "receive_timeout_ms", insp.receive_timeout_ms))
           .empty())
    return err;
  if (!(err = ReadUnsigned(obj, "max_consecutive_failures",
                           insp.max_consecutive_failures))
           .empty())
    return err;
  if (insp.enabled && insp.endpoint.empty()) {
    return "'endpoint' must not be empty when the inspector is enabled";
  }
  return "";
}

std::string ParseLogging(const nlohmann::json &obj, LoggingConfig &logging) {
  std::string err;
  std::string level;
  if (!(err = ReadString(obj, "level", level)).empty())
    return err;
  if (obj.contains("level") && !ConfigLoader::ParseLogLevel(level, logging.level)) {
    return "unknown log level '" + level + "'";
  }
  return ReadString(obj, "directory", logging.directory);
}

} // namespace

bool ConfigLoader::ParseLogLevel(const std::string &text,
                                 Util::LogLevel &level) {
  if (text == "DEBUG") {
    level = Util::LogLevel::DEBUG;
  } else if (text == "INFO") {
    level = Util::LogLevel::INFO;
  } else if (text == "WARN" || text == "WARNING") {
    level = Util::LogLevel::WARNING;
  } else if (text == "ERROR") {
    level = Util::LogLevel::ERROR;
  } else {
    return false;
  }
  return true;
}

Util::Result<ShadeConfig> ConfigLoader::FromJson(const nlohmann::json &root) {
  if (!root.is_object()) {
    return Util::Err<ShadeConfig>(
        Error(Error::INVALID_CONFIG, "configuration root must be an object"));
  }

  ShadeConfig config;
  std::string err = ReadUnsigned(root, "reconcile_interval_ms",
                                 config.reconcile_interval_ms);

  const nlohmann::json *section = nullptr;
  if (err.empty() && (err = ReadSection(root, "timeline", section)).empty() &&
      section) {
    err = ParseTimeline(*section, config.timeline);
  }
  if (err.empty() &&
      (err = ReadSection(root, "instrumentation", section)).empty() &&
      section) {
    err = ParseInstrumentation(*section, config.instrumentation);
  }
  if (err.empty() && (err = ReadSection(root, "inspector", section)).empty() &&
      section) {
    err = ParseInspector(*section, config.inspector);
  }
  if (err.empty() && (err = ReadSection(root, "logging", section)).empty() &&
      section) {
    err = ParseLogging(*section, config.logging);
  }

  if (!err.empty()) {
    return Util::Err<ShadeConfig>(Error(Error::INVALID_CONFIG, err));
  }
  return Util::Ok(std::move(config));
}

Util::Result<ShadeConfig> ConfigLoader::LoadFromString(const std::string &text) {
  try {
    return FromJson(nlohmann::json::parse(text));
  } catch (const nlohmann::json::parse_error &e) {
    return Util::Err<ShadeConfig>(Error(
        Error::INVALID_CONFIG, std::string("malformed JSON: ") + e.what()));
  }
}

Util::Result<ShadeConfig> ConfigLoader::LoadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Util::Err<ShadeConfig>(Error(Error::CONFIG_NOT_FOUND,
                                        "cannot open configuration file: " + path,
                                        errno));
  }

  std::string file_content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
  file.close();

  if (file_content.empty()) {
    return Util::Err<ShadeConfig>(
        Error(Error::INVALID_CONFIG, "configuration file is empty: " + path));
  }
  return LoadFromString(file_content);
}

nlohmann::json ConfigLoader::ToJson(const ShadeConfig &config) {
  nlohmann::json kinds = nlohmann::json::array();
  for (EventKind kind : config.instrumentation.event_kind_filter) {
    kinds.push_back(EventKindToString(kind));
  }

  return {
      {"reconcile_interval_ms", config.reconcile_interval_ms},
      {"timeline",
       {{"max_events", config.timeline.max_events},
        {"max_batches", config.timeline.max_batches},
        {"record_on_start", config.timeline.record_on_start}}},
      {"instrumentation",
       {{"timing_enabled", config.instrumentation.timing_enabled},
        {"min_duration_to_record_ms",
         config.instrumentation.min_duration_to_record_ms},
        {"excluded_component_types",
         config.instrumentation.excluded_component_types},
        {"event_kind_filter", kinds}}},
      {"inspector",
       {{"enabled", config.inspector.enabled},
        {"endpoint", config.inspector.endpoint},
        {"receive_timeout_ms", config.inspector.receive_timeout_ms},
        {"max_consecutive_failures",
         config.inspector.max_consecutive_failures}}},
      {"logging",
       {{"level", Util::LogLevelToString(config.logging.level)},
        {"directory", config.logging.directory}}}};
}

} // namespace SHADE
