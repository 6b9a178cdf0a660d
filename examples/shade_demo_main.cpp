/**
 * @file shade_demo_main.cpp
 * @brief Drives SHADE from a simulated component host
 *
 * Mounts a small component tree, fires the instrumentation hooks the way
 * a renderer would, and prints the render ranking. With --inspector the
 * query endpoint stays up so an external client can attach.
 *
 * Usage:
 *   shade_demo [options]
 *
 * Options:
 *   -c, --config <file>     JSON configuration (default: built-in defaults)
 *   -n, --cycles <number>   Render cycles to simulate (default: 20)
 *   --inspector             Serve the inspector endpoint until Ctrl+C
 *   -h, --help              Show this help message
 */

#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "shade/core/ConfigLoader.hpp"
#include "shade/inspector/InspectorServer.hpp"
#include "shade/runtime/InstrumentationHooks.hpp"
#include "shade/runtime/SessionManager.hpp"
#include "shade/timeline/TimelineRecorder.hpp"
#include "shade/util/Logger.hpp"

using namespace SHADE;

static volatile bool g_running = true;

void signalHandler(int signum) {
  std::cout << "\nReceived signal " << signum << ", shutting down..."
            << std::endl;
  g_running = false;
}

void printUsage(const char *program) {
  std::cout << "SHADE demo - simulated component host\n\n";
  std::cout << "Usage: " << program << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>     JSON configuration\n";
  std::cout << "  -n, --cycles <number>   Render cycles to simulate (default: 20)\n";
  std::cout << "  --inspector             Serve the inspector endpoint until Ctrl+C\n";
  std::cout << "  -h, --help              Show this help message\n";
}

namespace {

struct DemoComponent {
  explicit DemoComponent(std::string n) : name(std::move(n)) {}
  std::string name;
  int clicks = 0;
  bool rendered = false;
};

// Every instance the demo mounts is a DemoComponent
class DemoStateReader : public Tracking::IComponentStateReader {
public:
  std::vector<Tracking::ParameterValue>
  ReadParameters(const std::shared_ptr<void> &instance) override {
    auto component = std::static_pointer_cast<DemoComponent>(instance);
    return {{"Title", "String", component->name, false},
            {"Theme", "ThemeInfo", std::nullopt, true}};
  }

  std::map<std::string, std::optional<std::string>>
  ReadTrackedState(const std::shared_ptr<void> &instance) override {
    auto component = std::static_pointer_cast<DemoComponent>(instance);
    return {{"clicks", std::to_string(component->clicks)}};
  }

  std::optional<Tracking::InternalStateFlags>
  ReadInternalState(const std::shared_ptr<void> &instance) override {
    auto component = std::static_pointer_cast<DemoComponent>(instance);
    Tracking::InternalStateFlags flags;
    flags.has_never_rendered = !component->rendered;
    flags.has_called_post_render = component->rendered;
    flags.is_initialized = true;
    return flags;
  }

  std::optional<Tracking::SourceLocation>
  LocateSource(const ComponentTypeInfo &type) override {
    if (type.full_name.rfind("Demo.", 0) != 0) {
      return std::nullopt;
    }
    return Tracking::SourceLocation{"Pages/" + type.name + ".razor", 1};
  }
};

// Host runtime whose component table the demo fills as it mounts
class DemoHostRuntime : public Tracking::IHostRuntime {
public:
  std::string GetInternalsVersion() const override { return "demo-1"; }
  bool ExposesComponentTree() const override { return true; }

  std::vector<Tracking::HostComponentState> ReadComponentStates() override {
    std::lock_guard<std::mutex> lock(fMutex);
    std::vector<Tracking::HostComponentState> states;
    for (const auto &kv : fTable) {
      states.push_back(kv.second);
    }
    return states;
  }

  void Mount(ComponentId id, std::optional<ComponentId> parent,
             std::shared_ptr<void> instance, const std::string &fullName) {
    Tracking::HostComponentState state;
    state.id = id;
    state.parent_id = parent;
    state.instance = std::move(instance);
    state.type = ComponentTypeInfo::FromFullName(fullName);
    std::lock_guard<std::mutex> lock(fMutex);
    fTable[id] = state;
  }

private:
  std::mutex fMutex;
  std::map<ComponentId, Tracking::HostComponentState> fTable;
};

struct MountedComponent {
  ComponentId id;
  std::shared_ptr<void> instance;
};

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  int cycles = 20;
  bool serve_inspector = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      }
    } else if (arg == "-n" || arg == "--cycles") {
      if (i + 1 < argc) {
        cycles = std::stoi(argv[++i]);
      }
    } else if (arg == "--inspector") {
      serve_inspector = true;
    }
  }

  ShadeConfig config;
  if (!config_path.empty()) {
    auto loaded = ConfigLoader::LoadFromFile(config_path);
    if (!Util::isOk(loaded)) {
      const auto &error = Util::getError(loaded);
      std::cerr << "ERROR: " << Util::Error::codeToString(error.code) << ": "
                << error.message << std::endl;
      return 1;
    }
    config = Util::takeValue(std::move(loaded));
  }
  if (serve_inspector) {
    config.inspector.enabled = true;
  }

  if (!Util::Logger::Initialize(config.logging.directory, config.logging.level)) {
    std::cerr << "ERROR: Failed to initialize logging" << std::endl;
    return 1;
  }
  auto logger = Util::Logger::GetLogger(Util::Subsystem::Host);

  auto recorder = std::make_shared<Timeline::TimelineRecorder>(config.timeline);
  recorder->StartRecording();
  auto sessions = std::make_shared<Runtime::SessionManager>(
      recorder, std::chrono::milliseconds(config.reconcile_interval_ms));

  std::unique_ptr<Inspector::InspectorServer> server;
  if (config.inspector.enabled) {
    auto service =
        std::make_shared<Inspector::InspectorQueryService>(sessions, recorder);
    server = std::make_unique<Inspector::InspectorServer>(service, config.inspector);
    if (!server->Start()) {
      std::cerr << "ERROR: Failed to start inspector on "
                << config.inspector.endpoint << std::endl;
      return 1;
    }
    std::cout << "Inspector listening on " << server->GetBoundEndpoint()
              << std::endl;
  }

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  auto host = std::make_shared<DemoHostRuntime>();
  auto session = sessions->OpenSession(
      "demo", std::make_shared<Tracking::HostRuntimeIntrospector>(
                  host, std::vector<std::string>{"demo-1"}));
  session->GetRegistry().SetStateReader(std::make_shared<DemoStateReader>());
  Runtime::InstrumentationHooks hooks(session, config.instrumentation);

  // Layout(1) -> NavMenu(2), Counter(3), FetchData(4) -> Row(5..8)
  const std::vector<std::pair<std::string, std::optional<ComponentId>>> tree = {
      {"Demo.Layout", std::nullopt}, {"Demo.NavMenu", 1},
      {"Demo.Counter", 1},           {"Demo.FetchData", 1},
      {"Demo.Row", 4},               {"Demo.Row", 4},
      {"Demo.Row", 4},               {"Demo.Row", 4}};

  std::vector<MountedComponent> mounted;
  for (size_t i = 0; i < tree.size(); ++i) {
    ComponentId id = static_cast<ComponentId>(i + 1);
    auto instance = std::make_shared<DemoComponent>(tree[i].first);
    hooks.OnCreate(instance, ComponentTypeInfo::FromFullName(tree[i].first));
    hooks.OnInitialized(instance, 0.2);
    host->Mount(id, tree[i].second, instance, tree[i].first);
    if (id == 1) {
      hooks.OnAttach(instance, id);
    }
    hooks.OnRender(instance, 0.5, true);
    instance->rendered = true;
    hooks.OnPostRender(instance, 0.1, true);
    mounted.push_back({id, instance});
  }
  // Framework component the host renders without instrumentation
  host->Mount(9, 1, nullptr, "Framework.Router");

  std::mt19937 rng(42);
  std::uniform_int_distribution<size_t> pick(0, mounted.size() - 1);
  std::uniform_real_distribution<double> cost(0.05, 4.0);

  for (int cycle = 0; cycle < cycles && g_running; ++cycle) {
    const auto &target = mounted[pick(rng)];
    BatchId batch = hooks.OnBatchStarted("cycle " + std::to_string(cycle));

    std::static_pointer_cast<DemoComponent>(target.instance)->clicks++;
    hooks.OnCallbackInvoked(target.instance, cost(rng), "OnClick");
    hooks.OnInvalidate(target.instance, false, false);
    hooks.OnInvalidate(target.instance, true, false);
    hooks.OnRender(target.instance, cost(rng), false);
    hooks.OnBasicRender(9, "Framework.Router", cost(rng));
    hooks.OnBatchCompleted(batch, {target.id, 9});

    if (cycle % 5 == 4) {
      hooks.OnNavigation("/page/" + std::to_string(cycle));
    }
  }

  auto counts = session->GetRegistry().GetCounts();
  logger->Info("Simulation finished: %zu resolved, %zu pending", counts.resolved,
               counts.pending);

  std::cout << "=== Render ranking ===" << std::endl;
  for (const auto &ranked : recorder->GetRankedComponents()) {
    std::cout << "  [" << ranked.component_id << "] " << ranked.component_type
              << ": " << ranked.render_count << " renders, "
              << ranked.total_ms << " ms total, " << ranked.min_ms << "-"
              << ranked.max_ms << " ms range"
              << std::endl;
  }
  std::cout << "Events recorded: " << recorder->GetState().event_count
            << std::endl;

  if (server) {
    std::cout << "Inspector running. Press Ctrl+C to stop." << std::endl;
    while (g_running && server->IsRunning()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server->Stop();
  }

  sessions->CloseAll();
  return 0;
}
