/**
 * @file test_reconciliation_convergence.cpp
 * @brief Integration tests for hooks, registry and host introspection together
 *
 * A simulated host runtime mounts and unmounts components while the
 * instrumentation hooks fire; queries must converge on the host's tree.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "shade/runtime/InstrumentationHooks.hpp"
#include "shade/runtime/SessionManager.hpp"
#include "shade/timeline/TimelineRecorder.hpp"
#include "test_utils.hpp"

using namespace SHADE;
using namespace SHADE::Runtime;
using SHADE::test::SimulatedHostRuntime;

class ReconciliationConvergenceTest : public ::testing::Test {
protected:
  void SetUp() override {
    recorder_ = std::make_shared<Timeline::TimelineRecorder>();
    recorder_->StartRecording();
    manager_ = std::make_shared<SessionManager>(recorder_,
                                                std::chrono::milliseconds(0));
    host_ = std::make_shared<SimulatedHostRuntime>("8.0");
  }

  std::shared_ptr<Session> Open(std::vector<std::string> knownVersions = {}) {
    return manager_->OpenSession(
        "circuit", std::make_shared<Tracking::HostRuntimeIntrospector>(
                       host_, std::move(knownVersions)));
  }

  std::shared_ptr<Timeline::TimelineRecorder> recorder_;
  std::shared_ptr<SessionManager> manager_;
  std::shared_ptr<SimulatedHostRuntime> host_;
};

TEST_F(ReconciliationConvergenceTest, PendingComponentsResolveFromHostTree) {
  auto session = Open();
  InstrumentationHooks hooks(session);

  auto root = host_->Mount(1, std::nullopt, "App.Layout");
  auto counter = host_->Mount(2, 1, "App.Counter");
  auto hidden = host_->Mount(3, 1, "Lib.Router", false);

  hooks.OnCreate(root, ComponentTypeInfo::FromFullName("App.Layout"));
  hooks.OnAttach(root, 1);
  hooks.OnCreate(counter, ComponentTypeInfo::FromFullName("App.Counter"));
  hooks.OnInitialized(counter, 1.0);
  hooks.OnRender(counter, 2.0, true);

  auto &registry = session->GetRegistry();
  auto counts = registry.GetCounts();
  EXPECT_EQ(counts.resolved, 3u);
  EXPECT_EQ(counts.pending, 0u);

  auto summary = registry.GetComponent(2);
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->mode, ComponentMode::Enhanced);
  EXPECT_EQ(summary->parent_id, std::optional<ComponentId>(1));
  ASSERT_TRUE(summary->metrics.has_value());
  EXPECT_EQ(summary->metrics->GetRenderCount(), 1u);

  auto router = registry.GetComponent(3);
  ASSERT_TRUE(router.has_value());
  EXPECT_EQ(router->mode, ComponentMode::Basic);
  EXPECT_EQ(router->type.name, "Router");

  // Subsequent hooks carry the resolved id
  hooks.OnRender(counter, 1.0, false);
  auto events = recorder_->GetEventsForComponent(2);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, EventKind::Render);
}

TEST_F(ReconciliationConvergenceTest, UnmountedComponentsDisappear) {
  auto session = Open();
  InstrumentationHooks hooks(session);
  auto root = host_->Mount(1, std::nullopt, "App.Layout");
  auto child = host_->Mount(2, 1, "App.Counter");
  hooks.OnCreate(child, ComponentTypeInfo::FromFullName("App.Counter"));
  ASSERT_EQ(session->GetRegistry().GetCounts().resolved, 2u);

  host_->Unmount(2);

  auto &registry = session->GetRegistry();
  EXPECT_FALSE(registry.GetComponent(2).has_value());
  EXPECT_EQ(registry.GetSubtree(1).size(), 1u);
}

TEST_F(ReconciliationConvergenceTest, ResolvedIdsTrackTheHostAcrossChurn) {
  auto session = Open();
  InstrumentationHooks hooks(session);
  std::vector<std::shared_ptr<void>> alive;

  for (ComponentId round = 0; round < 5; ++round) {
    ComponentId base = round * 10;
    alive.push_back(host_->Mount(base + 1, std::nullopt, "App.Page"));
    alive.push_back(host_->Mount(base + 2, base + 1, "App.Row"));
    hooks.OnCreate(alive.back(), ComponentTypeInfo::FromFullName("App.Row"));
    if (round > 0) {
      host_->Unmount(base - 10 + 2);
    }

    auto all = session->GetRegistry().GetAllComponents();
    std::vector<ComponentId> ids;
    for (const auto &summary : all) {
      ASSERT_EQ(summary.state, LifecycleState::Resolved);
      ids.push_back(summary.id);
    }

    std::vector<ComponentId> expected;
    for (ComponentId r = 0; r <= round; ++r) {
      expected.push_back(r * 10 + 1);
      if (r == round) {
        expected.push_back(r * 10 + 2);
      }
    }
    EXPECT_EQ(ids, expected) << "round " << round;
  }
}

TEST_F(ReconciliationConvergenceTest, UnknownInternalsVersionDegradesGracefully) {
  auto session = Open({"9.0"});
  InstrumentationHooks hooks(session);
  auto attached = host_->Mount(1, std::nullopt, "App.Layout");
  auto orphan = host_->Mount(2, 1, "App.Counter");

  hooks.OnCreate(attached, ComponentTypeInfo::FromFullName("App.Layout"));
  hooks.OnAttach(attached, 1);
  hooks.OnCreate(orphan, ComponentTypeInfo::FromFullName("App.Counter"));

  auto &registry = session->GetRegistry();
  EXPECT_FALSE(registry.IsIntrospectionSupported());
  auto counts = registry.GetCounts();
  EXPECT_EQ(counts.resolved, 1u);
  EXPECT_EQ(counts.pending, 1u);
  EXPECT_TRUE(registry.GetComponent(1).has_value());
}

TEST_F(ReconciliationConvergenceTest, FailingHostReadKeepsLastKnownState) {
  auto session = Open();
  host_->Mount(1, std::nullopt, "App.Layout");
  ASSERT_EQ(session->GetRegistry().GetCounts().resolved, 1u);

  host_->SetFailReads(true);
  host_->Unmount(1);

  EXPECT_NO_THROW(session->GetRegistry().GetCounts());
  EXPECT_EQ(session->GetRegistry().GetCounts().resolved, 1u);

  host_->SetFailReads(false);
  EXPECT_EQ(session->GetRegistry().GetCounts().resolved, 0u);
}

TEST_F(ReconciliationConvergenceTest, HooksAndQueriesRunConcurrently) {
  auto session = Open();
  InstrumentationHooks hooks(session);
  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;

  std::atomic<bool> done{false};
  std::thread reader([&] {
    while (!done) {
      session->GetRegistry().GetCounts();
      session->GetRegistry().GetAllComponents();
    }
  });

  std::vector<std::thread> writers;
  std::vector<std::vector<std::shared_ptr<void>>> mounted(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        ComponentId id = t * 1000 + i + 1;
        auto instance = host_->Mount(id, std::nullopt, "App.Cell");
        mounted[t].push_back(instance);
        hooks.OnCreate(instance, ComponentTypeInfo::FromFullName("App.Cell"));
        hooks.OnRender(instance, 0.5, true);
        hooks.OnInvalidate(instance, false, false);
      }
    });
  }
  for (auto &writer : writers) {
    writer.join();
  }
  done = true;
  reader.join();

  auto counts = session->GetRegistry().GetCounts();
  EXPECT_EQ(counts.resolved, static_cast<size_t>(kThreads * kPerThread));
  EXPECT_EQ(counts.pending, 0u);
  EXPECT_EQ(hooks.GetSwallowedFailureCount(), 0u);

  // Ids are gapless across every thread's events
  auto events = recorder_->GetEvents();
  for (size_t i = 1; i < events.size(); ++i) {
    EXPECT_EQ(events[i].event_id, events[i - 1].event_id + 1);
  }
}
