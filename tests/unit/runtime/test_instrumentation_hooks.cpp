/**
 * @file test_instrumentation_hooks.cpp
 * @brief Unit tests for InstrumentationHooks
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "../test_helpers.hpp"
#include "shade/runtime/InstrumentationHooks.hpp"
#include "shade/timeline/TimelineRecorder.hpp"

using namespace SHADE;
using namespace SHADE::Runtime;
using SHADE::Timeline::TimelineEvent;
using SHADE::test::MakeComponent;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class InstrumentationHooksTest : public ::testing::Test {
protected:
  void SetUp() override {
    recorder_ = std::make_shared<Timeline::TimelineRecorder>();
    recorder_->StartRecording();
    session_ = MakeSession(recorder_);
  }

  static std::shared_ptr<Session>
  MakeSession(std::shared_ptr<Timeline::ITimelineRecorder> recorder) {
    return std::make_shared<Session>(
        "test", std::make_shared<Tracking::UnsupportedIntrospector>(),
        std::move(recorder), std::chrono::milliseconds(0));
  }

  std::shared_ptr<void> Attach(InstrumentationHooks &hooks, ComponentId id,
                               const std::string &fullName = "App.Counter") {
    auto instance = MakeComponent(fullName);
    hooks.OnCreate(instance, ComponentTypeInfo::FromFullName(fullName));
    hooks.OnAttach(instance, id);
    return instance;
  }

  std::vector<TimelineEvent> EventsOfKind(EventKind kind) const {
    std::vector<TimelineEvent> matching;
    for (const auto &event : recorder_->GetEvents()) {
      if (event.kind == kind) {
        matching.push_back(event);
      }
    }
    return matching;
  }

  std::shared_ptr<Timeline::TimelineRecorder> recorder_;
  std::shared_ptr<Session> session_;
};

TEST_F(InstrumentationHooksTest, CreateRegistersPendingComponent) {
  InstrumentationHooks hooks(session_);
  auto instance = MakeComponent();

  hooks.OnCreate(instance, ComponentTypeInfo::FromFullName("App.Counter"));

  auto counts = session_->GetRegistry().GetCounts();
  EXPECT_EQ(counts.pending, 1u);
}

TEST_F(InstrumentationHooksTest, PendingEventsUseSessionId) {
  InstrumentationHooks hooks(session_);
  auto instance = MakeComponent();
  hooks.OnCreate(instance, ComponentTypeInfo::FromFullName("App.Counter"));

  hooks.OnInitialized(instance, 1.5);

  auto events = EventsOfKind(EventKind::Initialize);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].component_id, kSessionComponentId);
  EXPECT_EQ(events[0].component_type, "Counter");
  EXPECT_EQ(events[0].duration_ms, std::optional<double>(1.5));
}

TEST_F(InstrumentationHooksTest, PendingComponentsDoNotShareTriggers) {
  InstrumentationHooks hooks(session_);
  auto a = MakeComponent("a");
  auto b = MakeComponent("b");
  hooks.OnCreate(a, ComponentTypeInfo::FromFullName("App.Counter"));
  hooks.OnCreate(b, ComponentTypeInfo::FromFullName("App.Row"));

  hooks.OnInvalidate(a, false, false);
  hooks.OnRender(b, 1.0, false);

  auto renders = EventsOfKind(EventKind::Render);
  ASSERT_EQ(renders.size(), 1u);
  EXPECT_EQ(renders[0].component_type, "Row");
  EXPECT_EQ(renders[0].trigger_reason, TriggerReason::Unknown);
  EXPECT_FALSE(renders[0].triggering_event_id.has_value());
}

TEST_F(InstrumentationHooksTest, ParameterSetRefreshesComponentDetails) {
  auto reader = std::make_shared<NiceMock<test::MockComponentStateReader>>();
  EXPECT_CALL(*reader, ReadParameters(_))
      .WillOnce(Return(std::vector<Tracking::ParameterValue>{
          {"Step", "Int32", std::string("1"), false}}))
      .WillOnce(Return(std::vector<Tracking::ParameterValue>{
          {"Step", "Int32", std::string("2"), false}}));
  session_->GetRegistry().SetStateReader(reader);
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);

  hooks.OnParametersSet(instance, 0.3);

  auto summary = session_->GetRegistry().GetComponent(4);
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->details.parameters.at(0).value,
            std::optional<std::string>("2"));
}

TEST_F(InstrumentationHooksTest, RenderUpdatesMetricsAndTimeline) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);

  hooks.OnRender(instance, 2.0, true);
  hooks.OnRender(instance, 6.0, false);

  auto summary = session_->GetRegistry().GetComponent(4);
  ASSERT_TRUE(summary.has_value());
  ASSERT_TRUE(summary->metrics.has_value());
  EXPECT_EQ(summary->metrics->GetRenderCount(), 2u);
  EXPECT_EQ(summary->metrics->GetMaxRenderDuration(), std::optional<double>(6.0));

  auto renders = EventsOfKind(EventKind::Render);
  ASSERT_EQ(renders.size(), 2u);
  EXPECT_EQ(renders[0].component_id, 4);
  EXPECT_EQ(renders[0].trigger_reason, TriggerReason::FirstRender);
  EXPECT_EQ(renders[1].trigger_reason, TriggerReason::ParentRerendered);
}

TEST_F(InstrumentationHooksTest, AsyncPhaseIsNotACall) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);

  hooks.OnInitialized(instance, 1.0);
  hooks.OnInitialized(instance, 20.0, true);

  auto metrics = *session_->GetRegistry().GetComponent(4)->metrics;
  EXPECT_EQ(metrics.GetCallCount(LifecyclePhase::Initialize), 1u);
  EXPECT_DOUBLE_EQ(metrics.GetAsyncTotalDuration(LifecyclePhase::Initialize), 20.0);

  auto events = EventsOfKind(EventKind::Initialize);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_TRUE(events[1].is_async);
}

TEST_F(InstrumentationHooksTest, InvalidationOutcomesAreRecorded) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);

  EXPECT_EQ(hooks.OnInvalidate(instance, false, false), InvalidationOutcome::Honored);
  EXPECT_EQ(hooks.OnInvalidate(instance, true, true),
            InvalidationOutcome::SuppressedAlreadyQueued);
  EXPECT_EQ(hooks.OnInvalidate(instance, false, true),
            InvalidationOutcome::SuppressedByPolicy);

  EXPECT_EQ(EventsOfKind(EventKind::Invalidation).size(), 1u);
  auto suppressed = EventsOfKind(EventKind::InvalidationSuppressed);
  ASSERT_EQ(suppressed.size(), 2u);
  EXPECT_TRUE(suppressed[0].was_suppressed);
  EXPECT_EQ(suppressed[0].trigger_details, "suppressed-already-queued");
  EXPECT_EQ(suppressed[1].trigger_details, "suppressed-by-policy");

  auto metrics = *session_->GetRegistry().GetComponent(4)->metrics;
  EXPECT_EQ(metrics.GetInvalidationCalls(), 3u);
  EXPECT_EQ(metrics.GetHonoredInvalidations(), 1u);
}

TEST_F(InstrumentationHooksTest, InvalidationTriggersFollowingRender) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);

  hooks.OnInvalidate(instance, false, false);
  hooks.OnRender(instance, 1.0, false);

  auto render = EventsOfKind(EventKind::Render).back();
  EXPECT_EQ(render.trigger_reason, TriggerReason::InvalidationCalled);
}

TEST_F(InstrumentationHooksTest, GateDecisionUpdatesMetricsOnly) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);
  size_t before = recorder_->GetEvents().size();

  hooks.OnGateDecision(instance, false);
  hooks.OnGateDecision(instance, true);

  auto metrics = *session_->GetRegistry().GetComponent(4)->metrics;
  EXPECT_EQ(metrics.GetGateDeclined(), 1u);
  EXPECT_EQ(metrics.GetGateAllowed(), 1u);
  EXPECT_EQ(recorder_->GetEvents().size(), before);
}

TEST_F(InstrumentationHooksTest, CallbackIsTimedAndNamed) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);

  hooks.OnCallbackInvoked(instance, 3.0, "OnClick");

  auto events = EventsOfKind(EventKind::CallbackInvoked);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].trigger_details, "OnClick");
  auto metrics = *session_->GetRegistry().GetComponent(4)->metrics;
  EXPECT_EQ(metrics.GetMaxEventCallbackDuration(), std::optional<double>(3.0));
}

TEST_F(InstrumentationHooksTest, DisposeRecordsLifetimeAndForgets) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);

  hooks.OnDispose(instance);

  auto disposals = EventsOfKind(EventKind::Dispose);
  ASSERT_EQ(disposals.size(), 1u);
  EXPECT_EQ(disposals[0].component_id, 4);
  EXPECT_EQ(disposals[0].metadata.count("lifetime_ms"), 1u);
  EXPECT_FALSE(session_->GetRegistry().GetComponent(4).has_value());

  size_t before = recorder_->GetEvents().size();
  hooks.OnRender(instance, 1.0, false);
  EXPECT_EQ(recorder_->GetEvents().size(), before);
}

TEST_F(InstrumentationHooksTest, DisposeOfPendingLeavesNoRecord) {
  InstrumentationHooks hooks(session_);
  auto instance = MakeComponent();
  hooks.OnCreate(instance, ComponentTypeInfo::FromFullName("App.Counter"));

  hooks.OnDispose(instance);

  EXPECT_EQ(session_->GetRegistry().GetCounts().pending, 0u);
}

TEST_F(InstrumentationHooksTest, UntrackedInstanceIsIgnored) {
  InstrumentationHooks hooks(session_);
  auto stranger = MakeComponent();

  hooks.OnRender(stranger, 1.0, true);
  hooks.OnInvalidate(stranger, false, false);
  hooks.OnDispose(stranger);

  EXPECT_TRUE(recorder_->GetEvents().empty());
  EXPECT_EQ(hooks.GetSwallowedFailureCount(), 0u);
}

TEST_F(InstrumentationHooksTest, ExcludedTypesAreNotTracked) {
  InstrumentationConfig config;
  config.excluded_component_types = {"Spinner", "Lib.Tooltip"};
  InstrumentationHooks hooks(session_, config);
  auto spinner = MakeComponent();
  auto tooltip = MakeComponent();

  hooks.OnCreate(spinner, ComponentTypeInfo::FromFullName("App.Spinner"));
  hooks.OnCreate(tooltip, ComponentTypeInfo::FromFullName("Lib.Tooltip"));
  hooks.OnRender(spinner, 1.0, true);
  hooks.OnBasicRender(9, "Lib.Tooltip", 1.0);

  EXPECT_EQ(session_->GetRegistry().GetCounts().total, 0u);
  EXPECT_TRUE(recorder_->GetEvents().empty());
}

TEST_F(InstrumentationHooksTest, KindFilterLimitsTimeline) {
  InstrumentationConfig config;
  config.event_kind_filter = {EventKind::Render};
  InstrumentationHooks hooks(session_, config);
  auto instance = Attach(hooks, 4);

  hooks.OnInitialized(instance, 1.0);
  hooks.OnRender(instance, 1.0, true);
  hooks.OnPostRender(instance, 1.0, true);

  auto events = recorder_->GetEvents();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, EventKind::Render);

  auto metrics = *session_->GetRegistry().GetComponent(4)->metrics;
  EXPECT_EQ(metrics.GetCallCount(LifecyclePhase::PostRender), 1u);
}

TEST_F(InstrumentationHooksTest, DisabledTimingDropsDurations) {
  InstrumentationConfig config;
  config.timing_enabled = false;
  InstrumentationHooks hooks(session_, config);
  auto instance = Attach(hooks, 4);

  hooks.OnRender(instance, 12.0, true);

  auto render = EventsOfKind(EventKind::Render).at(0);
  EXPECT_FALSE(render.duration_ms.has_value());
  auto metrics = *session_->GetRegistry().GetComponent(4)->metrics;
  EXPECT_EQ(metrics.GetRenderCount(), 1u);
  EXPECT_DOUBLE_EQ(metrics.GetTotalDuration(LifecyclePhase::Render), 0.0);
}

TEST_F(InstrumentationHooksTest, ShortPhasesAreNotRecorded) {
  InstrumentationConfig config;
  config.min_duration_to_record_ms = 5.0;
  InstrumentationHooks hooks(session_, config);
  auto instance = Attach(hooks, 4);

  hooks.OnRender(instance, 1.0, true);
  hooks.OnRender(instance, 8.0, false);

  EXPECT_EQ(EventsOfKind(EventKind::Render).size(), 1u);
  auto metrics = *session_->GetRegistry().GetComponent(4)->metrics;
  EXPECT_EQ(metrics.GetRenderCount(), 2u);
}

TEST_F(InstrumentationHooksTest, BasicRenderCountsHostComponent) {
  InstrumentationHooks hooks(session_);
  Tracking::HostTreeSnapshot snapshot;
  snapshot[7] = test::Entry(nullptr, std::nullopt, "Lib.Router");
  session_->GetRegistry().ReconcileWith(snapshot);

  hooks.OnBasicRender(7, "Lib.Router", 2.0, true);

  EXPECT_EQ(session_->GetRegistry().GetComponent(7)->basic_render_count, 1u);
  auto events = EventsOfKind(EventKind::BasicRender);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_FALSE(events[0].enhanced);
  EXPECT_EQ(events[0].trigger_reason, TriggerReason::FirstRender);
}

TEST_F(InstrumentationHooksTest, BatchHooksDriveRecorder) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);

  BatchId batch = hooks.OnBatchStarted("click");
  hooks.OnRender(instance, 1.0, false);
  hooks.OnBatchCompleted(batch, {4});

  auto batches = recorder_->GetBatches();
  ASSERT_EQ(batches.size(), 1u);
  EXPECT_EQ(batches[0].component_ids, (std::vector<ComponentId>{4}));
  EXPECT_EQ(EventsOfKind(EventKind::Render).at(0).batch_id,
            std::optional<BatchId>(batch));
}

TEST_F(InstrumentationHooksTest, NavigationIsSessionScoped) {
  InstrumentationHooks hooks(session_);

  hooks.OnNavigation("/settings");

  auto events = EventsOfKind(EventKind::Navigation);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].component_id, kSessionComponentId);
  EXPECT_EQ(events[0].trigger_details, "/settings");
  EXPECT_EQ(events[0].metadata.at("session"), "test");
}

TEST_F(InstrumentationHooksTest, StoppedRecorderStillTracksMetrics) {
  InstrumentationHooks hooks(session_);
  auto instance = Attach(hooks, 4);
  recorder_->StopRecording();

  hooks.OnRender(instance, 1.0, true);

  EXPECT_TRUE(recorder_->GetEvents().empty());
  EXPECT_EQ(session_->GetRegistry().GetComponent(4)->metrics->GetRenderCount(), 1u);
}

TEST_F(InstrumentationHooksTest, RecorderFailuresAreSwallowed) {
  auto failing = std::make_shared<NiceMock<test::MockTimelineRecorder>>();
  ON_CALL(*failing, RecordEvent(_, _, _, _))
      .WillByDefault(Throw(std::runtime_error("buffer corrupted")));
  ON_CALL(*failing, RecordBatchStart(_))
      .WillByDefault(Throw(std::runtime_error("buffer corrupted")));
  auto session = MakeSession(failing);
  InstrumentationHooks hooks(session);
  auto instance = Attach(hooks, 4);

  EXPECT_NO_THROW(hooks.OnRender(instance, 1.0, true));
  EXPECT_NO_THROW(hooks.OnInvalidate(instance, false, false));
  EXPECT_EQ(hooks.OnBatchStarted("click"), kNoBatch);

  EXPECT_EQ(hooks.GetSwallowedFailureCount(), 3u);
  EXPECT_EQ(session->GetRegistry().GetComponent(4)->metrics->GetRenderCount(), 1u);
}

TEST_F(InstrumentationHooksTest, InvalidateReturnsOutcomeDespiteFailure) {
  auto failing = std::make_shared<NiceMock<test::MockTimelineRecorder>>();
  ON_CALL(*failing, RecordEvent(_, _, _, _))
      .WillByDefault(Throw(std::runtime_error("boom")));
  auto session = MakeSession(failing);
  InstrumentationHooks hooks(session);
  auto instance = Attach(hooks, 4);

  EXPECT_EQ(hooks.OnInvalidate(instance, true, false),
            InvalidationOutcome::SuppressedAlreadyQueued);
}
