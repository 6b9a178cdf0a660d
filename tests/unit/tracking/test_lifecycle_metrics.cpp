/**
 * @file test_lifecycle_metrics.cpp
 * @brief Unit tests for LifecycleMetrics
 */

#include <gtest/gtest.h>

#include <chrono>

#include "shade/tracking/LifecycleMetrics.hpp"

using namespace SHADE;
using namespace SHADE::Tracking;
using namespace std::chrono_literals;

class LifecycleMetricsTest : public ::testing::Test {
protected:
  LifecycleMetrics::Clock::time_point created_ = LifecycleMetrics::Clock::now();
  LifecycleMetrics metrics_{created_};
};

TEST_F(LifecycleMetricsTest, AverageWithZeroCallsIsUnavailable) {
  for (size_t i = 0; i < kLifecyclePhaseCount; ++i) {
    auto phase = static_cast<LifecyclePhase>(i);
    EXPECT_FALSE(metrics_.GetAverageDuration(phase).has_value());
    EXPECT_FALSE(metrics_.GetLastDuration(phase).has_value());
  }
}

TEST_F(LifecycleMetricsTest, ZeroDenominatorRatiosAreUnavailable) {
  EXPECT_FALSE(metrics_.GetInvalidationEfficiency().has_value());
  EXPECT_FALSE(metrics_.GetSuppressionRatio().has_value());
  EXPECT_FALSE(metrics_.GetGateBlockRate().has_value());
  EXPECT_FALSE(metrics_.GetTimeToFirstRenderMs().has_value());
}

TEST_F(LifecycleMetricsTest, RecordPhaseAccumulates) {
  metrics_.RecordPhase(LifecyclePhase::ParameterSet, 2.0, created_ + 1ms);
  metrics_.RecordPhase(LifecyclePhase::ParameterSet, 4.0, created_ + 2ms);

  EXPECT_EQ(metrics_.GetCallCount(LifecyclePhase::ParameterSet), 2u);
  EXPECT_DOUBLE_EQ(*metrics_.GetLastDuration(LifecyclePhase::ParameterSet), 4.0);
  EXPECT_DOUBLE_EQ(metrics_.GetTotalDuration(LifecyclePhase::ParameterSet), 6.0);
  EXPECT_DOUBLE_EQ(*metrics_.GetAverageDuration(LifecyclePhase::ParameterSet), 3.0);
}

TEST_F(LifecycleMetricsTest, RenderTracksExtremesAndFreezesFirstRender) {
  metrics_.RecordPhase(LifecyclePhase::Render, 5.0, created_ + 10ms);
  metrics_.RecordPhase(LifecyclePhase::Render, 1.0, created_ + 50ms);
  metrics_.RecordPhase(LifecyclePhase::Render, 3.0, created_ + 90ms);

  EXPECT_EQ(metrics_.GetRenderCount(), 3u);
  EXPECT_DOUBLE_EQ(*metrics_.GetMaxRenderDuration(), 5.0);
  EXPECT_DOUBLE_EQ(*metrics_.GetMinRenderDuration(), 1.0);
  ASSERT_TRUE(metrics_.GetTimeToFirstRenderMs().has_value());
  EXPECT_DOUBLE_EQ(*metrics_.GetTimeToFirstRenderMs(), 10.0);
}

TEST_F(LifecycleMetricsTest, AlreadyQueuedWinsOverGateDeclined) {
  EXPECT_EQ(LifecycleMetrics::ClassifyInvalidation(true, true),
            InvalidationOutcome::SuppressedAlreadyQueued);
  EXPECT_EQ(LifecycleMetrics::ClassifyInvalidation(false, true),
            InvalidationOutcome::SuppressedByPolicy);
  EXPECT_EQ(LifecycleMetrics::ClassifyInvalidation(false, false),
            InvalidationOutcome::Honored);
}

TEST_F(LifecycleMetricsTest, InvalidationRatios) {
  metrics_.RecordInvalidation(false, false);
  metrics_.RecordInvalidation(true, false);
  metrics_.RecordInvalidation(false, true);
  metrics_.RecordInvalidation(false, false);
  metrics_.RecordPhase(LifecyclePhase::Render, 1.0, created_ + 1ms);
  metrics_.RecordPhase(LifecyclePhase::Render, 1.0, created_ + 2ms);

  EXPECT_EQ(metrics_.GetInvalidationCalls(), 4u);
  EXPECT_EQ(metrics_.GetHonoredInvalidations(), 2u);
  EXPECT_EQ(metrics_.GetSuppressedAlreadyQueued(), 1u);
  EXPECT_EQ(metrics_.GetSuppressedByPolicy(), 1u);
  EXPECT_DOUBLE_EQ(*metrics_.GetSuppressionRatio(), 0.5);
  EXPECT_DOUBLE_EQ(*metrics_.GetInvalidationEfficiency(), 0.5);
}

TEST_F(LifecycleMetricsTest, GateBlockRate) {
  metrics_.RecordGateDecision(true);
  metrics_.RecordGateDecision(false);
  metrics_.RecordGateDecision(false);
  metrics_.RecordGateDecision(true);

  EXPECT_EQ(metrics_.GetGateAllowed(), 2u);
  EXPECT_EQ(metrics_.GetGateDeclined(), 2u);
  EXPECT_DOUBLE_EQ(*metrics_.GetGateBlockRate(), 0.5);
  ASSERT_TRUE(metrics_.GetLastGateDecision().has_value());
  EXPECT_TRUE(*metrics_.GetLastGateDecision());
}

TEST_F(LifecycleMetricsTest, AsyncPhaseDoesNotCountAsCall) {
  metrics_.RecordAsyncPhase(LifecyclePhase::Initialize, 12.0);

  EXPECT_EQ(metrics_.GetCallCount(LifecyclePhase::Initialize), 0u);
  EXPECT_DOUBLE_EQ(metrics_.GetAsyncTotalDuration(LifecyclePhase::Initialize), 12.0);
  EXPECT_FALSE(metrics_.GetAverageDuration(LifecyclePhase::Initialize).has_value());
}

TEST_F(LifecycleMetricsTest, LifetimeStopsAtDisposal) {
  metrics_.MarkDisposed(created_ + 200ms);

  EXPECT_TRUE(metrics_.IsDisposed());
  EXPECT_DOUBLE_EQ(metrics_.GetLifetimeMs(created_ + 5s), 200.0);

  // A second disposal does not move the timestamp
  metrics_.MarkDisposed(created_ + 300ms);
  EXPECT_DOUBLE_EQ(metrics_.GetLifetimeMs(created_ + 5s), 200.0);
}

TEST_F(LifecycleMetricsTest, RendersPerMinuteAndSyncTotal) {
  metrics_.RecordPhase(LifecyclePhase::Initialize, 1.0, created_);
  metrics_.RecordPhase(LifecyclePhase::ParameterSet, 2.0, created_);
  metrics_.RecordPhase(LifecyclePhase::Render, 3.0, created_ + 1ms);
  metrics_.RecordPhase(LifecyclePhase::PostRender, 4.0, created_ + 2ms);
  metrics_.RecordPhase(LifecyclePhase::EventCallback, 100.0, created_ + 3ms);

  EXPECT_DOUBLE_EQ(metrics_.GetTotalSyncLifecycleMs(), 10.0);
  ASSERT_TRUE(metrics_.GetRendersPerMinute(created_ + 30s).has_value());
  EXPECT_DOUBLE_EQ(*metrics_.GetRendersPerMinute(created_ + 30s), 2.0);
  EXPECT_FALSE(metrics_.GetRendersPerMinute(created_).has_value());
}
