#include "quality_tracker.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

namespace {
bool hasRecommendation(const QualityMetrics &m, const std::string &text) {
  return std::find(m.recommendations.begin(), m.recommendations.end(), text) !=
         m.recommendations.end();
}
} // namespace

TEST(QualityTrackerTest, ClassifiesSamples) {
  EXPECT_EQ(QualityTracker::classifyNoise(0.95f), NoiseLevel::Low);
  EXPECT_EQ(QualityTracker::classifyNoise(0.7f), NoiseLevel::Medium);
  EXPECT_EQ(QualityTracker::classifyNoise(0.6f), NoiseLevel::High);

  EXPECT_EQ(QualityTracker::makeSample(0.95f, 0).audioQuality,
            AudioQuality::Excellent);
  EXPECT_EQ(QualityTracker::makeSample(0.85f, 0).audioQuality,
            AudioQuality::Good);
  EXPECT_EQ(QualityTracker::makeSample(0.7f, 0).audioQuality,
            AudioQuality::Fair);
  EXPECT_EQ(QualityTracker::makeSample(0.4f, 0).audioQuality,
            AudioQuality::Poor);

  const QualitySample s = QualityTracker::makeSample(0.5f, 1234);
  EXPECT_FLOAT_EQ(s.speechClarityScore, 50.0f);
  EXPECT_EQ(s.timestampMs, 1234);
}

TEST(QualityTrackerTest, EmptyTrackerHasNoMetrics) {
  QualityTracker tracker;
  tracker.startSession(0);
  const QualityMetrics &m = tracker.metrics();
  EXPECT_EQ(m.totalSamples, 0);
  EXPECT_TRUE(m.recommendations.empty());
  EXPECT_FALSE(tracker.current().has_value());
}

TEST(QualityTrackerTest, PartialResultsOnlyUpdateCurrent) {
  QualityTracker tracker;
  tracker.startSession(0);
  tracker.observe(0.9f, 10);

  ASSERT_TRUE(tracker.current().has_value());
  EXPECT_FLOAT_EQ(tracker.current()->confidence, 0.9f);
  EXPECT_EQ(tracker.metrics().totalSamples, 0);
}

TEST(QualityTrackerTest, AggregatesCounts) {
  QualityTracker tracker;
  tracker.startSession(1000);
  tracker.record(0.9f, 1100);
  tracker.record(0.5f, 1200);
  tracker.record(0.7f, 1500);

  const QualityMetrics &m = tracker.metrics();
  EXPECT_EQ(m.totalSamples, 3);
  EXPECT_NEAR(m.averageConfidence, 0.7, 1e-6);
  EXPECT_EQ(m.highConfidenceCount, 1);
  EXPECT_EQ(m.lowConfidenceCount, 1);
  EXPECT_EQ(m.trend, QualityTrend::Stable);
  EXPECT_EQ(m.sessionDurationMs, 500);
}

TEST(QualityTrackerTest, WindowIsBoundedTo30) {
  QualityTracker tracker;
  tracker.startSession(0);
  for (int i = 0; i < 45; i++) {
    tracker.record(i < 15 ? 0.1f : 0.9f, i);
  }
  EXPECT_EQ(tracker.metrics().totalSamples, (int)QualityTracker::kWindowSize);
  EXPECT_NEAR(tracker.metrics().averageConfidence, 0.9, 1e-6);
}

TEST(QualityTrackerTest, TrendNeedsBothWindows) {
  QualityTracker tracker;
  tracker.startSession(0);
  for (int i = 0; i < 10; i++) {
    tracker.record(0.9f, i);
  }
  EXPECT_EQ(tracker.metrics().trend, QualityTrend::Stable);

  tracker.record(0.3f, 10);
  // 之前 1 条 0.9，最近 10 条均值 0.84
  EXPECT_EQ(tracker.metrics().trend, QualityTrend::Declining);
}

TEST(QualityTrackerTest, DetectsImprovingAndDeclining) {
  QualityTracker improving;
  improving.startSession(0);
  for (int i = 0; i < 10; i++) {
    improving.record(0.6f, i);
  }
  for (int i = 0; i < 10; i++) {
    improving.record(0.9f, 10 + i);
  }
  EXPECT_EQ(improving.metrics().trend, QualityTrend::Improving);
  EXPECT_FALSE(hasRecommendation(improving.metrics(), "Check microphone positioning"));

  QualityTracker declining;
  declining.startSession(0);
  for (int i = 0; i < 10; i++) {
    declining.record(0.95f, i);
  }
  for (int i = 0; i < 10; i++) {
    declining.record(0.85f, 10 + i);
  }
  EXPECT_EQ(declining.metrics().trend, QualityTrend::Declining);
  EXPECT_TRUE(hasRecommendation(declining.metrics(), "Check microphone positioning"));
}

TEST(QualityTrackerTest, SmallChangeIsStable) {
  QualityTracker tracker;
  tracker.startSession(0);
  for (int i = 0; i < 10; i++) {
    tracker.record(0.80f, i);
  }
  for (int i = 0; i < 10; i++) {
    tracker.record(0.83f, 10 + i);
  }
  EXPECT_EQ(tracker.metrics().trend, QualityTrend::Stable);
}

TEST(QualityTrackerTest, LowConfidenceRecommendations) {
  QualityTracker tracker;
  tracker.startSession(0);
  tracker.record(0.4f, 0);
  tracker.record(0.5f, 1);
  tracker.record(0.9f, 2);

  const QualityMetrics &m = tracker.metrics();
  EXPECT_TRUE(hasRecommendation(m, "Try speaking closer to the microphone"));
  EXPECT_TRUE(hasRecommendation(m, "Reduce background noise if possible"));
  EXPECT_TRUE(hasRecommendation(m, "Speak more clearly and slowly"));
}

TEST(QualityTrackerTest, GoodAudioHasNoRecommendations) {
  QualityTracker tracker;
  tracker.startSession(0);
  for (int i = 0; i < 5; i++) {
    tracker.record(0.92f, i);
  }
  EXPECT_TRUE(tracker.metrics().recommendations.empty());
}

TEST(QualityTrackerTest, ClearCurrentKeepsHistory) {
  QualityTracker tracker;
  tracker.startSession(0);
  tracker.record(0.8f, 0);
  tracker.clearCurrent();
  EXPECT_FALSE(tracker.current().has_value());
  EXPECT_EQ(tracker.metrics().totalSamples, 1);

  tracker.clear();
  EXPECT_EQ(tracker.metrics().totalSamples, 0);
}

TEST(QualityTrackerTest, NamesAreLowercase) {
  EXPECT_STREQ(GetAudioQualityName(AudioQuality::Excellent), "excellent");
  EXPECT_STREQ(GetNoiseLevelName(NoiseLevel::Medium), "medium");
  EXPECT_STREQ(GetQualityTrendName(QualityTrend::Declining), "declining");
}
