#include "conversation_insights.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {
SpeakerLabel label(const std::string &speaker, const std::string &text) {
  SpeakerLabel l;
  l.speaker = speaker;
  l.text = text;
  return l;
}

ContentSafetyResult flagged(RiskLevel risk) {
  ContentSafetyResult r;
  r.profanity.detected = true;
  r.profanity.confidence = 0.9f;
  r.flaggedCategories = {"profanity"};
  r.riskLevel = risk;
  return r;
}
} // namespace

TEST(ConversationInsightsTest, SentimentHistoryIsBounded) {
  ConversationInsights insights;
  for (int i = 0; i < 15; i++) {
    SentimentReading r;
    r.sentiment = i % 2 ? Sentiment::Positive : Sentiment::Negative;
    r.timestampMs = i;
    insights.onSentiment(r);
  }
  ASSERT_TRUE(insights.sentiment().has_value());
  EXPECT_EQ(insights.sentiment()->timestampMs, 14);
  EXPECT_EQ(insights.sentimentHistory().size(), ConversationInsights::kSentimentHistory);
  EXPECT_EQ(insights.sentimentHistory().front().timestampMs, 5);
}

TEST(ConversationInsightsTest, TracksSpeakers) {
  ConversationInsights insights;
  insights.onSpeakerLabels({label("A", "hello there"), label("B", "hi"),
                            label("A", "   ")});

  ASSERT_TRUE(insights.currentSpeaker().has_value());
  EXPECT_EQ(*insights.currentSpeaker(), "A");
  EXPECT_EQ(insights.speakerLabels().size(), 3u);

  const auto &history = insights.speakerHistory();
  ASSERT_EQ(history.count("A"), 1u);
  EXPECT_EQ(history.at("A").size(), 1u); // 空文本不入历史
  EXPECT_EQ(history.at("B").front(), "hi");
}

TEST(ConversationInsightsTest, SpeakerHistoryKeepsLastTen) {
  ConversationInsights insights;
  for (int i = 0; i < 25; i++) {
    insights.onSpeakerLabels({label("A", "line " + std::to_string(i))});
  }
  const auto &texts = insights.speakerHistory().at("A");
  EXPECT_EQ(texts.size(), ConversationInsights::kPerSpeakerHistory);
  EXPECT_EQ(texts.front(), "line 15");
  EXPECT_EQ(texts.back(), "line 24");
}

TEST(ConversationInsightsTest, LabelHistoryKeepsLastFifty) {
  ConversationInsights insights;
  std::vector<SpeakerLabel> labels;
  for (int i = 0; i < 60; i++) {
    labels.push_back(label(i % 2 ? "A" : "B", "x"));
  }
  insights.onSpeakerLabels(labels);
  EXPECT_EQ(insights.speakerLabels().size(), ConversationInsights::kLabelHistory);
}

TEST(ConversationInsightsTest, ContentSafetyIgnoredWhenDisabled) {
  ConversationInsights insights;
  EXPECT_FALSE(insights.onContentSafety(flagged(RiskLevel::High)));
  EXPECT_FALSE(insights.contentSafety().has_value());
  EXPECT_TRUE(insights.safetyWarnings().empty());
}

TEST(ConversationInsightsTest, ContentSafetyWarningsWhenEnabled) {
  ConversationInsights insights;
  insights.setSafetyEnabled(true);

  EXPECT_FALSE(insights.onContentSafety(ContentSafetyResult()));
  EXPECT_TRUE(insights.contentSafety().has_value());
  EXPECT_TRUE(insights.safetyWarnings().empty());

  for (int i = 0; i < 8; i++) {
    EXPECT_TRUE(insights.onContentSafety(flagged(RiskLevel::High)));
  }
  EXPECT_EQ(insights.safetyWarnings().size(), ConversationInsights::kSafetyWarnings);
  EXPECT_EQ(insights.contentSafety()->riskLevel, RiskLevel::High);
}

TEST(ConversationInsightsTest, ResetLatestKeepsHistory) {
  ConversationInsights insights;
  insights.setSafetyEnabled(true);
  insights.onSentiment(SentimentReading());
  insights.onSpeakerLabels({label("A", "hello")});
  insights.onContentSafety(flagged(RiskLevel::Low));

  insights.resetLatest();
  EXPECT_FALSE(insights.sentiment().has_value());
  EXPECT_FALSE(insights.currentSpeaker().has_value());
  EXPECT_FALSE(insights.contentSafety().has_value());
  EXPECT_EQ(insights.sentimentHistory().size(), 1u);
  EXPECT_EQ(insights.speakerLabels().size(), 1u);
  EXPECT_EQ(insights.safetyWarnings().size(), 1u);

  insights.clear();
  EXPECT_TRUE(insights.sentimentHistory().empty());
  EXPECT_TRUE(insights.speakerLabels().empty());
  EXPECT_TRUE(insights.speakerHistory().empty());
  EXPECT_TRUE(insights.safetyWarnings().empty());
}
