#include "conversation_insights.h"

#include "turn_rules.h"

namespace {
template <typename T> void pushBounded(std::deque<T> &q, T value, size_t cap) {
  q.push_back(std::move(value));
  while (q.size() > cap) {
    q.pop_front();
  }
}
} // namespace

void ConversationInsights::onSentiment(const SentimentReading &reading) {
  m_sentiment = reading;
  pushBounded(m_sentimentHistory, reading, kSentimentHistory);
}

void ConversationInsights::onSpeakerLabels(
    const std::vector<SpeakerLabel> &labels) {
  for (const auto &label : labels) {
    pushBounded(m_labels, label, kLabelHistory);
    m_speaker = label.speaker;

    // 保留最近 9 条再追加本条，空文本不入历史
    auto &texts = m_speakerHistory[label.speaker];
    while (texts.size() > kPerSpeakerHistory - 1) {
      texts.pop_front();
    }
    if (!trimText(label.text).empty()) {
      texts.push_back(label.text);
    }
  }
}

bool ConversationInsights::onContentSafety(const ContentSafetyResult &result) {
  if (!m_safetyEnabled) {
    return false;
  }
  m_safety = result;
  if (result.flaggedCategories.empty()) {
    return false;
  }
  pushBounded(m_warnings, result, kSafetyWarnings);
  return true;
}

void ConversationInsights::resetLatest() {
  m_sentiment.reset();
  m_speaker.reset();
  m_safety.reset();
}

void ConversationInsights::clear() {
  resetLatest();
  m_sentimentHistory.clear();
  m_labels.clear();
  m_speakerHistory.clear();
  m_warnings.clear();
}
