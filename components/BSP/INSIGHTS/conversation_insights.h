#pragma once

#include "transcript_events.h"

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 会话附加信息：情绪、说话人、内容安全
 *
 * 不参与发送决策，只供状态展示。
 */
class ConversationInsights {
public:
  static constexpr size_t kSentimentHistory = 10;
  static constexpr size_t kLabelHistory = 50;
  static constexpr size_t kPerSpeakerHistory = 10;
  static constexpr size_t kSafetyWarnings = 5;

  void setSafetyEnabled(bool enabled) { m_safetyEnabled = enabled; }
  bool safetyEnabled() const { return m_safetyEnabled; }

  void onSentiment(const SentimentReading &reading);
  void onSpeakerLabels(const std::vector<SpeakerLabel> &labels);

  /**
   * @brief 内容安全结果，未开启时直接忽略
   * @return true: 结果被记录且有命中类别
   */
  bool onContentSafety(const ContentSafetyResult &result);

  const std::optional<SentimentReading> &sentiment() const { return m_sentiment; }
  const std::deque<SentimentReading> &sentimentHistory() const {
    return m_sentimentHistory;
  }

  const std::optional<std::string> &currentSpeaker() const { return m_speaker; }
  const std::deque<SpeakerLabel> &speakerLabels() const { return m_labels; }
  const std::map<std::string, std::deque<std::string>> &speakerHistory() const {
    return m_speakerHistory;
  }

  const std::optional<ContentSafetyResult> &contentSafety() const {
    return m_safety;
  }
  const std::deque<ContentSafetyResult> &safetyWarnings() const {
    return m_warnings;
  }

  /**
   * @brief 清除最新值，保留历史
   */
  void resetLatest();

  /**
   * @brief 清空全部
   */
  void clear();

private:
  bool m_safetyEnabled = false;

  std::optional<SentimentReading> m_sentiment;
  std::deque<SentimentReading> m_sentimentHistory;

  std::optional<std::string> m_speaker;
  std::deque<SpeakerLabel> m_labels;
  std::map<std::string, std::deque<std::string>> m_speakerHistory;

  std::optional<ContentSafetyResult> m_safety;
  std::deque<ContentSafetyResult> m_warnings;
};
