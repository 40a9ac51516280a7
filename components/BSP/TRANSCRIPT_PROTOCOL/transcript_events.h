#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 识别结果（partial 或 final）
 */
struct TranscriptEvent {
  std::string text;
  bool isFinal = false;     ///< end_of_turn == true
  float confidence = 0.5f;  ///< 0..1，服务端未给出时为 0.5
  std::optional<std::string> speakerId;
  int turnOrder = -1;
  int64_t timestampMs = 0;
};

enum class Sentiment { Positive, Neutral, Negative };

struct SentimentReading {
  Sentiment sentiment = Sentiment::Neutral;
  float confidence = 0.0f;
  int64_t timestampMs = 0;
};

struct SpeakerLabel {
  std::string speaker = "Unknown";
  double startTime = 0.0;
  double endTime = 0.0;
  float confidence = 0.0f;
  std::string text;
};

struct SafetyCategory {
  bool detected = false;
  float confidence = 0.0f;
};

enum class RiskLevel { Low, Medium, High };

/**
 * @brief 内容安全检测结果
 */
struct ContentSafetyResult {
  SafetyCategory violence;
  SafetyCategory hateSpeech;
  SafetyCategory profanity;
  SafetyCategory harassment;
  SafetyCategory selfHarm;
  SafetyCategory sexualContent;
  RiskLevel riskLevel = RiskLevel::Low;
  std::vector<std::string> flaggedCategories;
  int64_t timestampMs = 0;
};

/**
 * @brief 服务端下行消息分类
 */
enum class InboundType {
  Begin,
  Transcript,
  Sentiment,
  SpeakerLabels,
  ContentSafety,
  Error,
  Ignored,
};

struct InboundMessage {
  InboundType type = InboundType::Ignored;
  std::string rawType; ///< "type" 字段原文（可能为空）

  std::string sessionId; // Begin
  TranscriptEvent transcript;
  SentimentReading sentiment;
  std::vector<SpeakerLabel> speakerLabels;
  ContentSafetyResult contentSafety;
  std::string errorMessage; // Error
};

inline const char *GetInboundTypeName(InboundType type) {
  switch (type) {
  case InboundType::Begin:         return "Begin";
  case InboundType::Transcript:    return "Transcript";
  case InboundType::Sentiment:     return "Sentiment";
  case InboundType::SpeakerLabels: return "SpeakerLabels";
  case InboundType::ContentSafety: return "ContentSafety";
  case InboundType::Error:         return "Error";
  case InboundType::Ignored:       return "Ignored";
  default:                         return "Invalid";
  }
}

inline const char *GetSentimentName(Sentiment s) {
  switch (s) {
  case Sentiment::Positive: return "POSITIVE";
  case Sentiment::Neutral:  return "NEUTRAL";
  case Sentiment::Negative: return "NEGATIVE";
  default:                  return "UNKNOWN";
  }
}

inline const char *GetRiskLevelName(RiskLevel level) {
  switch (level) {
  case RiskLevel::Low:    return "low";
  case RiskLevel::Medium: return "medium";
  case RiskLevel::High:   return "high";
  default:                return "unknown";
  }
}
