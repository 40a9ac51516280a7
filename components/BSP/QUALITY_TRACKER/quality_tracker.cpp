#include "quality_tracker.h"

namespace {
double meanConfidence(const std::deque<QualitySample> &history, size_t begin,
                      size_t end) {
  if (end <= begin) {
    return 0.0;
  }
  double sum = 0.0;
  for (size_t i = begin; i < end; i++) {
    sum += history[i].confidence;
  }
  return sum / (double)(end - begin);
}
} // namespace

void QualityTracker::startSession(int64_t nowMs) {
  clear();
  m_sessionStartMs = nowMs;
}

NoiseLevel QualityTracker::classifyNoise(float confidence) {
  if (confidence > 0.8f) {
    return NoiseLevel::Low;
  }
  if (confidence > 0.6f) {
    return NoiseLevel::Medium;
  }
  return NoiseLevel::High;
}

AudioQuality QualityTracker::classifyQuality(float confidence,
                                             NoiseLevel noise) {
  if (confidence > 0.9f && noise == NoiseLevel::Low) {
    return AudioQuality::Excellent;
  }
  if (confidence > 0.8f && noise != NoiseLevel::High) {
    return AudioQuality::Good;
  }
  if (confidence > 0.6f) {
    return AudioQuality::Fair;
  }
  return AudioQuality::Poor;
}

QualitySample QualityTracker::makeSample(float confidence, int64_t nowMs) {
  QualitySample s;
  s.confidence = confidence;
  s.noiseLevel = classifyNoise(confidence);
  s.audioQuality = classifyQuality(confidence, s.noiseLevel);
  s.speechClarityScore = confidence * 100.0f;
  s.timestampMs = nowMs;
  return s;
}

void QualityTracker::observe(float confidence, int64_t nowMs) {
  m_current = makeSample(confidence, nowMs);
}

void QualityTracker::record(float confidence, int64_t nowMs) {
  m_current = makeSample(confidence, nowMs);
  m_history.push_back(*m_current);
  while (m_history.size() > kWindowSize) {
    m_history.pop_front();
  }
  recompute(nowMs);
}

void QualityTracker::clear() {
  m_current.reset();
  m_history.clear();
  m_metrics = QualityMetrics();
}

void QualityTracker::recompute(int64_t nowMs) {
  QualityMetrics m;
  const size_t n = m_history.size();
  if (n == 0) {
    m_metrics = m;
    return;
  }

  m.totalSamples = (int)n;
  m.averageConfidence = meanConfidence(m_history, 0, n);
  for (const auto &s : m_history) {
    if (s.confidence > 0.8f) {
      m.highConfidenceCount++;
    }
    if (s.confidence < 0.6f) {
      m.lowConfidenceCount++;
    }
  }

  // 最近 10 条 vs 之前 10 条，两段都非空才计算
  const size_t recentBegin = n > kTrendWindow ? n - kTrendWindow : 0;
  const size_t olderBegin =
      recentBegin > kTrendWindow ? recentBegin - kTrendWindow : 0;
  if (recentBegin > olderBegin) {
    const double recent = meanConfidence(m_history, recentBegin, n);
    const double older = meanConfidence(m_history, olderBegin, recentBegin);
    if (recent > older + 0.05) {
      m.trend = QualityTrend::Improving;
    } else if (recent < older - 0.05) {
      m.trend = QualityTrend::Declining;
    }
  }

  m.sessionDurationMs = nowMs - m_sessionStartMs;

  if (m.averageConfidence < 0.7) {
    m.recommendations.emplace_back("Try speaking closer to the microphone");
    m.recommendations.emplace_back("Reduce background noise if possible");
  }
  if ((double)m.lowConfidenceCount / (double)m.totalSamples > 0.3) {
    m.recommendations.emplace_back("Speak more clearly and slowly");
  }
  if (m.trend == QualityTrend::Declining) {
    m.recommendations.emplace_back("Check microphone positioning");
  }

  m_metrics = std::move(m);
}

const char *GetAudioQualityName(AudioQuality quality) {
  switch (quality) {
  case AudioQuality::Excellent: return "excellent";
  case AudioQuality::Good:      return "good";
  case AudioQuality::Fair:      return "fair";
  case AudioQuality::Poor:      return "poor";
  default:                      return "unknown";
  }
}

const char *GetNoiseLevelName(NoiseLevel level) {
  switch (level) {
  case NoiseLevel::Low:    return "low";
  case NoiseLevel::Medium: return "medium";
  case NoiseLevel::High:   return "high";
  default:                 return "unknown";
  }
}

const char *GetQualityTrendName(QualityTrend trend) {
  switch (trend) {
  case QualityTrend::Improving: return "improving";
  case QualityTrend::Stable:    return "stable";
  case QualityTrend::Declining: return "declining";
  default:                      return "unknown";
  }
}
