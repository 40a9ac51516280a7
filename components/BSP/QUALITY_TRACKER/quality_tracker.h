#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

enum class AudioQuality { Excellent, Good, Fair, Poor };
enum class NoiseLevel { Low, Medium, High };
enum class QualityTrend { Improving, Stable, Declining };

/**
 * @brief 单条识别结果的质量采样
 */
struct QualitySample {
  float confidence = 0.0f;
  AudioQuality audioQuality = AudioQuality::Poor;
  NoiseLevel noiseLevel = NoiseLevel::High;
  float speechClarityScore = 0.0f; ///< confidence * 100
  int64_t timestampMs = 0;
};

/**
 * @brief 滚动窗口聚合指标
 */
struct QualityMetrics {
  double averageConfidence = 0.0;
  int totalSamples = 0;
  int highConfidenceCount = 0; ///< > 0.8
  int lowConfidenceCount = 0;  ///< < 0.6
  QualityTrend trend = QualityTrend::Stable;
  int64_t sessionDurationMs = 0;
  std::vector<std::string> recommendations;
};

/**
 * @brief 识别质量跟踪
 *
 * partial 与 final 都会更新 current()；只有 final 进入 30 条滚动窗口，
 * 每次写入后重新计算 metrics()。
 */
class QualityTracker {
public:
  static constexpr size_t kWindowSize = 30;
  static constexpr size_t kTrendWindow = 10;

  void startSession(int64_t nowMs);

  /**
   * @brief partial 结果：只更新当前采样
   */
  void observe(float confidence, int64_t nowMs);

  /**
   * @brief final 结果：更新当前采样并写入滚动窗口
   */
  void record(float confidence, int64_t nowMs);

  const QualityMetrics &metrics() const { return m_metrics; }
  const std::optional<QualitySample> &current() const { return m_current; }

  /**
   * @brief 清除当前采样（保留窗口）
   */
  void clearCurrent() { m_current.reset(); }

  /**
   * @brief 清空全部数据
   */
  void clear();

  static NoiseLevel classifyNoise(float confidence);
  static AudioQuality classifyQuality(float confidence, NoiseLevel noise);
  static QualitySample makeSample(float confidence, int64_t nowMs);

private:
  void recompute(int64_t nowMs);

  int64_t m_sessionStartMs = 0;
  std::optional<QualitySample> m_current;
  std::deque<QualitySample> m_history;
  QualityMetrics m_metrics;
};

const char *GetAudioQualityName(AudioQuality quality);
const char *GetNoiseLevelName(NoiseLevel level);
const char *GetQualityTrendName(QualityTrend trend);
