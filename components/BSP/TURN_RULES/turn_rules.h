#pragma once

#include <cstdint>
#include <string>

/**
 * @brief 轮次结束评分的各项因子
 */
struct EndOfTurnFactors {
  double silenceScore = 0.0; ///< min(silence / threshold, 2.0)
  int wordCount = 0;
  bool hasPunctuation = false;       ///< 以 . ! ? 结尾
  bool hasCompletePattern = false;   ///< 命中完结短语
  bool hasIncompletePattern = false; ///< 命中未完结短语
};

/**
 * @brief 轮次结束评分结果 (0-100)
 */
struct EndOfTurnScore {
  double value = 0.0;
  bool isEndOfTurn = false;
  double confidence = 0.0; ///< value / 100
  EndOfTurnFactors factors;
};

static constexpr double kEndOfTurnThreshold = 60.0;
static constexpr int kMinAutoSendWords = 8;

/**
 * @brief 去掉首尾空白
 */
std::string trimText(const std::string &text);

/**
 * @brief 按空白切分统计词数（空串为 0）
 */
int countWords(const std::string &text);

/**
 * @brief 轮次结束评分
 *
 * @param text         当前累积的待发送文本
 * @param silenceMs    距上次语音活动的静音时长
 * @param thresholdMs  基准静音阈值
 */
EndOfTurnScore analyzeEndOfTurn(const std::string &text, int64_t silenceMs,
                                int64_t thresholdMs);

/**
 * @brief 自动发送门限：内容足够完整才允许任何自动发送
 *
 * 至少 8 个词，且不以未完结片段结尾；并满足以下之一：
 * - >= 15 个词
 * - >= 10 个词且有自然结尾
 * - >= 8 个词且以 ? 结尾
 */
bool shouldAutoSend(const std::string &text);

/**
 * @brief 是否为自然对话断点（立即发送的候选）
 *
 * @param fragment 刚到达的 final 片段
 * @param fullText 追加片段后的完整累积文本
 */
bool isNaturalBreak(const std::string &fragment, const std::string &fullText);

/**
 * @brief 根据评分置信度调整倒计时长度的倍率
 */
double countdownMultiplier(double confidence);

/**
 * @brief 倒计时秒数，向上取整
 */
int countdownSeconds(uint32_t durationMs);
