#pragma once

#include "turn_rules.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

enum class TurnTimer {
  Countdown,       ///< 1 s 周期 tick
  MaxAccumulation, ///< 单次，强制发送兜底
};

/**
 * @brief 引擎向宿主申请定时器的接口
 *
 * 定时器到期后，宿主必须把 (timer, generation) 投递回同一个决策循环，
 * 再调用 TurnTakingEngine::onTimer；generation 不匹配或早于预定时间到达的
 * 到期事件会被忽略。
 */
class TurnTimerPort {
public:
  virtual ~TurnTimerPort() = default;

  virtual void startTimer(TurnTimer timer, uint32_t periodMs, bool periodic,
                          uint32_t generation) = 0;
  virtual void stopTimer(TurnTimer timer) = 0;

  /**
   * @brief 投递一个延后执行的发送（不在当前调用栈内执行）
   */
  virtual void postDeferredSend(uint32_t generation) = 0;
};

struct TurnTakingConfig {
  uint32_t silence_threshold_ms = 5000;
  uint32_t max_accumulation_ms = 15000;
  uint32_t countdown_tick_ms = 1000;
};

/**
 * @brief 一次已完成的发送
 */
struct TurnDispatch {
  std::string text; // 已 trim
  std::string reason;
  bool forced = false; // 绕过自动发送门限（超时 / 静音 / 手动）
};

enum class TurnAction {
  None,               ///< 无事可做（空文本、空累积）
  Accumulated,        ///< 非连续模式，仅追加
  Muted,              ///< 静音中，仅追加，不做发送决策
  SentImmediately,    ///< 自然断点，立即发送
  CountdownStarted,   ///< (重新)开始倒计时
  Waiting,            ///< 未过门限，等待更多内容
  CountdownTick,      ///< 倒计时减一
  Sent,               ///< 定时器 / 延后任务 / 手动触发的发送
  DeferredSendQueued, ///< 静音触发的发送已投递
  Stale,              ///< 过期的定时器事件
};

struct TurnDecision {
  TurnAction action = TurnAction::None;
  EndOfTurnScore score;   // 仅 CountdownStarted 有效
  uint32_t countdownMs = 0;
  int countdownSeconds = 0;
  bool maxTimerArmed = false; // 本次调用是否启动了最长累积定时器
  std::string reason;
};

struct TurnSnapshot {
  std::string transcript; // 未 trim 的累积文本
  std::string interimTranscript;
  bool muted = false;
  bool active = false;
  std::optional<int> countdown;
  std::string countdownReason;
};

/**
 * @brief 轮次判定引擎
 *
 * 维护待发送累积文本，对每条 final 结果决定：立即发送、(重新)倒计时或继续等待。
 * 非线程安全，所有调用必须来自同一个决策循环。
 *
 * @example
 *   TurnTakingEngine engine(timerPort);
 *   engine.setOnSend([](const TurnDispatch &d) { forward(d.text); });
 *   engine.setActive(true);
 *   engine.onFinal("How are you doing today and what are your thoughts?",
 *                  std::nullopt, nowMs);
 */
class TurnTakingEngine {
public:
  using SendCallback = std::function<void(const TurnDispatch &)>;

  explicit TurnTakingEngine(TurnTimerPort &timers,
                            const TurnTakingConfig &cfg = TurnTakingConfig());

  TurnTakingEngine(const TurnTakingEngine &) = delete;
  TurnTakingEngine &operator=(const TurnTakingEngine &) = delete;

  void setOnSend(SendCallback cb) { m_onSend = std::move(cb); }

  /**
   * @brief 开启 / 关闭连续对话模式，两种情况都会清空全部状态
   */
  void setActive(bool active);
  bool isActive() const { return m_active; }

  TurnDecision onFinal(const std::string &text,
                       const std::optional<std::string> &speakerId,
                       int64_t nowMs);

  /**
   * @brief partial 结果：只更新显示值与活动时间，不影响倒计时
   */
  void onInterim(const std::string &text, int64_t nowMs);

  TurnDecision onTimer(TurnTimer timer, uint32_t generation, int64_t nowMs);
  TurnDecision onDeferredSend(uint32_t generation, int64_t nowMs);

  /**
   * @brief 静音开关
   *
   * 开启时若有待发送内容，投递一次延后发送；关闭时若仍有内容，
   * 重新启动最长累积定时器。
   */
  TurnDecision setMuted(bool muted, int64_t nowMs);
  bool isMuted() const { return m_muted; }

  /**
   * @brief 手动发送当前累积内容（不检查门限）
   */
  TurnDecision sendNow(int64_t nowMs);

  /**
   * @brief 清空累积内容，不发送
   */
  void reset();

  TurnSnapshot snapshot() const;

  /**
   * @brief 更新阈值配置，只应在非连续模式下调用
   */
  void setConfig(const TurnTakingConfig &cfg) { m_cfg = cfg; }
  const TurnTakingConfig &config() const { return m_cfg; }

private:
  void appendFragment(const std::string &trimmed,
                      const std::optional<std::string> &speakerId);
  void startCountdown(uint32_t durationMs, const std::string &reason,
                      int64_t nowMs);
  void cancelCountdown();
  bool armMaxTimer(int64_t nowMs);
  void cancelMaxTimer();
  void dispatch(const std::string &reason, bool forced, int64_t nowMs);

  TurnTimerPort &m_timers;
  TurnTakingConfig m_cfg;
  SendCallback m_onSend;

  bool m_active = false;
  bool m_muted = false;
  std::string m_accum;
  std::string m_interim;
  int64_t m_lastActivityMs = -1;

  uint32_t m_generation = 0;

  bool m_countdownActive = false;
  uint32_t m_countdownGen = 0;
  int m_countdownRemaining = 0;
  int64_t m_countdownDueMs = 0; // 下一次 tick 最早的到达时间
  std::string m_countdownReason;

  bool m_maxArmed = false;
  uint32_t m_maxGen = 0;
  int64_t m_maxDueMs = 0;

  bool m_deferredPending = false;
  uint32_t m_deferredGen = 0;
};

const char *GetTurnActionName(TurnAction action);
