#include "turn_taking.h"

#include <cmath>

namespace {
constexpr const char *kReasonNaturalBreak = "natural conversation break";
constexpr const char *kReasonEndOfTurn = "enhanced end-of-turn detection";
constexpr const char *kReasonMaxAccumulation = "max accumulation time";
constexpr const char *kReasonMuted = "muted - artificial silence";
constexpr const char *kReasonManual = "manual send";

std::string countdownLabel(double score) {
  return "smart detection (" + std::to_string(std::lround(score)) +
         "% confidence)";
}
} // namespace

TurnTakingEngine::TurnTakingEngine(TurnTimerPort &timers,
                                   const TurnTakingConfig &cfg)
    : m_timers(timers), m_cfg(cfg) {}

void TurnTakingEngine::setActive(bool active) {
  reset();
  m_active = active;
  m_muted = false;
  m_lastActivityMs = -1;
}

TurnDecision TurnTakingEngine::onFinal(
    const std::string &text, const std::optional<std::string> &speakerId,
    int64_t nowMs) {
  TurnDecision decision;
  const std::string piece = trimText(text);
  if (piece.empty()) {
    return decision;
  }

  // 静音时长：上次活动（partial 或 final）到本条 final 到达
  const int64_t silenceMs =
      m_lastActivityMs < 0 ? 0 : nowMs - m_lastActivityMs;
  m_lastActivityMs = nowMs;

  appendFragment(piece, speakerId);
  m_interim.clear();

  if (!m_active) {
    decision.action = TurnAction::Accumulated;
    return decision;
  }
  if (m_muted) {
    decision.action = TurnAction::Muted;
    return decision;
  }

  // 新的 final 总是先取消旧倒计时，门限通过才重新开始
  cancelCountdown();

  const bool gate = shouldAutoSend(m_accum);
  if (gate && isNaturalBreak(piece, m_accum)) {
    decision.action = TurnAction::SentImmediately;
    decision.reason = kReasonNaturalBreak;
    dispatch(kReasonNaturalBreak, false, nowMs);
    return decision;
  }

  if (gate) {
    decision.score =
        analyzeEndOfTurn(m_accum, silenceMs, m_cfg.silence_threshold_ms);
    const double multiplier = countdownMultiplier(decision.score.confidence);
    decision.countdownMs =
        (uint32_t)((double)m_cfg.silence_threshold_ms * multiplier);
    decision.countdownSeconds = countdownSeconds(decision.countdownMs);
    decision.reason = countdownLabel(decision.score.value);
    decision.action = TurnAction::CountdownStarted;
    startCountdown(decision.countdownMs, decision.reason, nowMs);
  } else {
    decision.action = TurnAction::Waiting;
  }

  decision.maxTimerArmed = armMaxTimer(nowMs);
  return decision;
}

void TurnTakingEngine::onInterim(const std::string &text, int64_t nowMs) {
  m_interim = text;
  m_lastActivityMs = nowMs;
}

TurnDecision TurnTakingEngine::onTimer(TurnTimer timer, uint32_t generation,
                                       int64_t nowMs) {
  TurnDecision decision;

  switch (timer) {
  case TurnTimer::Countdown:
    // 早于预定时间到达的 tick 来自重启前的定时器
    if (!m_countdownActive || generation != m_countdownGen ||
        nowMs < m_countdownDueMs) {
      decision.action = TurnAction::Stale;
      return decision;
    }
    m_countdownDueMs += m_cfg.countdown_tick_ms;
    m_countdownRemaining--;
    if (m_countdownRemaining > 0) {
      decision.action = TurnAction::CountdownTick;
      decision.countdownSeconds = m_countdownRemaining;
      return decision;
    }
    cancelCountdown();
    if (trimText(m_accum).empty()) {
      return decision;
    }
    decision.action = TurnAction::Sent;
    decision.reason = kReasonEndOfTurn;
    dispatch(kReasonEndOfTurn, false, nowMs);
    return decision;

  case TurnTimer::MaxAccumulation:
    if (!m_maxArmed || generation != m_maxGen || nowMs < m_maxDueMs) {
      decision.action = TurnAction::Stale;
      return decision;
    }
    m_maxArmed = false;
    if (trimText(m_accum).empty()) {
      return decision;
    }
    decision.action = TurnAction::Sent;
    decision.reason = kReasonMaxAccumulation;
    dispatch(kReasonMaxAccumulation, true, nowMs);
    return decision;

  default:
    decision.action = TurnAction::Stale;
    return decision;
  }
}

TurnDecision TurnTakingEngine::onDeferredSend(uint32_t generation,
                                              int64_t nowMs) {
  TurnDecision decision;
  if (!m_deferredPending || generation != m_deferredGen) {
    decision.action = TurnAction::Stale;
    return decision;
  }
  m_deferredPending = false;
  if (trimText(m_accum).empty()) {
    return decision;
  }
  decision.action = TurnAction::Sent;
  decision.reason = kReasonMuted;
  dispatch(kReasonMuted, true, nowMs);
  return decision;
}

TurnDecision TurnTakingEngine::setMuted(bool muted, int64_t nowMs) {
  TurnDecision decision;
  if (muted == m_muted) {
    return decision;
  }
  m_muted = muted;
  m_lastActivityMs = nowMs;

  if (!muted) {
    // 静音期间追加的内容同样受最长累积时间约束
    if (m_active) {
      decision.maxTimerArmed = armMaxTimer(nowMs);
    }
    return decision;
  }
  if (!m_active || trimText(m_accum).empty()) {
    return decision;
  }

  // 视为出现静音：停止所有定时器，把发送投递回循环
  cancelCountdown();
  cancelMaxTimer();
  m_deferredGen = ++m_generation;
  m_deferredPending = true;
  m_timers.postDeferredSend(m_deferredGen);

  decision.action = TurnAction::DeferredSendQueued;
  decision.reason = kReasonMuted;
  return decision;
}

TurnDecision TurnTakingEngine::sendNow(int64_t nowMs) {
  TurnDecision decision;
  if (trimText(m_accum).empty()) {
    return decision;
  }
  decision.action = TurnAction::Sent;
  decision.reason = kReasonManual;
  dispatch(kReasonManual, true, nowMs);
  return decision;
}

void TurnTakingEngine::reset() {
  cancelCountdown();
  cancelMaxTimer();
  m_deferredPending = false;
  m_accum.clear();
  m_interim.clear();
}

TurnSnapshot TurnTakingEngine::snapshot() const {
  TurnSnapshot snap;
  snap.transcript = m_accum;
  snap.interimTranscript = m_interim;
  snap.muted = m_muted;
  snap.active = m_active;
  if (m_countdownActive) {
    snap.countdown = m_countdownRemaining;
    snap.countdownReason = m_countdownReason;
  }
  return snap;
}

void TurnTakingEngine::appendFragment(
    const std::string &trimmed, const std::optional<std::string> &speakerId) {
  if (speakerId && !speakerId->empty()) {
    m_accum += "[" + *speakerId + "] ";
  }
  m_accum += trimmed;
  m_accum += ' ';
}

void TurnTakingEngine::startCountdown(uint32_t durationMs,
                                      const std::string &reason,
                                      int64_t nowMs) {
  cancelCountdown();
  m_countdownActive = true;
  m_countdownGen = ++m_generation;
  m_countdownDueMs = nowMs + m_cfg.countdown_tick_ms;
  m_countdownRemaining = countdownSeconds(durationMs);
  m_countdownReason = reason;
  m_timers.startTimer(TurnTimer::Countdown, m_cfg.countdown_tick_ms, true,
                      m_countdownGen);
}

void TurnTakingEngine::cancelCountdown() {
  if (!m_countdownActive) {
    return;
  }
  m_timers.stopTimer(TurnTimer::Countdown);
  m_countdownActive = false;
  m_countdownRemaining = 0;
  m_countdownReason.clear();
}

bool TurnTakingEngine::armMaxTimer(int64_t nowMs) {
  if (m_maxArmed || trimText(m_accum).empty()) {
    return false;
  }
  m_maxArmed = true;
  m_maxGen = ++m_generation;
  m_maxDueMs = nowMs + m_cfg.max_accumulation_ms;
  m_timers.startTimer(TurnTimer::MaxAccumulation, m_cfg.max_accumulation_ms,
                      false, m_maxGen);
  return true;
}

void TurnTakingEngine::cancelMaxTimer() {
  if (!m_maxArmed) {
    return;
  }
  m_timers.stopTimer(TurnTimer::MaxAccumulation);
  m_maxArmed = false;
}

void TurnTakingEngine::dispatch(const std::string &reason, bool forced,
                                int64_t nowMs) {
  TurnDispatch out;
  out.text = trimText(m_accum);
  out.reason = reason;
  out.forced = forced;

  // 先清空状态再回调，回调里可以安全地再次调用引擎
  reset();
  m_lastActivityMs = nowMs;

  if (m_onSend) {
    m_onSend(out);
  }
}

const char *GetTurnActionName(TurnAction action) {
  switch (action) {
  case TurnAction::None:               return "None";
  case TurnAction::Accumulated:        return "Accumulated";
  case TurnAction::Muted:              return "Muted";
  case TurnAction::SentImmediately:    return "SentImmediately";
  case TurnAction::CountdownStarted:   return "CountdownStarted";
  case TurnAction::Waiting:            return "Waiting";
  case TurnAction::CountdownTick:      return "CountdownTick";
  case TurnAction::Sent:               return "Sent";
  case TurnAction::DeferredSendQueued: return "DeferredSendQueued";
  case TurnAction::Stale:              return "Stale";
  default:                             return "Invalid";
  }
}
