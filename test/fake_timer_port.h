#pragma once

#include "turn_taking.h"

#include <cstdint>
#include <deque>
#include <map>
#include <vector>

/**
 * @brief 测试用定时器：手动推进时钟，按到期顺序回调引擎
 */
class FakeTimerPort : public TurnTimerPort {
public:
  struct Slot {
    bool active = false;
    bool periodic = false;
    uint32_t periodMs = 0;
    uint32_t generation = 0;
    int64_t dueMs = 0;
  };

  void bind(TurnTakingEngine *engine) { m_engine = engine; }

  void startTimer(TurnTimer timer, uint32_t periodMs, bool periodic,
                  uint32_t generation) override {
    Slot &slot = m_slots[timer];
    if (timer == TurnTimer::Countdown && slot.active) {
      overlappingCountdowns++;
    }
    slot.active = true;
    slot.periodic = periodic;
    slot.periodMs = periodMs;
    slot.generation = generation;
    slot.dueMs = nowMs + periodMs;
    starts[timer]++;
  }

  void stopTimer(TurnTimer timer) override {
    m_slots[timer].active = false;
    stops[timer]++;
  }

  void postDeferredSend(uint32_t generation) override {
    deferred.push_back(generation);
  }

  bool isActive(TurnTimer timer) const {
    auto it = m_slots.find(timer);
    return it != m_slots.end() && it->second.active;
  }

  const Slot &slot(TurnTimer timer) { return m_slots[timer]; }

  /**
   * @brief 执行已投递的延后发送（模拟下一次循环）
   */
  std::vector<TurnDecision> pump() {
    std::vector<TurnDecision> out;
    while (!deferred.empty()) {
      const uint32_t gen = deferred.front();
      deferred.pop_front();
      out.push_back(m_engine->onDeferredSend(gen, nowMs));
    }
    return out;
  }

  /**
   * @brief 推进时钟到 targetMs，期间到期的定时器依次回调
   */
  void advanceTo(int64_t targetMs) {
    while (true) {
      TurnTimer next = TurnTimer::Countdown;
      int64_t nextDue = INT64_MAX;
      for (const auto &[timer, s] : m_slots) {
        if (s.active && s.dueMs <= targetMs && s.dueMs < nextDue) {
          nextDue = s.dueMs;
          next = timer;
        }
      }
      if (nextDue == INT64_MAX) {
        break;
      }
      nowMs = nextDue;
      Slot &s = m_slots[next];
      const uint32_t gen = s.generation;
      if (s.periodic) {
        s.dueMs += s.periodMs;
      } else {
        s.active = false;
      }
      decisions.push_back(m_engine->onTimer(next, gen, nowMs));
    }
    nowMs = targetMs;
  }

  void advanceBy(int64_t ms) { advanceTo(nowMs + ms); }

  int64_t nowMs = 0;
  std::map<TurnTimer, int> starts;
  std::map<TurnTimer, int> stops;
  std::deque<uint32_t> deferred;
  std::vector<TurnDecision> decisions;
  int overlappingCountdowns = 0;

private:
  TurnTakingEngine *m_engine = nullptr;
  std::map<TurnTimer, Slot> m_slots;
};
