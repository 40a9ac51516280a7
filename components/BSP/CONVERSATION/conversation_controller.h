#pragma once

#include "audio_source.h"
#include "conversation_insights.h"
#include "conversation_state_machine.h"
#include "esp_err.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include "quality_tracker.h"
#include "speech_token.h"
#include "transcription_link.h"
#include "turn_taking.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct ConversationConfig {
  AudioSourceConfig audio;
  TranscriptionLinkConfig link;
  TurnTakingConfig turn;
  SpeechTokenConfig token;

  int queue_depth = 32;
  int post_timeout_ms = 100; // 外部命令 / 连接事件入队等待

  int worker_stack = 8192;
  int worker_prio = 5;
  int worker_core = 0;
};

/**
 * @brief 对外只读状态
 */
struct ConversationSnapshot {
  ConversationState state = kConversationStateIdle;
  bool isListening = false;
  std::string transcript;
  std::string interimTranscript;
  bool isMuted = false;
  std::optional<int> autoSendCountdown;
  std::string autoSendReason;
  QualityMetrics qualityMetrics;
  std::optional<QualitySample> quality;
  std::optional<SentimentReading> sentiment;
  std::optional<std::string> currentSpeaker;
  std::optional<ContentSafetyResult> contentSafety;
  std::string lastError;
  std::string sessionId;
};

/**
 * @brief 连续对话控制器
 *
 * 所有影响决策的事件（识别结果、连接关闭、定时器到期、按键命令）都投递到
 * 同一个 FreeRTOS 队列，由 worker 任务串行处理；音频帧由采集任务直接发送。
 *
 * @example
 *   ConversationController conv;
 *   conv.init(cfg);
 *   conv.setOnError([](ConversationErrorKind kind, const std::string &msg) { ... });
 *   conv.startContinuousMode([](const std::string &text) { forward(text); });
 *   conv.toggleMute();
 *   conv.stopContinuousMode();
 */
class ConversationController : private TurnTimerPort {
public:
  using UtteranceCallback = std::function<void(const std::string &text)>;
  using ErrorCallback =
      std::function<void(ConversationErrorKind kind, const std::string &message)>;

  ConversationController();
  ~ConversationController() override;

  ConversationController(const ConversationController &) = delete;
  ConversationController &operator=(const ConversationController &) = delete;

  esp_err_t init(const ConversationConfig &cfg);
  void deinit();

  /**
   * @brief 开始连续对话：麦克风 -> 凭证 -> 连接，失败时释放已获取的资源
   *
   * 启动在 worker 任务里异步进行，结果通过状态和 onError 回调体现。
   */
  esp_err_t startContinuousMode(UtteranceCallback onUtterance);

  /**
   * @brief 停止并丢弃未发送内容，可重复调用
   */
  esp_err_t stopContinuousMode();

  /**
   * @brief 停止并清空转写、情绪、说话人、质量等全部数据
   */
  esp_err_t cancelRecording();

  esp_err_t toggleMute();
  esp_err_t setMuted(bool muted);

  /**
   * @brief 手动发送当前累积内容（不检查自动发送门限）
   */
  esp_err_t sendCurrentTranscript();

  /**
   * @brief 清空当前累积内容，不发送
   */
  esp_err_t resetTranscript();

  /**
   * @brief 错误回调，在 worker 任务里调用
   */
  void setOnError(ErrorCallback cb);

  ConversationSnapshot snapshot() const;
  ConversationState getState() const { return m_sm.getState(); }
  ConversationStateMachine &stateMachine() { return m_sm; }

private:
  enum class EventType : uint8_t {
    Start,
    Stop,
    Cancel,
    SetMuted,
    ToggleMute,
    SendNow,
    Reset,
    Inbound,
    LinkClosed,
    Timer,
    DeferredSend,
    Shutdown,
  };

  // 队列元素（POD）。指针成员由 worker 负责释放
  struct ConversationEvent {
    EventType type = EventType::Shutdown;
    uint32_t session = 0;
    uint32_t generation = 0;
    int32_t arg = 0;
    InboundMessage *message = nullptr;
    CloseDescription *close = nullptr;
    UtteranceCallback *callback = nullptr;
  };

  // 一次会话独占的资源，整体创建、整体销毁
  struct Session {
    uint32_t serial = 0;
    UtteranceCallback onUtterance;
    AudioSource audio;
    TranscriptionLink link;
  };

  struct TimerSlot {
    ConversationController *owner = nullptr;
    TurnTimer kind = TurnTimer::Countdown;
    esp_timer_handle_t handle = nullptr;
    std::atomic<uint32_t> generation{0};
  };

  // TurnTimerPort
  void startTimer(TurnTimer timer, uint32_t periodMs, bool periodic,
                  uint32_t generation) override;
  void stopTimer(TurnTimer timer) override;
  void postDeferredSend(uint32_t generation) override;

  static void workerTask(void *arg);
  static void timerCallback(void *arg);

  esp_err_t post(const ConversationEvent &ev, TickType_t wait);
  esp_err_t postCommand(EventType type, int32_t arg = 0);
  static void releaseEvent(ConversationEvent &ev);

  bool handleEvent(ConversationEvent &ev);
  void handleStart(UtteranceCallback *callback);
  void handleStop(bool discardAll);
  void handleMute(bool muted);
  void handleInbound(const InboundMessage &msg);
  void handleLinkClosed(const CloseDescription &desc);

  void deliver(const TurnDispatch &dispatch);
  void failSession(ConversationErrorKind kind, const std::string &message);
  void teardownSession();
  void logDecision(const TurnDecision &decision);
  void publishSnapshot();
  bool sessionMatches(const ConversationEvent &ev) const;

  static int64_t nowMs();

  ConversationConfig m_cfg;
  bool m_inited = false;

  QueueHandle_t m_queue = nullptr;
  TaskHandle_t m_task = nullptr;
  SemaphoreHandle_t m_taskDone = nullptr;

  TimerSlot m_timers[2];

  // 以下仅在 worker 任务中访问
  ConversationStateMachine m_sm;
  int m_logListenerId = -1;
  TurnTakingEngine m_engine;
  QualityTracker m_quality;
  ConversationInsights m_insights;
  SpeechTokenClient m_token;
  std::unique_ptr<Session> m_session;
  std::atomic<uint32_t> m_serial{0};
  std::string m_lastError;
  std::string m_sessionId;

  ErrorCallback m_onError;
  std::mutex m_callbackMutex;

  mutable std::mutex m_snapshotMutex;
  ConversationSnapshot m_snapshot;
};
