#include "conversation_controller.h"

#include "esp_log.h"

#include <utility>

static const char *TAG = "Conversation";

namespace {
static const char *deviceErrorMessage(AudioDeviceError err) {
  switch (err) {
  case AudioDeviceError::PermissionDenied:
    return "Microphone access denied. Please allow microphone permissions.";
  case AudioDeviceError::NotFound:
    return "No microphone found. Please connect a microphone.";
  default:
    return "Failed to start speech recognition.";
  }
}

static ConversationErrorKind closeErrorKind(const CloseDescription &desc) {
  return desc.kind == LinkErrorKind::Network ? kConversationErrorNetwork
                                             : kConversationErrorProtocol;
}
} // namespace

ConversationController::ConversationController() : m_engine(*this) {
  m_timers[0].owner = this;
  m_timers[0].kind = TurnTimer::Countdown;
  m_timers[1].owner = this;
  m_timers[1].kind = TurnTimer::MaxAccumulation;
}

ConversationController::~ConversationController() { deinit(); }

int64_t ConversationController::nowMs() { return esp_timer_get_time() / 1000; }

// ============================================================================
// Init / Deinit
// ============================================================================

esp_err_t ConversationController::init(const ConversationConfig &cfg) {
  if (m_inited) {
    return ESP_OK;
  }
  m_cfg = cfg;
  m_engine.setConfig(m_cfg.turn);

  esp_err_t ret = m_token.init(m_cfg.token);
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "Speech token URL not configured");
    return ret;
  }

  for (auto &slot : m_timers) {
    esp_timer_create_args_t args = {};
    args.callback = &ConversationController::timerCallback;
    args.arg = &slot;
    args.dispatch_method = ESP_TIMER_TASK;
    args.name = slot.kind == TurnTimer::Countdown ? "turn_countdown"
                                                  : "turn_max_accum";
    ret = esp_timer_create(&args, &slot.handle);
    if (ret != ESP_OK) {
      ESP_LOGE(TAG, "esp_timer_create failed: %s", esp_err_to_name(ret));
      deinit();
      return ret;
    }
  }

  m_queue = xQueueCreate(m_cfg.queue_depth, sizeof(ConversationEvent));
  m_taskDone = xSemaphoreCreateBinary();
  if (!m_queue || !m_taskDone) {
    ESP_LOGE(TAG, "Failed to create queue");
    deinit();
    return ESP_ERR_NO_MEM;
  }

  m_engine.setOnSend([this](const TurnDispatch &d) { deliver(d); });

  m_logListenerId = m_sm.addStateChangeListener([](ConversationState from,
                                                   ConversationState to) {
    ESP_LOGI(TAG, "State transition: %s -> %s", GetConversationStateName(from),
             GetConversationStateName(to));
  });

  BaseType_t ok = xTaskCreatePinnedToCore(workerTask, "conversation",
                                          m_cfg.worker_stack, this,
                                          m_cfg.worker_prio, &m_task,
                                          m_cfg.worker_core);
  if (ok != pdPASS) {
    ESP_LOGE(TAG, "Failed to create worker task");
    m_task = nullptr;
    deinit();
    return ESP_FAIL;
  }

  m_inited = true;
  publishSnapshot();
  ESP_LOGI(TAG, "Init: silence=%u ms, max_accum=%u ms, safety=%d",
           (unsigned)m_cfg.turn.silence_threshold_ms,
           (unsigned)m_cfg.turn.max_accumulation_ms,
           m_cfg.link.options.content_safety ? 1 : 0);
  return ESP_OK;
}

void ConversationController::deinit() {
  if (m_task) {
    ConversationEvent ev{};
    ev.type = EventType::Shutdown;
    if (xQueueSend(m_queue, &ev, portMAX_DELAY) == pdTRUE) {
      xSemaphoreTake(m_taskDone, portMAX_DELAY);
    }
    m_task = nullptr;
  }

  if (m_logListenerId >= 0) {
    m_sm.removeStateChangeListener(m_logListenerId);
    m_logListenerId = -1;
  }

  for (auto &slot : m_timers) {
    if (slot.handle) {
      esp_timer_stop(slot.handle);
      esp_timer_delete(slot.handle);
      slot.handle = nullptr;
    }
  }

  if (m_queue) {
    ConversationEvent ev{};
    while (xQueueReceive(m_queue, &ev, 0) == pdTRUE) {
      releaseEvent(ev);
    }
    vQueueDelete(m_queue);
    m_queue = nullptr;
  }
  if (m_taskDone) {
    vSemaphoreDelete(m_taskDone);
    m_taskDone = nullptr;
  }
  m_inited = false;
}

// ============================================================================
// Public commands (any task)
// ============================================================================

esp_err_t ConversationController::startContinuousMode(
    UtteranceCallback onUtterance) {
  if (!m_inited) {
    return ESP_ERR_INVALID_STATE;
  }
  if (!onUtterance) {
    return ESP_ERR_INVALID_ARG;
  }
  if (!m_sm.canTransitionTo(kConversationStateStarting)) {
    ESP_LOGW(TAG, "Cannot start in state %s",
             GetConversationStateName(m_sm.getState()));
    return ESP_ERR_INVALID_STATE;
  }

  ConversationEvent ev{};
  ev.type = EventType::Start;
  ev.callback = new UtteranceCallback(std::move(onUtterance));
  esp_err_t err = post(ev, pdMS_TO_TICKS(m_cfg.post_timeout_ms));
  if (err != ESP_OK) {
    releaseEvent(ev);
  }
  return err;
}

esp_err_t ConversationController::stopContinuousMode() {
  return postCommand(EventType::Stop);
}

esp_err_t ConversationController::cancelRecording() {
  return postCommand(EventType::Cancel);
}

esp_err_t ConversationController::toggleMute() {
  return postCommand(EventType::ToggleMute);
}

esp_err_t ConversationController::setMuted(bool muted) {
  return postCommand(EventType::SetMuted, muted ? 1 : 0);
}

esp_err_t ConversationController::sendCurrentTranscript() {
  return postCommand(EventType::SendNow);
}

esp_err_t ConversationController::resetTranscript() {
  return postCommand(EventType::Reset);
}

void ConversationController::setOnError(ErrorCallback cb) {
  std::lock_guard<std::mutex> lock(m_callbackMutex);
  m_onError = std::move(cb);
}

ConversationSnapshot ConversationController::snapshot() const {
  std::lock_guard<std::mutex> lock(m_snapshotMutex);
  return m_snapshot;
}

esp_err_t ConversationController::postCommand(EventType type, int32_t arg) {
  if (!m_inited) {
    return ESP_ERR_INVALID_STATE;
  }
  ConversationEvent ev{};
  ev.type = type;
  ev.arg = arg;
  return post(ev, pdMS_TO_TICKS(m_cfg.post_timeout_ms));
}

esp_err_t ConversationController::post(const ConversationEvent &ev,
                                       TickType_t wait) {
  if (!m_queue) {
    return ESP_ERR_INVALID_STATE;
  }
  if (xQueueSend(m_queue, &ev, wait) != pdTRUE) {
    ESP_LOGW(TAG, "Event queue full, drop event %d", (int)ev.type);
    return ESP_ERR_TIMEOUT;
  }
  return ESP_OK;
}

void ConversationController::releaseEvent(ConversationEvent &ev) {
  delete ev.message;
  delete ev.close;
  delete ev.callback;
  ev.message = nullptr;
  ev.close = nullptr;
  ev.callback = nullptr;
}

// ============================================================================
// Timers (TurnTimerPort)
// ============================================================================

void ConversationController::startTimer(TurnTimer timer, uint32_t periodMs,
                                        bool periodic, uint32_t generation) {
  TimerSlot &slot = m_timers[timer == TurnTimer::Countdown ? 0 : 1];
  if (!slot.handle) {
    return;
  }
  // 先作废旧的 generation，正在执行的回调不会再投递；
  // 仍然漏过来的 tick 由引擎按到达时间丢弃
  slot.generation.store(0);
  esp_err_t err = esp_timer_stop(slot.handle);
  if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
    ESP_LOGW(TAG, "esp_timer_stop: %s", esp_err_to_name(err));
  }
  slot.generation.store(generation);

  const uint64_t periodUs = (uint64_t)periodMs * 1000ULL;
  err = periodic ? esp_timer_start_periodic(slot.handle, periodUs)
                 : esp_timer_start_once(slot.handle, periodUs);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to start %s timer: %s",
             timer == TurnTimer::Countdown ? "countdown" : "max accumulation",
             esp_err_to_name(err));
  }
}

void ConversationController::stopTimer(TurnTimer timer) {
  TimerSlot &slot = m_timers[timer == TurnTimer::Countdown ? 0 : 1];
  slot.generation.store(0);
  if (slot.handle) {
    // 未运行时返回 INVALID_STATE，属正常情况
    esp_err_t err = esp_timer_stop(slot.handle);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
      ESP_LOGW(TAG, "esp_timer_stop: %s", esp_err_to_name(err));
    }
  }
}

void ConversationController::postDeferredSend(uint32_t generation) {
  ConversationEvent ev{};
  ev.type = EventType::DeferredSend;
  ev.session = m_session ? m_session->serial : 0;
  ev.generation = generation;
  // worker 自己投递，不能阻塞等待
  if (xQueueSendToFront(m_queue, &ev, 0) != pdTRUE) {
    ESP_LOGE(TAG, "Failed to queue muted send");
  }
}

void ConversationController::timerCallback(void *arg) {
  auto *slot = static_cast<TimerSlot *>(arg);
  ConversationController *self = slot->owner;

  const uint32_t generation = slot->generation.load();
  if (generation == 0) {
    return;
  }

  ConversationEvent ev{};
  ev.type = EventType::Timer;
  ev.session = self->m_serial.load();
  ev.generation = generation;
  ev.arg = (int32_t)slot->kind;
  if (xQueueSend(self->m_queue, &ev, 0) != pdTRUE) {
    ESP_LOGW(TAG, "Event queue full, drop timer tick");
  }
}

// ============================================================================
// Worker
// ============================================================================

void ConversationController::workerTask(void *arg) {
  auto *self = static_cast<ConversationController *>(arg);
  ConversationEvent ev{};

  ESP_LOGI(TAG, "Decision loop started");
  bool running = true;
  while (running) {
    if (xQueueReceive(self->m_queue, &ev, portMAX_DELAY) != pdTRUE) {
      continue;
    }
    running = self->handleEvent(ev);
    releaseEvent(ev);
    self->publishSnapshot();
  }

  ESP_LOGI(TAG, "Decision loop exited");
  xSemaphoreGive(self->m_taskDone);
  vTaskDelete(nullptr);
}

bool ConversationController::sessionMatches(const ConversationEvent &ev) const {
  return m_session && ev.session == m_session->serial;
}

bool ConversationController::handleEvent(ConversationEvent &ev) {
  switch (ev.type) {
  case EventType::Start:
    handleStart(ev.callback);
    break;

  case EventType::Stop:
    handleStop(false);
    break;

  case EventType::Cancel:
    handleStop(true);
    break;

  case EventType::SetMuted:
    handleMute(ev.arg != 0);
    break;

  case EventType::ToggleMute:
    handleMute(!m_engine.isMuted());
    break;

  case EventType::SendNow: {
    if (!m_session) {
      ESP_LOGW(TAG, "Manual send ignored: no active session");
      break;
    }
    TurnDecision decision = m_engine.sendNow(nowMs());
    if (decision.action == TurnAction::None) {
      ESP_LOGI(TAG, "Manual send: nothing accumulated");
    }
    break;
  }

  case EventType::Reset:
    m_engine.reset();
    m_insights.resetLatest();
    m_quality.clearCurrent();
    ESP_LOGI(TAG, "Transcript reset");
    break;

  case EventType::Inbound:
    if (sessionMatches(ev) && ev.message) {
      handleInbound(*ev.message);
    }
    break;

  case EventType::LinkClosed:
    if (sessionMatches(ev) && ev.close) {
      handleLinkClosed(*ev.close);
    }
    break;

  case EventType::Timer:
    if (sessionMatches(ev)) {
      logDecision(m_engine.onTimer((TurnTimer)ev.arg, ev.generation, nowMs()));
    }
    break;

  case EventType::DeferredSend:
    if (sessionMatches(ev)) {
      logDecision(m_engine.onDeferredSend(ev.generation, nowMs()));
    }
    break;

  case EventType::Shutdown:
    handleStop(true);
    return false;

  default:
    break;
  }
  return true;
}

void ConversationController::handleStart(UtteranceCallback *callback) {
  if (!callback || !m_sm.transitionTo(kConversationStateStarting)) {
    ESP_LOGW(TAG, "Start ignored in state %s",
             GetConversationStateName(m_sm.getState()));
    return;
  }

  const int64_t now = nowMs();
  m_lastError.clear();
  m_sessionId.clear();
  m_engine.setActive(true);
  m_quality.startSession(now);
  m_insights.clear();
  m_insights.setSafetyEnabled(m_cfg.link.options.content_safety);

  m_session = std::make_unique<Session>();
  m_session->serial = m_serial.fetch_add(1) + 1;
  m_session->onUtterance = std::move(*callback);
  const uint32_t serial = m_session->serial;
  Session *session = m_session.get();

  ESP_LOGI(TAG, "Starting continuous mode (session %u)", (unsigned)serial);

  // 1. 麦克风
  AudioDeviceError deviceErr = AudioDeviceError::None;
  esp_err_t err = session->audio.start(
      m_cfg.audio,
      [session](const int16_t *samples, size_t numSamples) {
        // 连接未打开时 send 直接丢弃
        session->link.send(reinterpret_cast<const uint8_t *>(samples),
                           numSamples * sizeof(int16_t));
      },
      &deviceErr);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Microphone start failed: %s (%s)", esp_err_to_name(err),
             GetAudioDeviceErrorName(deviceErr));
    failSession(kConversationErrorDevice, deviceErrorMessage(deviceErr));
    return;
  }

  // 2. 凭证
  SpeechToken token;
  err = m_token.fetch(token);
  if (err != ESP_OK) {
    failSession(kConversationErrorToken, token.message);
    return;
  }

  // 3. 连接
  session->link.setOnMessage([this, serial](const InboundMessage &msg) {
    ConversationEvent ev{};
    ev.type = EventType::Inbound;
    ev.session = serial;
    ev.message = new InboundMessage(msg);
    if (post(ev, pdMS_TO_TICKS(m_cfg.post_timeout_ms)) != ESP_OK) {
      releaseEvent(ev);
    }
  });
  session->link.setOnClosed([this, serial](const CloseDescription &desc) {
    ConversationEvent ev{};
    ev.type = EventType::LinkClosed;
    ev.session = serial;
    ev.close = new CloseDescription(desc);
    if (post(ev, pdMS_TO_TICKS(m_cfg.post_timeout_ms * 10)) != ESP_OK) {
      releaseEvent(ev);
    }
  });

  err = session->link.open(token.apiKey, m_cfg.link);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Link open failed: %s", esp_err_to_name(err));
    failSession(kConversationErrorNetwork, describeNetworkFailure().message);
    return;
  }

  m_sm.transitionTo(kConversationStateListening);
  ESP_LOGI(TAG, "Continuous mode started");
}

void ConversationController::handleStop(bool discardAll) {
  const bool hadSession = m_session != nullptr;

  m_engine.setActive(false);
  teardownSession();
  if (discardAll) {
    m_insights.clear();
    m_quality.clear();
  }

  if (m_sm.isActive() || m_sm.getState() == kConversationStateError) {
    m_sm.transitionTo(kConversationStateStopped);
  }
  if (hadSession) {
    ESP_LOGI(TAG, "%s", discardAll ? "Recording cancelled" : "Continuous mode stopped");
  }
}

void ConversationController::handleMute(bool muted) {
  const ConversationState state = m_sm.getState();
  if (state != kConversationStateListening && state != kConversationStateMuted) {
    ESP_LOGW(TAG, "Mute ignored in state %s", GetConversationStateName(state));
    return;
  }

  logDecision(m_engine.setMuted(muted, nowMs()));
  m_sm.transitionTo(muted ? kConversationStateMuted : kConversationStateListening);
  ESP_LOGI(TAG, "Microphone %s", muted ? "muted" : "unmuted");
}

void ConversationController::handleInbound(const InboundMessage &msg) {
  const int64_t now = nowMs();

  switch (msg.type) {
  case InboundType::Begin:
    m_sessionId = msg.sessionId;
    break;

  case InboundType::Transcript: {
    const TranscriptEvent &t = msg.transcript;
    if (t.text.empty()) {
      break;
    }
    if (t.isFinal) {
      m_quality.record(t.confidence, now);
      std::optional<std::string> speaker = t.speakerId;
      if (!speaker) {
        speaker = m_insights.currentSpeaker();
      }
      ESP_LOGD(TAG, "Final: \"%s\" (conf=%.2f)", t.text.c_str(),
               (double)t.confidence);
      logDecision(m_engine.onFinal(t.text, speaker, now));
    } else {
      m_quality.observe(t.confidence, now);
      m_engine.onInterim(t.text, now);
    }
    break;
  }

  case InboundType::Sentiment:
    m_insights.onSentiment(msg.sentiment);
    ESP_LOGD(TAG, "Sentiment: %s (%.2f)", GetSentimentName(msg.sentiment.sentiment),
             (double)msg.sentiment.confidence);
    break;

  case InboundType::SpeakerLabels:
    m_insights.onSpeakerLabels(msg.speakerLabels);
    ESP_LOGD(TAG, "Speaker labels: %u", (unsigned)msg.speakerLabels.size());
    break;

  case InboundType::ContentSafety:
    if (m_insights.onContentSafety(msg.contentSafety)) {
      ESP_LOGW(TAG, "Content safety flagged: risk=%s categories=%u",
               GetRiskLevelName(msg.contentSafety.riskLevel),
               (unsigned)msg.contentSafety.flaggedCategories.size());
    }
    break;

  case InboundType::Error:
    ESP_LOGE(TAG, "Service error: %s", msg.errorMessage.c_str());
    failSession(kConversationErrorProtocol,
                "Speech recognition error: " + msg.errorMessage);
    break;

  default:
    break;
  }
}

void ConversationController::handleLinkClosed(const CloseDescription &desc) {
  if (desc.isError) {
    failSession(closeErrorKind(desc), desc.message);
    return;
  }
  ESP_LOGI(TAG, "Service closed the session (code=%d)", desc.code);
  handleStop(false);
}

// ============================================================================
// Helpers
// ============================================================================

void ConversationController::deliver(const TurnDispatch &dispatch) {
  if (dispatch.reason == "max accumulation time") {
    ESP_LOGI(TAG, "Forced send after max accumulation (%u chars)",
             (unsigned)dispatch.text.size());
  } else {
    ESP_LOGI(TAG, "Sending utterance: reason=%s forced=%d (%u chars)",
             dispatch.reason.c_str(), dispatch.forced ? 1 : 0,
             (unsigned)dispatch.text.size());
  }

  if (m_session && m_session->onUtterance) {
    m_session->onUtterance(dispatch.text);
  }
}

void ConversationController::failSession(ConversationErrorKind kind,
                                         const std::string &message) {
  ESP_LOGE(TAG, "%s error: %s", GetConversationErrorKindName(kind),
           message.c_str());
  m_lastError = message;

  m_sm.transitionTo(kConversationStateError);
  m_engine.setActive(false);
  teardownSession();
  m_sm.transitionTo(kConversationStateStopped);

  ErrorCallback cb;
  {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    cb = m_onError;
  }
  if (cb) {
    cb(kind, message);
  }
}

void ConversationController::teardownSession() {
  if (!m_session) {
    return;
  }
  // 先停采集任务，再关连接：采集回调持有 link 的裸指针
  m_session->audio.stop();
  m_session->link.close();
  ESP_LOGI(TAG, "Session %u torn down (link code=%d reason=%s)",
           (unsigned)m_session->serial, m_session->link.closeCode(),
           m_session->link.closeReason().c_str());
  m_session.reset();
}

void ConversationController::logDecision(const TurnDecision &decision) {
  switch (decision.action) {
  case TurnAction::CountdownStarted:
    ESP_LOGI(TAG, "Countdown %ds: %s (score=%.0f, words=%d)",
             decision.countdownSeconds, decision.reason.c_str(),
             decision.score.value, decision.score.factors.wordCount);
    break;
  case TurnAction::Waiting:
    ESP_LOGD(TAG, "Auto-send conditions not met%s",
             decision.maxTimerArmed ? ", max accumulation timer armed" : "");
    break;
  case TurnAction::CountdownTick:
    ESP_LOGD(TAG, "Countdown %d", decision.countdownSeconds);
    break;
  case TurnAction::DeferredSendQueued:
    ESP_LOGI(TAG, "Muted with pending text, send queued");
    break;
  case TurnAction::Stale:
    ESP_LOGD(TAG, "Stale timer event dropped");
    break;
  case TurnAction::None:
    break;
  default:
    ESP_LOGD(TAG, "Turn decision: %s", GetTurnActionName(decision.action));
    break;
  }
}

void ConversationController::publishSnapshot() {
  const TurnSnapshot turn = m_engine.snapshot();
  const ConversationState state = m_sm.getState();

  std::lock_guard<std::mutex> lock(m_snapshotMutex);
  m_snapshot.state = state;
  m_snapshot.isListening = state == kConversationStateListening ||
                           state == kConversationStateMuted;
  m_snapshot.transcript = turn.transcript;
  m_snapshot.interimTranscript = turn.interimTranscript;
  m_snapshot.isMuted = turn.muted;
  m_snapshot.autoSendCountdown = turn.countdown;
  m_snapshot.autoSendReason = turn.countdownReason;
  m_snapshot.qualityMetrics = m_quality.metrics();
  m_snapshot.quality = m_quality.current();
  m_snapshot.sentiment = m_insights.sentiment();
  m_snapshot.currentSpeaker = m_insights.currentSpeaker();
  m_snapshot.contentSafety = m_insights.contentSafety();
  m_snapshot.lastError = m_lastError;
  m_snapshot.sessionId = m_sessionId;
}
