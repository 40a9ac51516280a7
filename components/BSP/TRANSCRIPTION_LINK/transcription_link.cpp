#include "transcription_link.h"
#include "esp_crt_bundle.h"
#include "esp_log.h"
#include "esp_timer.h"

static const char* TAG = "TranscriptionLink";

TranscriptionLink::~TranscriptionLink() {
    close();
    if (event_group_) {
        vEventGroupDelete(event_group_);
        event_group_ = nullptr;
    }
}

esp_err_t TranscriptionLink::open(const std::string& token,
                                  const TranscriptionLinkConfig& config) {
    if (state_.load() != LinkState::Idle || client_) {
        ESP_LOGW(TAG, "Already opened");
        return ESP_ERR_INVALID_STATE;
    }
    if (token.empty()) {
        ESP_LOGE(TAG, "Empty token");
        return ESP_ERR_INVALID_ARG;
    }

    if (!event_group_) {
        event_group_ = xEventGroupCreate();
        if (!event_group_) {
            ESP_LOGE(TAG, "Failed to create event group");
            return ESP_ERR_NO_MEM;
        }
    }
    xEventGroupClearBits(event_group_, CONNECTED_BIT | FAIL_BIT);

    config_ = config;
    url_ = buildStreamingUrl(config_.options, token);
    close_code_ = kCloseNoStatus;
    close_reason_.clear();
    close_frame_seen_ = false;
    rx_continuation_opcode_ = 0;
    rx_text_buf_.clear();
    closing_.store(false);
    closed_reported_.store(false);

    // 配置 WebSocket 客户端
    esp_websocket_client_config_t ws_config = {};
    ws_config.uri = url_.c_str();
    ws_config.buffer_size = config_.buffer_size;
    ws_config.network_timeout_ms = config_.network_timeout_ms;
    ws_config.disable_auto_reconnect = true;
    ws_config.ping_interval_sec = 30;
    ws_config.pingpong_timeout_sec = 10;
    ws_config.task_stack = config_.task_stack;
    ws_config.task_prio = config_.task_prio;
    ws_config.crt_bundle_attach = esp_crt_bundle_attach;

    client_ = esp_websocket_client_init(&ws_config);
    if (!client_) {
        ESP_LOGE(TAG, "Failed to init WebSocket client");
        return ESP_FAIL;
    }

    esp_err_t err = esp_websocket_register_events(client_, WEBSOCKET_EVENT_ANY,
                                                  eventHandler, this);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register events: %s", esp_err_to_name(err));
        destroyClient();
        return err;
    }

    state_.store(LinkState::Connecting);
    ESP_LOGI(TAG, "Connecting (sample_rate=%d, safety=%d)...",
             config_.options.sample_rate, config_.options.content_safety ? 1 : 0);

    err = esp_websocket_client_start(client_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start WebSocket client: %s", esp_err_to_name(err));
        destroyClient();
        state_.store(LinkState::Idle);
        return err;
    }

    // 等待连接结果
    EventBits_t bits = xEventGroupWaitBits(event_group_, CONNECTED_BIT | FAIL_BIT,
                                           pdFALSE, pdFALSE,
                                           pdMS_TO_TICKS(config_.connect_timeout_ms));
    if (bits & CONNECTED_BIT) {
        return ESP_OK;
    }

    const bool timedOut = (bits & FAIL_BIT) == 0;
    ESP_LOGE(TAG, "Connect failed (%s)", timedOut ? "timeout" : "error");
    closing_.store(true);
    destroyClient();
    close_code_ = kCloseAbnormal;
    state_.store(LinkState::Closed);
    return timedOut ? ESP_ERR_TIMEOUT : ESP_FAIL;
}

esp_err_t TranscriptionLink::sendText(const std::string& text) {
    if (state_.load() != LinkState::Open) {
        return ESP_ERR_INVALID_STATE;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int sent = esp_websocket_client_send_text(client_, text.c_str(), text.length(),
                                              pdMS_TO_TICKS(1000));
    if (sent < 0) {
        ESP_LOGE(TAG, "Failed to send text");
        return ESP_FAIL;
    }

    ESP_LOGD(TAG, "Sent: %s", text.c_str());
    return ESP_OK;
}

esp_err_t TranscriptionLink::send(const uint8_t* data, size_t len) {
    if (state_.load() != LinkState::Open || closing_.load()) {
        return ESP_ERR_INVALID_STATE;
    }
    if (data == nullptr || len == 0) {
        return ESP_ERR_INVALID_ARG;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        return ESP_ERR_INVALID_STATE;
    }
    int sent = esp_websocket_client_send_bin(client_, (const char*)data, len,
                                             pdMS_TO_TICKS(1000));
    if (sent < 0) {
        ESP_LOGW(TAG, "Failed to send audio frame");
        return ESP_FAIL;
    }
    return ESP_OK;
}

void TranscriptionLink::close() {
    const bool already_closed = state_.load() == LinkState::Closed;
    closing_.store(true);

    if (client_) {
        if (state_.load() == LinkState::Open &&
            esp_websocket_client_is_connected(client_)) {
            if (sendText(buildTerminateMessage()) == ESP_OK) {
                ESP_LOGI(TAG, "Sent Terminate");
            }
            esp_err_t err = esp_websocket_client_close(
                client_, pdMS_TO_TICKS(config_.close_timeout_ms));
            if (err != ESP_OK) {
                ESP_LOGW(TAG, "Close handshake failed: %s", esp_err_to_name(err));
            }
        }
        destroyClient();
    }

    CloseFrame recorded;
    recorded.code = close_code_;
    recorded.reason = close_reason_;
    const CloseFrame settled =
        settleLocalClose(already_closed, close_frame_seen_, recorded);
    close_code_ = settled.code;
    close_reason_ = settled.reason;
    state_.store(LinkState::Closed);

    if (!already_closed) {
        ESP_LOGI(TAG, "Closed (code=%d)", close_code_);
    }
}

void TranscriptionLink::destroyClient() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (client_) {
        esp_websocket_client_destroy(client_);
        client_ = nullptr;
    }
}

void TranscriptionLink::reportClosed() {
    if (closing_.load() || closed_reported_.exchange(true)) {
        return;
    }

    CloseDescription desc = close_frame_seen_
                                ? describeClose(close_code_, close_reason_)
                                : describeNetworkFailure();
    if (desc.isError) {
        ESP_LOGE(TAG, "Connection closed: code=%d reason=%s kind=%s", desc.code,
                 desc.reason.c_str(), GetLinkErrorKindName(desc.kind));
    } else {
        ESP_LOGI(TAG, "Connection closed normally (code=%d)", desc.code);
    }

    if (on_closed_) {
        on_closed_(desc);
    }
}

void TranscriptionLink::eventHandler(void* arg, esp_event_base_t event_base,
                                     int32_t event_id, void* event_data) {
    auto* self = static_cast<TranscriptionLink*>(arg);
    auto* data = static_cast<esp_websocket_event_data_t*>(event_data);
    self->handleEvent(data, event_id);
}

void TranscriptionLink::handleEvent(esp_websocket_event_data_t* data, int32_t event_id) {
    switch (event_id) {
        case WEBSOCKET_EVENT_CONNECTED:
            ESP_LOGI(TAG, "WebSocket connected");
            state_.store(LinkState::Open);
            xEventGroupSetBits(event_group_, CONNECTED_BIT);
            break;

        case WEBSOCKET_EVENT_DATA:
            if (data->op_code == 0x08) {
                // 关闭帧：2 字节状态码 + 原因
                CloseFrame frame = parseCloseFrame((const uint8_t*)data->data_ptr,
                                                   data->data_len > 0 ? (size_t)data->data_len : 0);
                close_code_ = frame.code;
                close_reason_ = frame.reason;
                close_frame_seen_ = true;
                ESP_LOGI(TAG, "Close frame: code=%d reason=%s", close_code_,
                         close_reason_.c_str());
                break;
            }
            if (data->data_ptr && data->data_len > 0) {
                const uint8_t raw_op = data->op_code;
                uint8_t op = raw_op;

                // Handle RFC6455 continuation frames (opcode 0x00) by tracking
                // the last non-continuation opcode.
                if (op == 0x00) {
                    op = rx_continuation_opcode_;
                } else if (op == 0x01 || op == 0x02) {
                    rx_continuation_opcode_ = op;
                }

                const bool frame_done =
                    (data->payload_len <= 0) ? data->fin
                                             : ((data->payload_offset + data->data_len) >= data->payload_len);

                if (op == 0x01) {
                    if (raw_op == 0x01 && data->payload_offset == 0) {
                        rx_text_buf_.clear();
                        if (data->payload_len > 0) {
                            rx_text_buf_.reserve((size_t)data->payload_len);
                        }
                    }
                    rx_text_buf_.append(data->data_ptr, (size_t)data->data_len);

                    if (data->fin && frame_done) {
                        if (!rx_text_buf_.empty()) {
                            handleTextMessage(rx_text_buf_.c_str(), rx_text_buf_.size());
                        }
                        rx_text_buf_.clear();
                    }
                }

                if (data->fin && frame_done) {
                    rx_continuation_opcode_ = 0;
                }
            }
            break;

        case WEBSOCKET_EVENT_ERROR:
            ESP_LOGE(TAG, "WebSocket error");
            if (state_.load() == LinkState::Connecting) {
                xEventGroupSetBits(event_group_, FAIL_BIT);
                break;
            }
            // ERROR 之后不一定有 DISCONNECTED
            if (!close_frame_seen_) {
                close_code_ = kCloseAbnormal;
                state_.store(LinkState::Closed);
                reportClosed();
            }
            break;

        case WEBSOCKET_EVENT_DISCONNECTED:
        case WEBSOCKET_EVENT_CLOSED:
            ESP_LOGI(TAG, "WebSocket %s",
                     event_id == WEBSOCKET_EVENT_CLOSED ? "closed" : "disconnected");
            if (state_.load() == LinkState::Connecting) {
                xEventGroupSetBits(event_group_, FAIL_BIT);
                break;
            }
            if (!close_frame_seen_) {
                close_code_ = kCloseAbnormal;
            }
            state_.store(LinkState::Closed);
            rx_continuation_opcode_ = 0;
            rx_text_buf_.clear();
            reportClosed();
            break;

        default:
            break;
    }
}

void TranscriptionLink::handleTextMessage(const char* data, size_t len) {
    InboundMessage msg;
    const int64_t now_ms = esp_timer_get_time() / 1000;
    if (!parseInboundMessage(data, len, now_ms, msg)) {
        ESP_LOGW(TAG, "Malformed message skipped (len=%u)", (unsigned)len);
        return;
    }

    switch (msg.type) {
        case InboundType::Begin:
            ESP_LOGI(TAG, "Session started, id=%s", msg.sessionId.c_str());
            break;
        case InboundType::Ignored:
            ESP_LOGD(TAG, "Ignored message type=%s", msg.rawType.c_str());
            return;
        default:
            break;
    }

    if (on_message_) {
        on_message_(msg);
    }
}

const char* GetLinkStateName(LinkState state) {
    switch (state) {
        case LinkState::Idle:       return "Idle";
        case LinkState::Connecting: return "Connecting";
        case LinkState::Open:       return "Open";
        case LinkState::Closed:     return "Closed";
        default:                    return "Invalid";
    }
}
