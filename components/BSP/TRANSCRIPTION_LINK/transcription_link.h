#pragma once

#include "esp_err.h"
#include "esp_websocket_client.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "transcript_protocol.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

/**
 * @brief 连接生命周期
 */
enum class LinkState {
    Idle,       ///< 未打开
    Connecting, ///< 握手中
    Open,       ///< 可发送音频
    Closed,     ///< 已关闭（closeCode / closeReason 有效）
};

/**
 * @brief 流式转写连接配置
 */
struct TranscriptionLinkConfig {
    StreamingOptions options;            ///< URL 参数
    int buffer_size = 4096;              ///< 接收缓冲区大小
    int network_timeout_ms = 10000;      ///< 网络超时
    int connect_timeout_ms = 10000;      ///< open() 等待握手的最长时间
    int close_timeout_ms = 2000;         ///< close() 等待关闭握手的最长时间
    int task_stack = 6144;
    int task_prio = 5;
};

/**
 * @brief 流式转写 WebSocket 客户端
 *
 * 每个会话一个实例，不自动重连：任何关闭都通过 onClosed 回调上报一次。
 * 回调在 websocket 任务中执行，调用方需要自行投递到自己的任务。
 *
 * @example
 *   TranscriptionLink link;
 *   link.setOnMessage([](const InboundMessage& msg) { ... });
 *   link.setOnClosed([](const CloseDescription& desc) { ... });
 *   link.open(apiKey, {});
 *   link.send(pcm_bytes, len);
 *   link.close();
 */
class TranscriptionLink {
public:
    TranscriptionLink() = default;
    ~TranscriptionLink();

    TranscriptionLink(const TranscriptionLink&) = delete;
    TranscriptionLink& operator=(const TranscriptionLink&) = delete;

    /**
     * @brief 建立连接，阻塞直到握手完成、失败或超时
     * @return ESP_OK / ESP_ERR_TIMEOUT / ESP_FAIL / ESP_ERR_INVALID_STATE
     */
    esp_err_t open(const std::string& token, const TranscriptionLinkConfig& config);

    /**
     * @brief 发送一帧 PCM16 音频，未处于 Open 时静默丢弃
     */
    esp_err_t send(const uint8_t* data, size_t len);

    /**
     * @brief 发送 Terminate 并关闭连接，可重复调用
     *
     * 结束后总是处于 Closed；此前未结束的连接记为 1000 "normal"，
     * 已经因对端关闭或网络故障结束的连接保留原关闭码。
     */
    void close();

    LinkState getState() const { return state_.load(); }
    bool isOpen() const { return state_.load() == LinkState::Open; }

    int closeCode() const { return close_code_; }
    const std::string& closeReason() const { return close_reason_; }

    /**
     * @brief 解析后的下行消息回调
     */
    using MessageCallback = std::function<void(const InboundMessage& msg)>;
    void setOnMessage(MessageCallback cb) { on_message_ = cb; }

    /**
     * @brief 连接关闭回调（每个连接最多一次，主动 close() 不触发）
     */
    using ClosedCallback = std::function<void(const CloseDescription& desc)>;
    void setOnClosed(ClosedCallback cb) { on_closed_ = cb; }

private:
    TranscriptionLinkConfig config_;
    esp_websocket_client_handle_t client_ = nullptr;
    EventGroupHandle_t event_group_ = nullptr;
    std::atomic<LinkState> state_{LinkState::Idle};
    std::atomic<bool> closing_{false};
    std::atomic<bool> closed_reported_{false};
    std::mutex mutex_;

    std::string url_;
    int close_code_ = kCloseNoStatus;
    std::string close_reason_;
    bool close_frame_seen_ = false;

    // RX framing helpers (handle continuation / oversized frames)
    uint8_t rx_continuation_opcode_ = 0;
    std::string rx_text_buf_;

    MessageCallback on_message_;
    ClosedCallback on_closed_;

    static constexpr int CONNECTED_BIT = BIT0;
    static constexpr int FAIL_BIT = BIT1;

    esp_err_t sendText(const std::string& text);
    void destroyClient();
    void reportClosed();

    // 事件处理
    static void eventHandler(void* arg, esp_event_base_t event_base,
                             int32_t event_id, void* event_data);
    void handleEvent(esp_websocket_event_data_t* data, int32_t event_id);
    void handleTextMessage(const char* data, size_t len);
};

const char* GetLinkStateName(LinkState state);
