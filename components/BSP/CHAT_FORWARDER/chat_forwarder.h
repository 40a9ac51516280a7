#pragma once

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"

#include <atomic>
#include <string>

/**
 * @brief 对话后端配置
 *
 * 完整的一轮用户话语以 JSON POST 给后端，后端如何处理与设备无关。
 */
struct ChatForwarderConfig {
  /**
   * @brief Chat URL，例如: http://192.168.1.10:8000/chat
   *
   * POST {"text": "...", "device_id": "..."}
   */
  std::string url;
  std::string device_id;

  int timeout_ms = 15000;
  int queue_depth = 4;

  int worker_stack = 6144;
  int worker_prio = 3;
  int worker_core = 0;
};

/**
 * @brief 把完成的话语异步转发到后端
 *
 * submit() 只入队，HTTP 在独立 worker 任务中完成，不阻塞决策循环。
 */
class ChatForwarder {
public:
  ChatForwarder() = default;
  ~ChatForwarder();

  ChatForwarder(const ChatForwarder &) = delete;
  ChatForwarder &operator=(const ChatForwarder &) = delete;

  esp_err_t init(const ChatForwarderConfig &cfg);
  void deinit();

  /**
   * @brief 入队一条话语
   * @return ESP_ERR_TIMEOUT 队列已满
   */
  esp_err_t submit(const std::string &text);

  uint32_t sentCount() const { return m_sent.load(); }
  uint32_t failedCount() const { return m_failed.load(); }

private:
  struct ForwardEvent {
    char *body = nullptr; // malloc owned; worker will free
    size_t len = 0;
  };

  static void workerTask(void *arg);
  esp_err_t post(const char *body, size_t len);

  ChatForwarderConfig m_cfg;
  bool m_inited = false;

  QueueHandle_t m_queue = nullptr;
  TaskHandle_t m_task = nullptr;
  std::atomic<bool> m_running{false};
  std::atomic<bool> m_exited{false};

  std::atomic<uint32_t> m_sent{0};
  std::atomic<uint32_t> m_failed{0};
};
