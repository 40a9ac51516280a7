#pragma once

#include "driver/gpio.h"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <atomic>
#include <functional>

struct PushButtonConfig {
  gpio_num_t pin = GPIO_NUM_0;
  bool active_high = true; // VCC 接按键，内部下拉
  int poll_ms = 20;
  int debounce_ms = 40;
  int long_press_ms = 800;
  int task_stack = 3072;
  int task_prio = 3;
};

/**
 * @brief 轮询式按键：短按 / 长按（松开时判定）
 *
 * 回调在按键任务里执行，应当只做投递命令之类的轻量操作。
 */
class PushButton {
public:
  using PressCallback = std::function<void()>;

  PushButton() = default;
  ~PushButton();

  PushButton(const PushButton &) = delete;
  PushButton &operator=(const PushButton &) = delete;

  esp_err_t start(const PushButtonConfig &cfg);
  void stop();

  void setOnShortPress(PressCallback cb) { m_onShort = std::move(cb); }
  void setOnLongPress(PressCallback cb) { m_onLong = std::move(cb); }

private:
  static void pollTask(void *arg);
  bool isPressed() const;

  PushButtonConfig m_cfg;
  PressCallback m_onShort;
  PressCallback m_onLong;

  TaskHandle_t m_task = nullptr;
  std::atomic<bool> m_running{false};
  std::atomic<bool> m_exited{true};
};
