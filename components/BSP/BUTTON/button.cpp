#include "button.h"

#include "esp_log.h"

static const char *TAG = "PushButton";

PushButton::~PushButton() { stop(); }

esp_err_t PushButton::start(const PushButtonConfig &cfg) {
  if (m_running.load()) {
    return ESP_OK;
  }
  m_cfg = cfg;

  gpio_config_t conf = {.pin_bit_mask = (1ULL << m_cfg.pin),
                        .mode = GPIO_MODE_INPUT,
                        .pull_up_en = m_cfg.active_high ? GPIO_PULLUP_DISABLE
                                                        : GPIO_PULLUP_ENABLE,
                        .pull_down_en = m_cfg.active_high
                                            ? GPIO_PULLDOWN_ENABLE
                                            : GPIO_PULLDOWN_DISABLE,
                        .intr_type = GPIO_INTR_DISABLE};
  esp_err_t ret = gpio_config(&conf);
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "gpio_config(%d) failed: %s", (int)m_cfg.pin,
             esp_err_to_name(ret));
    return ret;
  }

  m_running.store(true);
  m_exited.store(false);
  if (xTaskCreate(pollTask, "button", m_cfg.task_stack, this, m_cfg.task_prio,
                  &m_task) != pdPASS) {
    m_running.store(false);
    m_exited.store(true);
    m_task = nullptr;
    ESP_LOGE(TAG, "Failed to create button task");
    return ESP_FAIL;
  }

  ESP_LOGI(TAG, "Button on GPIO %d (long press %d ms)", (int)m_cfg.pin,
           m_cfg.long_press_ms);
  return ESP_OK;
}

void PushButton::stop() {
  if (!m_task) {
    return;
  }
  m_running.store(false);
  while (!m_exited.load()) {
    vTaskDelay(pdMS_TO_TICKS(m_cfg.poll_ms));
  }
  m_task = nullptr;
}

bool PushButton::isPressed() const {
  const int level = gpio_get_level(m_cfg.pin);
  return m_cfg.active_high ? level == 1 : level == 0;
}

void PushButton::pollTask(void *arg) {
  auto *self = static_cast<PushButton *>(arg);
  const TickType_t period = pdMS_TO_TICKS(self->m_cfg.poll_ms);

  bool stable = false;
  int changedMs = 0; // 原始电平与稳定电平不一致的持续时间
  int heldMs = 0;

  while (self->m_running.load()) {
    vTaskDelay(period);

    const bool raw = self->isPressed();
    if (raw != stable) {
      changedMs += self->m_cfg.poll_ms;
      if (changedMs < self->m_cfg.debounce_ms) {
        continue;
      }
      stable = raw;
      changedMs = 0;

      if (stable) {
        heldMs = 0;
      } else if (heldMs >= self->m_cfg.long_press_ms) {
        ESP_LOGI(TAG, "Long press (%d ms)", heldMs);
        if (self->m_onLong) {
          self->m_onLong();
        }
      } else {
        ESP_LOGI(TAG, "Short press");
        if (self->m_onShort) {
          self->m_onShort();
        }
      }
      continue;
    }

    changedMs = 0;
    if (stable) {
      heldMs += self->m_cfg.poll_ms;
    }
  }

  self->m_exited.store(true);
  vTaskDelete(nullptr);
}
