#include "chat_forwarder.h"

#include "cJSON.h"
#include "esp_http_client.h"
#include "esp_log.h"

#include <cstdlib>
#include <cstring>

static const char *TAG = "ChatForwarder";

ChatForwarder::~ChatForwarder() { deinit(); }

esp_err_t ChatForwarder::init(const ChatForwarderConfig &cfg) {
  if (m_inited) {
    return ESP_OK;
  }
  if (cfg.url.empty()) {
    return ESP_ERR_INVALID_ARG;
  }
  m_cfg = cfg;

  m_queue = xQueueCreate(m_cfg.queue_depth > 0 ? m_cfg.queue_depth : 4,
                         sizeof(ForwardEvent));
  if (!m_queue) {
    ESP_LOGE(TAG, "Failed to create queue");
    return ESP_ERR_NO_MEM;
  }

  m_running.store(true);
  m_exited.store(false);
  BaseType_t ok =
      xTaskCreatePinnedToCore(workerTask, "chat_forward", m_cfg.worker_stack,
                              this, m_cfg.worker_prio, &m_task,
                              m_cfg.worker_core);
  if (ok != pdPASS) {
    m_running.store(false);
    vQueueDelete(m_queue);
    m_queue = nullptr;
    ESP_LOGE(TAG, "Failed to create worker task");
    return ESP_FAIL;
  }

  m_inited = true;
  ESP_LOGI(TAG, "Init: url=%s", m_cfg.url.c_str());
  return ESP_OK;
}

void ChatForwarder::deinit() {
  if (!m_inited) {
    return;
  }
  m_running.store(false);

  // 空事件唤醒 worker 让它退出
  ForwardEvent wake{};
  xQueueSend(m_queue, &wake, pdMS_TO_TICKS(100));
  while (!m_exited.load()) {
    vTaskDelay(pdMS_TO_TICKS(10));
  }
  m_task = nullptr;

  ForwardEvent ev{};
  while (xQueueReceive(m_queue, &ev, 0) == pdTRUE) {
    free(ev.body);
  }
  vQueueDelete(m_queue);
  m_queue = nullptr;
  m_inited = false;
}

esp_err_t ChatForwarder::submit(const std::string &text) {
  if (!m_inited) {
    return ESP_ERR_INVALID_STATE;
  }
  if (text.empty()) {
    return ESP_ERR_INVALID_ARG;
  }

  cJSON *root = cJSON_CreateObject();
  if (!root) {
    return ESP_ERR_NO_MEM;
  }
  cJSON_AddStringToObject(root, "text", text.c_str());
  if (!m_cfg.device_id.empty()) {
    cJSON_AddStringToObject(root, "device_id", m_cfg.device_id.c_str());
  }
  char *str = cJSON_PrintUnformatted(root);
  cJSON_Delete(root);
  if (!str) {
    return ESP_ERR_NO_MEM;
  }

  ForwardEvent ev{};
  ev.body = str;
  ev.len = strlen(str);
  if (xQueueSend(m_queue, &ev, 0) != pdTRUE) {
    ESP_LOGW(TAG, "Queue full, drop utterance (%u bytes)", (unsigned)ev.len);
    cJSON_free(str);
    m_failed.fetch_add(1);
    return ESP_ERR_TIMEOUT;
  }
  return ESP_OK;
}

void ChatForwarder::workerTask(void *arg) {
  auto *self = static_cast<ChatForwarder *>(arg);
  ForwardEvent ev{};

  while (self->m_running.load()) {
    if (xQueueReceive(self->m_queue, &ev, portMAX_DELAY) != pdTRUE) {
      continue;
    }
    if (ev.body == nullptr) {
      continue;
    }

    esp_err_t err = self->post(ev.body, ev.len);
    if (err == ESP_OK) {
      self->m_sent.fetch_add(1);
    } else {
      self->m_failed.fetch_add(1);
    }
    cJSON_free(ev.body);
    ev = {};
  }

  self->m_exited.store(true);
  vTaskDelete(nullptr);
}

esp_err_t ChatForwarder::post(const char *body, size_t len) {
  ESP_LOGI(TAG, "POST %s (%u bytes)", m_cfg.url.c_str(), (unsigned)len);

  esp_http_client_config_t cfg = {};
  cfg.url = m_cfg.url.c_str();
  cfg.method = HTTP_METHOD_POST;
  cfg.timeout_ms = m_cfg.timeout_ms;

  esp_http_client_handle_t client = esp_http_client_init(&cfg);
  if (!client) {
    return ESP_ERR_NO_MEM;
  }

  esp_http_client_set_header(client, "Content-Type", "application/json");
  if (!m_cfg.device_id.empty()) {
    esp_http_client_set_header(client, "X-Device-Id", m_cfg.device_id.c_str());
  }
  esp_http_client_set_post_field(client, body, (int)len);

  esp_err_t err = esp_http_client_perform(client);
  int status = esp_http_client_get_status_code(client);
  esp_http_client_cleanup(client);

  if (err != ESP_OK) {
    ESP_LOGE(TAG, "chat http failed: %s", esp_err_to_name(err));
    return err;
  }
  if (status < 200 || status >= 300) {
    ESP_LOGE(TAG, "chat http status=%d", status);
    return ESP_FAIL;
  }
  return ESP_OK;
}
