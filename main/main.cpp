#include "app_config.h"
#include "button.h"
#include "chat_forwarder.h"
#include "conversation_controller.h"
#include "esp_event.h"
#include "esp_log.h"
#include "esp_mac.h"
#include "esp_netif.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "nvs_flash.h"
#include "wifi_sta.h"
#include <stdio.h>
#include <string>

static const char *TAG = "main";

static ChatForwarder chatForwarder;
static ConversationController conversation;
static PushButton button;

static std::string makeDeviceId() {
  uint8_t mac[6] = {};
  if (esp_read_mac(mac, ESP_MAC_WIFI_STA) != ESP_OK) {
    return "voice-turn";
  }
  char buf[32];
  snprintf(buf, sizeof(buf), "voice-turn-%02x%02x%02x", mac[3], mac[4], mac[5]);
  return std::string(buf);
}

static void logStatus() {
  const ConversationSnapshot snap = conversation.snapshot();
  ESP_LOGI(TAG, "[%s] muted=%d pending=\"%s\" interim=\"%s\"",
           GetConversationStateName(snap.state), snap.isMuted ? 1 : 0,
           snap.transcript.c_str(), snap.interimTranscript.c_str());
  if (snap.autoSendCountdown) {
    ESP_LOGI(TAG, "  auto-send in %ds (%s)", *snap.autoSendCountdown,
             snap.autoSendReason.c_str());
  }
  if (snap.qualityMetrics.totalSamples > 0) {
    ESP_LOGI(TAG, "  quality: avg=%.2f samples=%d trend=%s",
             (double)snap.qualityMetrics.averageConfidence,
             snap.qualityMetrics.totalSamples,
             GetQualityTrendName(snap.qualityMetrics.trend));
    for (const auto &tip : snap.qualityMetrics.recommendations) {
      ESP_LOGI(TAG, "  tip: %s", tip.c_str());
    }
  }
  if (snap.currentSpeaker) {
    ESP_LOGI(TAG, "  speaker: %s", snap.currentSpeaker->c_str());
  }
  if (snap.sentiment) {
    ESP_LOGI(TAG, "  sentiment: %s", GetSentimentName(snap.sentiment->sentiment));
  }
  ESP_LOGI(TAG, "  forwarded=%u failed=%u", (unsigned)chatForwarder.sentCount(),
           (unsigned)chatForwarder.failedCount());
}

static void forwardUtterance(const std::string &text) {
  ESP_LOGI(TAG, "User: %s", text.c_str());
  esp_err_t err = chatForwarder.submit(text);
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "Forward dropped: %s", esp_err_to_name(err));
  }
}

extern "C" void app_main(void) {
  ESP_LOGI(TAG, "========================================");
  ESP_LOGI(TAG, "    连续语音对话");
  ESP_LOGI(TAG, "========================================");

  // NVS / netif / 事件循环失败时无法继续
  esp_err_t ret = nvs_flash_init();
  if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_ERROR_CHECK(nvs_flash_erase());
    ret = nvs_flash_init();
  }
  ESP_ERROR_CHECK(ret);
  ESP_ERROR_CHECK(esp_netif_init());
  ESP_ERROR_CHECK(esp_event_loop_create_default());

  AppConfig appCfg;
  ret = loadAppConfig(appCfg);
  if (ret != ESP_OK) {
    ESP_LOGW(TAG, "Config load failed (%s), using defaults", esp_err_to_name(ret));
  }

  auto &wifi = WifiStation::instance();
  ret = wifi.init({.max_retry = 5, .connect_timeout_ms = 15000});
  if (ret == ESP_OK) {
    ret = wifi.connect(appCfg.wifi_ssid, appCfg.wifi_pass);
  }
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "WiFi 不可用: %s", esp_err_to_name(ret));
    return;
  }

  ret = chatForwarder.init({
      .url = appCfg.chat_url,
      .device_id = makeDeviceId(),
      .timeout_ms = 15000,
      .queue_depth = 4,
  });
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "Chat forwarder init failed: %s", esp_err_to_name(ret));
    return;
  }

  ConversationConfig convCfg;
  convCfg.audio.sample_rate_hz = (int)appCfg.mic_rate;
  convCfg.link.options.content_safety = appCfg.content_safety;
  convCfg.turn.silence_threshold_ms = appCfg.silence_ms;
  convCfg.token.url = appCfg.token_url;

  ret = conversation.init(convCfg);
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "对话控制器初始化失败: %s", esp_err_to_name(ret));
    return;
  }

  conversation.setOnError([](ConversationErrorKind kind, const std::string &msg) {
    ESP_LOGE(TAG, "会话结束 (%s): %s", GetConversationErrorKindName(kind),
             msg.c_str());
  });

  // 短按静音 / 取消静音；长按立即发送，会话已结束时长按重新开始
  button.setOnShortPress([]() {
    esp_err_t err = conversation.toggleMute();
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "toggleMute: %s", esp_err_to_name(err));
    }
  });
  button.setOnLongPress([]() {
    esp_err_t err = conversation.stateMachine().isActive()
                        ? conversation.sendCurrentTranscript()
                        : conversation.startContinuousMode(forwardUtterance);
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "Long press: %s", esp_err_to_name(err));
    }
  });
  ret = button.start({.pin = GPIO_NUM_0, .active_high = false});
  if (ret != ESP_OK) {
    ESP_LOGW(TAG, "Button unavailable: %s", esp_err_to_name(ret));
  }

  ret = conversation.startContinuousMode(forwardUtterance);
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "连续对话启动失败: %s", esp_err_to_name(ret));
    return;
  }

  ESP_LOGI(TAG, "========================================");
  ESP_LOGI(TAG, "  系统已就绪!");
  ESP_LOGI(TAG, "  短按: 静音/取消静音  长按: 立即发送 / 重新开始");
  ESP_LOGI(TAG, "  静音阈值: %u ms", (unsigned)appCfg.silence_ms);
  ESP_LOGI(TAG, "========================================");

  while (1) {
    vTaskDelay(pdMS_TO_TICKS(5000));
    logStatus();
  }
}
