#include "app_config.h"

#include "esp_log.h"
#include "nvs.h"

#include <cstring>

static const char *TAG = "AppConfig";

static constexpr const char *kNvsNamespace = "voice_cfg";
static constexpr const char *kKeyWifiSsid = "wifi_ssid";
static constexpr const char *kKeyWifiPass = "wifi_pass";
static constexpr const char *kKeyTokenUrl = "token_url";
static constexpr const char *kKeyChatUrl = "chat_url";
static constexpr const char *kKeySilenceMs = "silence_ms";
static constexpr const char *kKeySafety = "safety";
static constexpr const char *kKeyMicRate = "mic_rate";

// 静音阈值合法范围
static constexpr uint32_t kMinSilenceMs = 1000;
static constexpr uint32_t kMaxSilenceMs = 30000;

static void readString(nvs_handle_t h, const char *key, std::string &out) {
  size_t len = 0;
  esp_err_t ret = nvs_get_str(h, key, nullptr, &len);
  if (ret != ESP_OK || len <= 1) {
    return;
  }
  std::string value(len, '\0');
  if (nvs_get_str(h, key, &value[0], &len) == ESP_OK) {
    // nvs_get_str writes trailing '\0'
    value.resize(std::strlen(value.c_str()));
    out = value;
  }
}

esp_err_t loadAppConfig(AppConfig &cfg) {
  nvs_handle_t h;
  esp_err_t ret = nvs_open(kNvsNamespace, NVS_READONLY, &h);
  if (ret == ESP_ERR_NVS_NOT_FOUND) {
    ESP_LOGI(TAG, "No saved config, using defaults");
    return ESP_OK;
  }
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "nvs_open failed: %s", esp_err_to_name(ret));
    return ret;
  }

  readString(h, kKeyWifiSsid, cfg.wifi_ssid);
  readString(h, kKeyWifiPass, cfg.wifi_pass);
  readString(h, kKeyTokenUrl, cfg.token_url);
  readString(h, kKeyChatUrl, cfg.chat_url);

  uint32_t silence = 0;
  if (nvs_get_u32(h, kKeySilenceMs, &silence) == ESP_OK) {
    if (silence >= kMinSilenceMs && silence <= kMaxSilenceMs) {
      cfg.silence_ms = silence;
    } else {
      ESP_LOGW(TAG, "silence_ms=%u out of range, keep %u", (unsigned)silence,
               (unsigned)cfg.silence_ms);
    }
  }

  uint8_t safety = 0;
  if (nvs_get_u8(h, kKeySafety, &safety) == ESP_OK) {
    cfg.content_safety = safety != 0;
  }

  uint32_t rate = 0;
  if (nvs_get_u32(h, kKeyMicRate, &rate) == ESP_OK && rate > 0) {
    cfg.mic_rate = rate;
  }

  nvs_close(h);

  ESP_LOGI(TAG, "Config: ssid=%s token_url=%s chat_url=%s silence=%u ms safety=%d mic=%u Hz",
           cfg.wifi_ssid.empty() ? "(none)" : cfg.wifi_ssid.c_str(),
           cfg.token_url.c_str(), cfg.chat_url.c_str(),
           (unsigned)cfg.silence_ms, cfg.content_safety ? 1 : 0,
           (unsigned)cfg.mic_rate);
  return ESP_OK;
}
