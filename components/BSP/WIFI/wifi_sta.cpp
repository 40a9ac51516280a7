#include "wifi_sta.h"

#include "esp_log.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

static const char *TAG = "WifiStation";

WifiStation &WifiStation::instance() {
  static WifiStation instance;
  return instance;
}

// ============================================================================
// 事件处理
// ============================================================================
void WifiStation::eventHandler(void *arg, esp_event_base_t eventBase,
                               int32_t eventId, void *eventData) {
  auto *self = static_cast<WifiStation *>(arg);

  if (eventBase == WIFI_EVENT) {
    self->handleWifiEvent(eventId);
  } else if (eventBase == IP_EVENT) {
    self->handleIpEvent(eventId, eventData);
  }
}

void WifiStation::handleWifiEvent(int32_t eventId) {
  switch (eventId) {
  case WIFI_EVENT_STA_START:
    ESP_LOGI(TAG, "STA started, connecting to %s...", m_ssid.c_str());
    m_state = WifiState::Connecting;
    esp_wifi_connect();
    break;

  case WIFI_EVENT_STA_DISCONNECTED:
    if (!m_connecting) {
      // 已连接后掉线：只记录状态，会话层会收到 socket 错误
      ESP_LOGW(TAG, "Disconnected from %s", m_ssid.c_str());
      m_state = WifiState::Disconnected;
      break;
    }
    if (m_retryCount < m_cfg.max_retry) {
      esp_wifi_connect();
      m_retryCount++;
      ESP_LOGI(TAG, "Retry connecting (%d/%d)", m_retryCount, m_cfg.max_retry);
    } else {
      m_state = WifiState::Failed;
      xEventGroupSetBits(m_eventGroup, FAIL_BIT);
      ESP_LOGE(TAG, "Failed to connect after %d attempts", m_cfg.max_retry);
    }
    break;

  default:
    break;
  }
}

void WifiStation::handleIpEvent(int32_t eventId, void *eventData) {
  if (eventId != IP_EVENT_STA_GOT_IP) {
    return;
  }
  auto *event = static_cast<ip_event_got_ip_t *>(eventData);
  m_ipAddr = event->ip_info.ip;
  ESP_LOGI(TAG, "Got IP: " IPSTR, IP2STR(&m_ipAddr));

  m_retryCount = 0;
  m_state = WifiState::Connected;
  xEventGroupSetBits(m_eventGroup, CONNECTED_BIT);
}

// ============================================================================
// 公共方法
// ============================================================================
esp_err_t WifiStation::init(const WifiStationConfig &cfg) {
  if (m_initialized) {
    ESP_LOGW(TAG, "Already initialized");
    return ESP_OK;
  }
  m_cfg = cfg;

  m_eventGroup = xEventGroupCreate();
  if (!m_eventGroup) {
    ESP_LOGE(TAG, "Failed to create event group");
    return ESP_ERR_NO_MEM;
  }

  m_netif = esp_netif_create_default_wifi_sta();
  if (!m_netif) {
    ESP_LOGE(TAG, "Failed to create netif");
    return ESP_FAIL;
  }

  wifi_init_config_t initCfg = WIFI_INIT_CONFIG_DEFAULT();
  esp_err_t ret = esp_wifi_init(&initCfg);
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_init failed: %s", esp_err_to_name(ret));
    return ret;
  }

  ret = esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID,
                                            &eventHandler, this, nullptr);
  if (ret == ESP_OK) {
    ret = esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP,
                                              &eventHandler, this, nullptr);
  }
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "Event handler register failed: %s", esp_err_to_name(ret));
    return ret;
  }

  m_initialized = true;
  ESP_LOGI(TAG, "WiFi initialized");
  return ESP_OK;
}

esp_err_t WifiStation::connect(const std::string &ssid,
                               const std::string &password) {
  if (!m_initialized) {
    ESP_LOGE(TAG, "Not initialized, call init() first");
    return ESP_ERR_INVALID_STATE;
  }
  if (ssid.empty()) {
    ESP_LOGE(TAG, "SSID not configured");
    return ESP_ERR_INVALID_ARG;
  }

  m_ssid = ssid;
  m_retryCount = 0;
  m_connecting = true;
  xEventGroupClearBits(m_eventGroup, CONNECTED_BIT | FAIL_BIT);

  wifi_config_t wifiConfig = {};
  std::memcpy(wifiConfig.sta.ssid, ssid.c_str(),
              std::min(ssid.size(), sizeof(wifiConfig.sta.ssid) - 1));
  std::memcpy(wifiConfig.sta.password, password.c_str(),
              std::min(password.size(), sizeof(wifiConfig.sta.password) - 1));
  wifiConfig.sta.threshold.authmode =
      password.empty() ? WIFI_AUTH_OPEN : WIFI_AUTH_WPA2_PSK;
  wifiConfig.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;

  esp_err_t ret = esp_wifi_set_mode(WIFI_MODE_STA);
  if (ret == ESP_OK) {
    ret = esp_wifi_set_config(WIFI_IF_STA, &wifiConfig);
  }
  if (ret == ESP_OK) {
    ret = esp_wifi_start();
  }
  if (ret != ESP_OK) {
    m_connecting = false;
    ESP_LOGE(TAG, "WiFi start failed: %s", esp_err_to_name(ret));
    return ret;
  }

  ESP_LOGI(TAG, "Waiting for connection to %s...", ssid.c_str());
  EventBits_t bits = xEventGroupWaitBits(
      m_eventGroup, CONNECTED_BIT | FAIL_BIT, pdFALSE, pdFALSE,
      pdMS_TO_TICKS(m_cfg.connect_timeout_ms));
  m_connecting = false;

  if (bits & CONNECTED_BIT) {
    ESP_LOGI(TAG, "Connected to %s", ssid.c_str());
    return ESP_OK;
  }
  if (bits & FAIL_BIT) {
    ESP_LOGE(TAG, "Failed to connect to %s", ssid.c_str());
    return ESP_FAIL;
  }

  m_state = WifiState::Failed;
  ESP_LOGE(TAG, "Connect to %s timed out (%d ms)", ssid.c_str(),
           m_cfg.connect_timeout_ms);
  return ESP_ERR_TIMEOUT;
}

std::string WifiStation::getIpAddress() const {
  if (!isConnected()) {
    return "";
  }
  char buf[16];
  snprintf(buf, sizeof(buf), IPSTR, IP2STR(&m_ipAddr));
  return std::string(buf);
}

const char *GetWifiStateName(WifiState state) {
  switch (state) {
  case WifiState::Disconnected: return "Disconnected";
  case WifiState::Connecting:   return "Connecting";
  case WifiState::Connected:    return "Connected";
  case WifiState::Failed:       return "Failed";
  default:                      return "Invalid";
  }
}
