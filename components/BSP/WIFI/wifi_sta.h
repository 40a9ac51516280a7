#pragma once

#include "esp_event.h"
#include "esp_netif.h"
#include "esp_wifi.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"

#include <atomic>
#include <string>

enum class WifiState { Disconnected = 0, Connecting, Connected, Failed };

struct WifiStationConfig {
  int max_retry = 5;
  int connect_timeout_ms = 15000;
};

/**
 * @brief Wi-Fi Station
 *
 * 单例：ESP32 只有一个 Wi-Fi 硬件。NVS 与默认事件循环由调用方先初始化。
 * 不做断线重连，连接丢失后状态变为 Disconnected。
 *
 * @example
 *   auto &wifi = WifiStation::instance();
 *   wifi.init({.max_retry = 5, .connect_timeout_ms = 15000});
 *   if (wifi.connect(ssid, pass) == ESP_OK) {
 *     ESP_LOGI(TAG, "IP: %s", wifi.getIpAddress().c_str());
 *   }
 */
class WifiStation {
public:
  static WifiStation &instance();

  WifiStation(const WifiStation &) = delete;
  WifiStation &operator=(const WifiStation &) = delete;

  esp_err_t init(const WifiStationConfig &cfg = WifiStationConfig());

  /**
   * @brief 连接（阻塞，最多 connect_timeout_ms）
   * @return ESP_OK / ESP_ERR_TIMEOUT / ESP_FAIL
   */
  esp_err_t connect(const std::string &ssid, const std::string &password);

  WifiState getState() const { return m_state.load(); }
  bool isConnected() const { return getState() == WifiState::Connected; }
  std::string getIpAddress() const;

private:
  WifiStation() = default;
  ~WifiStation() = default;

  static void eventHandler(void *arg, esp_event_base_t eventBase,
                           int32_t eventId, void *eventData);
  void handleWifiEvent(int32_t eventId);
  void handleIpEvent(int32_t eventId, void *eventData);

  WifiStationConfig m_cfg;
  bool m_initialized = false;
  bool m_connecting = false;
  std::atomic<WifiState> m_state{WifiState::Disconnected};
  std::string m_ssid;
  int m_retryCount = 0;

  esp_netif_t *m_netif = nullptr;
  EventGroupHandle_t m_eventGroup = nullptr;
  esp_ip4_addr_t m_ipAddr = {};

  static constexpr int CONNECTED_BIT = BIT0;
  static constexpr int FAIL_BIT = BIT1;
};

const char *GetWifiStateName(WifiState state);
