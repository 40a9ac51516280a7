#pragma once

#include "esp_err.h"

#include <cstdint>
#include <string>

/**
 * @brief 运行时配置
 *
 * 启动时从 NVS 命名空间 "voice_cfg" 读取，缺失的键使用下面的编译期默认值。
 */
struct AppConfig {
  std::string wifi_ssid;
  std::string wifi_pass;
  std::string token_url = "http://192.168.1.100:3000/api/speech-token";
  std::string chat_url = "http://192.168.1.100:3000/api/chat";
  uint32_t silence_ms = 5000;
  bool content_safety = false;
  uint32_t mic_rate = 16000;
};

/**
 * @brief 读取配置
 *
 * 需先完成 nvs_flash_init()。命名空间不存在时返回 ESP_OK 并保留默认值。
 */
esp_err_t loadAppConfig(AppConfig &cfg);

