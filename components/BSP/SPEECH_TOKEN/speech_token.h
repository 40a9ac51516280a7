#pragma once

#include "esp_err.h"
#include <string>

/**
 * @brief 语音识别凭证接口配置
 *
 * 服务端持有真正的 API Key，设备每次开始会话前 POST 一次换取临时凭证。
 */
struct SpeechTokenConfig {
  /**
   * @brief Token URL，例如: http://192.168.1.10:8000/api/speech-token
   *
   * POST 空 body；响应 {"apiKey": "..."}，失败时 {"error": "..."}。
   */
  std::string url;

  int timeout_ms = 10000;
  int max_response_bytes = 4096;
};

/**
 * @brief 获取结果
 */
struct SpeechToken {
  std::string apiKey;
  int status = 0;      ///< HTTP 状态码，传输失败为 0
  std::string message; ///< 失败时面向用户的文案
};

class SpeechTokenClient {
public:
  esp_err_t init(const SpeechTokenConfig &cfg);

  /**
   * @brief 请求一次凭证（阻塞）
   * @return ESP_OK 时 out.apiKey 非空；其它情况 out.message 给出原因
   */
  esp_err_t fetch(SpeechToken &out);

private:
  SpeechTokenConfig m_cfg;
  bool m_inited = false;
};
