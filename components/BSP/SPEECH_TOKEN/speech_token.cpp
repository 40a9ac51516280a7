#include "speech_token.h"

#include "esp_http_client.h"
#include "esp_log.h"
#include "transcript_protocol.h"

#include <algorithm>
#include <string>

static const char *TAG = "SpeechToken";

namespace {
static std::string statusMessage(int status) {
  return "Failed to get API key (" + std::to_string(status) + ")";
}

static esp_err_t readBody(esp_http_client_handle_t client, std::string &body,
                          size_t maxBytes) {
  body.clear();
  char chunk[512];
  while (true) {
    int r = esp_http_client_read(client, chunk, sizeof(chunk));
    if (r < 0) {
      return ESP_FAIL;
    }
    if (r == 0) {
      return ESP_OK;
    }
    if (body.size() + (size_t)r > maxBytes) {
      return ESP_ERR_NO_MEM;
    }
    body.append(chunk, (size_t)r);
  }
}
} // namespace

esp_err_t SpeechTokenClient::init(const SpeechTokenConfig &cfg) {
  if (cfg.url.empty()) {
    return ESP_ERR_INVALID_ARG;
  }
  m_cfg = cfg;
  m_inited = true;
  return ESP_OK;
}

esp_err_t SpeechTokenClient::fetch(SpeechToken &out) {
  out = SpeechToken();
  if (!m_inited) {
    out.message = "Failed to start speech recognition.";
    return ESP_ERR_INVALID_STATE;
  }

  ESP_LOGI(TAG, "POST %s", m_cfg.url.c_str());

  esp_http_client_config_t cfg = {};
  cfg.url = m_cfg.url.c_str();
  cfg.method = HTTP_METHOD_POST;
  cfg.timeout_ms = m_cfg.timeout_ms;

  esp_http_client_handle_t client = esp_http_client_init(&cfg);
  if (!client) {
    out.message = "Failed to start speech recognition.";
    return ESP_ERR_NO_MEM;
  }

  esp_http_client_set_header(client, "Accept", "application/json");

  esp_err_t err = esp_http_client_open(client, 0);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "http open failed: %s", esp_err_to_name(err));
    esp_http_client_cleanup(client);
    out.message = "Failed to start speech recognition.";
    return err;
  }

  esp_http_client_fetch_headers(client);
  out.status = esp_http_client_get_status_code(client);

  std::string body;
  const size_t maxBytes = (size_t)std::max(256, m_cfg.max_response_bytes);
  esp_err_t readErr = readBody(client, body, maxBytes);

  esp_http_client_close(client);
  esp_http_client_cleanup(client);

  if (out.status != 200) {
    std::string serverError = parseErrorField(body.data(), body.size());
    out.message = serverError.empty() ? statusMessage(out.status) : serverError;
    ESP_LOGE(TAG, "token http status=%d: %s", out.status, out.message.c_str());
    return ESP_FAIL;
  }

  if (readErr != ESP_OK) {
    ESP_LOGE(TAG, "token read failed: %s", esp_err_to_name(readErr));
    out.message = statusMessage(out.status);
    return readErr;
  }

  if (!parseSpeechTokenResponse(body.data(), body.size(), out.apiKey)) {
    ESP_LOGE(TAG, "token response missing apiKey (len=%u)",
             (unsigned)body.size());
    out.message = "Speech token response missing apiKey";
    return ESP_ERR_INVALID_RESPONSE;
  }

  ESP_LOGI(TAG, "Speech token received");
  return ESP_OK;
}
