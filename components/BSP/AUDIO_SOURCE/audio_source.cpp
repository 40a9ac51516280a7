#include "audio_source.h"

#include "esp_log.h"

#include <cstdlib>

static const char *TAG = "AudioSource";

AudioSource::~AudioSource() { stop(); }

AudioDeviceError AudioSource::classifyError(esp_err_t err) {
  switch (err) {
  case ESP_OK:
    return AudioDeviceError::None;
  case ESP_ERR_NOT_FOUND:
    return AudioDeviceError::NotFound;
  case ESP_ERR_INVALID_STATE:
    return AudioDeviceError::PermissionDenied;
  default:
    return AudioDeviceError::Other;
  }
}

esp_err_t AudioSource::start(const AudioSourceConfig &cfg,
                             FrameCallback onFrame, AudioDeviceError *errOut) {
  if (errOut) {
    *errOut = AudioDeviceError::None;
  }
  if (m_running.load()) {
    ESP_LOGW(TAG, "Already running");
    return ESP_OK;
  }
  if (cfg.sample_rate_hz <= 0 || cfg.read_chunk_samples <= 0 || !onFrame) {
    if (errOut) {
      *errOut = AudioDeviceError::Other;
    }
    return ESP_ERR_INVALID_ARG;
  }

  m_cfg = cfg;
  m_onFrame = std::move(onFrame);

  m_resampler.configure(m_cfg.sample_rate_hz, kStreamSampleRate);
  m_assembler = FrameAssembler(m_cfg.frame_samples);

  const size_t chunk = (size_t)m_cfg.read_chunk_samples;
  m_floatBuf.assign(chunk, 0.0f);
  m_resampledBuf.assign(m_resampler.outputSamples(chunk), 0.0f);
  m_pcmBuf.assign(m_resampledBuf.size(), 0);

  esp_err_t ret = initI2s();
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "I2S 初始化失败: %s", esp_err_to_name(ret));
    if (errOut) {
      *errOut = classifyError(ret);
    }
    releaseI2s();
    return ret;
  }

  if (!m_taskDone) {
    m_taskDone = xSemaphoreCreateBinary();
    if (!m_taskDone) {
      releaseI2s();
      if (errOut) {
        *errOut = AudioDeviceError::Other;
      }
      return ESP_ERR_NO_MEM;
    }
  }

  m_running.store(true);
  BaseType_t ok = xTaskCreatePinnedToCore(captureTask, "audio_capture",
                                          m_cfg.task_stack, this,
                                          m_cfg.task_prio, &m_task,
                                          m_cfg.task_core);
  if (ok != pdPASS) {
    m_running.store(false);
    m_task = nullptr;
    releaseI2s();
    ESP_LOGE(TAG, "Failed to create capture task");
    if (errOut) {
      *errOut = AudioDeviceError::Other;
    }
    return ESP_FAIL;
  }

  ESP_LOGI(TAG, "Capture started (hw=%d Hz, frame=%u samples)",
           m_cfg.sample_rate_hz, (unsigned)m_assembler.frameSamples());
  return ESP_OK;
}

void AudioSource::stop() {
  const bool wasRunning = m_running.exchange(false);

  if (m_task) {
    // 采集任务退出前会释放信号量
    if (xSemaphoreTake(m_taskDone, pdMS_TO_TICKS(m_cfg.read_timeout_ms * 10)) !=
        pdTRUE) {
      ESP_LOGW(TAG, "Capture task slow to exit, waiting");
      xSemaphoreTake(m_taskDone, portMAX_DELAY);
    }
    m_task = nullptr;
  }

  releaseI2s();
  m_assembler.flush();
  m_resampler.reset();

  if (m_taskDone) {
    vSemaphoreDelete(m_taskDone);
    m_taskDone = nullptr;
  }

  if (wasRunning) {
    ESP_LOGI(TAG, "Capture stopped");
  }
}

void AudioSource::captureTask(void *arg) {
  auto *self = static_cast<AudioSource *>(arg);

  const size_t chunk = (size_t)self->m_cfg.read_chunk_samples;
  int32_t *raw = (int32_t *)malloc(chunk * sizeof(int32_t));
  if (raw == nullptr) {
    ESP_LOGE(TAG, "无法分配音频缓冲区");
    self->m_running.store(false);
    xSemaphoreGive(self->m_taskDone);
    vTaskDelete(nullptr);
    return;
  }

  ESP_LOGI(TAG, "音频采集任务已启动, chunk size: %u", (unsigned)chunk);

  size_t bytesRead = 0;
  uint32_t failures = 0;
  while (self->m_running.load()) {
    esp_err_t ret = i2s_channel_read(self->m_i2sRxHandle, raw,
                                     chunk * sizeof(int32_t), &bytesRead,
                                     pdMS_TO_TICKS(self->m_cfg.read_timeout_ms));
    if (ret == ESP_OK && bytesRead > 0) {
      self->processChunk(raw, bytesRead / sizeof(int32_t));
      failures = 0;
    } else if (ret != ESP_ERR_TIMEOUT) {
      // 连续失败只打印一次
      if (failures++ == 0) {
        ESP_LOGW(TAG, "I2S 读取失败: ret=%s, bytesRead=%u",
                 esp_err_to_name(ret), (unsigned)bytesRead);
      }
    }
  }

  free(raw);
  ESP_LOGI(TAG, "音频采集任务已退出");
  xSemaphoreGive(self->m_taskDone);
  vTaskDelete(nullptr);
}

void AudioSource::processChunk(const int32_t *raw, size_t n) {
  for (size_t i = 0; i < n; i++) {
    m_floatBuf[i] = i2sSampleToFloat(raw[i]);
  }

  const size_t out = m_resampler.process(m_floatBuf.data(), n,
                                         m_resampledBuf.data());
  encodePcm16(m_resampledBuf.data(), out, m_pcmBuf.data());

  m_assembler.push(m_pcmBuf.data(), out,
                   [this](const int16_t *frame, size_t samples) {
                     if (m_onFrame) {
                       m_onFrame(frame, samples);
                     }
                   });
}

esp_err_t AudioSource::initI2s() {
  i2s_chan_config_t chanCfg =
      I2S_CHANNEL_DEFAULT_CONFIG((i2s_port_t)m_cfg.port, I2S_ROLE_MASTER);
  chanCfg.auto_clear = true;

  esp_err_t ret = i2s_new_channel(&chanCfg, nullptr, &m_i2sRxHandle);
  if (ret != ESP_OK) {
    m_i2sRxHandle = nullptr;
    return ret;
  }

  // INMP441 输出 24 位数据，放在 32 位槽里左对齐
  i2s_std_slot_config_t slotCfg = I2S_STD_PHILIPS_SLOT_DEFAULT_CONFIG(
      I2S_DATA_BIT_WIDTH_32BIT, I2S_SLOT_MODE_MONO);
  slotCfg.slot_mask = I2S_STD_SLOT_LEFT;

  i2s_std_config_t stdCfg = {
      .clk_cfg = I2S_STD_CLK_DEFAULT_CONFIG((uint32_t)m_cfg.sample_rate_hz),
      .slot_cfg = slotCfg,
      .gpio_cfg =
          {
              .mclk = I2S_GPIO_UNUSED,
              .bclk = (gpio_num_t)m_cfg.bck_io,
              .ws = (gpio_num_t)m_cfg.ws_io,
              .dout = I2S_GPIO_UNUSED,
              .din = (gpio_num_t)m_cfg.din_io,
              .invert_flags =
                  {
                      .mclk_inv = false,
                      .bclk_inv = false,
                      .ws_inv = false,
                  },
          },
  };

  ret = i2s_channel_init_std_mode(m_i2sRxHandle, &stdCfg);
  if (ret != ESP_OK) {
    return ret;
  }
  ret = i2s_channel_enable(m_i2sRxHandle);
  if (ret != ESP_OK) {
    return ret;
  }

  ESP_LOGI(TAG, "I2S 初始化完成 (BCK:%d, WS:%d, DIN:%d, %d Hz)", m_cfg.bck_io,
           m_cfg.ws_io, m_cfg.din_io, m_cfg.sample_rate_hz);
  return ESP_OK;
}

void AudioSource::releaseI2s() {
  if (m_i2sRxHandle) {
    // 未 enable 的通道 disable 会返回 INVALID_STATE，忽略即可
    esp_err_t ret = i2s_channel_disable(m_i2sRxHandle);
    if (ret != ESP_OK && ret != ESP_ERR_INVALID_STATE) {
      ESP_LOGW(TAG, "i2s_channel_disable: %s", esp_err_to_name(ret));
    }
    ret = i2s_del_channel(m_i2sRxHandle);
    if (ret != ESP_OK) {
      ESP_LOGW(TAG, "i2s_del_channel: %s", esp_err_to_name(ret));
    }
    m_i2sRxHandle = nullptr;
  }
}

const char *GetAudioDeviceErrorName(AudioDeviceError err) {
  switch (err) {
  case AudioDeviceError::None:             return "None";
  case AudioDeviceError::PermissionDenied: return "PermissionDenied";
  case AudioDeviceError::NotFound:         return "NotFound";
  case AudioDeviceError::Other:            return "Other";
  default:                                 return "Invalid";
  }
}
