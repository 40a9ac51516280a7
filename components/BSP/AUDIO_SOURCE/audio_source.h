#pragma once

#include "driver/i2s_std.h"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include "pcm_encoder.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

/**
 * @brief 麦克风打开失败的分类
 */
enum class AudioDeviceError {
  None,
  PermissionDenied, ///< I2S 通道被占用
  NotFound,         ///< 没有可用的 I2S 控制器
  Other,
};

/**
 * @brief I2S 麦克风配置（INMP441，L/R 接 GND 输出左声道）
 */
struct AudioSourceConfig {
  int port = 0;    /*!< I2S 端口号 */
  int bck_io = 41; /*!< I2S BCK GPIO */
  int ws_io = 42;  /*!< I2S WS GPIO */
  int din_io = 2;  /*!< I2S DIN GPIO */

  int sample_rate_hz = kStreamSampleRate; /*!< 硬件采样率，输出固定 16 kHz */
  size_t frame_samples = kFrameSamples;   /*!< 每帧样本数（16 kHz 下） */
  int read_chunk_samples = 512;           /*!< 单次 i2s_channel_read 样本数 */
  int read_timeout_ms = 100;

  int task_stack = 8192; // 帧回调里直接走 TLS 发送
  int task_prio = 6;
  int task_core = 1;
};

/**
 * @brief 麦克风采集：I2S 32 位 -> float -> 16 kHz -> PCM16 定长帧
 *
 * 帧回调在采集任务里执行，回调内不要阻塞。
 *
 * @example
 *   AudioSource mic;
 *   AudioDeviceError derr;
 *   mic.start({.bck_io = 41, .ws_io = 42, .din_io = 2},
 *             [](const int16_t *pcm, size_t n) { link.send(...); }, &derr);
 *   ...
 *   mic.stop();
 */
class AudioSource {
public:
  using FrameCallback = std::function<void(const int16_t *samples, size_t numSamples)>;

  AudioSource() = default;
  ~AudioSource();

  AudioSource(const AudioSource &) = delete;
  AudioSource &operator=(const AudioSource &) = delete;

  /**
   * @brief 打开 I2S 并启动采集任务
   * @param errOut 失败时写入错误分类，可为 nullptr
   */
  esp_err_t start(const AudioSourceConfig &cfg, FrameCallback onFrame,
                  AudioDeviceError *errOut = nullptr);

  /**
   * @brief 停止采集并释放 I2S 通道，可重复调用
   */
  void stop();

  bool isRunning() const { return m_running.load(); }

  static AudioDeviceError classifyError(esp_err_t err);

private:
  static void captureTask(void *arg);
  esp_err_t initI2s();
  void releaseI2s();
  void processChunk(const int32_t *raw, size_t n);

  AudioSourceConfig m_cfg;
  FrameCallback m_onFrame;

  i2s_chan_handle_t m_i2sRxHandle = nullptr;
  TaskHandle_t m_task = nullptr;
  SemaphoreHandle_t m_taskDone = nullptr;
  std::atomic<bool> m_running{false};

  LinearResampler m_resampler;
  FrameAssembler m_assembler;
  std::vector<float> m_floatBuf;
  std::vector<float> m_resampledBuf;
  std::vector<int16_t> m_pcmBuf;
};

const char *GetAudioDeviceErrorName(AudioDeviceError err);
