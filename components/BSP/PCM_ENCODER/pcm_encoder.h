#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

static constexpr int kStreamSampleRate = 16000;
static constexpr size_t kFrameSamples = 1600; // 100 ms @ 16 kHz

/**
 * @brief float [-1,1] -> PCM16，超范围先截断
 *
 * 负数乘 0x8000，非负数乘 0x7FFF，向零取整。
 */
int16_t floatToPcm16(float x);

/**
 * @brief I2S 32 位槽（24 位数据左对齐）-> float
 */
float i2sSampleToFloat(int32_t raw);

/**
 * @brief 批量转换，返回写入的样本数
 */
size_t encodePcm16(const float *in, size_t n, int16_t *out);

/**
 * @brief 线性插值重采样
 *
 * 跨调用保存小数位置和上一块的最后一个样本，分块处理与整段处理结果一致。
 * 输入输出采样率相同时直接拷贝。
 */
class LinearResampler {
public:
  void configure(int inRate, int outRate);
  void reset();

  /**
   * @brief 处理 n 个输入样本最多产生的输出样本数（用于分配缓冲）
   */
  size_t outputSamples(size_t n) const;

  /**
   * @brief 重采样一块数据
   * @param out 至少 outputSamples(n) 个元素
   * @return 实际输出样本数
   */
  size_t process(const float *in, size_t n, float *out);

  bool isIdentity() const { return m_identity; }

private:
  double m_step = 1.0; // 每个输出样本前进的输入样本数
  double m_pos = 0.0;  // 下一个输出在当前块中的位置，-1 表示上一块最后一个样本
  float m_last = 0.0f;
  bool m_identity = true;
};

/**
 * @brief 把连续 PCM16 样本切成定长帧
 *
 * 只输出完整帧；flush() 丢弃不足一帧的尾部。
 */
class FrameAssembler {
public:
  using FrameCallback = std::function<void(const int16_t *, size_t)>;

  explicit FrameAssembler(size_t frameSamples = kFrameSamples);

  /**
   * @return 本次调用输出的帧数
   */
  size_t push(const int16_t *samples, size_t n, const FrameCallback &emit);

  void flush() { m_fill = 0; }
  size_t pending() const { return m_fill; }
  size_t frameSamples() const { return m_frame.size(); }

private:
  std::vector<int16_t> m_frame;
  size_t m_fill = 0;
};
