#include "pcm_encoder.h"

#include <algorithm>
#include <cmath>
#include <cstring>

int16_t floatToPcm16(float x) {
  if (std::isnan(x)) {
    return 0;
  }
  const float s = std::max(-1.0f, std::min(1.0f, x));
  if (s < 0.0f) {
    return (int16_t)(s * 32768.0f);
  }
  return (int16_t)(s * 32767.0f);
}

float i2sSampleToFloat(int32_t raw) {
  return (float)((double)raw / 2147483648.0);
}

size_t encodePcm16(const float *in, size_t n, int16_t *out) {
  if (in == nullptr || out == nullptr) {
    return 0;
  }
  for (size_t i = 0; i < n; i++) {
    out[i] = floatToPcm16(in[i]);
  }
  return n;
}

void LinearResampler::configure(int inRate, int outRate) {
  if (inRate <= 0 || outRate <= 0 || inRate == outRate) {
    m_identity = true;
    m_step = 1.0;
  } else {
    m_identity = false;
    m_step = (double)inRate / (double)outRate;
  }
  reset();
}

void LinearResampler::reset() {
  m_pos = 0.0;
  m_last = 0.0f;
}

size_t LinearResampler::outputSamples(size_t n) const {
  if (m_identity) {
    return n;
  }
  return (size_t)std::ceil((double)(n + 1) / m_step) + 1;
}

size_t LinearResampler::process(const float *in, size_t n, float *out) {
  if (in == nullptr || out == nullptr || n == 0) {
    return 0;
  }
  if (m_identity) {
    std::memcpy(out, in, n * sizeof(float));
    return n;
  }

  auto sampleAt = [&](long i) -> float { return i < 0 ? m_last : in[i]; };

  size_t produced = 0;
  const double end = (double)(n - 1);
  while (m_pos < end) {
    const double base = std::floor(m_pos);
    const long i0 = (long)base;
    const float frac = (float)(m_pos - base);
    const float a = sampleAt(i0);
    const float b = sampleAt(i0 + 1);
    out[produced++] = a + (b - a) * frac;
    m_pos += m_step;
  }

  // 位置平移到下一块坐标系，本块最后一个样本变成 -1
  m_pos -= (double)n;
  m_last = in[n - 1];
  return produced;
}

FrameAssembler::FrameAssembler(size_t frameSamples)
    : m_frame(frameSamples == 0 ? kFrameSamples : frameSamples, 0) {}

size_t FrameAssembler::push(const int16_t *samples, size_t n,
                            const FrameCallback &emit) {
  if (samples == nullptr) {
    return 0;
  }
  size_t frames = 0;
  size_t offset = 0;
  while (offset < n) {
    const size_t take = std::min(n - offset, m_frame.size() - m_fill);
    std::memcpy(m_frame.data() + m_fill, samples + offset,
                take * sizeof(int16_t));
    m_fill += take;
    offset += take;
    if (m_fill == m_frame.size()) {
      if (emit) {
        emit(m_frame.data(), m_frame.size());
      }
      m_fill = 0;
      frames++;
    }
  }
  return frames;
}
