#pragma once

#include <algorithm>
#include <stdexcept>
#include <vector>
#include "../core/AudioBuffer.hpp"
#include "../core/Errors.hpp"
#include "PcmSamples.hpp"

struct MixSource {
  const AudioBuffer* buffer = nullptr;
  double gain = 1.0;
};

// Shared mixing policy. Every source must carry the same format (16-bit int or 32-bit float).
// Shorter sources contribute silence past their end; with normalize, each sample is divided by
// the number of sources that had data at that offset. channelWeights applies only when sized to
// the channel count.
inline AudioBuffer mixSources(const std::vector<MixSource>& sources, const std::vector<double>& channelWeights, bool normalize) {
  if (sources.empty()) throw std::invalid_argument("mixSources: no sources");
  const AudioFormat fmt = sources.front().buffer->format();
  for (const auto& s : sources) {
    if (s.buffer->format() != fmt) {
      throw std::invalid_argument("mixSources: incompatible formats " + fmt.toString() + " and " + s.buffer->format().toString());
    }
  }
  if (!fmt.isPcm16() && !fmt.isFloat32()) {
    throw UnsupportedMixFormat("Mixing is only supported for 16-bit PCM and 32-bit float, got " + fmt.toString());
  }

  size_t maxLen = 0;
  for (const auto& s : sources) maxLen = std::max(maxLen, s.buffer->size());
  const size_t bps = fmt.bytesPerSample();
  const size_t channels = fmt.channels();
  const bool weighted = channelWeights.size() == channels;

  std::vector<uint8_t> out(maxLen, 0);
  for (size_t offset = 0; offset + bps <= maxLen; offset += bps) {
    const size_t ch = (offset / bps) % channels;
    const double weight = weighted ? channelWeights[ch] : 1.0;
    double sum = 0.0;
    size_t present = 0;
    for (const auto& s : sources) {
      const auto& bytes = s.buffer->bytes();
      if (offset + bps > bytes.size()) continue;
      const double sample = fmt.isFloat()
        ? static_cast<double>(readFloat32(&bytes[offset]))
        : static_cast<double>(readPcm16(&bytes[offset]));
      sum += sample * s.gain * weight;
      ++present;
    }
    if (present == 0) continue;
    if (normalize) sum /= static_cast<double>(present);
    if (fmt.isFloat()) writeFloat32(&out[offset], clampUnit(sum));
    else writePcm16(&out[offset], clampToPcm16(sum));
  }
  return AudioBuffer(std::move(out), fmt);
}

// Two-buffer utility: raw sum with explicit gains unless normalize is requested.
inline AudioBuffer mixAudio(const AudioBuffer& a, const AudioBuffer& b, double gainA = 1.0, double gainB = 1.0, bool normalize = false) {
  if (a.format() != b.format()) {
    throw std::invalid_argument("mixAudio: buffers are not format compatible (" + a.format().toString() +
                                " vs " + b.format().toString() + ")");
  }
  return mixSources({MixSource{&a, gainA}, MixSource{&b, gainB}}, {}, normalize);
}
