#pragma once

#include <string>
#include <vector>
#include "../core/AudioBuffer.hpp"
#include "../core/Errors.hpp"
#include "../core/ProcessingContext.hpp"
#include "PcmSamples.hpp"

// Linear conversion between 16-bit integer PCM and 32-bit float at the same rate and channel count.
inline AudioBuffer convertFormat(const AudioBuffer& source, const AudioFormat& target) {
  const AudioFormat& src = source.format();
  if (src == target) return source;
  if (src.sampleRate() != target.sampleRate() || src.channels() != target.channels()) {
    throw UnsupportedConversion("Unsupported conversion " + src.toString() + " -> " + target.toString() +
                                ": resampling and channel remapping are not supported");
  }
  const std::vector<uint8_t>& in = source.bytes();
  std::vector<uint8_t> out;
  if (src.isPcm16() && target.isFloat32()) {
    const size_t samples = in.size() / 2;
    out.assign(samples * 4, 0);
    for (size_t i = 0; i < samples; ++i) {
      const double s = static_cast<double>(readPcm16(&in[i * 2])) / 32768.0;
      writeFloat32(&out[i * 4], clampUnit(s));
    }
  } else if (src.isFloat32() && target.isPcm16()) {
    const size_t samples = in.size() / 4;
    out.assign(samples * 2, 0);
    for (size_t i = 0; i < samples; ++i) {
      const double f = static_cast<double>(clampUnit(readFloat32(&in[i * 4])));
      writePcm16(&out[i * 2], clampToPcm16(f * 32767.0));
    }
  } else {
    throw UnsupportedConversion("Unsupported conversion " + src.toString() + " -> " + target.toString());
  }
  AudioBuffer result(std::move(out), target);
  result.metadata() = source.metadata();
  return result;
}

// Best-effort variant for nodes: on an unsupported pairing the input is returned and a warning logged.
inline AudioBufferPtr convertOrKeep(const AudioBufferPtr& source, const AudioFormat& target, ProcessingContext& context) {
  if (!source || source->format() == target) return source;
  try {
    return std::make_shared<const AudioBuffer>(convertFormat(*source, target));
  } catch (const UnsupportedConversion& e) {
    context.logWarning(e.what());
    return source;
  }
}
