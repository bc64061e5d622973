#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AudioFormat.hpp"

// Raw interleaved PCM bytes plus their format and free-form metadata.
class AudioBuffer {
public:
  AudioBuffer() = default;
  AudioBuffer(std::vector<uint8_t> bytes, AudioFormat format)
  : bytes_(std::move(bytes)), format_(format) {}

  const std::vector<uint8_t>& bytes() const { return bytes_; }
  std::vector<uint8_t>& mutableBytes() { return bytes_; }
  const AudioFormat& format() const { return format_; }
  size_t size() const { return bytes_.size(); }
  bool empty() const { return bytes_.empty(); }

  nlohmann::json& metadata() { return metadata_; }
  const nlohmann::json& metadata() const { return metadata_; }

  double durationSeconds() const {
    const uint32_t bps = format_.bytesPerSecond();
    return bps == 0 ? 0.0 : static_cast<double>(bytes_.size()) / static_cast<double>(bps);
  }

  // Whole frames only; a trailing partial frame is not counted.
  size_t frameCount() const { return bytes_.size() / format_.frameSize(); }
  const uint8_t* framePtr(size_t frameIndex) const { return bytes_.data() + frameIndex * format_.frameSize(); }
  uint8_t* framePtr(size_t frameIndex) { return bytes_.data() + frameIndex * format_.frameSize(); }

  // Deep copy (bytes and metadata).
  std::shared_ptr<AudioBuffer> clone() const { return std::make_shared<AudioBuffer>(*this); }

  AudioBuffer segment(size_t offset, size_t length) const {
    if (offset >= bytes_.size()) {
      throw std::out_of_range("AudioBuffer::segment: offset " + std::to_string(offset) +
                              " outside buffer of " + std::to_string(bytes_.size()) + " bytes");
    }
    if (length == 0 || length > bytes_.size() - offset) {
      throw std::out_of_range("AudioBuffer::segment: length " + std::to_string(length) +
                              " exceeds buffer bounds at offset " + std::to_string(offset));
    }
    AudioBuffer out(std::vector<uint8_t>(bytes_.begin() + static_cast<std::ptrdiff_t>(offset),
                                         bytes_.begin() + static_cast<std::ptrdiff_t>(offset + length)),
                    format_);
    out.metadata_ = metadata_;
    out.metadata_["originalOffset"] = offset;
    out.metadata_["originalLength"] = bytes_.size();
    return out;
  }

private:
  std::vector<uint8_t> bytes_{};
  AudioFormat format_{};
  nlohmann::json metadata_ = nlohmann::json::object();
};

// Buffers travel through the graph as shared, logically immutable values.
using AudioBufferPtr = std::shared_ptr<const AudioBuffer>;

inline AudioBufferPtr makeAudioBuffer(std::vector<uint8_t> bytes, AudioFormat format) {
  return std::make_shared<const AudioBuffer>(std::move(bytes), format);
}
