#pragma once

#include <cstdint>
#include <mutex>
#include <vector>
#include "../core/AudioBuffer.hpp"

// Re-aligns streamed PCM fragments to whole frames; a trailing partial frame is held back.
class PcmFrameAssembler {
public:
  explicit PcmFrameAssembler(AudioFormat format) : format_(format) {}

  void setFormat(const AudioFormat& f) {
    std::lock_guard<std::mutex> lk(m_);
    format_ = f;
    pending_.clear();
  }

  // Returns null when no whole frame is available yet.
  AudioBufferPtr push(const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lk(m_);
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
    const size_t frame = format_.frameSize();
    const size_t whole = (pending_.size() / frame) * frame;
    if (whole == 0) return nullptr;
    std::vector<uint8_t> out(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(whole));
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(whole));
    return makeAudioBuffer(std::move(out), format_);
  }

  size_t pendingBytes() const { std::lock_guard<std::mutex> lk(m_); return pending_.size(); }
  void clear() { std::lock_guard<std::mutex> lk(m_); pending_.clear(); }

private:
  mutable std::mutex m_;
  AudioFormat format_;
  std::vector<uint8_t> pending_{};
};
