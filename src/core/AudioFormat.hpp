#pragma once

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

// Describes raw PCM layout. Value type: no mutators after construction.
class AudioFormat {
public:
  AudioFormat() = default;
  AudioFormat(uint32_t sampleRate, uint16_t channels, uint16_t bitsPerSample, bool isFloat = false)
  : sampleRate_(sampleRate), channels_(channels), bitsPerSample_(bitsPerSample), isFloat_(isFloat) {
    if (sampleRate_ == 0) throw std::invalid_argument("AudioFormat: sampleRate must be > 0");
    if (channels_ == 0) throw std::invalid_argument("AudioFormat: channels must be > 0");
    if (bitsPerSample_ != 16 && bitsPerSample_ != 24 && bitsPerSample_ != 32) {
      throw std::invalid_argument("AudioFormat: bitsPerSample must be 16, 24 or 32");
    }
    if (isFloat_ && bitsPerSample_ != 32) throw std::invalid_argument("AudioFormat: float samples must be 32-bit");
  }

  static AudioFormat defaultFormat() { return AudioFormat(16000, 1, 16, false); }
  static AudioFormat cdQuality() { return AudioFormat(44100, 2, 16, false); }
  static AudioFormat highQuality() { return AudioFormat(48000, 2, 24, false); }
  static AudioFormat float32(uint32_t sampleRate, uint16_t channels) { return AudioFormat(sampleRate, channels, 32, true); }

  uint32_t sampleRate() const { return sampleRate_; }
  uint16_t channels() const { return channels_; }
  uint16_t bitsPerSample() const { return bitsPerSample_; }
  bool isFloat() const { return isFloat_; }

  uint32_t bytesPerSample() const { return bitsPerSample_ / 8u; }
  uint32_t frameSize() const { return static_cast<uint32_t>(channels_) * bytesPerSample(); }
  uint32_t bytesPerSecond() const { return sampleRate_ * frameSize(); }

  bool isPcm16() const { return !isFloat_ && bitsPerSample_ == 16; }
  bool isFloat32() const { return isFloat_ && bitsPerSample_ == 32; }

  std::string toString() const {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%uHz, %uch, %u-bit%s", sampleRate_, static_cast<unsigned>(channels_),
                  static_cast<unsigned>(bitsPerSample_), isFloat_ ? " float" : "");
    return std::string(buf);
  }

  bool operator==(const AudioFormat& o) const {
    return sampleRate_ == o.sampleRate_ && channels_ == o.channels_ &&
           bitsPerSample_ == o.bitsPerSample_ && isFloat_ == o.isFloat_;
  }
  bool operator!=(const AudioFormat& o) const { return !(*this == o); }

private:
  uint32_t sampleRate_ = 16000;
  uint16_t channels_ = 1;
  uint16_t bitsPerSample_ = 16;
  bool isFloat_ = false;
};
