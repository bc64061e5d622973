#pragma once

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/AudioBuffer.hpp"
#include "../core/AudioFormat.hpp"

// Headerless PCM in, raw PCM or RIFF/WAV out.

inline std::shared_ptr<AudioBuffer> loadRawPcm(const std::string& path, const AudioFormat& format) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open PCM file: " + path);
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  const size_t frame = format.frameSize();
  if (bytes.size() % frame != 0) {
    std::fprintf(stderr, "Warning: %s: dropping %zu trailing byte(s) of a partial frame\n", path.c_str(), bytes.size() % frame);
    bytes.resize(bytes.size() - bytes.size() % frame);
  }
  auto buf = std::make_shared<AudioBuffer>(std::move(bytes), format);
  buf->metadata()["sourcePath"] = path;
  return buf;
}

inline void saveRawPcm(const std::string& path, const AudioBuffer& audio) {
  std::ofstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open for writing: " + path);
  f.write(reinterpret_cast<const char*>(audio.bytes().data()), static_cast<std::streamsize>(audio.size()));
  if (!f) throw std::runtime_error("Failed to write: " + path);
}

namespace wavdetail {
inline void put16(std::ostream& s, uint16_t v) {
  const char b[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
  s.write(b, 2);
}
inline void put32(std::ostream& s, uint32_t v) {
  const char b[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                     static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
  s.write(b, 4);
}
}

// 16/24/32-bit integer PCM (format tag 1) or 32-bit float (format tag 3).
inline void writeWavFile(const std::string& path, const AudioBuffer& audio) {
  const AudioFormat& fmt = audio.format();
  std::ofstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open for writing: " + path);
  const uint32_t dataBytes = static_cast<uint32_t>(audio.size());
  const uint32_t riffSize = 4U + 8U + 16U + 8U + dataBytes;
  f.write("RIFF", 4);
  wavdetail::put32(f, riffSize);
  f.write("WAVE", 4);
  f.write("fmt ", 4);
  wavdetail::put32(f, 16U);
  wavdetail::put16(f, fmt.isFloat() ? 3U : 1U);
  wavdetail::put16(f, fmt.channels());
  wavdetail::put32(f, fmt.sampleRate());
  wavdetail::put32(f, static_cast<uint32_t>(fmt.bytesPerSecond()));
  wavdetail::put16(f, static_cast<uint16_t>(fmt.frameSize()));
  wavdetail::put16(f, fmt.bitsPerSample());
  f.write("data", 4);
  wavdetail::put32(f, dataBytes);
  f.write(reinterpret_cast<const char*>(audio.bytes().data()), static_cast<std::streamsize>(dataBytes));
  if (!f) throw std::runtime_error("Failed to write: " + path);
}
