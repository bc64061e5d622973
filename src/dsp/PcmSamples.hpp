#pragma once

#include <cstdint>
#include <cstring>

// Little-endian sample access on raw PCM bytes.

inline int16_t readPcm16(const uint8_t* p) {
  return static_cast<int16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
}

inline void writePcm16(uint8_t* p, int16_t v) {
  const uint16_t u = static_cast<uint16_t>(v);
  p[0] = static_cast<uint8_t>(u & 0xFFu);
  p[1] = static_cast<uint8_t>(u >> 8);
}

inline float readFloat32(const uint8_t* p) {
  const uint32_t u = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                     (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
  float f;
  std::memcpy(&f, &u, sizeof(f));
  return f;
}

inline void writeFloat32(uint8_t* p, float f) {
  uint32_t u;
  std::memcpy(&u, &f, sizeof(u));
  p[0] = static_cast<uint8_t>(u & 0xFFu);
  p[1] = static_cast<uint8_t>((u >> 8) & 0xFFu);
  p[2] = static_cast<uint8_t>((u >> 16) & 0xFFu);
  p[3] = static_cast<uint8_t>(u >> 24);
}

inline int16_t clampToPcm16(double v) {
  if (v > 32767.0) return 32767;
  if (v < -32768.0) return -32768;
  return static_cast<int16_t>(v); // truncates toward zero
}

inline float clampUnit(double v) {
  if (v > 1.0) return 1.0f;
  if (v < -1.0) return -1.0f;
  return static_cast<float>(v);
}
