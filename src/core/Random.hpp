#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>
#include <string>

// Process-wide RNG used for generated ids. Seeding makes ids reproducible in tests.
inline std::mt19937& globalRng() {
  static std::mt19937 rng{std::random_device{}()};
  return rng;
}

inline std::mutex& globalRngMutex() {
  static std::mutex m;
  return m;
}

inline void setGlobalSeed(uint32_t seed) {
  if (seed == 0) return;
  std::lock_guard<std::mutex> lk(globalRngMutex());
  globalRng().seed(seed);
}

inline uint32_t randomU32() {
  std::lock_guard<std::mutex> lk(globalRngMutex());
  return static_cast<uint32_t>(globalRng()());
}

// 8 lowercase hex digits.
inline std::string randomHex8() {
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", randomU32());
  return std::string(buf);
}

// Random RFC 4122 version-4 style identifier.
inline std::string generateUuid() {
  uint32_t w[4];
  {
    std::lock_guard<std::mutex> lk(globalRngMutex());
    for (auto& x : w) x = static_cast<uint32_t>(globalRng()());
  }
  w[1] = (w[1] & 0xFFFF0FFFu) | 0x00004000u;
  w[2] = (w[2] & 0x3FFFFFFFu) | 0x80000000u;
  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%04x%08x",
                w[0], w[1] >> 16, w[1] & 0xFFFFu, w[2] >> 16, w[2] & 0xFFFFu, w[3]);
  return std::string(buf);
}
