#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "AudioFormat.hpp"

inline nlohmann::json audioFormatToJson(const AudioFormat& f) {
  return nlohmann::json{{"sampleRate", f.sampleRate()}, {"channels", f.channels()},
                        {"bitsPerSample", f.bitsPerSample()}, {"isFloat", f.isFloat()}};
}

// Missing fields fall back to the default 16 kHz mono 16-bit format.
inline AudioFormat audioFormatFromJson(const nlohmann::json& j) {
  const AudioFormat d = AudioFormat::defaultFormat();
  const bool isFloat = j.value("isFloat", false);
  return AudioFormat(j.value("sampleRate", d.sampleRate()),
                     j.value("channels", d.channels()),
                     j.value("bitsPerSample", static_cast<uint16_t>(isFloat ? 32 : d.bitsPerSample())),
                     isFloat);
}

inline std::vector<AudioFormat> audioFormatsFromJson(const nlohmann::json& arr) {
  std::vector<AudioFormat> out;
  if (!arr.is_array()) return out;
  for (const auto& e : arr) out.push_back(audioFormatFromJson(e));
  return out;
}

inline nlohmann::json audioFormatsToJson(const std::vector<AudioFormat>& formats) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& f : formats) arr.push_back(audioFormatToJson(f));
  return arr;
}
