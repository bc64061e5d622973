#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include "PcmFrameAssembler.hpp"
#include "WebSocketNode.hpp"

// Text-to-speech over a socket. Requests go out as {"text": ...}; binary frames are synthesized
// PCM in outputFormat() and are propagated downstream as they arrive.
class TextToSpeechNode : public WebSocketNode {
public:
  TextToSpeechNode(std::string id, std::string name, std::string endpoint = {});
  ~TextToSpeechNode() override;

  const char* typeName() const override { return "text_to_speech"; }
  CapabilitySet capabilities() const override { return {Capability::AudioOutput, Capability::Streaming}; }

  void configure(const nlohmann::json& config) override;
  std::optional<AudioFormat> outputFormat() const override;
  void setOutputFormat(const AudioFormat& f);
  AudioBufferPtr audioOutput(ProcessingContext& context) override;
  bool acceptText(const std::string& text, ProcessingContext& context) override;

  void speakText(const std::string& text);
  bool isSpeaking() const { return speaking_.load(std::memory_order_acquire); }

protected:
  void onMessageReceived(const std::vector<uint8_t>& data, MessageKind kind, bool isFinal, ProcessingContext& context) override;
  void onReset() override;

private:
  mutable std::mutex audioMutex_;
  AudioBufferPtr lastAudio_{};
  PcmFrameAssembler assembler_;
  std::atomic<bool> speaking_{false};
};
