#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "HttpClient.hpp"
#include "PcmFrameAssembler.hpp"
#include "WebSocketNode.hpp"

// Full-duplex voice agent session. Before the socket opens, a call is created on a control-plane
// HTTP endpoint and its joinUrl becomes the socket endpoint. Input audio goes out as binary
// frames; received binary frames are agent speech, received text frames are transcripts.
class RealtimeAgentNode : public WebSocketNode {
public:
  static constexpr const char* kDefaultControlUrl = "https://api.ultravox.ai/api/calls";

  using CallRequester = std::function<HttpResponse(const std::string& url, const HttpHeaders& headers, const std::string& body)>;

  RealtimeAgentNode(std::string id, std::string name);
  ~RealtimeAgentNode() override;

  const char* typeName() const override { return "realtime_agent"; }
  CapabilitySet capabilities() const override {
    return {Capability::AudioInput, Capability::AudioOutput, Capability::Streaming};
  }

  void configure(const nlohmann::json& config) override;
  std::optional<AudioFormat> outputFormat() const override { return agentFormat(); }
  AudioBufferPtr audioOutput(ProcessingContext& context) override;
  bool acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) override;
  bool acceptText(const std::string& text, ProcessingContext& context) override;

  AudioFormat agentFormat() const;
  nlohmann::json callRequest() const;
  std::string joinUrl() const { std::lock_guard<std::mutex> lk(joinMutex_); return joinUrl_; }
  // Replaces the HTTP POST used for call creation.
  void setCallRequester(CallRequester requester) { requester_ = std::move(requester); }

protected:
  std::string resolveEndpoint() override;
  void onMessageReceived(const std::vector<uint8_t>& data, MessageKind kind, bool isFinal, ProcessingContext& context) override;
  void onReset() override;

private:
  CallRequester requester_;
  mutable std::mutex joinMutex_;
  std::string joinUrl_;
  mutable std::mutex audioMutex_;
  AudioBufferPtr lastAudio_{};
  PcmFrameAssembler assembler_;
};
