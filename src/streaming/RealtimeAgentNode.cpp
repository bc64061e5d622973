#include "RealtimeAgentNode.hpp"
#include <chrono>
#include <cstdio>
#include "../core/Errors.hpp"
#include "../dsp/AudioConvert.hpp"

RealtimeAgentNode::RealtimeAgentNode(std::string id, std::string name)
: WebSocketNode(std::move(id), std::move(name)),
  requester_([](const std::string& url, const HttpHeaders& headers, const std::string& body) {
    return httpPost(url, headers, body);
  }),
  assembler_(AudioFormat(8000, 1, 16, false)) {}

RealtimeAgentNode::~RealtimeAgentNode() { stopStreaming(); }

void RealtimeAgentNode::configure(const nlohmann::json& config) {
  WebSocketNode::configure(config);
  assembler_.setFormat(agentFormat());
  std::lock_guard<std::mutex> lk(joinMutex_);
  joinUrl_.clear();
}

AudioFormat RealtimeAgentNode::agentFormat() const {
  return AudioFormat(configuration().value("sampleRate", 8000u), 1, 16, false);
}

nlohmann::json RealtimeAgentNode::callRequest() const {
  const auto& c = configuration();
  const uint32_t rate = agentFormat().sampleRate();
  return nlohmann::json{
    {"systemPrompt", c.value("systemPrompt", std::string("You are a helpful assistant."))},
    {"model", c.value("model", std::string("fixie-ai/ultravox"))},
    {"voice", c.value("voice", std::string("Mark"))},
    {"medium", {{"serverWebSocket", {{"inputSampleRate", rate}, {"outputSampleRate", rate}}}}}
  };
}

std::string RealtimeAgentNode::resolveEndpoint() {
  {
    std::lock_guard<std::mutex> lk(joinMutex_);
    if (!joinUrl_.empty()) return joinUrl_;
  }
  const auto& c = configuration();
  const std::string url = c.value("controlUrl", std::string(kDefaultControlUrl));
  HttpHeaders headers;
  const std::string apiKey = c.value("apiKey", std::string{});
  if (!apiKey.empty()) headers.emplace_back("X-API-Key", apiKey);
  const HttpResponse res = requester_(url, headers, callRequest().dump());
  if (res.status < 200 || res.status >= 300) {
    throw TransportError("Failed to create agent call: HTTP " + std::to_string(res.status));
  }
  std::string join;
  try {
    const nlohmann::json j = nlohmann::json::parse(res.body);
    join = j.value("joinUrl", std::string{});
  } catch (const nlohmann::json::exception& e) {
    throw TransportError(std::string("Agent call response is not valid JSON: ") + e.what());
  }
  if (join.empty()) throw TransportError("Agent call response did not contain joinUrl");
  setDiagnostic("JoinUrl", join);
  std::lock_guard<std::mutex> lk(joinMutex_);
  joinUrl_ = join;
  return joinUrl_;
}

AudioBufferPtr RealtimeAgentNode::audioOutput(ProcessingContext&) {
  std::lock_guard<std::mutex> lk(audioMutex_);
  return lastAudio_;
}

bool RealtimeAgentNode::acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) {
  if (!audio || !enabled() || context.isCancelled()) return false;
  if (!isFormatSupported(audio->format())) {
    context.logWarning("Agent node '" + id() + "' does not support format " + audio->format().toString());
    return false;
  }
  const AudioFormat target = agentFormat();
  const AudioFormat pcm16(audio->format().sampleRate(), audio->format().channels(), 16, false);
  AudioBufferPtr outgoing = convertOrKeep(audio, pcm16, context);
  if (outgoing->format() != target) {
    context.logWarning("Agent node '" + id() + "' expects " + target.toString() + ", got " + outgoing->format().toString());
    return false;
  }
  const auto t0 = std::chrono::steady_clock::now();
  try {
    if (!isConnected()) connect();
    send(outgoing->bytes(), MessageKind::Binary, true);
  } catch (const TransportError& e) {
    recordError("LastWebSocketError", e.what());
    context.logError("Agent node '" + id() + "' send failed: " + e.what());
    return false;
  }
  trackProcessing(std::chrono::steady_clock::now() - t0);
  return true;
}

bool RealtimeAgentNode::acceptText(const std::string& text, ProcessingContext& context) {
  if (!enabled() || text.empty() || context.isCancelled()) return false;
  try {
    if (!isConnected()) connect();
    sendText(nlohmann::json{{"text", text}}.dump());
  } catch (const TransportError& e) {
    recordError("LastWebSocketError", e.what());
    context.logError("Agent node '" + id() + "' send failed: " + e.what());
    return false;
  }
  return true;
}

void RealtimeAgentNode::onMessageReceived(const std::vector<uint8_t>& data, MessageKind kind, bool, ProcessingContext& context) {
  if (kind == MessageKind::Binary) {
    AudioBufferPtr audio = assembler_.push(data);
    if (!audio) return;
    {
      std::lock_guard<std::mutex> lk(audioMutex_);
      lastAudio_ = audio;
    }
    Notification n;
    n.type = NotificationType::SpeechAudioReceived;
    n.sessionId = context.sessionId();
    n.audio = audio;
    publish(n);
    propagateToOutputs(audio, context);
    return;
  }
  if (kind != MessageKind::Text) return;
  try {
    const nlohmann::json j = nlohmann::json::parse(std::string(data.begin(), data.end()));
    if (!j.is_object()) return;
    const std::string text = j.value("text", std::string{});
    if (text.empty()) return;
    Notification n;
    n.type = NotificationType::TranscriptionReceived;
    n.sessionId = context.sessionId();
    n.text = text;
    n.isFinal = j.value("is_final", true);
    publish(n);
  } catch (const nlohmann::json::exception& e) {
    context.logError("Error parsing agent message: " + std::string(e.what()));
    std::fprintf(stderr, "Warning: [ws] %s: unparseable agent message\n", id().c_str());
  }
}

void RealtimeAgentNode::onReset() {
  assembler_.clear();
  std::lock_guard<std::mutex> lk(audioMutex_);
  lastAudio_.reset();
}
