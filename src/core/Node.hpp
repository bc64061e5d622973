#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AudioBuffer.hpp"
#include "AudioFormat.hpp"
#include "Notification.hpp"
#include "ProcessingContext.hpp"

class Connection;
class Pipeline;

enum class Capability : uint8_t { AudioInput = 1u << 0, AudioOutput = 1u << 1, Streaming = 1u << 2 };

// Set of capabilities a node type declares; routing dispatches on these, not on class position.
class CapabilitySet {
public:
  CapabilitySet() = default;
  CapabilitySet(std::initializer_list<Capability> caps) { for (auto c : caps) add(c); }
  CapabilitySet& add(Capability c) { bits_ |= static_cast<uint8_t>(c); return *this; }
  bool has(Capability c) const { return (bits_ & static_cast<uint8_t>(c)) != 0; }
  uint8_t bits() const { return bits_; }
  bool operator==(const CapabilitySet& o) const { return bits_ == o.bits_; }
private:
  uint8_t bits_ = 0;
};

// State the algorithms read back. Diagnostics live in a separate opaque map.
struct NodeStatus {
  bool initialized = false;
  uint64_t processingCount = 0;
  double totalProcessingMs = 0.0;
  std::string lastError;
  double averageProcessingMs() const {
    return processingCount == 0 ? 0.0 : totalProcessingMs / static_cast<double>(processingCount);
  }
};

class Node {
public:
  Node(std::string id, std::string name);
  virtual ~Node() = default;
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  // Registry key; also what persistence writes as "type".
  virtual const char* typeName() const = 0;
  virtual CapabilitySet capabilities() const = 0;
  bool hasCapability(Capability c) const { return capabilities().has(c); }
  // Whether execute() feeds the pass input to this node directly. Terminal sinks opt out.
  virtual bool isEntryPoint() const { return hasCapability(Capability::AudioInput); }

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }
  void setName(std::string name) { name_ = std::move(name); }
  bool enabled() const { return enabled_; }
  void setEnabled(bool e) { enabled_ = e; }

  // Settings live in this object so they round-trip through persistence.
  nlohmann::json& configuration() { return configuration_; }
  const nlohmann::json& configuration() const { return configuration_; }
  virtual void configure(const nlohmann::json& config);

  virtual void initialize();
  virtual void shutdown();
  virtual void reset();
  virtual bool validate() const { return true; }

  // Audio input contract. Returns true when the buffer was consumed.
  virtual bool acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context);
  // Empty means accept-any.
  const std::vector<AudioFormat>& supportedFormats() const { return supportedFormats_; }
  // Also written to configuration()["supportedFormats"]; an empty list removes the key.
  void setSupportedFormats(std::vector<AudioFormat> formats);
  bool isFormatSupported(const AudioFormat& f) const;

  // Audio output contract.
  virtual std::optional<AudioFormat> outputFormat() const { return std::nullopt; }
  virtual AudioBufferPtr audioOutput(ProcessingContext& context);

  // Text payloads are node-specific; the default node ignores them.
  virtual bool acceptText(const std::string& text, ProcessingContext& context);

  const std::vector<Connection*>& inbound() const { return inbound_; }
  const std::vector<Connection*>& outbound() const { return outbound_; }

  NodeStatus status() const { std::lock_guard<std::mutex> lk(statusMutex_); return status_; }
  std::map<std::string, std::string> diagnostics() const { std::lock_guard<std::mutex> lk(statusMutex_); return diagnostics_; }
  NotificationChannel& notifications() { return notifications_; }

protected:
  virtual void onInitialize() {}
  virtual void onShutdown() {}
  virtual void onReset() {}

  // Fan out to enabled outbound connections in ascending priority. True if any transfer succeeded.
  bool propagateToOutputs(const AudioBufferPtr& audio, ProcessingContext& context);
  bool propagateText(const std::string& text, ProcessingContext& context);
  // Enabled outbound connections, stable-sorted by priority.
  std::vector<Connection*> orderedOutbound() const;

  void publish(Notification n);
  void trackProcessing(std::chrono::steady_clock::duration elapsed);
  void recordError(const std::string& diagnosticsKey, const std::string& message);
  void setDiagnostic(const std::string& key, std::string value);

private:
  friend class Pipeline;

  std::string id_;
  std::string name_;
  bool enabled_ = true;
  nlohmann::json configuration_ = nlohmann::json::object();
  std::vector<AudioFormat> supportedFormats_{};
  std::vector<Connection*> inbound_{};
  std::vector<Connection*> outbound_{};
  mutable std::mutex statusMutex_;
  NodeStatus status_{};
  std::map<std::string, std::string> diagnostics_{};
  NotificationChannel notifications_{};
  NotificationChannel* feed_ = nullptr; // owning pipeline's feed while registered
};

// Processor helper: accept -> processAudio -> remember output -> propagate.
class ProcessorNode : public Node {
public:
  using Node::Node;

  CapabilitySet capabilities() const override { return {Capability::AudioInput, Capability::AudioOutput}; }
  bool acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) override;
  std::optional<AudioFormat> outputFormat() const override;
  AudioBufferPtr audioOutput(ProcessingContext& context) override;
  void setOutputFormat(const AudioFormat& f) { std::lock_guard<std::mutex> lk(outputMutex_); outputFormat_ = f; }

protected:
  virtual AudioBufferPtr processAudio(const AudioBufferPtr& input, ProcessingContext& context) = 0;
  // Where the processed result goes; subclasses may restrict the connection set.
  virtual bool propagateResult(const AudioBufferPtr& result, ProcessingContext& context) {
    return propagateToOutputs(result, context);
  }
  void onReset() override;
  AudioBufferPtr lastOutput() const { std::lock_guard<std::mutex> lk(outputMutex_); return lastOutput_; }

private:
  mutable std::mutex outputMutex_;
  AudioFormat outputFormat_ = AudioFormat::defaultFormat();
  AudioBufferPtr lastOutput_{};
};
