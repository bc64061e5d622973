#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../core/Node.hpp"

// Per-channel transform; receives a private clone of the input.
using ChannelTransform = std::function<AudioBufferPtr(std::shared_ptr<AudioBuffer>, ProcessingContext&)>;

struct SplitterChannel {
  std::string id;
  std::string name;
  bool enabled = true;
  ChannelTransform transform{};
};

// Named-channel fan-out. Each enabled channel gets its own clone of the input and feeds only the
// outbound connections tagged with its id ("channelId" in the connection configuration). Untagged
// connections always receive the original input.
class SplitterNode : public ProcessorNode {
public:
  static constexpr const char* kOriginalInputKey = "Splitter.OriginalInput";

  using ProcessorNode::ProcessorNode;
  const char* typeName() const override { return "splitter"; }

  // Throws std::invalid_argument on empty or duplicate id.
  void addChannel(std::string channelId, std::string name = {}, ChannelTransform transform = {});
  bool removeChannel(const std::string& channelId);
  void setChannelEnabled(const std::string& channelId, bool enabled);
  void setChannelTransform(const std::string& channelId, ChannelTransform transform);
  bool hasChannel(const std::string& channelId) const;
  std::vector<std::string> channelIds() const;
  size_t enabledChannelCount() const;

  void configure(const nlohmann::json& config) override;

  // Transient context key under which a channel's output for the current pass is stored.
  static std::string channelOutputKey(const std::string& channelId) { return "Splitter.Channel." + channelId; }

protected:
  AudioBufferPtr processAudio(const AudioBufferPtr& input, ProcessingContext& context) override;
  bool propagateResult(const AudioBufferPtr& result, ProcessingContext& context) override;
  // Re-enables every channel; transforms stay bound.
  void onReset() override;

private:
  std::vector<SplitterChannel> channelsSnapshot() const;
  void syncChannelConfiguration();

  mutable std::mutex channelsMutex_;
  std::vector<SplitterChannel> channels_{};
};
