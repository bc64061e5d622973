#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include "../core/Cancellation.hpp"
#include "../core/Node.hpp"

// Idle <-> Streaming lifecycle layered onto a node. start/stop are idempotent.
class StreamingNode : public Node {
public:
  using Node::Node;
  ~StreamingNode() override = default;

  bool isStreaming() const { return streaming_.load(std::memory_order_acquire); }
  void startStreaming();
  void stopStreaming();

  // Stops streaming unconditionally before the regular shutdown hook.
  void shutdown() override;

protected:
  virtual void onStartStreaming(const CancellationToken& token) { (void)token; }
  virtual void onStopStreaming() {}

private:
  std::mutex lifecycleMutex_;
  std::unique_ptr<CancellationSource> scope_{};
  std::atomic<bool> streaming_{false};
};
