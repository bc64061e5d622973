#include "StreamingNode.hpp"
#include "../core/ProcessingContext.hpp"

void StreamingNode::startStreaming() {
  std::lock_guard<std::mutex> lk(lifecycleMutex_);
  if (streaming_.load(std::memory_order_acquire)) return;
  scope_ = std::make_unique<CancellationSource>();
  const CancellationToken token = scope_->token();
  streaming_.store(true, std::memory_order_release);
  try {
    onStartStreaming(token);
  } catch (const std::exception&) {
    scope_->cancel();
    scope_.reset();
    streaming_.store(false, std::memory_order_release);
    throw;
  }
  Notification n;
  n.type = NotificationType::StreamingStarted;
  n.context = std::make_shared<ProcessingContext>(std::string{}, token);
  n.sessionId = n.context->sessionId();
  publish(n);
}

void StreamingNode::stopStreaming() {
  std::lock_guard<std::mutex> lk(lifecycleMutex_);
  if (!streaming_.load(std::memory_order_acquire)) return;
  scope_->cancel();
  streaming_.store(false, std::memory_order_release);
  onStopStreaming();
  scope_.reset();
  Notification n;
  n.type = NotificationType::StreamingStopped;
  publish(n);
}

void StreamingNode::shutdown() {
  stopStreaming();
  Node::shutdown();
}
