#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "AudioBuffer.hpp"
#include "Connection.hpp"
#include "Errors.hpp"
#include "Node.hpp"
#include "Notification.hpp"
#include "ProcessingContext.hpp"

// Owns a graph of nodes and connections and drives one routing pass per execute().
// Structural edits (add/remove/connect) are not synchronized with execute(); do them while idle.
class Pipeline {
public:
  explicit Pipeline(std::string id = {}, std::string name = {});
  ~Pipeline();
  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }
  void setName(std::string n) { name_ = std::move(n); }
  bool isRunning() const { return running_.load(std::memory_order_acquire); }
  bool isInitialized() const { return initialized_; }

  Node& addNode(std::unique_ptr<Node> node);
  template <class T, class... Args>
  T& emplaceNode(Args&&... args) {
    auto n = std::make_unique<T>(std::forward<Args>(args)...);
    T& ref = *n;
    addNode(std::move(n));
    return ref;
  }
  // Drops every connection touching the node, then releases ownership to the caller.
  std::unique_ptr<Node> removeNode(const std::string& nodeId);

  Connection& connect(const std::string& sourceId, const std::string& targetId, const std::string& connectionId = {});
  Connection& connect(Node& source, Node& target, const std::string& connectionId = {});
  void removeConnection(const std::string& connectionId);

  void initialize();
  void shutdown();
  void reset();

  std::vector<AudioBufferPtr> execute(const AudioBufferPtr& input);
  std::vector<AudioBufferPtr> execute(const AudioBufferPtr& input, ProcessingContext& context);
  std::vector<AudioBufferPtr> executeMultiple(const std::vector<AudioBufferPtr>& inputs);
  std::vector<AudioBufferPtr> executeMultiple(const std::vector<AudioBufferPtr>& inputs, ProcessingContext& context);

  Node* findNode(const std::string& nodeId) const;
  Connection* findConnection(const std::string& connectionId) const;
  std::vector<Node*> nodes() const;
  std::vector<Connection*> connections() const;
  const std::vector<Node*>& entryPoints() const { return entryPoints_; }
  const std::vector<Node*>& exitPoints() const { return exitPoints_; }

  NotificationChannel& notifications() { return feed_; }
  std::vector<TransferRecord> executionLog() const { return log_.snapshot(); }

private:
  std::vector<AudioBufferPtr> runPass(const AudioBufferPtr& input, ProcessingContext& context);
  std::vector<AudioBufferPtr> cancelled(const std::string& executionId, ProcessingContext& context);
  void publishPipelineEvent(NotificationType type, const std::string& executionId, ProcessingContext& context,
                            size_t resultCount = 0, std::chrono::nanoseconds duration = std::chrono::nanoseconds{0},
                            const std::string& error = {});
  std::string generateConnectionId(const std::string& sourceId, const std::string& targetId) const;
  static void eraseFrom(std::vector<Connection*>& list, const Connection* c);
  static void eraseFrom(std::vector<Node*>& list, const Node* n);

  std::string id_;
  std::string name_;
  // Declared before the graph: nodes and connections publish into these until they are destroyed.
  NotificationChannel feed_{};
  ExecutionLog log_{};
  std::vector<std::unique_ptr<Node>> nodes_{};
  std::unordered_map<std::string, Node*> nodeIndex_{};
  std::vector<std::unique_ptr<Connection>> connections_{};
  std::unordered_map<std::string, Connection*> connectionIndex_{};
  std::vector<Node*> entryPoints_{};
  std::vector<Node*> exitPoints_{};
  std::mutex executionMutex_;
  std::atomic<bool> running_{false};
  bool initialized_ = false;
};
