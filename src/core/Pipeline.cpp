#include "Pipeline.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include "Random.hpp"

namespace {
// Clears per-pass state on every exit path of a routing pass.
struct PassScope {
  ProcessingContext& context;
  std::atomic<bool>& running;
  PassScope(ProcessingContext& c, std::atomic<bool>& r) : context(c), running(r) {
    running.store(true, std::memory_order_release);
  }
  ~PassScope() {
    context.clearTransientData();
    running.store(false, std::memory_order_release);
  }
};
} // namespace

Pipeline::Pipeline(std::string id, std::string name)
: id_(id.empty() ? generateUuid() : std::move(id)), name_(name.empty() ? id_ : std::move(name)) {}

Pipeline::~Pipeline() {
  // Streaming nodes can be live without initialize(); stop them while the feed still exists.
  shutdown();
  for (auto& n : nodes_) n->feed_ = nullptr;
  for (auto& c : connections_) {
    c->feed_ = nullptr;
    c->log_ = nullptr;
  }
}

Node& Pipeline::addNode(std::unique_ptr<Node> node) {
  if (!node) throw std::invalid_argument("Pipeline::addNode: null node");
  const std::string nid = node->id();
  if (nodeIndex_.count(nid)) {
    throw GraphError(id_, GraphErrorKind::DuplicateId, nid, "Node with id '" + nid + "' already exists in pipeline '" + id_ + "'");
  }
  Node* raw = node.get();
  nodes_.push_back(std::move(node));
  nodeIndex_.emplace(nid, raw);
  raw->feed_ = &feed_;
  if (raw->isEntryPoint()) entryPoints_.push_back(raw);
  if (raw->hasCapability(Capability::AudioOutput)) exitPoints_.push_back(raw);
  return *raw;
}

std::unique_ptr<Node> Pipeline::removeNode(const std::string& nodeId) {
  auto it = nodeIndex_.find(nodeId);
  if (it == nodeIndex_.end()) {
    throw GraphError(id_, GraphErrorKind::UnknownId, nodeId, "Node '" + nodeId + "' not found in pipeline '" + id_ + "'");
  }
  Node* raw = it->second;
  std::vector<std::string> touching;
  for (auto* c : raw->inbound_) touching.push_back(c->id());
  for (auto* c : raw->outbound_) touching.push_back(c->id());
  for (const auto& cid : touching) {
    if (connectionIndex_.count(cid)) removeConnection(cid);
  }
  eraseFrom(entryPoints_, raw);
  eraseFrom(exitPoints_, raw);
  nodeIndex_.erase(it);
  std::unique_ptr<Node> out;
  for (auto nit = nodes_.begin(); nit != nodes_.end(); ++nit) {
    if (nit->get() == raw) { out = std::move(*nit); nodes_.erase(nit); break; }
  }
  out->feed_ = nullptr;
  return out;
}

Connection& Pipeline::connect(const std::string& sourceId, const std::string& targetId, const std::string& connectionId) {
  Node* src = findNode(sourceId);
  if (!src) throw GraphError(id_, GraphErrorKind::UnknownId, sourceId, "Source node '" + sourceId + "' not found in pipeline '" + id_ + "'");
  Node* tgt = findNode(targetId);
  if (!tgt) throw GraphError(id_, GraphErrorKind::UnknownId, targetId, "Target node '" + targetId + "' not found in pipeline '" + id_ + "'");
  return connect(*src, *tgt, connectionId);
}

Connection& Pipeline::connect(Node& source, Node& target, const std::string& connectionId) {
  if (findNode(source.id()) != &source) {
    throw GraphError(id_, GraphErrorKind::UnknownId, source.id(), "Source node '" + source.id() + "' does not belong to pipeline '" + id_ + "'");
  }
  if (findNode(target.id()) != &target) {
    throw GraphError(id_, GraphErrorKind::UnknownId, target.id(), "Target node '" + target.id() + "' does not belong to pipeline '" + id_ + "'");
  }
  const std::string cid = connectionId.empty() ? generateConnectionId(source.id(), target.id()) : connectionId;
  if (connectionIndex_.count(cid)) {
    throw GraphError(id_, GraphErrorKind::DuplicateId, cid, "Connection with id '" + cid + "' already exists in pipeline '" + id_ + "'");
  }
  auto conn = std::make_unique<Connection>(cid, source, target);
  Connection* raw = conn.get();
  raw->feed_ = &feed_;
  raw->log_ = &log_;
  connections_.push_back(std::move(conn));
  connectionIndex_.emplace(cid, raw);
  source.outbound_.push_back(raw);
  target.inbound_.push_back(raw);
  return *raw;
}

void Pipeline::removeConnection(const std::string& connectionId) {
  auto it = connectionIndex_.find(connectionId);
  if (it == connectionIndex_.end()) {
    throw GraphError(id_, GraphErrorKind::UnknownId, connectionId, "Connection '" + connectionId + "' not found in pipeline '" + id_ + "'");
  }
  Connection* raw = it->second;
  eraseFrom(raw->source().outbound_, raw);
  eraseFrom(raw->target().inbound_, raw);
  connectionIndex_.erase(it);
  connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                    [raw](const std::unique_ptr<Connection>& c) { return c.get() == raw; }),
                     connections_.end());
}

void Pipeline::initialize() {
  try {
    for (auto& n : nodes_) n->initialize();
    for (auto& c : connections_) {
      if (!c->validate()) {
        std::fprintf(stderr, "Warning: connection '%s' (%s) failed node self-validation\n", c->id().c_str(), c->label().c_str());
      }
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Warning: pipeline '%s' initialization failed, rolling back: %s\n", id_.c_str(), e.what());
    shutdown();
    throw;
  }
  initialized_ = true;
}

void Pipeline::shutdown() {
  for (auto& n : nodes_) {
    try {
      n->shutdown();
    } catch (const std::exception& e) {
      std::fprintf(stderr, "Warning: node '%s' shutdown failed: %s\n", n->id().c_str(), e.what());
    }
  }
  initialized_ = false;
}

void Pipeline::reset() {
  std::lock_guard<std::mutex> guard(executionMutex_);
  log_.clear();
  for (auto& n : nodes_) n->reset();
}

std::vector<AudioBufferPtr> Pipeline::execute(const AudioBufferPtr& input) {
  ProcessingContext context;
  return execute(input, context);
}

std::vector<AudioBufferPtr> Pipeline::execute(const AudioBufferPtr& input, ProcessingContext& context) {
  std::lock_guard<std::mutex> guard(executionMutex_);
  return runPass(input, context);
}

std::vector<AudioBufferPtr> Pipeline::executeMultiple(const std::vector<AudioBufferPtr>& inputs) {
  ProcessingContext context;
  return executeMultiple(inputs, context);
}

std::vector<AudioBufferPtr> Pipeline::executeMultiple(const std::vector<AudioBufferPtr>& inputs, ProcessingContext& context) {
  std::lock_guard<std::mutex> guard(executionMutex_);
  std::vector<AudioBufferPtr> all;
  for (const auto& in : inputs) {
    auto part = runPass(in, context);
    if (context.isCancelled()) return {};
    all.insert(all.end(), part.begin(), part.end());
  }
  return all;
}

std::vector<AudioBufferPtr> Pipeline::runPass(const AudioBufferPtr& input, ProcessingContext& context) {
  PassScope scope(context, running_);
  const std::string executionId = generateUuid();
  const auto t0 = std::chrono::steady_clock::now();
  publishPipelineEvent(NotificationType::ExecutionStarted, executionId, context);
  try {
    std::vector<Node*> entries;
    entries.reserve(entryPoints_.size());
    for (auto* n : entryPoints_) if (n->enabled()) entries.push_back(n);
    // Fewer inbound connections first; registration order breaks ties.
    std::stable_sort(entries.begin(), entries.end(),
                     [](const Node* a, const Node* b) { return a->inbound().size() < b->inbound().size(); });
    if (entries.empty()) throw NoEntryPointsError(id_);

    for (auto* n : entries) {
      if (context.isCancelled()) return cancelled(executionId, context);
      n->acceptAudio(input, context);
    }

    std::vector<AudioBufferPtr> results;
    for (auto* n : exitPoints_) {
      if (context.isCancelled()) return cancelled(executionId, context);
      if (!n->enabled()) continue;
      if (auto out = n->audioOutput(context)) results.push_back(std::move(out));
    }
    if (context.isCancelled()) return cancelled(executionId, context);

    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0);
    publishPipelineEvent(NotificationType::ExecutionCompleted, executionId, context, results.size(), elapsed);
    return results;
  } catch (const PipelineExecutionFailed& e) {
    publishPipelineEvent(NotificationType::ExecutionFailed, executionId, context, 0, std::chrono::nanoseconds{0}, e.what());
    throw;
  } catch (const std::exception& e) {
    context.logError(std::string("Pipeline execution failed: ") + e.what());
    publishPipelineEvent(NotificationType::ExecutionFailed, executionId, context, 0, std::chrono::nanoseconds{0}, e.what());
    std::throw_with_nested(PipelineExecutionFailed(id_, "Pipeline '" + id_ + "' execution failed: " + e.what()));
  }
}

std::vector<AudioBufferPtr> Pipeline::cancelled(const std::string& executionId, ProcessingContext& context) {
  context.logInfo("Pipeline '" + id_ + "' execution cancelled");
  publishPipelineEvent(NotificationType::ExecutionCancelled, executionId, context);
  return {};
}

void Pipeline::publishPipelineEvent(NotificationType type, const std::string& executionId, ProcessingContext& context,
                                    size_t resultCount, std::chrono::nanoseconds duration, const std::string& error) {
  Notification n;
  n.type = type;
  n.sourceId = id_;
  n.executionId = executionId;
  n.sessionId = context.sessionId();
  n.resultCount = resultCount;
  n.duration = duration;
  n.error = error;
  feed_.publish(n);
}

Node* Pipeline::findNode(const std::string& nodeId) const {
  auto it = nodeIndex_.find(nodeId);
  return it == nodeIndex_.end() ? nullptr : it->second;
}

Connection* Pipeline::findConnection(const std::string& connectionId) const {
  auto it = connectionIndex_.find(connectionId);
  return it == connectionIndex_.end() ? nullptr : it->second;
}

std::vector<Node*> Pipeline::nodes() const {
  std::vector<Node*> out;
  out.reserve(nodes_.size());
  for (const auto& n : nodes_) out.push_back(n.get());
  return out;
}

std::vector<Connection*> Pipeline::connections() const {
  std::vector<Connection*> out;
  out.reserve(connections_.size());
  for (const auto& c : connections_) out.push_back(c.get());
  return out;
}

std::string Pipeline::generateConnectionId(const std::string& sourceId, const std::string& targetId) const {
  std::string cid;
  do {
    cid = "conn_" + sourceId + "_" + targetId + "_" + randomHex8();
  } while (connectionIndex_.count(cid));
  return cid;
}

void Pipeline::eraseFrom(std::vector<Connection*>& list, const Connection* c) {
  list.erase(std::remove(list.begin(), list.end(), c), list.end());
}

void Pipeline::eraseFrom(std::vector<Node*>& list, const Node* n) {
  list.erase(std::remove(list.begin(), list.end(), n), list.end());
}
