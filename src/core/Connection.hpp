#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AudioBuffer.hpp"
#include "Node.hpp"
#include "ProcessingContext.hpp"

struct TransferRecord {
  std::string connectionId;
  std::string sourceId;
  std::string targetId;
  std::chrono::system_clock::time_point timestamp{};
};

// Append-only record of successful transfers; owned by a pipeline, cleared on reset.
class ExecutionLog {
public:
  void append(TransferRecord r) { std::lock_guard<std::mutex> lk(m_); records_.push_back(std::move(r)); }
  std::vector<TransferRecord> snapshot() const { std::lock_guard<std::mutex> lk(m_); return records_; }
  void clear() { std::lock_guard<std::mutex> lk(m_); records_.clear(); }
private:
  mutable std::mutex m_;
  std::vector<TransferRecord> records_{};
};

// Directed edge between two nodes of the same pipeline.
class Connection {
public:
  Connection(std::string id, Node& source, Node& target);
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  const std::string& id() const { return id_; }
  Node& source() const { return source_; }
  Node& target() const { return target_; }

  const std::string& label() const { return label_; }
  void setLabel(std::string l) { label_ = std::move(l); }
  bool enabled() const { return enabled_; }
  void setEnabled(bool e) { enabled_ = e; }
  int priority() const { return priority_; }
  void setPriority(int p) { priority_ = p; }
  const std::string& kind() const { return kind_; }
  void setKind(std::string k) { kind_ = std::move(k); }
  nlohmann::json& configuration() { return configuration_; }
  const nlohmann::json& configuration() const { return configuration_; }

  // Splitter channel this edge is tagged with; empty when untagged.
  std::string channelTag() const;

  // Throws ConnectionIncompatible on capability/format mismatch; false if a node self-check fails.
  bool validate() const;

  bool transferData(const AudioBufferPtr& audio, ProcessingContext& context);
  bool transferText(const std::string& text, ProcessingContext& context);

private:
  friend class Pipeline;
  void notifyTransferred(ProcessingContext& context, const AudioBufferPtr& audio, const std::string& text);

  std::string id_;
  Node& source_;
  Node& target_;
  std::string label_;
  bool enabled_ = true;
  int priority_ = 0;
  std::string kind_ = "audio";
  nlohmann::json configuration_ = nlohmann::json::object();
  NotificationChannel* feed_ = nullptr;
  ExecutionLog* log_ = nullptr;
};
