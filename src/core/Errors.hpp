#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

class PipelineError : public std::runtime_error {
public:
  PipelineError(std::string pipelineId, const std::string& what)
  : std::runtime_error(what), pipelineId_(std::move(pipelineId)) {}
  const std::string& pipelineId() const { return pipelineId_; }
private:
  std::string pipelineId_;
};

enum class GraphErrorKind : uint8_t { DuplicateId = 0, UnknownId };

// Structural misuse of the graph (ids). Fatal to the call; the graph is left unchanged.
class GraphError : public PipelineError {
public:
  GraphError(std::string pipelineId, GraphErrorKind kind, std::string itemId, const std::string& what)
  : PipelineError(std::move(pipelineId), what), kind_(kind), itemId_(std::move(itemId)) {}
  GraphErrorKind kind() const { return kind_; }
  const std::string& itemId() const { return itemId_; }
private:
  GraphErrorKind kind_;
  std::string itemId_;
};

class PipelineExecutionFailed : public PipelineError {
public:
  using PipelineError::PipelineError;
};

class NoEntryPointsError : public PipelineExecutionFailed {
public:
  explicit NoEntryPointsError(std::string pipelineId)
  : PipelineExecutionFailed(pipelineId, "Pipeline '" + pipelineId + "' has no enabled entry points") {}
};

class ConnectionError : public std::runtime_error {
public:
  ConnectionError(std::string sourceId, std::string targetId, const std::string& what)
  : std::runtime_error(what), sourceId_(std::move(sourceId)), targetId_(std::move(targetId)) {}
  const std::string& sourceId() const { return sourceId_; }
  const std::string& targetId() const { return targetId_; }
private:
  std::string sourceId_;
  std::string targetId_;
};

class ConnectionIncompatible : public ConnectionError {
public:
  using ConnectionError::ConnectionError;
};

class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class NotConnectedError : public TransportError {
public:
  NotConnectedError() : TransportError("WebSocket is not connected") {}
};

// A pending receive was aborted locally; not a fault.
class TransportCancelled : public TransportError {
public:
  TransportCancelled() : TransportError("WebSocket operation cancelled") {}
};

class AudioFormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class UnsupportedConversion : public AudioFormatError {
public:
  using AudioFormatError::AudioFormatError;
};

class UnsupportedMixFormat : public AudioFormatError {
public:
  using AudioFormatError::AudioFormatError;
};
