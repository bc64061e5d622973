#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "../core/Notification.hpp"

struct ReceivedFrame {
  MessageKind kind = MessageKind::Binary;
  size_t size = 0;     // bytes written into the caller's buffer
  bool isFinal = true; // last fragment of the message
};

// Blocking socket interface owned by a WebSocketNode. Implementations must allow one
// receive() to be pending while send()/close()/cancel() are called from other threads.
class WebSocketTransport {
public:
  virtual ~WebSocketTransport() = default;
  virtual TransportState state() const = 0;
  virtual void connect(const std::string& uri) = 0;
  virtual void send(const uint8_t* data, size_t size, MessageKind kind, bool isFinal) = 0;
  // Throws TransportCancelled after cancel(), TransportError on socket failure.
  virtual ReceivedFrame receive(std::vector<uint8_t>& buffer) = 0;
  virtual void close(uint16_t code, const std::string& reason) = 0;
  virtual void cancel() = 0;
  virtual void setHeader(const std::string& name, const std::string& value) { (void)name; (void)value; }
};

using TransportFactory = std::function<std::unique_ptr<WebSocketTransport>()>;

constexpr uint16_t kCloseNormal = 1000;
