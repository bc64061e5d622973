#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "StreamingNode.hpp"
#include "WebSocketTransport.hpp"

// Streaming node that owns one socket: connect/disconnect, a background receive loop
// while streaming, and outward sends.
class WebSocketNode : public StreamingNode {
public:
  static constexpr size_t kReceiveBufferSize = 32768;

  WebSocketNode(std::string id, std::string name, std::string endpoint = {});
  ~WebSocketNode() override;

  std::string endpoint() const;
  void setEndpoint(const std::string& uri);
  TransportState transportState() const;
  bool isConnected() const { return transportState() == TransportState::Open; }

  // Defaults to BeastWebSocketTransport.
  void setTransportFactory(TransportFactory factory);

  void connect();
  void disconnect();
  void send(const std::vector<uint8_t>& data, MessageKind kind, bool isFinal = true);
  void send(const uint8_t* data, size_t size, MessageKind kind, bool isFinal = true);
  void sendText(const std::string& text, bool isFinal = true);

  void shutdown() override;

protected:
  // Session-setup hook run under the socket lock before each connect attempt.
  virtual std::string resolveEndpoint() { return endpoint(); }
  virtual void configureTransport(WebSocketTransport& transport) { (void)transport; }
  virtual void onMessageReceived(const std::vector<uint8_t>& data, MessageKind kind, bool isFinal, ProcessingContext& context) {
    (void)data; (void)kind; (void)isFinal; (void)context;
  }

  void onStartStreaming(const CancellationToken& token) override;
  void onStopStreaming() override;

private:
  void receiveLoop(CancellationToken token, std::shared_ptr<WebSocketTransport> transport);
  void disconnectQuietly();
  void joinReceiveThread();
  void publishStateChange(TransportState previous, TransportState current);

  mutable std::mutex socketMutex_;
  TransportFactory factory_{};
  std::shared_ptr<WebSocketTransport> transport_{};
  std::thread receiveThread_{};
};
