#include "WebSocketNode.hpp"
#include <cstdio>
#include "BeastWebSocketTransport.hpp"
#include "../core/Errors.hpp"

WebSocketNode::WebSocketNode(std::string id, std::string name, std::string endpoint)
: StreamingNode(std::move(id), std::move(name)),
  factory_([] { return std::make_unique<BeastWebSocketTransport>(); }) {
  if (!endpoint.empty()) configuration()["endpoint"] = endpoint;
}

WebSocketNode::~WebSocketNode() {
  // Derived hooks are gone by now; only tear down what this class owns.
  std::shared_ptr<WebSocketTransport> t;
  {
    std::lock_guard<std::mutex> lk(socketMutex_);
    t = transport_;
  }
  if (t) t->cancel();
  joinReceiveThread();
}

std::string WebSocketNode::endpoint() const {
  return configuration().value("endpoint", std::string{});
}

void WebSocketNode::setEndpoint(const std::string& uri) {
  configuration()["endpoint"] = uri;
}

TransportState WebSocketNode::transportState() const {
  std::lock_guard<std::mutex> lk(socketMutex_);
  return transport_ ? transport_->state() : TransportState::None;
}

void WebSocketNode::setTransportFactory(TransportFactory factory) {
  std::lock_guard<std::mutex> lk(socketMutex_);
  factory_ = std::move(factory);
}

void WebSocketNode::connect() {
  std::lock_guard<std::mutex> lk(socketMutex_);
  if (transport_ && transport_->state() == TransportState::Open) return;
  if (transport_ && transport_->state() != TransportState::None) transport_.reset();
  if (!transport_) {
    if (!factory_) throw TransportError("Node '" + id() + "' has no transport factory");
    transport_ = std::shared_ptr<WebSocketTransport>(factory_());
    configureTransport(*transport_);
  }
  const TransportState previous = transport_->state();
  std::string uri = resolveEndpoint();
  if (uri.empty()) uri = configuration().value("endpoint", std::string{});
  if (uri.empty()) throw TransportError("Node '" + id() + "' has no endpoint configured");
  try {
    transport_->connect(uri);
  } catch (const TransportError& e) {
    recordError("LastWebSocketError", e.what());
    throw;
  }
  publishStateChange(previous, transport_->state());
}

void WebSocketNode::disconnect() {
  std::lock_guard<std::mutex> lk(socketMutex_);
  if (!transport_ || transport_->state() != TransportState::Open) return;
  const TransportState previous = transport_->state();
  transport_->close(kCloseNormal, "Disconnecting");
  publishStateChange(previous, transport_->state());
}

void WebSocketNode::send(const std::vector<uint8_t>& data, MessageKind kind, bool isFinal) {
  send(data.data(), data.size(), kind, isFinal);
}

void WebSocketNode::send(const uint8_t* data, size_t size, MessageKind kind, bool isFinal) {
  std::shared_ptr<WebSocketTransport> t;
  {
    std::lock_guard<std::mutex> lk(socketMutex_);
    t = transport_;
  }
  if (!t || t->state() != TransportState::Open) throw NotConnectedError();
  t->send(data, size, kind, isFinal);
}

void WebSocketNode::sendText(const std::string& text, bool isFinal) {
  send(reinterpret_cast<const uint8_t*>(text.data()), text.size(), MessageKind::Text, isFinal);
}

void WebSocketNode::onStartStreaming(const CancellationToken& token) {
  connect();
  joinReceiveThread();
  std::shared_ptr<WebSocketTransport> t;
  {
    std::lock_guard<std::mutex> lk(socketMutex_);
    t = transport_;
  }
  receiveThread_ = std::thread(&WebSocketNode::receiveLoop, this, token, std::move(t));
}

void WebSocketNode::onStopStreaming() {
  std::shared_ptr<WebSocketTransport> t;
  {
    std::lock_guard<std::mutex> lk(socketMutex_);
    t = transport_;
  }
  if (t) t->cancel();
  joinReceiveThread();
}

void WebSocketNode::shutdown() {
  stopStreaming();
  disconnectQuietly();
  {
    std::lock_guard<std::mutex> lk(socketMutex_);
    transport_.reset();
  }
  StreamingNode::shutdown();
}

void WebSocketNode::receiveLoop(CancellationToken token, std::shared_ptr<WebSocketTransport> transport) {
  std::vector<uint8_t> buffer(kReceiveBufferSize);
  try {
    while (!token.isCancellationRequested() && transport->state() == TransportState::Open) {
      const ReceivedFrame frame = transport->receive(buffer);
      if (frame.kind == MessageKind::Close) {
        publishStateChange(TransportState::Open, transport->state());
        disconnect();
        break;
      }
      std::vector<uint8_t> data(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(frame.size));
      ProcessingContext context(std::string{}, token);
      Notification n;
      n.type = NotificationType::MessageReceived;
      n.sessionId = context.sessionId();
      n.bytes = data;
      n.messageKind = frame.kind;
      n.isFinal = frame.isFinal;
      publish(n);
      onMessageReceived(data, frame.kind, frame.isFinal, context);
    }
  } catch (const TransportCancelled&) {
    // stopStreaming() aborted the pending receive
  } catch (const TransportError& e) {
    recordError("LastWebSocketError", e.what());
    std::fprintf(stderr, "[ws] %s: %s\n", id().c_str(), e.what());
    disconnectQuietly();
  } catch (const std::exception& e) {
    recordError("LastError", e.what());
    std::fprintf(stderr, "[ws] %s: receive loop failed: %s\n", id().c_str(), e.what());
    disconnectQuietly();
  }
}

void WebSocketNode::disconnectQuietly() {
  try {
    disconnect();
  } catch (const std::exception& e) {
    recordError("LastWebSocketError", e.what());
    std::fprintf(stderr, "Warning: [ws] %s: disconnect failed: %s\n", id().c_str(), e.what());
  }
}

void WebSocketNode::joinReceiveThread() {
  if (!receiveThread_.joinable()) return;
  if (receiveThread_.get_id() == std::this_thread::get_id()) receiveThread_.detach();
  else receiveThread_.join();
}

void WebSocketNode::publishStateChange(TransportState previous, TransportState current) {
  Notification n;
  n.type = NotificationType::ConnectionStateChanged;
  n.previousState = previous;
  n.currentState = current;
  publish(n);
}
