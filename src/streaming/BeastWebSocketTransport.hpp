#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include "WebSocketTransport.hpp"

struct ParsedUri {
  bool secure = false;
  std::string host;
  std::string port;
  std::string target = "/";
};

// ws:// and wss:// (http:// and https:// also accepted for the HTTP helper).
ParsedUri parseUri(const std::string& uri);

// Boost.Beast client. connect() is synchronous; after that a private io thread runs the
// socket and the blocking calls wait on its completions.
class BeastWebSocketTransport : public WebSocketTransport {
public:
  BeastWebSocketTransport();
  ~BeastWebSocketTransport() override;

  TransportState state() const override { return state_.load(std::memory_order_acquire); }
  void connect(const std::string& uri) override;
  void send(const uint8_t* data, size_t size, MessageKind kind, bool isFinal) override;
  ReceivedFrame receive(std::vector<uint8_t>& buffer) override;
  void close(uint16_t code, const std::string& reason) override;
  void cancel() override;
  void setHeader(const std::string& name, const std::string& value) override;

private:
  using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
  using SecureStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

  template <class Fn> void withStream(Fn&& fn);
  void stopIo();

  boost::asio::io_context ioc_;
  boost::asio::ssl::context sslCtx_;
  std::unique_ptr<PlainStream> plain_{};
  std::unique_ptr<SecureStream> secure_{};
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_{};
  std::thread ioThread_{};
  std::atomic<TransportState> state_{TransportState::None};
  std::mutex writeMutex_;
  std::vector<std::pair<std::string, std::string>> headers_{};
};
