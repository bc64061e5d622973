#include "BeastWebSocketTransport.hpp"
#include <algorithm>
#include <cctype>
#include <future>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>
#include "../core/Errors.hpp"

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {
constexpr size_t kDefaultReceiveBuffer = 32768;
}

ParsedUri parseUri(const std::string& uri) {
  const auto sep = uri.find("://");
  if (sep == std::string::npos) throw TransportError("Invalid endpoint URI (missing scheme): " + uri);
  std::string scheme = uri.substr(0, sep);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  ParsedUri out;
  if (scheme == "wss" || scheme == "https") out.secure = true;
  else if (scheme == "ws" || scheme == "http") out.secure = false;
  else throw TransportError("Unsupported URI scheme '" + scheme + "' in " + uri);

  const std::string rest = uri.substr(sep + 3);
  const auto pathStart = rest.find_first_of("/?");
  std::string hostPort = rest.substr(0, pathStart);
  if (pathStart != std::string::npos) {
    out.target = rest.substr(pathStart);
    if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
  }
  if (!hostPort.empty() && hostPort.front() == '[') {
    const auto close = hostPort.find(']');
    if (close == std::string::npos) throw TransportError("Invalid IPv6 host in " + uri);
    out.host = hostPort.substr(1, close - 1);
    if (close + 1 < hostPort.size() && hostPort[close + 1] == ':') out.port = hostPort.substr(close + 2);
  } else {
    const auto colon = hostPort.rfind(':');
    if (colon != std::string::npos) { out.host = hostPort.substr(0, colon); out.port = hostPort.substr(colon + 1); }
    else out.host = hostPort;
  }
  if (out.host.empty()) throw TransportError("Missing host in " + uri);
  if (out.port.empty()) out.port = out.secure ? "443" : "80";
  return out;
}

BeastWebSocketTransport::BeastWebSocketTransport()
: sslCtx_(ssl::context::tls_client) {
  sslCtx_.set_default_verify_paths();
  sslCtx_.set_verify_mode(ssl::verify_peer);
}

BeastWebSocketTransport::~BeastWebSocketTransport() { stopIo(); }

void BeastWebSocketTransport::setHeader(const std::string& name, const std::string& value) {
  headers_.emplace_back(name, value);
}

template <class Fn>
void BeastWebSocketTransport::withStream(Fn&& fn) {
  if (secure_) fn(*secure_);
  else if (plain_) fn(*plain_);
}

void BeastWebSocketTransport::connect(const std::string& uri) {
  if (state() != TransportState::None) throw TransportError("WebSocket transport already used; allocate a fresh one");
  const ParsedUri u = parseUri(uri);
  state_.store(TransportState::Connecting, std::memory_order_release);
  const bool defaultPort = (u.secure && u.port == "443") || (!u.secure && u.port == "80");
  const std::string hostHeader = defaultPort ? u.host : (u.host + ":" + u.port);
  const auto headers = headers_;
  auto decorate = [headers](websocket::request_type& req) {
    req.set(beast::http::field::user_agent, "voxflow");
    for (const auto& h : headers) req.set(h.first, h.second);
  };
  try {
    tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(u.host, u.port);
    if (u.secure) {
      secure_ = std::make_unique<SecureStream>(ioc_, sslCtx_);
      if (!SSL_set_tlsext_host_name(secure_->next_layer().native_handle(), u.host.c_str())) {
        throw TransportError("Failed to set TLS SNI host name for " + u.host);
      }
      beast::get_lowest_layer(*secure_).connect(results);
      secure_->next_layer().handshake(ssl::stream_base::client);
      secure_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
      secure_->set_option(websocket::stream_base::decorator(decorate));
      secure_->handshake(hostHeader, u.target);
    } else {
      plain_ = std::make_unique<PlainStream>(ioc_);
      beast::get_lowest_layer(*plain_).connect(results);
      plain_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
      plain_->set_option(websocket::stream_base::decorator(decorate));
      plain_->handshake(hostHeader, u.target);
    }
  } catch (const boost::system::system_error& e) {
    state_.store(TransportState::Closed, std::memory_order_release);
    plain_.reset();
    secure_.reset();
    throw TransportError("WebSocket connect to " + uri + " failed: " + e.code().message());
  } catch (const TransportError&) {
    state_.store(TransportState::Closed, std::memory_order_release);
    throw;
  }
  state_.store(TransportState::Open, std::memory_order_release);
  work_.emplace(net::make_work_guard(ioc_));
  ioThread_ = std::thread([this] { ioc_.run(); });
}

void BeastWebSocketTransport::send(const uint8_t* data, size_t size, MessageKind kind, bool isFinal) {
  if (state() != TransportState::Open) throw NotConnectedError();
  std::lock_guard<std::mutex> lk(writeMutex_);
  std::promise<beast::error_code> done;
  auto fut = done.get_future();
  net::post(ioc_, [&] {
    withStream([&](auto& ws) {
      ws.text(kind == MessageKind::Text);
      ws.async_write_some(isFinal, net::buffer(data, size), [&done](beast::error_code ec, std::size_t) { done.set_value(ec); });
    });
  });
  const beast::error_code ec = fut.get();
  if (ec) {
    state_.store(TransportState::Closed, std::memory_order_release);
    throw TransportError("WebSocket send failed: " + ec.message());
  }
}

ReceivedFrame BeastWebSocketTransport::receive(std::vector<uint8_t>& buffer) {
  const TransportState s = state();
  if (s != TransportState::Open && s != TransportState::CloseSent) throw NotConnectedError();
  if (buffer.empty()) buffer.resize(kDefaultReceiveBuffer);
  ReceivedFrame frame;
  std::promise<std::pair<beast::error_code, size_t>> done;
  auto fut = done.get_future();
  net::post(ioc_, [&] {
    withStream([&](auto& ws) {
      ws.async_read_some(net::buffer(buffer.data(), buffer.size()), [&frame, &done, &ws](beast::error_code ec, std::size_t n) {
        if (!ec) {
          frame.kind = ws.got_text() ? MessageKind::Text : MessageKind::Binary;
          frame.isFinal = ws.is_message_done();
        }
        done.set_value(std::make_pair(ec, n));
      });
    });
  });
  const auto result = fut.get();
  const beast::error_code& ec = result.first;
  if (ec == websocket::error::closed) {
    // Beast has already answered the peer's close frame.
    state_.store(TransportState::Closed, std::memory_order_release);
    frame.kind = MessageKind::Close;
    frame.size = 0;
    return frame;
  }
  if (ec == net::error::operation_aborted) throw TransportCancelled();
  if (ec) {
    state_.store(TransportState::Closed, std::memory_order_release);
    throw TransportError("WebSocket receive failed: " + ec.message());
  }
  frame.size = result.second;
  return frame;
}

void BeastWebSocketTransport::close(uint16_t code, const std::string& reason) {
  if (state() != TransportState::Open) return;
  state_.store(TransportState::CloseSent, std::memory_order_release);
  std::lock_guard<std::mutex> lk(writeMutex_);
  std::promise<beast::error_code> done;
  auto fut = done.get_future();
  net::post(ioc_, [&] {
    withStream([&](auto& ws) {
      ws.async_close(websocket::close_reason(static_cast<websocket::close_code>(code), reason), [&done](beast::error_code ec) { done.set_value(ec); });
    });
  });
  const beast::error_code ec = fut.get();
  state_.store(TransportState::Closed, std::memory_order_release);
  if (ec && ec != net::error::operation_aborted && ec != websocket::error::closed && ec != ssl::error::stream_truncated) {
    throw TransportError("WebSocket close failed: " + ec.message());
  }
}

void BeastWebSocketTransport::cancel() {
  if (!work_) return;
  net::post(ioc_, [this] {
    if (secure_) beast::get_lowest_layer(*secure_).cancel();
    else if (plain_) beast::get_lowest_layer(*plain_).cancel();
  });
  // An aborted websocket operation leaves the stream unusable.
  state_.store(TransportState::Closed, std::memory_order_release);
}

void BeastWebSocketTransport::stopIo() {
  work_.reset();
  ioc_.stop();
  if (ioThread_.joinable()) ioThread_.join();
}
