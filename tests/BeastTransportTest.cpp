#include <gtest/gtest.h>
#include <cstdint>
#include <exception>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/stream.hpp>
#include "core/Errors.hpp"
#include "streaming/BeastWebSocketTransport.hpp"

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

// Loopback peer: echoes one message, then reports the close frame it receives.
struct EchoPeer {
  net::io_context ioc;
  tcp::acceptor acceptor{ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)};
  std::thread thread;
  std::string error;
  bool sawClose = false;
  uint16_t closeCode = 0;
  std::string closeReason;

  ~EchoPeer() {
    if (thread.joinable()) thread.join();
  }

  unsigned short port() const { return acceptor.local_endpoint().port(); }

  void start() {
    thread = std::thread([this] {
      try {
        tcp::socket sock(ioc);
        acceptor.accept(sock);
        websocket::stream<tcp::socket> ws(std::move(sock));
        ws.accept();
        beast::flat_buffer buf;
        ws.read(buf);
        ws.text(ws.got_text());
        ws.write(buf.data());
        buf.consume(buf.size());
        beast::error_code ec;
        ws.read(buf, ec);
        sawClose = ec == websocket::error::closed;
        closeCode = static_cast<uint16_t>(ws.reason().code);
        closeReason = std::string(ws.reason().reason.data(), ws.reason().reason.size());
      } catch (const std::exception& e) {
        error = e.what();
      }
    });
  }
};

} // namespace

TEST(ParseUri, DefaultsPortAndTarget) {
  const auto plain = parseUri("ws://stt.local");
  EXPECT_FALSE(plain.secure);
  EXPECT_EQ(plain.host, "stt.local");
  EXPECT_EQ(plain.port, "80");
  EXPECT_EQ(plain.target, "/");
  const auto secure = parseUri("wss://api.example.com:8443/v1/listen?model=nova");
  EXPECT_TRUE(secure.secure);
  EXPECT_EQ(secure.port, "8443");
  EXPECT_EQ(secure.target, "/v1/listen?model=nova");
  EXPECT_THROW(parseUri("ftp://host/"), TransportError);
}

TEST(BeastWebSocketTransport, EchoThenCloseSendsCodeAndReason) {
  EchoPeer peer;
  peer.start();
  BeastWebSocketTransport t;
  try {
    t.connect("ws://127.0.0.1:" + std::to_string(peer.port()) + "/echo");
  } catch (const TransportError& e) {
    // Unblock a peer still waiting in accept().
    beast::error_code ignored;
    tcp::socket nudge(peer.ioc);
    nudge.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), peer.port()), ignored);
    nudge.close(ignored);
    peer.thread.join();
    FAIL() << e.what();
  }
  EXPECT_EQ(t.state(), TransportState::Open);

  const std::string ping = "ping";
  t.send(reinterpret_cast<const uint8_t*>(ping.data()), ping.size(), MessageKind::Text, true);
  std::vector<uint8_t> buffer(64);
  const ReceivedFrame frame = t.receive(buffer);
  EXPECT_EQ(frame.kind, MessageKind::Text);
  EXPECT_TRUE(frame.isFinal);
  EXPECT_EQ(std::string(buffer.begin(), buffer.begin() + frame.size), "ping");

  t.close(kCloseNormal, "done");
  peer.thread.join();
  EXPECT_EQ(t.state(), TransportState::Closed);
  EXPECT_TRUE(peer.error.empty()) << peer.error;
  EXPECT_TRUE(peer.sawClose);
  EXPECT_EQ(peer.closeCode, kCloseNormal);
  EXPECT_EQ(peer.closeReason, "done");
  EXPECT_THROW(t.send(reinterpret_cast<const uint8_t*>(ping.data()), ping.size(), MessageKind::Text, true), NotConnectedError);
}
