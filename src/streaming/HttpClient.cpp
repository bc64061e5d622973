#include "HttpClient.hpp"
#include <cstdio>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include "BeastWebSocketTransport.hpp"
#include "../core/Errors.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {
template <class Stream>
HttpResponse roundTrip(Stream& stream, const http::request<http::string_body>& req) {
  http::write(stream, req);
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);
  return HttpResponse{static_cast<int>(res.result_int()), res.body()};
}
} // namespace

HttpResponse httpPost(const std::string& url, const HttpHeaders& headers, const std::string& body, const std::string& contentType) {
  const ParsedUri u = parseUri(url);
  http::request<http::string_body> req{http::verb::post, u.target, 11};
  req.set(http::field::host, u.host);
  req.set(http::field::user_agent, "voxflow");
  req.set(http::field::content_type, contentType);
  for (const auto& h : headers) req.set(h.first, h.second);
  req.body() = body;
  req.prepare_payload();

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    const auto results = resolver.resolve(u.host, u.port);
    if (u.secure) {
      ssl::context ctx(ssl::context::tls_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(ssl::verify_peer);
      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
        throw TransportError("Failed to set TLS SNI host name for " + u.host);
      }
      beast::get_lowest_layer(stream).connect(results);
      stream.handshake(ssl::stream_base::client);
      HttpResponse res = roundTrip(stream, req);
      beast::error_code ec;
      stream.shutdown(ec);
      if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        std::fprintf(stderr, "Warning: TLS shutdown for %s: %s\n", u.host.c_str(), ec.message().c_str());
      }
      return res;
    }
    beast::tcp_stream stream(ioc);
    stream.connect(results);
    HttpResponse res = roundTrip(stream, req);
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
  } catch (const boost::system::system_error& e) {
    throw TransportError("HTTP POST " + url + " failed: " + e.code().message());
  }
}
