#include "tether/client_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/coroutine.hpp>

#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <boost/core/ignore_unused.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <memory>
#include <utility>

namespace tether {
namespace detail {

struct async_connect_op : public boost::asio::coroutine {

  using tcp = boost::asio::ip::tcp;

  std::shared_ptr<session_state>    s;
  std::string                       host;
  std::string                       service;
  std::unique_ptr<tcp::resolver>    resolver;
  tcp::resolver::results_type       endpoints;
  tcp::endpoint                     endpoint;

  async_connect_op(
    std::shared_ptr<session_state> s_,
    std::string                    host_,
    std::string                    service_)
  : s(std::move(s_))
  , host(std::move(host_))
  , service(std::move(service_))
  {
  }

  template <typename Self>
  auto operator()(
    Self&                     self,
    boost::system::error_code ec,
    tcp::resolver::results_type results) -> void {

    endpoints = std::move(results);
    (*this)(self, ec);
  }

  template <typename Self>
  auto operator()(
    Self&                     self,
    boost::system::error_code ec,
    tcp::endpoint             connected) -> void {

    endpoint = std::move(connected);
    (*this)(self, ec);
  }

  #include <boost/asio/yield.hpp>
  template <typename Self>
  auto operator()(
    Self&                     self,
    boost::system::error_code ec = {}) -> void {

    namespace asio = boost::asio;
    namespace ssl  = boost::asio::ssl;

    reenter(*this) {
      // never complete inline from the initiating function
      //
      yield asio::post(s->stream.get_executor(), std::move(self));

      if (s->stream.is_ssl()) {
        auto& ssl_stream = s->stream.ssl_stream();

        auto const res = SSL_set_tlsext_host_name(
          ssl_stream.native_handle(), host.c_str());

        if (res != 1) {
          ec.assign(
            static_cast<int>(::ERR_get_error()),
            asio::error::get_ssl_category());

          return self.complete(ec, tcp::endpoint());
        }

        // only consulted when the context asks for peer verification
        //
        ssl_stream.set_verify_callback(ssl::host_name_verification(host));
      }

      resolver = std::make_unique<tcp::resolver>(s->stream.get_executor());

      yield resolver->async_resolve(host, service, std::move(self));
      if (ec) {
        return self.complete(ec, tcp::endpoint());
      }

      yield asio::async_connect(s->stream.stream(), endpoints, std::move(self));
      if (ec) {
        return self.complete(ec, tcp::endpoint());
      }

      if (s->stream.is_ssl()) {
        yield s->stream.ssl_stream().async_handshake(
          ssl::stream_base::client, std::move(self));

        if (ec) {
          return self.complete(ec, tcp::endpoint());
        }
      }

      self.complete({}, endpoint);
    }
  }
  #include <boost/asio/unyield.hpp>
};

template <
  typename Request,
  typename ResponseParser
>
struct async_request_op : public boost::asio::coroutine {

  std::shared_ptr<session_state> s;
  Request&                       request;
  ResponseParser&                parser;

  async_request_op(
    std::shared_ptr<session_state> s_,
    Request&                       request_,
    ResponseParser&                parser_)
  : s(std::move(s_))
  , request(request_)
  , parser(parser_)
  {
  }

  #include <boost/asio/yield.hpp>
  template <typename Self>
  auto operator()(
    Self&                     self,
    boost::system::error_code ec                = {},
    std::size_t               bytes_transferred = 0) -> void {

    namespace http = boost::beast::http;

    boost::ignore_unused(bytes_transferred);

    reenter(*this) {
      yield http::async_write(s->stream, request, std::move(self));
      if (ec) {
        return self.complete(ec);
      }

      yield http::async_read(s->stream, s->buffer, parser, std::move(self));
      self.complete(ec);
    }
  }
  #include <boost/asio/unyield.hpp>
};

} // detail
} // tether

template <typename ConnectHandler>
auto tether::client_session::async_connect(
  std::string      host,
  std::string      service,
  ConnectHandler&& connect_handler
) & {

  using boost::asio::ip::tcp;
  using boost::system::error_code;

  return boost::asio::async_compose<
    ConnectHandler, void(error_code, tcp::endpoint)
  >(
    detail::async_connect_op(s_, std::move(host), std::move(service)),
    connect_handler,
    s_->stream);
}

template <
  typename Request,
  typename ResponseParser,
  typename RequestHandler
>
auto tether::client_session::async_request(
  Request&         request,
  ResponseParser&  parser,
  RequestHandler&& request_handler
) & {

  using boost::system::error_code;

  return boost::asio::async_compose<RequestHandler, void(error_code)>(
    detail::async_request_op<Request, ResponseParser>(s_, request, parser),
    request_handler,
    s_->stream);
}
