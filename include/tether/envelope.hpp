#ifndef TETHER_ENVELOPE_HPP_
#define TETHER_ENVELOPE_HPP_

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include <boost/optional/optional.hpp>
#include <boost/system/error_code.hpp>

#include <string>
#include <utility>
#include <vector>
#include <string_view>

namespace tether {

// header name/value pairs in the order they were received, name case
// preserved; a name may repeat (e.g. Set-Cookie)
//
using header_list = std::vector<std::pair<std::string, std::string>>;

// first value of a header, compared case-insensitively
//
auto find_header(header_list const& headers, std::string_view const name)
  -> boost::optional<std::string>;

// the payload of a `frame_type::request` frame
//
struct request_envelope {
  std::string method;

  // absolute-form url, origin-form path, or `host:port` for CONNECT
  //
  std::string url;
  header_list headers;

  // raw bytes; base64 only on the wire
  //
  std::string body;

  auto is_connect() const -> bool;
};

// the payload of a `frame_type::response` frame
//
struct response_envelope {
  unsigned    status_code = 200;
  header_list headers;
  std::string body;
};

// literal acknowledgments the relay sends for a CONNECT envelope
//
inline constexpr std::string_view tunnel_ack_ok   = "OK";
inline constexpr std::string_view tunnel_ack_fail = "FAIL";

auto base64_encode(std::string_view const bytes) -> std::string;

// returns false on characters outside the base64 alphabet
//
auto base64_decode(std::string_view const text, std::string& bytes) -> bool;

auto serialize(request_envelope const& envelope)  -> std::string;
auto serialize(response_envelope const& envelope) -> std::string;

// both parsers set `error::malformed_envelope` on anything that is not a JSON
// object with correctly typed members
//
auto parse_request_envelope(
  std::string_view const     text,
  boost::system::error_code& ec) -> request_envelope;

auto parse_response_envelope(
  std::string_view const     text,
  boost::system::error_code& ec) -> response_envelope;

using request_type  =
  boost::beast::http::request<boost::beast::http::string_body>;

using response_type =
  boost::beast::http::response<boost::beast::http::string_body>;

// captures a proxy request as received from a local client
//
auto make_request_envelope(request_type const& request) -> request_envelope;

// captures an origin response at the relay; hop-by-hop fields are dropped
// since the body is already de-chunked
//
auto make_response_envelope(response_type const& response)
  -> response_envelope;

auto make_error_envelope(
  boost::beast::http::status const status,
  std::string_view const           reason) -> response_envelope;

// rebuilds the answer for a local client; framing fields are recomputed
// from the body
//
auto make_response(
  response_envelope const& envelope,
  unsigned const           version,
  bool const               keep_alive) -> response_type;

auto make_error_response(
  boost::beast::http::status const status,
  std::string_view const           body,
  unsigned const                   version,
  bool const                       keep_alive) -> response_type;

} // tether

#endif // TETHER_ENVELOPE_HPP_
