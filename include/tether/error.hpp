#ifndef TETHER_ERROR_HPP_
#define TETHER_ERROR_HPP_

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace tether {

// error codes produced by tether itself
//
// failures from the network stack (resolution, connection, TLS) keep their
// original categories and are passed through untouched
//
enum class error {
  // a frame payload could not be decoded as an envelope
  malformed_envelope = 1,

  // no connection to the relay could be established in time
  relay_unavailable,

  // the relay connection closed while a request was in flight
  relay_connection_lost,

  // the relay did not answer within the response timeout
  response_timeout,

  // the origin server did not answer within the upstream timeout
  upstream_timeout,

  // a relay connection was refused because another one is active
  connection_refused_busy,

  // the relay could not open the requested tunnel
  tunnel_rejected,

  // a request url or CONNECT target could not be parsed
  invalid_target
};

auto tether_category() -> boost::system::error_category const&;

auto make_error_code(error const e) -> boost::system::error_code;

} // tether

namespace boost {
namespace system {

template <>
struct is_error_code_enum<tether::error> : std::true_type {};

} // system
} // boost

#endif // TETHER_ERROR_HPP_
