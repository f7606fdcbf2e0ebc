#ifndef TETHER_TARGET_HPP_
#define TETHER_TARGET_HPP_

#include <string>
#include <string_view>

namespace tether {

// the pieces of an absolute-form request URL the relay needs to reach an
// origin server
//
struct target {
  std::string scheme;
  std::string host;
  std::string port;

  // origin-form request target, always starting with '/'
  //
  std::string path;

  auto is_secure() const -> bool;
};

// parses `scheme://host[:port][path]`; IPv6 literals are accepted in
// brackets and returned without them
//
// the port defaults to 443 for https and 80 otherwise
//
auto parse_url(std::string_view const url, target& out) -> bool;

// turns the request target a local client sent into an absolute URL
//
// proxy clients send the absolute form already, origin-form targets are
// completed from the Host header
//
auto resolve_request_url(
  std::string_view const url,
  std::string_view const host_header) -> std::string;

// splits a CONNECT authority `host[:port]`
//
auto parse_authority(
  std::string_view const authority,
  std::string_view const default_port,
  std::string&           host,
  std::string&           port) -> bool;

} // tether

#endif // TETHER_TARGET_HPP_
