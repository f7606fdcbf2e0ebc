#include "tether/target.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/fusion/container/vector.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace x3     = boost::spirit::x3;
namespace fusion = boost::fusion;

auto tether::target::is_secure() const -> bool {
  return scheme == "https";
}

auto tether::parse_url(std::string_view const url, target& out) -> bool {

  auto scheme = std::string();
  auto host   = std::string();
  auto port   = std::string();
  auto rest   = std::string();

  auto parts =
    fusion::vector<std::string&, std::string&, std::string&, std::string&>(
      scheme, host, port, rest);

  auto const host_rule =
    ('[' >> +(x3::char_ - ']') >> ']') | +(x3::char_ - x3::char_(":/?#"));

  auto begin = url.begin();

  auto const matched = x3::parse(
    begin, url.end(),
    +x3::alpha >> "://" >> host_rule >> -(':' >> +x3::digit) >>
    -(&x3::char_("/?#") >> *x3::char_),
    parts);

  if (!matched || begin != url.end()) { return false; }

  boost::algorithm::to_lower(scheme);
  if (scheme != "http" && scheme != "https") { return false; }

  if (port.empty()) {
    port = (scheme == "https") ? "443" : "80";
  }

  // a fragment never goes on the wire
  //
  auto const fragment = rest.find('#');
  if (fragment != std::string::npos) {
    rest.erase(fragment);
  }

  if (rest.empty() || rest.front() != '/') {
    rest.insert(rest.begin(), '/');
  }

  out.scheme = std::move(scheme);
  out.host   = std::move(host);
  out.port   = std::move(port);
  out.path   = std::move(rest);

  return true;
}

auto tether::resolve_request_url(
  std::string_view const url,
  std::string_view const host_header
) -> std::string {

  // only a scheme at the very start makes the target absolute; a URL carried
  // in the query of an origin-form target does not
  //
  auto begin = url.begin();

  auto const has_scheme = x3::parse(
    begin, url.end(),
    x3::alpha >> *(x3::alnum | x3::lit('+') | '.' | '-') >> "://");

  if (has_scheme) {
    return std::string(url);
  }

  auto resolved = std::string("http://");
  resolved.append(host_header.data(), host_header.size());

  if (url.empty() || url.front() != '/') {
    resolved.push_back('/');
  }
  resolved.append(url.data(), url.size());

  return resolved;
}

auto tether::parse_authority(
  std::string_view const authority,
  std::string_view const default_port,
  std::string&           host,
  std::string&           port
) -> bool {

  host.clear();
  port.clear();

  auto host_and_port =
    fusion::vector<std::string&, std::string&>(host, port);

  auto begin = authority.begin();

  auto const matched = x3::parse(
    begin, authority.end(),
    (('[' >> +(x3::char_ - ']') >> ']') | +(x3::char_ - ':')) >>
    -(':' >> +x3::digit),
    host_and_port);

  if (!matched || begin != authority.end()) { return false; }

  if (port.empty()) {
    port = std::string(default_port);
  }

  return true;
}
