#include "tether/config.hpp"

#include <boost/optional/optional.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include <cstdlib>

namespace {

auto read_env(char const* name) -> boost::optional<std::string> {
  auto const* value = std::getenv(name);
  if (value == nullptr || *value == '\0') { return boost::none; }
  return std::string(value);
}

auto bad_value(char const* name, std::string const& value) -> std::string {
  return std::string(name) + ": invalid value \"" + value + "\"";
}

auto read_string(char const* name, std::string& out) -> void {
  if (auto const value = read_env(name)) { out = *value; }
}

auto read_port(
  char const*               name,
  std::uint16_t&            out,
  std::vector<std::string>& problems
) -> void {

  auto const value = read_env(name);
  if (!value) { return; }

  // lexical_cast into uint16_t would accept "-1" by wrapping it around
  //
  auto port = 0u;
  if (!boost::conversion::try_lexical_convert(*value, port) ||
      port == 0 || port > 65535) {
    problems.push_back(bad_value(name, *value));
    return;
  }
  out = static_cast<std::uint16_t>(port);
}

auto read_millis(
  char const*                name,
  std::chrono::milliseconds& out,
  std::vector<std::string>&  problems
) -> void {

  auto const value = read_env(name);
  if (!value) { return; }

  auto millis = 0ll;
  if (!boost::conversion::try_lexical_convert(*value, millis) || millis <= 0) {
    problems.push_back(bad_value(name, *value));
    return;
  }
  out = std::chrono::milliseconds(millis);
}

auto read_bool(
  char const*               name,
  bool&                     out,
  std::vector<std::string>& problems
) -> void {

  auto const value = read_env(name);
  if (!value) { return; }

  auto const lowered = boost::algorithm::to_lower_copy(*value);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    out = true;
  } else if (lowered == "false" || lowered == "0" || lowered == "no") {
    out = false;
  } else {
    problems.push_back(bad_value(name, *value));
  }
}

} // anonymous

auto tether::agent_config::from_environment() -> agent_config {
  auto config = agent_config();
  auto& problems = config.problems;

  read_port("TETHER_LOCAL_PORT", config.local_port, problems);
  read_string("TETHER_RELAY_HOST", config.relay_host);

  auto relay_port = std::uint16_t(0);
  read_port("TETHER_RELAY_PORT", relay_port, problems);
  if (relay_port != 0) {
    config.relay_port = std::to_string(relay_port);
  }

  if (auto const mode = read_env("TETHER_TUNNEL_MODE")) {
    auto const lowered = boost::algorithm::to_lower_copy(*mode);
    if (lowered == "direct") {
      config.tunnel = tunnel_mode::direct;
    } else if (lowered == "relay") {
      config.tunnel = tunnel_mode::relay;
    } else {
      problems.push_back(bad_value("TETHER_TUNNEL_MODE", *mode));
    }
  }

  read_bool("TETHER_USE_TLS", config.use_tls, problems);
  read_millis(
    "TETHER_RESPONSE_TIMEOUT_MS", config.response_timeout, problems);
  read_millis("TETHER_RECONNECT_MS", config.reconnect_interval, problems);
  read_millis("TETHER_CONNECT_WAIT_MS", config.connect_wait, problems);
  read_bool("TETHER_DEBUG", config.debug, problems);

  return config;
}

auto tether::agent_config::validate() const -> std::vector<std::string> {
  auto errors = problems;

  if (relay_host.empty()) {
    errors.push_back("relay host must not be empty");
  }
  if (response_timeout.count() <= 0) {
    errors.push_back("response timeout must be positive");
  }
  if (reconnect_interval.count() <= 0) {
    errors.push_back("reconnect interval must be positive");
  }

  return errors;
}

auto tether::relay_config::from_environment() -> relay_config {
  auto config = relay_config();
  auto& problems = config.problems;

  read_port("TETHER_PORT", config.port, problems);
  read_bool("TETHER_USE_TLS", config.use_tls, problems);
  read_string("TETHER_TLS_CERT_PATH", config.cert_path);
  read_string("TETHER_TLS_KEY_PATH", config.key_path);
  read_millis(
    "TETHER_UPSTREAM_TIMEOUT_MS", config.upstream_timeout, problems);
  read_bool("TETHER_UPSTREAM_VERIFY", config.upstream_verify, problems);
  read_bool("TETHER_DEBUG", config.debug, problems);

  return config;
}

auto tether::relay_config::validate() const -> std::vector<std::string> {
  auto errors = problems;

  if (use_tls && (cert_path.empty() || key_path.empty())) {
    errors.push_back(
      "TETHER_USE_TLS requires TETHER_TLS_CERT_PATH and TETHER_TLS_KEY_PATH");
  }
  if (upstream_timeout.count() <= 0) {
    errors.push_back("upstream timeout must be positive");
  }

  return errors;
}
