#ifndef TETHER_CONFIG_HPP_
#define TETHER_CONFIG_HPP_

#include <chrono>
#include <string>
#include <vector>
#include <cstdint>

namespace tether {

// how the agent carries CONNECT tunnels
//
// direct: the agent dials the target itself
// relay:  tunnel bytes travel as frames over the relay link
//
enum class tunnel_mode { direct, relay };

struct agent_config {
  std::uint16_t local_port = 8080;
  std::string   relay_host = "localhost";
  std::string   relay_port = "9999";
  bool          use_tls    = false;
  tunnel_mode   tunnel     = tunnel_mode::direct;

  std::chrono::milliseconds response_timeout   = std::chrono::milliseconds(20000);
  std::chrono::milliseconds reconnect_interval = std::chrono::milliseconds(5000);
  std::chrono::milliseconds connect_wait       = std::chrono::milliseconds(200);

  bool debug = false;

  // values present in the environment that could not be parsed
  //
  std::vector<std::string> problems;

  static auto from_environment() -> agent_config;

  // every reason the configuration is unusable, empty when it is fine
  //
  auto validate() const -> std::vector<std::string>;
};

struct relay_config {
  std::uint16_t port    = 9999;
  bool          use_tls = false;
  std::string   cert_path;
  std::string   key_path;

  std::chrono::milliseconds upstream_timeout = std::chrono::milliseconds(20000);

  // verify origin certificates against the system trust store
  //
  bool upstream_verify = true;
  bool debug           = false;

  std::vector<std::string> problems;

  static auto from_environment() -> relay_config;
  auto validate() const -> std::vector<std::string>;
};

} // tether

#endif // TETHER_CONFIG_HPP_
