#ifndef TETHER_LOG_HPP_
#define TETHER_LOG_HPP_

#include <string_view>
#include <boost/system/error_code.hpp>

namespace tether {

  // the role tag ("agent", "relay") prefixed to every line
  //
  auto set_log_role(std::string_view const role) -> void;

  auto set_debug_logging(bool const enabled) -> void;
  auto debug_logging() -> bool;

  auto log_error(
    boost::system::error_code const ec,
    std::string_view const what
  ) -> void;

  auto log_error(std::string_view const what) -> void;
  auto log_warn(std::string_view const what)  -> void;
  auto log_info(std::string_view const what)  -> void;

  // only written when debug logging is enabled
  //
  auto log_debug(std::string_view const what) -> void;

} // tether

#endif // TETHER_LOG_HPP_
