#include "tether/log.hpp"
#include <iostream>
#include <string>

namespace {

auto role          = std::string("tether");
auto debug_enabled = false;

auto write_line(
  std::ostream&          os,
  std::string_view const level,
  std::string_view const what
) -> void {
  os << "[" << role << "] " << level << ": " << what << "\n";
}

} // anonymous

auto tether::set_log_role(std::string_view const r) -> void {
  role = std::string(r);
}

auto tether::set_debug_logging(bool const enabled) -> void {
  debug_enabled = enabled;
}

auto tether::debug_logging() -> bool {
  return debug_enabled;
}

auto tether::log_error(
  boost::system::error_code const ec,
  std::string_view const what
) -> void {

  std::cerr
    << "[" << role << "] error: "
    << what << " : " << ec.message() << " (" << ec << ")\n";
}

auto tether::log_error(std::string_view const what) -> void {
  write_line(std::cerr, "error", what);
}

auto tether::log_warn(std::string_view const what) -> void {
  write_line(std::cerr, "warn", what);
}

auto tether::log_info(std::string_view const what) -> void {
  write_line(std::cout, "info", what);
}

auto tether::log_debug(std::string_view const what) -> void {
  if (!debug_enabled) { return; }
  write_line(std::cout, "debug", what);
}
