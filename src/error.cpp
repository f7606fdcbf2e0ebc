#include "tether/error.hpp"

#include <string>

namespace {

struct tether_error_category : public boost::system::error_category {

  auto name() const noexcept -> char const* override {
    return "tether";
  }

  auto message(int ev) const -> std::string override {
    switch (static_cast<tether::error>(ev)) {
      case tether::error::malformed_envelope:
        return "malformed envelope";

      case tether::error::relay_unavailable:
        return "relay unavailable";

      case tether::error::relay_connection_lost:
        return "relay connection lost";

      case tether::error::response_timeout:
        return "relay response timed out";

      case tether::error::upstream_timeout:
        return "upstream request timed out";

      case tether::error::connection_refused_busy:
        return "relay already serves a connection";

      case tether::error::tunnel_rejected:
        return "tunnel rejected by relay";

      case tether::error::invalid_target:
        return "invalid request target";
    }
    return "unknown tether error";
  }
};

} // anonymous

auto tether::tether_category() -> boost::system::error_category const& {
  static tether_error_category const category;
  return category;
}

auto tether::make_error_code(error const e) -> boost::system::error_code {
  return boost::system::error_code(static_cast<int>(e), tether_category());
}
