#ifndef TETHER_FRAME_HPP_
#define TETHER_FRAME_HPP_

#include <boost/beast/core/flat_buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <optional>
#include <string_view>

namespace tether {

// wire layout of a frame:
//
// | length: uint32 big-endian | type: uint8 | payload: length bytes |
//
inline constexpr std::size_t frame_header_size = 5;

enum class frame_type : std::uint8_t {
  request      = 0,
  response     = 1,
  tunnel_data  = 2,
  tunnel_close = 3
};

struct frame {
  // kept as the raw tag so that frames of unknown types survive decoding
  //
  std::uint8_t type = 0;
  std::string  payload;

  auto is(frame_type const t) const -> bool;
};

auto is_known_frame_type(std::uint8_t const type) -> bool;

auto encode_frame(std::uint8_t const type, std::string_view const payload)
  -> std::string;

auto encode_frame(frame_type const type, std::string_view const payload)
  -> std::string;

// consumes exactly one complete frame from the front of `buffer`
//
// returns an empty optional, leaving `buffer` untouched, when fewer than
// `length + 5` bytes are available
//
auto decode_frame(boost::beast::flat_buffer& buffer) -> std::optional<frame>;

// frame_decoder accumulates a byte stream delivered in arbitrary pieces and
// hands out the complete frames it contains, one at a time
//
struct frame_decoder {
private:
  boost::beast::flat_buffer buffer_;

public:
  auto feed(std::string_view const bytes) -> void;

  // the next complete frame, if any; an incomplete trailing frame stays
  // buffered for later calls
  //
  auto next() -> std::optional<frame>;

  auto buffered() const -> std::size_t;
};

} // tether

#endif // TETHER_FRAME_HPP_
