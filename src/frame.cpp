#include "tether/frame.hpp"

#include <boost/asio/buffer.hpp>

#include <array>

namespace asio = boost::asio;

namespace {

auto write_be32(std::uint32_t const v, std::string& out) -> void {
  out.push_back(static_cast<char>((v >> 24) & 0xff));
  out.push_back(static_cast<char>((v >> 16) & 0xff));
  out.push_back(static_cast<char>((v >> 8) & 0xff));
  out.push_back(static_cast<char>(v & 0xff));
}

auto read_be32(unsigned char const* in) -> std::uint32_t {
  return
    (static_cast<std::uint32_t>(in[0]) << 24) |
    (static_cast<std::uint32_t>(in[1]) << 16) |
    (static_cast<std::uint32_t>(in[2]) << 8)  |
     static_cast<std::uint32_t>(in[3]);
}

} // anonymous

auto tether::frame::is(frame_type const t) const -> bool {
  return type == static_cast<std::uint8_t>(t);
}

auto tether::is_known_frame_type(std::uint8_t const type) -> bool {
  return type <= static_cast<std::uint8_t>(frame_type::tunnel_close);
}

auto tether::encode_frame(
  std::uint8_t const     type,
  std::string_view const payload
) -> std::string {

  auto out = std::string();
  out.reserve(frame_header_size + payload.size());

  write_be32(static_cast<std::uint32_t>(payload.size()), out);
  out.push_back(static_cast<char>(type));
  out.append(payload.data(), payload.size());

  return out;
}

auto tether::encode_frame(
  frame_type const       type,
  std::string_view const payload
) -> std::string {
  return encode_frame(static_cast<std::uint8_t>(type), payload);
}

auto tether::decode_frame(boost::beast::flat_buffer& buffer)
  -> std::optional<frame> {

  if (buffer.size() < frame_header_size) { return {}; }

  auto header = std::array<unsigned char, frame_header_size>();
  asio::buffer_copy(asio::buffer(header), buffer.data());

  auto const length = static_cast<std::size_t>(read_be32(header.data()));
  if (buffer.size() - frame_header_size < length) { return {}; }

  buffer.consume(frame_header_size);

  auto f    = frame();
  f.type    = header[4];
  f.payload = std::string(length, '\0');

  asio::buffer_copy(asio::buffer(f.payload), buffer.data());
  buffer.consume(length);

  return f;
}

auto tether::frame_decoder::feed(std::string_view const bytes) -> void {
  auto const n = asio::buffer_copy(
    buffer_.prepare(bytes.size()),
    asio::buffer(bytes.data(), bytes.size()));

  buffer_.commit(n);
}

auto tether::frame_decoder::next() -> std::optional<frame> {
  return decode_frame(buffer_);
}

auto tether::frame_decoder::buffered() const -> std::size_t {
  return buffer_.size();
}
