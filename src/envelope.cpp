#include "tether/envelope.hpp"

#include "tether/error.hpp"
#include "tether/hop_by_hop.hpp"

#include <boost/beast/core/detail/base64.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace http   = boost::beast::http;
namespace base64 = boost::beast::detail::base64;

using json = nlohmann::json;
using boost::system::error_code;

namespace {

auto to_json(tether::header_list const& headers) -> json {
  auto obj = json::object();

  for (auto const& [name, value] : headers) {
    auto pos = obj.find(name);
    if (pos == obj.end()) {
      obj[name] = value;
      continue;
    }

    // repeated header names collapse into an array of values
    //
    if (!pos->is_array()) {
      *pos = json::array({*pos});
    }
    pos->push_back(value);
  }

  return obj;
}

auto from_json(json const& obj, tether::header_list& headers) -> bool {
  if (!obj.is_object()) { return false; }

  for (auto const& item : obj.items()) {
    auto const& value = item.value();

    if (value.is_string()) {
      headers.emplace_back(item.key(), value.get<std::string>());
      continue;
    }

    if (!value.is_array()) { return false; }

    for (auto const& element : value) {
      if (!element.is_string()) { return false; }
      headers.emplace_back(item.key(), element.get<std::string>());
    }
  }

  return true;
}

auto parse_object(std::string_view const text, error_code& ec) -> json {
  auto obj = json::parse(text.begin(), text.end(), nullptr, false);
  if (obj.is_discarded() || !obj.is_object()) {
    ec = tether::error::malformed_envelope;
    return json();
  }
  return obj;
}

template <typename Fields>
auto copy_fields(Fields const& fields) -> tether::header_list {
  auto headers = tether::header_list();
  for (auto const& field : fields) {
    auto const name  = field.name_string();
    auto const value = field.value();

    headers.emplace_back(
      std::string(name.data(), name.size()),
      std::string(value.data(), value.size()));
  }
  return headers;
}

} // anonymous

auto tether::find_header(
  header_list const&     headers,
  std::string_view const name
) -> boost::optional<std::string> {

  auto const pos = std::find_if(
    headers.begin(), headers.end(),
    [&](auto const& header) {
      return boost::algorithm::iequals(header.first, name);
    });

  if (pos == headers.end()) { return boost::none; }
  return pos->second;
}

auto tether::request_envelope::is_connect() const -> bool {
  return boost::algorithm::iequals(method, "CONNECT");
}

auto tether::base64_encode(std::string_view const bytes) -> std::string {
  auto text = std::string(base64::encoded_size(bytes.size()), '\0');
  auto const n = base64::encode(text.data(), bytes.data(), bytes.size());
  text.resize(n);
  return text;
}

auto tether::base64_decode(std::string_view const text, std::string& bytes)
  -> bool {

  // the decoder stops at the first '=' or at the first character outside the
  // alphabet, only the former is acceptable
  //
  auto const padding = text.find('=');
  auto const data    =
    (padding == std::string_view::npos) ? text.size() : padding;

  if (text.find_first_not_of('=', data) != std::string_view::npos) {
    return false;
  }

  // unpadded input may carry a trailing partial quantum
  //
  bytes.resize(base64::decoded_size(text.size()) + 3);
  auto const [written, read] =
    base64::decode(bytes.data(), text.data(), text.size());

  if (read < data) { return false; }

  bytes.resize(written);
  return true;
}

auto tether::serialize(request_envelope const& envelope) -> std::string {
  auto obj = json::object();

  obj["method"]  = envelope.method;
  obj["url"]     = envelope.url;
  obj["headers"] = to_json(envelope.headers);
  obj["body"]    = base64_encode(envelope.body);

  return obj.dump();
}

auto tether::serialize(response_envelope const& envelope) -> std::string {
  auto obj = json::object();

  obj["statusCode"] = envelope.status_code;
  obj["headers"]    = to_json(envelope.headers);
  obj["body"]       = base64_encode(envelope.body);

  return obj.dump();
}

auto tether::parse_request_envelope(
  std::string_view const text,
  error_code&            ec
) -> request_envelope {

  auto envelope = request_envelope();

  auto const obj = parse_object(text, ec);
  if (ec) { return envelope; }

  auto const method = obj.find("method");
  if (method == obj.end() || !method->is_string() ||
      method->get_ref<std::string const&>().empty()) {
    ec = error::malformed_envelope;
    return envelope;
  }
  envelope.method = method->get<std::string>();

  // `path` is accepted in place of `url`
  //
  auto url = obj.find("url");
  if (url == obj.end() || url->is_null()) {
    url = obj.find("path");
  }
  if (url != obj.end() && !url->is_null()) {
    if (!url->is_string()) {
      ec = error::malformed_envelope;
      return envelope;
    }
    envelope.url = url->get<std::string>();
  }

  auto const headers = obj.find("headers");
  if (headers != obj.end() && !headers->is_null()) {
    if (!from_json(*headers, envelope.headers)) {
      ec = error::malformed_envelope;
      return envelope;
    }
  }

  auto const body = obj.find("body");
  if (body != obj.end() && !body->is_null()) {
    if (!body->is_string() ||
        !base64_decode(body->get_ref<std::string const&>(), envelope.body)) {
      ec = error::malformed_envelope;
      return envelope;
    }
  }

  return envelope;
}

auto tether::parse_response_envelope(
  std::string_view const text,
  error_code&            ec
) -> response_envelope {

  auto envelope = response_envelope();

  auto const obj = parse_object(text, ec);
  if (ec) { return envelope; }

  // a missing or zero status means success
  //
  auto const status = obj.find("statusCode");
  if (status != obj.end() && !status->is_null()) {
    if (!status->is_number_unsigned() && !status->is_number_integer()) {
      ec = error::malformed_envelope;
      return envelope;
    }

    auto const code = status->get<long long>();
    if (code < 0 || code > 999) {
      ec = error::malformed_envelope;
      return envelope;
    }
    if (code != 0) {
      envelope.status_code = static_cast<unsigned>(code);
    }
  }

  auto const headers = obj.find("headers");
  if (headers != obj.end() && !headers->is_null()) {
    if (!from_json(*headers, envelope.headers)) {
      ec = error::malformed_envelope;
      return envelope;
    }
  }

  auto const body = obj.find("body");
  if (body != obj.end() && !body->is_null()) {
    if (!body->is_string() ||
        !base64_decode(body->get_ref<std::string const&>(), envelope.body)) {
      ec = error::malformed_envelope;
      return envelope;
    }
  }

  return envelope;
}

auto tether::make_request_envelope(request_type const& request)
  -> request_envelope {

  auto const method = request.method_string();
  auto const target = request.target();

  auto envelope    = request_envelope();
  envelope.method  = std::string(method.data(), method.size());
  envelope.url     = std::string(target.data(), target.size());
  envelope.headers = copy_fields(request.base());
  envelope.body    = request.body();

  return envelope;
}

auto tether::make_response_envelope(response_type const& response)
  -> response_envelope {

  auto fields = http::fields(response.base());
  strip_hop_by_hop(fields);

  auto envelope        = response_envelope();
  envelope.status_code = response.result_int();
  envelope.headers     = copy_fields(fields);
  envelope.body        = response.body();

  return envelope;
}

auto tether::make_error_envelope(
  http::status const     status,
  std::string_view const reason
) -> response_envelope {

  auto envelope        = response_envelope();
  envelope.status_code = static_cast<unsigned>(status);
  envelope.headers.emplace_back("content-type", "text/plain");
  envelope.body        = std::string(reason);

  return envelope;
}

auto tether::make_response(
  response_envelope const& envelope,
  unsigned const           version,
  bool const               keep_alive
) -> response_type {

  auto response = response_type();
  response.result(envelope.status_code);
  response.version(version);

  for (auto const& [name, value] : envelope.headers) {
    response.insert(name, value);
  }

  strip_hop_by_hop(response.base());

  response.body() = envelope.body;
  response.keep_alive(keep_alive);
  response.prepare_payload();

  return response;
}

auto tether::make_error_response(
  http::status const     status,
  std::string_view const body,
  unsigned const         version,
  bool const             keep_alive
) -> response_type {

  auto response = response_type(status, version);
  response.set(http::field::content_type, "text/plain");
  response.body() = std::string(body);
  response.keep_alive(keep_alive);
  response.prepare_payload();

  return response;
}
