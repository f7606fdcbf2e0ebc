#ifndef TETHER_HOP_BY_HOP_HPP_
#define TETHER_HOP_BY_HOP_HPP_

#include <boost/spirit/home/x3.hpp>
#include <boost/beast/http/field.hpp>

#include <boost/range/algorithm/for_each.hpp>

#include <vector>
#include <string>

namespace tether {

// every option enumerated by the Connection fields, in the order listed
//
// rfc 7230 allows empty list elements and optional whitespace around each
// element:
//
// Connection = *( "," OWS ) connection-option *( OWS "," [ OWS
// connection-option ] )
//
template <typename Fields>
auto connection_options(Fields const& fields) -> std::vector<std::string> {

  namespace x3    = boost::spirit::x3;
  namespace http  = boost::beast::http;
  namespace range = boost::range;

  auto options = std::vector<std::string>();

  range::for_each(
    fields.equal_range(http::field::connection),
    [&](auto const& field) {
      auto const val = field.value();

      auto const option = x3::lexeme[+(x3::char_ - ',' - x3::ascii::space)];

      x3::phrase_parse(
        val.begin(), val.end(),
        *x3::lit(',') >> -(option % +x3::lit(',')) >> *x3::lit(','),
        x3::ascii::space,
        options);
    });

  return options;
}

// removes everything that only concerns a single hop: the Connection field
// and the options it names, the fixed hop-by-hop set of rfc 7230 section 6.1
// and the legacy Proxy-Connection field
//
// Content-Length goes too; each hop re-frames the body it forwards
//
template <typename Fields>
auto strip_hop_by_hop(Fields& fields) -> void {

  namespace http = boost::beast::http;

  for (auto const& opt : connection_options(fields)) {
    fields.erase(opt);
  }

  fields.erase(http::field::connection);
  fields.erase(http::field::keep_alive);
  fields.erase(http::field::proxy_connection);
  fields.erase(http::field::proxy_authorization);
  fields.erase(http::field::te);
  fields.erase(http::field::trailer);
  fields.erase(http::field::transfer_encoding);
  fields.erase(http::field::upgrade);
  fields.erase(http::field::content_length);
}

} // tether

#endif // TETHER_HOP_BY_HOP_HPP_
