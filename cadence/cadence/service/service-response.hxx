#pragma once

#include <string>
#include <optional>

#include <boost/json.hpp>

namespace cadence
{
  namespace json = boost::json;

  // Throw the transfer error matching a non-2xx status of a service
  // request: 401, 403, 404, and 410 are fatal, everything else (notably 429
  // and 5xx) is recoverable. Do nothing on 2xx.
  //
  void
  throw_for_status (unsigned status, const std::string& what);

  // Return the list of items of the given kind in a search result.
  //
  // The service is not consistent about its envelope so accept all of:
  //
  // [{"<key>": {"items": [...]}}, ...]
  // [{"<key>": [...]}, ...]
  // [<item>, ...]
  // {"<key>": {"items": [...]}}
  // {"items": [...]}
  //
  // Anything else yields an empty array.
  //
  json::array
  extract_items (const json::value&, const std::string& key);

  // Locate the stream URL in a track response (an object or an array of
  // them): the first OriginalTrackUrl member, else the first decodable
  // base64 manifest member, read either as JSON with a urls array or as
  // text containing an http(s) URL.
  //
  std::optional<std::string>
  extract_stream_url (const json::value&);

  // Decode standard base64. Whitespace is ignored and missing padding is
  // tolerated. Throw std::invalid_argument on malformed input.
  //
  std::string
  decode_base64 (const std::string&);
}
