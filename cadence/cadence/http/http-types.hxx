#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <optional>

namespace cadence
{
  // Components of an absolute http(s) URL.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path and query, at least "/".

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    // scheme://host[:port], with the port omitted if it is the default one.
    //
    std::string
    origin () const;
  };

  // Split an http(s) URL. A URL without a scheme is taken to be http.
  //
  // Note that this handles the plain scheme://host:port/path form and
  // nothing else (no user info, no IPv6 literals). Throw
  // std::invalid_argument if there is no host or the scheme is not http or
  // https.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a Location header value against the URL of the request that
  // produced it.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);

  // Percent-encode a query component (RFC 3986 unreserved characters are
  // kept as is).
  //
  std::string
  url_encode (const std::string&);

  using http_header = std::pair<std::string, std::string>;

  // Fully buffered response.
  //
  struct http_response
  {
    unsigned status {0};
    std::string reason;
    std::vector<http_header> headers;
    std::string body;

    // Case-insensitive lookup of the first header with this name.
    //
    std::optional<std::string>
    header (const std::string& name) const;

    bool
    success () const noexcept
    {
      return status >= 200 && status < 300;
    }
  };

  inline bool
  redirection (unsigned status) noexcept
  {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
  }
}
