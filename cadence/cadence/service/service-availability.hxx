#pragma once

#include <string>
#include <optional>

#include <boost/asio.hpp>

#include <cadence/diagnostics.hxx>
#include <cadence/http/http-client.hxx>
#include <cadence/endpoint/endpoint-registry.hxx>
#include <cadence/validation/validation-source.hxx>

namespace cadence
{
  namespace asio = boost::asio;

  // Availability lookup with
  //
  // GET <endpoint>/search/?s=<artist> <title>
  //
  // where the first track item of the result is taken as the match.
  //
  // Endpoints are taken from the shared registry. An endpoint that cannot be
  // reached or answers with a server error is flagged and the next one is
  // tried. Once every endpoint has been tried, the lookup throws
  // pipeline_abort.
  //
  class service_availability: public availability_checker
  {
  public:
    service_availability (http_client& c,
                          endpoint_registry& r,
                          diagnostics& d)
      : client_ (c), registry_ (r), diag_ (d) {}

    asio::awaitable<std::optional<availability>>
    check (const candidate_track&) override;

    static std::string
    search_url (const std::string& endpoint, const candidate_track&);

  private:
    http_client& client_;
    endpoint_registry& registry_;
    diagnostics& diag_;
  };
}
