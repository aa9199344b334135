#pragma once

#include <memory>
#include <string>

#include <boost/asio.hpp>

#include <cadence/http/http-client.hxx>
#include <cadence/transfer/transfer-source.hxx>

namespace cadence
{
  namespace asio = boost::asio;

  // Resolves a job against an endpoint with
  //
  // GET <endpoint>/track/?id=<reference>&quality=<tier>
  //
  // and locates the stream URL in the response.
  //
  class service_resolver: public stream_resolver
  {
  public:
    explicit
    service_resolver (http_client& c)
      : client_ (c) {}

    asio::awaitable<stream_location>
    resolve (const endpoint_candidate&, const job_descriptor&) override;

    // Request URL for the job on this endpoint.
    //
    static std::string
    track_url (const endpoint_candidate&, const job_descriptor&);

  private:
    http_client& client_;
  };

  // Streams a resolved location straight off the HTTP response body.
  //
  class service_fetcher: public stream_fetcher
  {
  public:
    explicit
    service_fetcher (http_client& c)
      : client_ (c) {}

    asio::awaitable<std::unique_ptr<byte_stream>>
    open (const stream_location&) override;

  private:
    http_client& client_;
  };

  // Endpoint base URL without trailing slashes.
  //
  std::string
  endpoint_base (const std::string& url);
}
