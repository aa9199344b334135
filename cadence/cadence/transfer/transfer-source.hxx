#pragma once

#include <memory>
#include <string>
#include <optional>

#include <boost/asio.hpp>

#include <cadence/job/job-types.hxx>
#include <cadence/endpoint/endpoint-types.hxx>
#include <cadence/transfer/transfer-types.hxx>

namespace cadence
{
  namespace asio = boost::asio;

  // Maps a job to a stream location on a given endpoint.
  //
  // Throws fatal_transfer_error when the service refuses the job for good
  // (not found, not authorized) and recoverable_transfer_error for anything
  // worth retrying. Network errors surface as boost::system::system_error.
  //
  class stream_resolver
  {
  public:
    virtual
    ~stream_resolver () = default;

    virtual asio::awaitable<stream_location>
    resolve (const endpoint_candidate&, const job_descriptor&) = 0;
  };

  // Ordered chunks of a stream. read() returns nullopt once the stream is
  // exhausted.
  //
  class byte_stream
  {
  public:
    virtual
    ~byte_stream () = default;

    virtual asio::awaitable<std::optional<std::string>>
    read () = 0;

    // Total size as announced by the source, if any.
    //
    virtual std::optional<std::uint64_t>
    content_length () const
    {
      return std::nullopt;
    }
  };

  class stream_fetcher
  {
  public:
    virtual
    ~stream_fetcher () = default;

    virtual asio::awaitable<std::unique_ptr<byte_stream>>
    open (const stream_location&) = 0;
  };
}
