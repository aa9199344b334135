#pragma once

#include <chrono>
#include <string>
#include <cstdint>

#include <boost/asio.hpp>

#include <cadence/diagnostics.hxx>
#include <cadence/transfer/transfer-lease.hxx>
#include <cadence/transfer/transfer-types.hxx>
#include <cadence/transfer/transfer-source.hxx>

namespace cadence
{
  namespace asio = boost::asio;

  // Runs one attempt of a job.
  //
  // Implementations report every per-job failure through the result rather
  // than by throwing.
  //
  class transfer_executor
  {
  public:
    virtual
    ~transfer_executor () = default;

    virtual asio::awaitable<attempt_result>
    execute (transfer_lease&) = 0;
  };

  struct stream_transfer_executor_traits
  {
    // Deadline for resolving the stream location (0 = none).
    //
    std::chrono::milliseconds resolve_timeout {60000};

    // Deadline for moving the bytes (0 = none).
    //
    std::chrono::milliseconds transfer_timeout {300000};
  };

  // Executor that resolves a stream location on the lease's endpoint, pulls
  // the bytes through a fetcher into the lease's sink, verifies them, and
  // commits.
  //
  // The cancellation token is checked before resolving and before every
  // chunk is written. A transfer completes only if it produced at least one
  // byte, matched the resolved size when one was given, and matched the
  // resolved digest when one was given.
  //
  class stream_transfer_executor: public transfer_executor
  {
  public:
    using traits_type = stream_transfer_executor_traits;

    stream_transfer_executor (stream_resolver&,
                              stream_fetcher&,
                              diagnostics&,
                              traits_type = traits_type ());

    asio::awaitable<attempt_result>
    execute (transfer_lease&) override;

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    struct transfer_outcome
    {
      bool stopped {false};     // Cancelled or lease revoked.
      std::uint64_t bytes {0};
      std::string digest;       // Empty if not computed.
    };

    asio::awaitable<transfer_outcome>
    transfer (transfer_lease&, const stream_location&);

    stream_resolver& resolver_;
    stream_fetcher& fetcher_;
    diagnostics& diag_;
    traits_type traits_;
  };
}
