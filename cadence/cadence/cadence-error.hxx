#pragma once

#include <string>
#include <stdexcept>

namespace cadence
{
  // Job descriptor is missing a required field. Reported synchronously to
  // the caller of enqueue() and never retried.
  //
  class invalid_job_spec: public std::runtime_error
  {
  public:
    explicit
    invalid_job_spec (const std::string& m)
      : std::runtime_error (m) {}
  };

  // Base for everything that can go wrong during a transfer attempt.
  //
  class transfer_error: public std::runtime_error
  {
  public:
    explicit
    transfer_error (const std::string& m)
      : std::runtime_error (m) {}
  };

  // Network error, timeout, retryable status, or integrity mismatch. The job
  // is retried (on the next endpoint) while it has attempts left.
  //
  // A connection-level failure additionally flags the endpoint as suspected
  // down.
  //
  class recoverable_transfer_error: public transfer_error
  {
  public:
    explicit
    recoverable_transfer_error (const std::string& m,
                                bool connection_level = false)
      : transfer_error (m), connection_level_ (connection_level) {}

    bool
    connection_level () const noexcept
    {
      return connection_level_;
    }

  private:
    bool connection_level_;
  };

  // Authorization denied, resource not found, and the like. The job fails
  // without further attempts.
  //
  class fatal_transfer_error: public transfer_error
  {
  public:
    explicit
    fatal_transfer_error (const std::string& m)
      : transfer_error (m) {}
  };

  // No endpoint could serve the attempt. Counts as one recoverable failure
  // against the retry budget.
  //
  class endpoint_exhausted: public recoverable_transfer_error
  {
  public:
    explicit
    endpoint_exhausted (const std::string& m)
      : recoverable_transfer_error (m) {}
  };

  // Validation batch cannot continue (availability service unreachable).
  //
  class pipeline_abort: public std::runtime_error
  {
  public:
    explicit
    pipeline_abort (const std::string& m)
      : std::runtime_error (m) {}
  };

  // Subscription was torn down because its buffer overflowed. The consumer
  // has to subscribe again.
  //
  class subscription_overflow: public std::runtime_error
  {
  public:
    explicit
    subscription_overflow (const std::string& m)
      : std::runtime_error (m) {}
  };
}
