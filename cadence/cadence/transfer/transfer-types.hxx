#pragma once

#include <atomic>
#include <string>
#include <cstdint>
#include <ostream>
#include <utility>
#include <optional>

namespace cadence
{
  // Where the bytes of a job can be fetched from, as resolved against one
  // endpoint.
  //
  struct stream_location
  {
    std::string url;
    std::optional<std::uint64_t> size;  // Expected byte count, if known.
    std::optional<std::string> digest;  // Hex digest, if the service has one.
    std::string digest_algorithm = "sha256";
  };

  // Cooperative cancellation flag shared between the queue manager and the
  // attempt that runs a job.
  //
  class cancellation_token
  {
  public:
    void
    cancel () noexcept
    {
      cancelled_.store (true, std::memory_order_release);
    }

    bool
    cancelled () const noexcept
    {
      return cancelled_.load (std::memory_order_acquire);
    }

  private:
    std::atomic<bool> cancelled_ {false};
  };

  // How a transfer attempt ended.
  //
  enum class attempt_status
  {
    completed,
    recoverable,
    fatal,
    cancelled
  };

  std::string
  to_string (attempt_status);

  inline std::ostream&
  operator<< (std::ostream& os, attempt_status s)
  {
    return os << to_string (s);
  }

  // Outcome of a single transfer attempt, reported back to the queue
  // manager.
  //
  struct attempt_result
  {
    attempt_status status {attempt_status::recoverable};
    std::string message;

    // The failure was at the connection level and the endpoint should be
    // considered suspected down.
    //
    bool connection_failure {false};

    std::string location;     // Committed output, once completed.
    std::uint64_t bytes {0};  // Bytes written in this attempt.

    static attempt_result
    completed (std::string location, std::uint64_t bytes)
    {
      attempt_result r;
      r.status = attempt_status::completed;
      r.location = std::move (location);
      r.bytes = bytes;
      return r;
    }

    static attempt_result
    recoverable (std::string m, bool connection_failure = false)
    {
      attempt_result r;
      r.status = attempt_status::recoverable;
      r.message = std::move (m);
      r.connection_failure = connection_failure;
      return r;
    }

    static attempt_result
    fatal (std::string m)
    {
      attempt_result r;
      r.status = attempt_status::fatal;
      r.message = std::move (m);
      return r;
    }

    static attempt_result
    cancelled (std::string m = "cancelled")
    {
      attempt_result r;
      r.status = attempt_status::cancelled;
      r.message = std::move (m);
      return r;
    }
  };
}
