#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include <cadence/job/job-types.hxx>

namespace cadence
{
  // Job state machine.
  //
  // queued -> active -> {completed | failed | cancelled}, with active able to
  // re-enter itself through retry() (attempt + 1, progress back to 0). Any
  // transition the machine does not permit throws std::logic_error; the queue
  // manager never issues one.
  //
  // Not synchronized: the owner serializes access.
  //
  class job
  {
  public:
    job (job_id, job_descriptor);

    job_id
    id () const noexcept
    {
      return id_;
    }

    const job_descriptor&
    descriptor () const noexcept
    {
      return descriptor_;
    }

    job_status
    status () const noexcept
    {
      return status_;
    }

    bool
    terminal () const noexcept
    {
      return cadence::terminal (status_);
    }

    double
    progress () const noexcept
    {
      return progress_;
    }

    std::uint32_t
    attempt () const noexcept
    {
      return attempt_;
    }

    const std::optional<std::string>&
    last_error () const noexcept
    {
      return last_error_;
    }

    const std::optional<std::string>&
    endpoint () const noexcept
    {
      return endpoint_;
    }

    // queued -> active with a fresh attempt count of 1.
    //
    void
    start ();

    // active -> (retrying) -> active. Record the error that caused it.
    //
    void
    retry (std::string error);

    // Endpoint the current attempt runs against.
    //
    void
    assign_endpoint (std::string);

    // Record attempt progress. Ratios are clamped to [0, 1] and never move
    // backwards within an attempt. Return true if the whole-percent value
    // changed, which is what is worth reporting.
    //
    bool
    advance (double ratio, std::uint64_t bytes);

    void
    complete (std::string location, std::uint64_t bytes);

    void
    fail (std::string error);

    // Any non-terminal state -> cancelled.
    //
    void
    cancel (std::string reason);

    job_snapshot
    snapshot () const;

  private:
    void
    require (job_status, const char* transition) const;

    job_id id_;
    job_descriptor descriptor_;

    job_status status_ {job_status::queued};
    double progress_ {0.0};
    std::uint32_t attempt_ {0};
    std::uint64_t bytes_ {0};
    std::optional<std::string> last_error_;
    std::optional<std::string> endpoint_;
    std::optional<std::string> location_;
  };
}
