#pragma once

#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>

#include <cadence/job/job-types.hxx>

namespace cadence
{
  // Ordered writer for the bytes of one job.
  //
  // Bytes arrive in offset order. Nothing is visible at the final location
  // until commit(); discard() throws away whatever was written and turns
  // later writes into no-ops.
  //
  class transfer_sink
  {
  public:
    virtual
    ~transfer_sink () = default;

    virtual void
    write (std::uint64_t offset, const char* data, std::size_t size) = 0;

    // Start over from offset 0 (new attempt).
    //
    virtual void
    reset () = 0;

    // Make the output final and return its location.
    //
    virtual std::string
    commit () = 0;

    virtual void
    discard () noexcept = 0;

    // Bytes written since the last reset.
    //
    virtual std::uint64_t
    size () const = 0;
  };

  class sink_factory
  {
  public:
    virtual
    ~sink_factory () = default;

    virtual std::shared_ptr<transfer_sink>
    create (job_id, const job_descriptor&) = 0;
  };
}
