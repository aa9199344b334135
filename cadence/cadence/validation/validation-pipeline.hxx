#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstddef>

#include <boost/asio.hpp>

#include <cadence/diagnostics.hxx>
#include <cadence/progress/progress-event.hxx>
#include <cadence/progress/progress-broadcaster.hxx>
#include <cadence/validation/validation-types.hxx>
#include <cadence/validation/validation-source.hxx>

namespace cadence
{
  namespace asio = boost::asio;

  struct validation_pipeline_traits
  {
    // Lookups in flight per batch. Independent of the download bound.
    //
    std::size_t concurrency = 4;
  };

  // Checks a batch of candidates for availability with a bounded set of
  // workers and streams the outcome on the batch subject.
  //
  // For every record the subject sees "validating" followed by either
  // "found" or "not_found"; once all records are through, a single
  // "complete" carries the annotated list in input order. If the service
  // turns out to be unreachable, outstanding lookups are abandoned, a single
  // "error" is published instead of "complete", and pipeline_abort is
  // thrown.
  //
  class validation_pipeline
  {
  public:
    using traits_type = validation_pipeline_traits;

    validation_pipeline (availability_checker&,
                         progress_broadcaster&,
                         diagnostics&,
                         traits_type = traits_type ());

    asio::awaitable<validation_result>
    run (std::vector<candidate_track>, subject_id batch);

    // Fetch candidates from the source and validate them. A source that
    // fails produces a single "error" event and the exception propagates.
    //
    asio::awaitable<validation_result>
    generate (candidate_source&,
              std::string username,
              std::string playlist_type,
              subject_id batch);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    struct batch_state;

    asio::awaitable<void>
    work (std::shared_ptr<batch_state>);

    availability_checker& checker_;
    progress_broadcaster& broadcaster_;
    diagnostics& diag_;
    traits_type traits_;
  };
}
