#pragma once

#include <map>
#include <set>
#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <optional>

#include <boost/asio.hpp>

#include <cadence/diagnostics.hxx>
#include <cadence/job/job.hxx>
#include <cadence/job/job-types.hxx>
#include <cadence/endpoint/endpoint-registry.hxx>
#include <cadence/progress/progress-broadcaster.hxx>
#include <cadence/transfer/transfer-sink.hxx>
#include <cadence/transfer/transfer-lease.hxx>
#include <cadence/transfer/transfer-executor.hxx>

namespace cadence
{
  namespace asio = boost::asio;

  // Queue manager options.
  //
  struct queue_manager_traits
  {
    // Maximum number of active jobs.
    //
    std::size_t concurrency = 2;

    // Attempts per job, the first one included.
    //
    std::uint32_t max_attempts = 3;

    // Time an active job gets to acknowledge cancellation before it is
    // finalized without it.
    //
    std::chrono::milliseconds cancel_grace {5000};

    // Terminal jobs to keep around (0 = all). The broadcaster forgets the
    // subjects of evicted jobs.
    //
    std::size_t retention_limit = 0;
  };

  // Job counts by status.
  //
  struct queue_statistics
  {
    std::size_t queued {0};
    std::size_t active {0};
    std::size_t completed {0};
    std::size_t failed {0};
    std::size_t cancelled {0};

    std::size_t
    total () const noexcept
    {
      return queued + active + completed + failed + cancelled;
    }
  };

  // Bounded-concurrency download queue.
  //
  // Jobs are admitted in enqueue order while fewer than the concurrency
  // bound are active and the queue is not paused. Each admitted job runs as
  // a coroutine on the io_context that loops over attempts: pick an endpoint
  // from the registry (skipping the ones this job already tried), hand a
  // fresh lease to the executor, and act on the result. Every job produces
  // exactly one terminal event on its subject ("job-<id>").
  //
  // The job table is guarded by its own mutex, which is never held while
  // calling into the registry, the broadcaster, or the executor. The
  // manager must outlive the io_context run that drives its jobs.
  //
  class queue_manager
  {
  public:
    using traits_type = queue_manager_traits;

    queue_manager (asio::io_context&,
                   endpoint_registry&,
                   transfer_executor&,
                   sink_factory&,
                   progress_broadcaster&,
                   diagnostics&,
                   traits_type = traits_type ());

    queue_manager (const queue_manager&) = delete;
    queue_manager& operator= (const queue_manager&) = delete;

    // Add a job and run the scheduler. Throw invalid_job_spec if the
    // descriptor lacks a title, artist, or external reference.
    //
    job_id
    enqueue (job_descriptor);

    // Cancel a job. A queued job is cancelled on the spot; an active one is
    // asked to stop and is finalized once its attempt acknowledges or the
    // grace period runs out. Return false if the job is unknown or already
    // terminal.
    //
    bool
    cancel (job_id);

    // Cancel every non-terminal job and return how many there were.
    //
    std::size_t
    cancel_all ();

    // Stop admitting queued jobs. Active jobs carry on.
    //
    void
    pause_all ();

    void
    resume_all ();

    bool
    paused () const;

    // Snapshots in admission order, optionally only those in one status.
    //
    std::vector<job_snapshot>
    list_jobs (std::optional<job_status> = std::nullopt) const;

    std::optional<job_snapshot>
    find (job_id) const;

    // Forget a terminal job. Return false if it is unknown or not terminal.
    //
    bool
    remove (job_id);

    // Forget all terminal jobs and return how many there were.
    //
    std::size_t
    clear_finished ();

    queue_statistics
    statistics () const;

    // Complete once nothing is active and nothing can be admitted (either
    // the queue is empty or it is paused).
    //
    asio::awaitable<void>
    drain ();

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    struct record
    {
      explicit
      record (cadence::job j): job (std::move (j)) {}

      cadence::job job;

      // Generation of the current lease (0 = none). A lease whose generation
      // no longer matches has been revoked.
      //
      std::uint64_t lease {0};

      std::shared_ptr<cancellation_token> token;
      std::shared_ptr<asio::cancellation_signal> signal;
      std::shared_ptr<transfer_sink> sink;
      std::shared_ptr<asio::steady_timer> grace;

      // Endpoints this job already tried.
      //
      std::set<std::string> tried;
    };

    struct pending_event
    {
      subject_id subject;
      event_kind kind;
      event_payload payload;
    };

    using events = std::vector<pending_event>;

    struct admission
    {
      job_id id;
      std::shared_ptr<asio::cancellation_signal> signal;
    };

    using admissions = std::vector<admission>;

    // One attempt about to run.
    //
    struct attempt
    {
      std::uint64_t generation;
      transfer_lease lease;
      std::optional<attempt_result> preset; // Decided without the executor.
    };

    // Job coroutine.
    //
    asio::awaitable<void>
    run (job_id);

    std::optional<attempt>
    prepare (job_id);

    // Return true if the job goes for another attempt.
    //
    bool
    conclude (job_id, std::uint64_t generation, const attempt_result&);

    bool
    report (job_id, std::uint64_t generation, double, std::uint64_t);

    asio::awaitable<void>
    watch (job_id, std::uint64_t generation,
           std::shared_ptr<asio::steady_timer>);

    void
    force_cancel (job_id, std::uint64_t generation);

    // The following are called with the mutex held.
    //
    void
    schedule (events&, admissions&);

    void
    finish (record&);

    // Drop the oldest terminal jobs beyond the retention limit and add
    // their ids to the list.
    //
    void
    evict (std::vector<job_id>&);

    bool
    idle () const;

    void
    emit (events&, job_id, event_kind, event_payload = event_payload ());

    // The following are called without the mutex.
    //
    void
    publish (events&);

    // Forget the subjects of evicted jobs. Call after publishing their
    // terminal events.
    //
    void
    forget (const std::vector<job_id>&);

    void
    spawn (const admissions&);

    void
    notify_idle ();

    asio::io_context& ioc_;
    endpoint_registry& registry_;
    transfer_executor& executor_;
    sink_factory& sinks_;
    progress_broadcaster& broadcaster_;
    diagnostics& diag_;
    traits_type traits_;

    mutable std::mutex mutex_;
    std::map<job_id, record> jobs_; // Ids grow, so this is admission order.
    job_id next_id_ {1};
    std::uint64_t next_lease_ {1};
    bool paused_ {false};

    // Waiters in drain() sleep on this timer.
    //
    asio::steady_timer idle_;
  };
}
