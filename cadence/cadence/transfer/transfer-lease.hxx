#pragma once

#include <memory>
#include <cstdint>
#include <functional>

#include <cadence/job/job-types.hxx>
#include <cadence/endpoint/endpoint-types.hxx>
#include <cadence/transfer/transfer-sink.hxx>
#include <cadence/transfer/transfer-types.hxx>

namespace cadence
{
  // Capability to run one attempt of one job.
  //
  // The queue manager issues a fresh lease per attempt and revokes it when
  // the attempt is abandoned (forced cancellation). Progress reported through
  // a revoked lease is ignored and report() returns false, which the
  // executor takes as a signal to stop.
  //
  class transfer_lease
  {
  public:
    // Return false if the lease is no longer valid.
    //
    using report_function = std::function<bool (double, std::uint64_t)>;

    transfer_lease (job_id,
                    job_descriptor,
                    std::uint32_t attempt,
                    endpoint_candidate,
                    std::shared_ptr<cancellation_token>,
                    std::shared_ptr<transfer_sink>,
                    report_function);

    job_id
    id () const noexcept;

    const job_descriptor&
    descriptor () const noexcept;

    std::uint32_t
    attempt () const noexcept;

    const endpoint_candidate&
    endpoint () const noexcept;

    transfer_sink&
    sink () const noexcept;

    const cancellation_token&
    token () const noexcept;

    bool
    cancelled () const noexcept;

    // Report the fraction done (0 to 1) and the bytes written so far in this
    // attempt.
    //
    bool
    report (double ratio, std::uint64_t bytes) const;

  private:
    job_id id_;
    job_descriptor descriptor_;
    std::uint32_t attempt_;
    endpoint_candidate endpoint_;
    std::shared_ptr<cancellation_token> token_;
    std::shared_ptr<transfer_sink> sink_;
    report_function report_;
  };
}

#include <cadence/transfer/transfer-lease.ixx>
