#include <utility>

namespace cadence
{
  inline transfer_lease::
  transfer_lease (job_id id,
                  job_descriptor d,
                  std::uint32_t attempt,
                  endpoint_candidate e,
                  std::shared_ptr<cancellation_token> t,
                  std::shared_ptr<transfer_sink> s,
                  report_function r)
    : id_ (id),
      descriptor_ (std::move (d)),
      attempt_ (attempt),
      endpoint_ (std::move (e)),
      token_ (std::move (t)),
      sink_ (std::move (s)),
      report_ (std::move (r))
  {
  }

  inline job_id transfer_lease::
  id () const noexcept
  {
    return id_;
  }

  inline const job_descriptor& transfer_lease::
  descriptor () const noexcept
  {
    return descriptor_;
  }

  inline std::uint32_t transfer_lease::
  attempt () const noexcept
  {
    return attempt_;
  }

  inline const endpoint_candidate& transfer_lease::
  endpoint () const noexcept
  {
    return endpoint_;
  }

  inline transfer_sink& transfer_lease::
  sink () const noexcept
  {
    return *sink_;
  }

  inline const cancellation_token& transfer_lease::
  token () const noexcept
  {
    return *token_;
  }

  inline bool transfer_lease::
  cancelled () const noexcept
  {
    return token_->cancelled ();
  }

  inline bool transfer_lease::
  report (double ratio, std::uint64_t bytes) const
  {
    return report_ ? report_ (ratio, bytes) : true;
  }
}
