#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <optional>

namespace cadence
{
  // Target quality tier, highest to lowest.
  //
  enum class quality_tier
  {
    hi_res_lossless,
    lossless,
    high_bitrate_lossy,
    low_bitrate_lossy
  };

  // Canonical name ("hi-res-lossless", ...).
  //
  std::string
  to_string (quality_tier);

  // Spelling used by the backing service ("HI_RES_LOSSLESS", "LOSSLESS",
  // "HIGH", "LOW").
  //
  std::string
  to_service_string (quality_tier);

  // Accept either spelling, case-insensitively.
  //
  std::optional<quality_tier>
  parse_quality_tier (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, quality_tier q)
  {
    return os << to_string (q);
  }

  // Externally visible job lifecycle status.
  //
  enum class job_status
  {
    queued,
    active,
    completed,
    failed,
    cancelled
  };

  std::string
  to_string (job_status);

  std::optional<job_status>
  parse_job_status (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, job_status s)
  {
    return os << to_string (s);
  }

  inline bool
  terminal (job_status s) noexcept
  {
    return s == job_status::completed ||
           s == job_status::failed    ||
           s == job_status::cancelled;
  }

  using job_id = std::uint64_t;

  // Progress subject for a job ("job-<id>").
  //
  std::string
  job_subject (job_id);

  // Download request as submitted by the user.
  //
  struct job_descriptor
  {
    std::string title;
    std::string artist;
    std::optional<std::string> album;
    std::string external_reference; // Service-side track id.
    quality_tier quality {quality_tier::lossless};
  };

  // Throw invalid_job_spec if a required field is missing.
  //
  void
  validate (const job_descriptor&);

  // Point-in-time copy of a job's state.
  //
  struct job_snapshot
  {
    job_id id {0};
    job_descriptor descriptor;
    job_status status {job_status::queued};
    double progress {0.0};
    std::uint32_t attempt {0};
    std::uint64_t bytes_written {0};
    std::optional<std::string> last_error;
    std::optional<std::string> endpoint;
    std::optional<std::string> location; // Output, once completed.

    bool
    terminal () const noexcept
    {
      return cadence::terminal (status);
    }
  };

  std::ostream&
  operator<< (std::ostream&, const job_snapshot&);
}
