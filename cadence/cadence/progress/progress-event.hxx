#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <optional>

#include <boost/json.hpp>

#include <cadence/validation/validation-types.hxx>

namespace cadence
{
  // Job id or validation batch id that an event stream is scoped to.
  //
  using subject_id = std::string;

  // Event kind.
  //
  enum class event_kind
  {
    // Jobs.
    //
    queued,
    started,
    progress,
    retrying,
    completed,
    failed,
    cancelled,

    // Validation batches.
    //
    validating,
    found,
    not_found,
    complete,
    error,

    // Keep-alive on an idle stream.
    //
    ping
  };

  // Wire name, as in the "type" field ("not_found", ...).
  //
  std::string
  to_string (event_kind);

  std::optional<event_kind>
  parse_event_kind (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, event_kind k)
  {
    return os << to_string (k);
  }

  // Terminal kinds end a subject's stream.
  //
  inline bool
  terminal (event_kind k) noexcept
  {
    return k == event_kind::complete  ||
           k == event_kind::completed ||
           k == event_kind::failed    ||
           k == event_kind::cancelled ||
           k == event_kind::error;
  }

  // Optional event payload. Which members are present depends on the kind.
  //
  struct event_payload
  {
    std::optional<std::string> message;
    std::optional<double> progress;          // Ratio, 0 to 1.
    std::optional<std::size_t> total;        // Batch size.
    std::optional<std::vector<validated_track>> tracks;
    std::optional<std::size_t> found_count;
    std::optional<std::string> external_id;  // Resolved id (found).
    std::optional<std::uint32_t> attempt;
    std::optional<std::string> endpoint;
  };

  // Immutable progress event.
  //
  // Sequence numbers start at 1 and grow by one per subject. A ping repeats
  // the sequence number of the last event delivered to its subscription (0
  // if none) and has no payload.
  //
  struct progress_event
  {
    using clock_type = std::chrono::system_clock;

    subject_id subject;
    event_kind kind {event_kind::ping};
    event_payload payload;
    std::uint64_t sequence {0};
    clock_type::time_point timestamp;

    bool
    terminal () const noexcept
    {
      return cadence::terminal (kind);
    }
  };

  std::ostream&
  operator<< (std::ostream&, const progress_event&);

  // JSON representation:
  //
  // {"type", "subject", "sequence", "timestamp", "message"?, "progress"?,
  //  "total"?, "tracks"?, "found_count"?, "external_id"?, "attempt"?,
  //  "endpoint"?}
  //
  // A ping is just {"type": "ping"}. The timestamp is in milliseconds since
  // the epoch.
  //
  boost::json::object
  to_json (const progress_event&);

  boost::json::object
  to_json (const validated_track&);

  // Server-Sent Events framing: "data: <json>\n\n".
  //
  std::string
  to_sse (const progress_event&);
}
