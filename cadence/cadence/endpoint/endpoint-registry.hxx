#pragma once

#include <set>
#include <mutex>
#include <chrono>
#include <string>
#include <vector>
#include <cstddef>
#include <optional>

#include <cadence/endpoint/endpoint-types.hxx>

namespace cadence
{
  // Prioritized set of endpoint candidates with shared health state.
  //
  // A single registry is constructed by the owner of the engine and handed
  // to everything that needs to pick an endpoint, so that all jobs (and the
  // validation pipeline) see the same health flags. All access goes through
  // one mutex.
  //
  // The time-sensitive functions take the current time as an argument
  // (defaulting to now) which lets tests walk through the cool-down window
  // without sleeping.
  //
  class endpoint_registry
  {
  public:
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using duration   = clock_type::duration;

    explicit
    endpoint_registry (duration cooldown = std::chrono::minutes (5));

    explicit
    endpoint_registry (std::vector<endpoint_candidate>,
                       duration cooldown = std::chrono::minutes (5));

    endpoint_registry (const endpoint_registry&) = delete;
    endpoint_registry& operator= (const endpoint_registry&) = delete;

    // Add a candidate. Adding an already known URL updates its priority.
    //
    void
    add (std::string url, int priority);

    void
    add (const endpoint_candidate& c)
    {
      add (c.url, c.priority);
    }

    // Return the candidate to try next.
    //
    // Preference order: the lowest priority number that is neither excluded
    // nor suspected down; failing that, the lowest that is not excluded,
    // ignoring health; failing that, the lowest overall. Only an empty
    // registry yields nothing.
    //
    std::optional<endpoint_candidate>
    next_candidate (const std::set<std::string>& excluding = {},
                    time_point now = clock_type::now ());

    // Flag the endpoint as suspected down after a connection-level failure.
    // The flag clears by itself once the cool-down window has passed.
    //
    // Return true if the endpoint was not already flagged.
    //
    bool
    mark_down (const std::string& url, time_point now = clock_type::now ());

    // Clear the flag after a successful attempt. Return true if the endpoint
    // was flagged.
    //
    bool
    mark_up (const std::string& url);

    bool
    suspected_down (const std::string& url,
                    time_point now = clock_type::now ());

    // Snapshot of all candidates in preference order with their effective
    // health.
    //
    std::vector<endpoint_candidate>
    candidates (time_point now = clock_type::now ());

    std::size_t
    size () const;

    bool
    empty () const
    {
      return size () == 0;
    }

    duration
    cooldown () const noexcept
    {
      return cooldown_;
    }

  private:
    struct entry
    {
      endpoint_candidate candidate;
      std::optional<time_point> down_since;
      std::size_t order; // Insertion order, breaks priority ties.
    };

    // Clear flags whose cool-down has expired. Call with the mutex held.
    //
    void
    expire (time_point now);

    entry*
    find (const std::string& url);

    mutable std::mutex mutex_;
    std::vector<entry> entries_; // Sorted by (priority, order).
    std::size_t next_order_ {0};
    duration cooldown_;
  };
}
