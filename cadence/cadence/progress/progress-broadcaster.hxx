#pragma once

#include <chrono>
#include <memory>
#include <cstddef>
#include <optional>

#include <boost/asio.hpp>

#include <cadence/progress/progress-event.hxx>

namespace cadence
{
  namespace asio = boost::asio;

  namespace detail
  {
    struct broadcaster_core;
    struct subscription_state;
  }

  // Broadcaster options.
  //
  struct progress_broadcaster_traits
  {
    // Undelivered events a subscription may hold before it is torn down.
    //
    std::size_t buffer_capacity = 256;

    // Idle time after which a subscription yields a ping (0 = never).
    //
    std::chrono::milliseconds keepalive_interval {15000};
  };

  // Live stream of events for one subject.
  //
  // A subscription sees only events published after it was created. It ends
  // after delivering the subject's terminal event (or right away if the
  // subject had already finished), when the broadcaster shuts down, or when
  // it is closed. If the consumer falls behind by more than the buffer
  // capacity the subscription is torn down and the next read throws
  // subscription_overflow; the events still buffered at that point are lost.
  //
  // Reads must happen on the broadcaster's io_context thread.
  //
  class progress_subscription
  {
  public:
    progress_subscription (progress_subscription&&) noexcept = default;

    progress_subscription&
    operator= (progress_subscription&&) noexcept;

    progress_subscription (const progress_subscription&) = delete;
    progress_subscription& operator= (const progress_subscription&) = delete;

    ~progress_subscription ();

    // Wait for the next event. Return nullopt at end of stream. An idle wait
    // longer than the keep-alive interval yields a ping event.
    //
    asio::awaitable<std::optional<progress_event>>
    next ();

    // Return the next buffered event without waiting, if there is one.
    //
    std::optional<progress_event>
    poll ();

    // True once the stream is exhausted: no buffered events and nothing more
    // will arrive.
    //
    bool
    ended () const;

    bool
    overflowed () const;

    const subject_id&
    subject () const noexcept;

    // Detach from the broadcaster. Buffered events can still be read.
    //
    void
    close ();

  private:
    friend class progress_broadcaster;

    progress_subscription (std::shared_ptr<detail::broadcaster_core>,
                           std::shared_ptr<detail::subscription_state>);

    std::shared_ptr<detail::broadcaster_core> core_;
    std::shared_ptr<detail::subscription_state> state_;
  };

  // Process-wide fan-out of progress events keyed by subject.
  //
  // Sequence numbers are assigned per subject at publication, under the same
  // lock that appends the event to the subscriber buffers, so every
  // subscriber observes a subject's events in sequence order without gaps.
  // Publishing never waits for subscribers.
  //
  // Once a terminal event has been published for a subject, the subject is
  // closed: further events for it are dropped and new subscribers get an
  // immediate end of stream.
  //
  class progress_broadcaster
  {
  public:
    using traits_type = progress_broadcaster_traits;

    explicit
    progress_broadcaster (asio::io_context&,
                          traits_type traits = traits_type ());

    ~progress_broadcaster ();

    progress_broadcaster (const progress_broadcaster&) = delete;
    progress_broadcaster& operator= (const progress_broadcaster&) = delete;

    // Publish an event and return it as delivered, or nullopt if the subject
    // is closed or the broadcaster shut down. Pings cannot be published.
    //
    std::optional<progress_event>
    publish (const subject_id&, event_kind, event_payload = event_payload ());

    progress_subscription
    subscribe (const subject_id&);

    bool
    closed (const subject_id&) const;

    std::size_t
    subscriber_count (const subject_id&) const;

    // Drop everything remembered about a closed subject (sequence counter and
    // closed marker).
    //
    void
    forget (const subject_id&);

    // End every stream and refuse further publications.
    //
    void
    shutdown ();

    const traits_type&
    traits () const noexcept;

  private:
    std::shared_ptr<detail::broadcaster_core> core_;
  };
}
