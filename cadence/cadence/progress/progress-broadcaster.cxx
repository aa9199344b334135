#include <cadence/progress/progress-broadcaster.hxx>

#include <deque>
#include <mutex>
#include <vector>
#include <utility>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <cadence/cadence-error.hxx>

using namespace std;

namespace cadence
{
  namespace detail
  {
    struct subscription_state
    {
      subscription_state (asio::any_io_executor ex, subject_id s)
        : subject (move (s)), signal (ex)
      {
      }

      subject_id subject;
      deque<progress_event> buffer;

      bool attached {true};
      bool overflowed {false};
      uint64_t last_sequence {0};

      // Waiting readers sleep on this timer; publishers cancel it.
      //
      asio::steady_timer signal;
    };

    struct broadcaster_core
    {
      broadcaster_core (asio::any_io_executor ex,
                        progress_broadcaster_traits t)
        : executor (move (ex)), traits (t)
      {
      }

      asio::any_io_executor executor;
      progress_broadcaster_traits traits;

      mutable mutex mtx;
      unordered_map<subject_id,
                    vector<shared_ptr<subscription_state>>> subscribers;
      unordered_map<subject_id, uint64_t> sequences;
      unordered_set<subject_id> closed;
      bool down {false};

      // Must be called with the mutex held.
      //
      void
      detach (const shared_ptr<subscription_state>& s)
      {
        s->attached = false;

        auto i (subscribers.find (s->subject));
        if (i == subscribers.end ())
          return;

        auto& v (i->second);
        v.erase (remove (v.begin (), v.end (), s), v.end ());

        if (v.empty ())
          subscribers.erase (i);
      }
    };

    static void
    wake (const shared_ptr<subscription_state>& s)
    {
      asio::post (s->signal.get_executor (), [s] {s->signal.cancel ();});
    }
  }

  using detail::subscription_state;
  using detail::broadcaster_core;

  // progress_subscription
  //
  progress_subscription::
  progress_subscription (shared_ptr<broadcaster_core> c,
                         shared_ptr<subscription_state> s)
    : core_ (move (c)), state_ (move (s))
  {
  }

  progress_subscription& progress_subscription::
  operator= (progress_subscription&& x) noexcept
  {
    if (this != &x)
    {
      close ();
      core_ = move (x.core_);
      state_ = move (x.state_);
    }
    return *this;
  }

  progress_subscription::
  ~progress_subscription ()
  {
    close ();
  }

  void progress_subscription::
  close ()
  {
    if (core_ == nullptr || state_ == nullptr)
      return;

    lock_guard<mutex> l (core_->mtx);
    core_->detach (state_);
  }

  const subject_id& progress_subscription::
  subject () const noexcept
  {
    return state_->subject;
  }

  bool progress_subscription::
  ended () const
  {
    lock_guard<mutex> l (core_->mtx);
    return state_->buffer.empty () && !state_->attached;
  }

  bool progress_subscription::
  overflowed () const
  {
    lock_guard<mutex> l (core_->mtx);
    return state_->overflowed;
  }

  optional<progress_event> progress_subscription::
  poll ()
  {
    lock_guard<mutex> l (core_->mtx);

    subscription_state& s (*state_);

    if (s.overflowed)
      throw subscription_overflow ("subscription to " + s.subject +
                                   " overflowed");

    if (s.buffer.empty ())
      return nullopt;

    progress_event e (move (s.buffer.front ()));
    s.buffer.pop_front ();
    s.last_sequence = e.sequence;
    return e;
  }

  asio::awaitable<optional<progress_event>> progress_subscription::
  next ()
  {
    // Keep the state alive even if this object is moved from while we wait.
    //
    shared_ptr<broadcaster_core> c (core_);
    shared_ptr<subscription_state> s (state_);

    for (;;)
    {
      {
        lock_guard<mutex> l (c->mtx);

        if (s->overflowed)
          throw subscription_overflow ("subscription to " + s->subject +
                                       " overflowed");

        if (!s->buffer.empty ())
        {
          progress_event e (move (s->buffer.front ()));
          s->buffer.pop_front ();
          s->last_sequence = e.sequence;
          co_return e;
        }

        if (!s->attached)
          co_return nullopt;

        if (c->traits.keepalive_interval.count () > 0)
          s->signal.expires_after (c->traits.keepalive_interval);
        else
          s->signal.expires_at (asio::steady_timer::time_point::max ());
      }

      boost::system::error_code ec;
      co_await s->signal.async_wait (
        asio::redirect_error (asio::use_awaitable, ec));

      // Cancelled means woken by a publisher (or shutdown); look again.
      //
      if (ec == asio::error::operation_aborted)
        continue;

      lock_guard<mutex> l (c->mtx);

      if (s->buffer.empty () && s->attached && !s->overflowed)
      {
        progress_event p;
        p.subject = s->subject;
        p.kind = event_kind::ping;
        p.sequence = s->last_sequence;
        p.timestamp = progress_event::clock_type::now ();
        co_return p;
      }
    }
  }

  // progress_broadcaster
  //
  progress_broadcaster::
  progress_broadcaster (asio::io_context& ioc, traits_type t)
    : core_ (make_shared<broadcaster_core> (ioc.get_executor (), t))
  {
    if (t.buffer_capacity == 0)
      throw invalid_argument ("subscription buffer capacity must be positive");
  }

  progress_broadcaster::
  ~progress_broadcaster ()
  {
    shutdown ();
  }

  const progress_broadcaster::traits_type& progress_broadcaster::
  traits () const noexcept
  {
    return core_->traits;
  }

  optional<progress_event> progress_broadcaster::
  publish (const subject_id& subject, event_kind k, event_payload p)
  {
    if (k == event_kind::ping)
      throw invalid_argument ("ping events are produced by subscriptions");

    vector<shared_ptr<subscription_state>> woken;
    progress_event e;

    {
      lock_guard<mutex> l (core_->mtx);

      if (core_->down || core_->closed.count (subject) != 0)
        return nullopt;

      e.subject = subject;
      e.kind = k;
      e.payload = move (p);
      e.sequence = ++core_->sequences[subject];
      e.timestamp = progress_event::clock_type::now ();

      auto i (core_->subscribers.find (subject));
      if (i != core_->subscribers.end ())
      {
        auto& v (i->second);

        for (auto j (v.begin ()); j != v.end (); )
        {
          const shared_ptr<subscription_state>& s (*j);

          if (s->buffer.size () >= core_->traits.buffer_capacity)
          {
            s->overflowed = true;
            s->attached = false;
            s->buffer.clear ();
            woken.push_back (s);
            j = v.erase (j);
            continue;
          }

          s->buffer.push_back (e);
          woken.push_back (s);
          ++j;
        }

        // The terminal event is the last one a subscriber sees.
        //
        if (e.terminal ())
        {
          for (const shared_ptr<subscription_state>& s: v)
            s->attached = false;

          core_->subscribers.erase (i);
        }
        else if (v.empty ())
          core_->subscribers.erase (i);
      }

      if (e.terminal ())
        core_->closed.insert (subject);
    }

    for (const shared_ptr<subscription_state>& s: woken)
      detail::wake (s);

    return e;
  }

  progress_subscription progress_broadcaster::
  subscribe (const subject_id& subject)
  {
    auto s (make_shared<subscription_state> (core_->executor, subject));

    lock_guard<mutex> l (core_->mtx);

    if (core_->down || core_->closed.count (subject) != 0)
      s->attached = false;
    else
      core_->subscribers[subject].push_back (s);

    return progress_subscription (core_, move (s));
  }

  bool progress_broadcaster::
  closed (const subject_id& subject) const
  {
    lock_guard<mutex> l (core_->mtx);
    return core_->closed.count (subject) != 0;
  }

  size_t progress_broadcaster::
  subscriber_count (const subject_id& subject) const
  {
    lock_guard<mutex> l (core_->mtx);

    auto i (core_->subscribers.find (subject));
    return i != core_->subscribers.end () ? i->second.size () : 0;
  }

  void progress_broadcaster::
  forget (const subject_id& subject)
  {
    lock_guard<mutex> l (core_->mtx);

    if (core_->closed.erase (subject) != 0)
      core_->sequences.erase (subject);
  }

  void progress_broadcaster::
  shutdown ()
  {
    vector<shared_ptr<subscription_state>> woken;

    {
      lock_guard<mutex> l (core_->mtx);

      if (core_->down)
        return;

      core_->down = true;

      for (auto& p: core_->subscribers)
      {
        for (const shared_ptr<subscription_state>& s: p.second)
        {
          s->attached = false;
          woken.push_back (s);
        }
      }

      core_->subscribers.clear ();
    }

    for (const shared_ptr<subscription_state>& s: woken)
      detail::wake (s);
  }
}
