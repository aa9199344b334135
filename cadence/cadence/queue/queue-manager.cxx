#include <cadence/queue/queue-manager.hxx>

#include <utility>
#include <exception>
#include <stdexcept>

#include <cadence/cadence-error.hxx>

using namespace std;

namespace cadence
{
  queue_manager::
  queue_manager (asio::io_context& ioc,
                 endpoint_registry& r,
                 transfer_executor& x,
                 sink_factory& s,
                 progress_broadcaster& b,
                 diagnostics& d,
                 traits_type t)
    : ioc_ (ioc),
      registry_ (r),
      executor_ (x),
      sinks_ (s),
      broadcaster_ (b),
      diag_ (d),
      traits_ (t),
      idle_ (ioc, asio::steady_timer::time_point::max ())
  {
    if (traits_.concurrency == 0)
      throw invalid_argument ("concurrency must be positive");

    if (traits_.max_attempts == 0)
      throw invalid_argument ("max attempts must be positive");
  }

  job_id queue_manager::
  enqueue (job_descriptor d)
  {
    validate (d);

    events ev;
    admissions ad;
    job_id id;

    {
      lock_guard<mutex> l (mutex_);

      id = next_id_++;

      event_payload p;
      p.message = d.artist + " - " + d.title;

      jobs_.emplace (id, record (job (id, move (d))));
      emit (ev, id, event_kind::queued, move (p));

      schedule (ev, ad);
    }

    diag_.trace (job_subject (id) + " queued");

    publish (ev);
    spawn (ad);

    return id;
  }

  bool queue_manager::
  cancel (job_id id)
  {
    events ev;
    vector<job_id> gone;
    shared_ptr<asio::steady_timer> t;
    uint64_t g (0);

    {
      lock_guard<mutex> l (mutex_);

      auto i (jobs_.find (id));
      if (i == jobs_.end ())
        return false;

      record& r (i->second);

      switch (r.job.status ())
      {
      case job_status::queued:
        {
          r.job.cancel ("cancelled");
          emit (ev, id, event_kind::cancelled,
                event_payload {string ("cancelled")});
          evict (gone);
          break;
        }
      case job_status::active:
        {
          // Already asked, the watchdog is running.
          //
          if (r.token->cancelled ())
            return true;

          r.token->cancel ();

          t = make_shared<asio::steady_timer> (ioc_, traits_.cancel_grace);
          r.grace = t;
          g = r.lease;
          break;
        }
      case job_status::completed:
      case job_status::failed:
      case job_status::cancelled:
        return false;
      }
    }

    if (t != nullptr)
    {
      diag_.trace (job_subject (id) + " cancellation requested");

      asio::co_spawn (ioc_, watch (id, g, move (t)), asio::detached);
    }

    publish (ev);
    forget (gone);
    notify_idle ();

    return true;
  }

  size_t queue_manager::
  cancel_all ()
  {
    vector<job_id> ids;
    {
      lock_guard<mutex> l (mutex_);

      for (const auto& p: jobs_)
      {
        if (!p.second.job.terminal ())
          ids.push_back (p.first);
      }
    }

    // Cancel the queued ones first so that cancelling active jobs does not
    // admit them.
    //
    size_t n (0);
    for (bool queued: {true, false})
    {
      for (job_id id: ids)
      {
        optional<job_snapshot> s (find (id));

        if (s && (s->status == job_status::queued) == queued && cancel (id))
          ++n;
      }
    }

    return n;
  }

  void queue_manager::
  pause_all ()
  {
    {
      lock_guard<mutex> l (mutex_);
      paused_ = true;
    }

    diag_.trace ("queue paused");
    notify_idle ();
  }

  void queue_manager::
  resume_all ()
  {
    events ev;
    admissions ad;

    {
      lock_guard<mutex> l (mutex_);
      paused_ = false;
      schedule (ev, ad);
    }

    diag_.trace ("queue resumed");

    publish (ev);
    spawn (ad);
  }

  bool queue_manager::
  paused () const
  {
    lock_guard<mutex> l (mutex_);
    return paused_;
  }

  vector<job_snapshot> queue_manager::
  list_jobs (optional<job_status> f) const
  {
    lock_guard<mutex> l (mutex_);

    vector<job_snapshot> r;
    r.reserve (jobs_.size ());

    for (const auto& p: jobs_)
    {
      if (!f || p.second.job.status () == *f)
        r.push_back (p.second.job.snapshot ());
    }

    return r;
  }

  optional<job_snapshot> queue_manager::
  find (job_id id) const
  {
    lock_guard<mutex> l (mutex_);

    auto i (jobs_.find (id));
    if (i == jobs_.end ())
      return nullopt;

    return i->second.job.snapshot ();
  }

  bool queue_manager::
  remove (job_id id)
  {
    lock_guard<mutex> l (mutex_);

    auto i (jobs_.find (id));
    if (i == jobs_.end () || !i->second.job.terminal ())
      return false;

    jobs_.erase (i);
    return true;
  }

  size_t queue_manager::
  clear_finished ()
  {
    lock_guard<mutex> l (mutex_);

    size_t n (0);
    for (auto i (jobs_.begin ()); i != jobs_.end (); )
    {
      if (i->second.job.terminal ())
      {
        i = jobs_.erase (i);
        ++n;
      }
      else
        ++i;
    }

    return n;
  }

  queue_statistics queue_manager::
  statistics () const
  {
    lock_guard<mutex> l (mutex_);

    queue_statistics s;

    for (const auto& p: jobs_)
    {
      switch (p.second.job.status ())
      {
      case job_status::queued:    ++s.queued;    break;
      case job_status::active:    ++s.active;    break;
      case job_status::completed: ++s.completed; break;
      case job_status::failed:    ++s.failed;    break;
      case job_status::cancelled: ++s.cancelled; break;
      }
    }

    return s;
  }

  asio::awaitable<void> queue_manager::
  drain ()
  {
    for (;;)
    {
      {
        lock_guard<mutex> l (mutex_);

        if (idle ())
          co_return;
      }

      boost::system::error_code ec;
      co_await idle_.async_wait (
        asio::redirect_error (asio::use_awaitable, ec));
    }
  }

  // Job coroutine.
  //
  asio::awaitable<void> queue_manager::
  run (job_id id)
  {
    for (;;)
    {
      optional<attempt> a (prepare (id));

      if (!a)
        co_return;

      attempt_result r;

      if (a->preset)
        r = move (*a->preset);
      else
      {
        try
        {
          r = co_await executor_.execute (a->lease);
        }
        catch (const exception& e)
        {
          // Executors are not supposed to throw; count it as an ordinary
          // failed attempt.
          //
          r = attempt_result::recoverable (e.what ());
        }
      }

      if (!conclude (id, a->generation, r))
        co_return;
    }
  }

  optional<queue_manager::attempt> queue_manager::
  prepare (job_id id)
  {
    set<string> tried;
    job_descriptor d;
    uint32_t n;
    uint64_t g;
    shared_ptr<cancellation_token> t;
    shared_ptr<transfer_sink> s;

    {
      lock_guard<mutex> l (mutex_);

      auto i (jobs_.find (id));
      if (i == jobs_.end () || i->second.job.status () != job_status::active)
        return nullopt;

      record& r (i->second);

      tried = r.tried;
      d = r.job.descriptor ();
      n = r.job.attempt ();
      g = r.lease;
      t = r.token;
      s = r.sink;
    }

    optional<attempt_result> preset;

    // Once every endpoint has been tried, the registry hands back one we
    // already used. Start a new round from it.
    //
    optional<endpoint_candidate> c (registry_.next_candidate (tried));

    if (!c)
      preset = attempt_result::recoverable (
        endpoint_exhausted ("no endpoint available").what ());

    if (s == nullptr)
    {
      try
      {
        s = sinks_.create (id, d);
      }
      catch (const exception& e)
      {
        preset = attempt_result::fatal (
          string ("unable to create output: ") + e.what ());
      }
    }

    {
      lock_guard<mutex> l (mutex_);

      auto i (jobs_.find (id));
      if (i == jobs_.end () ||
          i->second.job.status () != job_status::active ||
          i->second.lease != g)
      {
        if (s != nullptr)
          s->discard ();

        return nullopt;
      }

      record& r (i->second);
      r.sink = s;

      if (c)
      {
        if (r.tried.count (c->url) != 0)
          r.tried.clear ();

        r.tried.insert (c->url);
        r.job.assign_endpoint (c->url);
      }
    }

    return attempt {
      g,
      transfer_lease (id,
                      move (d),
                      n,
                      c ? *c : endpoint_candidate (),
                      move (t),
                      move (s),
                      [this, id, g] (double ratio, uint64_t bytes)
                      {
                        return report (id, g, ratio, bytes);
                      }),
      move (preset)};
  }

  bool queue_manager::
  report (job_id id, uint64_t g, double ratio, uint64_t bytes)
  {
    events ev;

    {
      lock_guard<mutex> l (mutex_);

      auto i (jobs_.find (id));
      if (i == jobs_.end ())
        return false;

      record& r (i->second);

      if (r.lease != g || r.job.status () != job_status::active)
        return false;

      if (r.job.advance (ratio, bytes))
      {
        event_payload p;
        p.progress = r.job.progress ();
        p.attempt = r.job.attempt ();
        emit (ev, id, event_kind::progress, move (p));
      }
    }

    publish (ev);
    return true;
  }

  bool queue_manager::
  conclude (job_id id, uint64_t g, const attempt_result& a)
  {
    events ev;
    admissions ad;
    vector<job_id> gone;
    bool again (false);
    string url;
    string n (job_subject (id));

    {
      lock_guard<mutex> l (mutex_);

      auto i (jobs_.find (id));
      if (i == jobs_.end ())
        return false;

      record& r (i->second);

      // Revoked: the job was finalized while the attempt ran.
      //
      if (r.lease != g || r.job.status () != job_status::active)
        return false;

      url = r.job.endpoint ().value_or (string ());

      event_payload p;
      p.attempt = r.job.attempt ();
      if (!url.empty ())
        p.endpoint = url;

      attempt_status s (a.status);

      // Whatever went wrong, a job that was asked to stop is cancelled.
      //
      if (s != attempt_status::completed && r.token->cancelled ())
        s = attempt_status::cancelled;

      switch (s)
      {
      case attempt_status::completed:
        {
          r.job.complete (a.location, a.bytes);
          finish (r);

          p.progress = 1.0;
          p.message = a.location;
          emit (ev, id, event_kind::completed, move (p));
          break;
        }
      case attempt_status::cancelled:
        {
          r.job.cancel ("cancelled");
          finish (r);

          p.message = "cancelled";
          emit (ev, id, event_kind::cancelled, move (p));
          break;
        }
      case attempt_status::fatal:
        {
          r.job.fail (a.message);
          finish (r);

          p.message = a.message;
          emit (ev, id, event_kind::failed, move (p));
          break;
        }
      case attempt_status::recoverable:
        {
          if (r.job.attempt () < traits_.max_attempts)
          {
            r.job.retry (a.message);
            r.lease = next_lease_++;

            p.attempt = r.job.attempt ();
            p.message = a.message;
            emit (ev, id, event_kind::retrying, move (p));
            again = true;
          }
          else
          {
            string m ("giving up after " +
                      std::to_string (r.job.attempt ()) + " attempts: " +
                      a.message);

            r.job.fail (m);
            finish (r);

            p.message = move (m);
            emit (ev, id, event_kind::failed, move (p));
          }
          break;
        }
      }

      if (!again)
      {
        schedule (ev, ad);
        evict (gone);
      }
    }

    // Endpoint health.
    //
    if (!url.empty ())
    {
      if (a.status == attempt_status::completed)
      {
        if (registry_.mark_up (url))
          diag_.trace ("endpoint " + url + " is responding again");
      }
      else if (a.status == attempt_status::recoverable && a.connection_failure)
      {
        if (registry_.mark_down (url))
          diag_.warning ("endpoint " + url + " suspected down: " + a.message);
      }
    }

    if (again)
      diag_.warning (n + " attempt failed (" + a.message + "), retrying");
    else
    {
      switch (a.status)
      {
      case attempt_status::completed:
        diag_.trace (n + " completed: " + a.location);
        break;
      case attempt_status::cancelled:
        diag_.trace (n + " cancelled");
        break;
      case attempt_status::fatal:
      case attempt_status::recoverable:
        diag_.error (n + " failed: " + a.message);
        break;
      }
    }

    publish (ev);
    forget (gone);
    spawn (ad);

    if (!again)
      notify_idle ();

    return again;
  }

  asio::awaitable<void> queue_manager::
  watch (job_id id, uint64_t g, shared_ptr<asio::steady_timer> t)
  {
    boost::system::error_code ec;
    co_await t->async_wait (asio::redirect_error (asio::use_awaitable, ec));

    // Cancelled timer: the attempt acknowledged in time.
    //
    if (!ec)
      force_cancel (id, g);
  }

  void queue_manager::
  force_cancel (job_id id, uint64_t g)
  {
    events ev;
    admissions ad;
    vector<job_id> gone;
    shared_ptr<asio::cancellation_signal> sig;

    {
      lock_guard<mutex> l (mutex_);

      auto i (jobs_.find (id));
      if (i == jobs_.end ())
        return;

      record& r (i->second);

      if (r.lease != g || r.job.status () != job_status::active)
        return;

      r.job.cancel ("cancelled (forced)");
      finish (r);
      sig = r.signal;

      event_payload p;
      p.attempt = r.job.attempt ();
      p.message = "cancelled";
      emit (ev, id, event_kind::cancelled, move (p));

      schedule (ev, ad);
      evict (gone);
    }

    diag_.warning (job_subject (id) + " did not stop within the grace " +
                   "period, cancelling it forcibly");

    // Abort whatever the abandoned attempt is waiting on.
    //
    if (sig != nullptr)
      sig->emit (asio::cancellation_type::terminal);

    publish (ev);
    forget (gone);
    spawn (ad);
    notify_idle ();
  }

  void queue_manager::
  schedule (events& ev, admissions& ad)
  {
    if (paused_)
      return;

    size_t active (0);
    for (const auto& p: jobs_)
    {
      if (p.second.job.status () == job_status::active)
        ++active;
    }

    for (auto i (jobs_.begin ());
         i != jobs_.end () && active < traits_.concurrency;
         ++i)
    {
      record& r (i->second);

      if (r.job.status () != job_status::queued)
        continue;

      r.job.start ();
      r.lease = next_lease_++;
      r.token = make_shared<cancellation_token> ();
      r.signal = make_shared<asio::cancellation_signal> ();
      ++active;

      event_payload p;
      p.attempt = r.job.attempt ();
      emit (ev, i->first, event_kind::started, move (p));

      ad.push_back (admission {i->first, r.signal});
    }
  }

  void queue_manager::
  finish (record& r)
  {
    // Revoke the lease.
    //
    r.lease = 0;

    if (r.grace != nullptr)
    {
      r.grace->cancel ();
      r.grace.reset ();
    }

    if (r.sink != nullptr)
    {
      if (r.job.status () != job_status::completed)
        r.sink->discard ();

      r.sink.reset ();
    }
  }

  void queue_manager::
  evict (vector<job_id>& gone)
  {
    if (traits_.retention_limit == 0)
      return;

    size_t n (0);
    for (const auto& p: jobs_)
    {
      if (p.second.job.terminal ())
        ++n;
    }

    for (auto i (jobs_.begin ());
         i != jobs_.end () && n > traits_.retention_limit; )
    {
      if (i->second.job.terminal ())
      {
        gone.push_back (i->first);
        i = jobs_.erase (i);
        --n;
      }
      else
        ++i;
    }
  }

  bool queue_manager::
  idle () const
  {
    for (const auto& p: jobs_)
    {
      job_status s (p.second.job.status ());

      if (s == job_status::active || (s == job_status::queued && !paused_))
        return false;
    }

    return true;
  }

  void queue_manager::
  emit (events& ev, job_id id, event_kind k, event_payload p)
  {
    ev.push_back (pending_event {job_subject (id), k, move (p)});
  }

  void queue_manager::
  publish (events& ev)
  {
    for (pending_event& e: ev)
      broadcaster_.publish (e.subject, e.kind, move (e.payload));

    ev.clear ();
  }

  void queue_manager::
  forget (const vector<job_id>& gone)
  {
    for (job_id id: gone)
      broadcaster_.forget (job_subject (id));
  }

  void queue_manager::
  spawn (const admissions& ad)
  {
    for (const admission& a: ad)
    {
      job_id id (a.id);

      asio::co_spawn (
        ioc_,
        run (id),
        asio::bind_cancellation_slot (
          a.signal->slot (),
          [this, id, sig = a.signal] (exception_ptr e)
          {
            if (!e)
              return;

            try
            {
              rethrow_exception (e);
            }
            catch (const exception& x)
            {
              diag_.error (job_subject (id) + " worker terminated: " +
                           x.what ());
            }
          }));
    }
  }

  void queue_manager::
  notify_idle ()
  {
    asio::post (ioc_, [this] {idle_.cancel ();});
  }
}
