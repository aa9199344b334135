#include <cadence/queue/queue-manager.hxx>

#include <map>
#include <set>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cassert>
#include <utility>

#include <boost/asio.hpp>

#include <cadence/cadence-error.hxx>

using namespace std;
using namespace cadence;

namespace asio = boost::asio;

using chrono::milliseconds;

static asio::awaitable<void>
delay (milliseconds d)
{
  asio::steady_timer t (co_await asio::this_coro::executor, d);

  boost::system::error_code ec;
  co_await t.async_wait (asio::redirect_error (asio::use_awaitable, ec));
}

// Executor whose behavior is chosen by the job's external reference:
//
// ok        two progress reports, then completed
// flaky-N   connection-level failure for the first N attempts, then ok
// fatal     fatal failure
// slow      keeps going until cancelled (checks the token every 5ms)
// stuck     ignores the token and only stops when aborted
// held      waits until its id is released, then ok
//
class scripted_executor: public transfer_executor
{
public:
  struct call
  {
    job_id id;
    uint32_t attempt;
    string endpoint;
  };

  vector<call> calls;
  set<job_id> released;
  size_t running = 0;
  size_t max_running = 0;

  asio::awaitable<attempt_result>
  execute (transfer_lease& l) override
  {
    calls.push_back (call {l.id (), l.attempt (), l.endpoint ().url});

    ++running;
    if (running > max_running)
      max_running = running;

    attempt_result r (co_await behave (l));

    --running;
    co_return r;
  }

private:
  asio::awaitable<attempt_result>
  behave (transfer_lease& l)
  {
    const string& b (l.descriptor ().external_reference);

    if (b == "fatal")
      co_return attempt_result::fatal ("not authorized");

    if (b.compare (0, 6, "flaky-") == 0)
    {
      uint32_t n (static_cast<uint32_t> (stoul (b.substr (6))));

      if (l.attempt () <= n)
      {
        co_await delay (milliseconds (2));
        l.report (0.3, 3);
        co_return attempt_result::recoverable ("connection reset", true);
      }
    }

    if (b == "slow")
    {
      for (;;)
      {
        if (l.cancelled ())
          co_return attempt_result::cancelled ();

        co_await delay (milliseconds (5));
      }
    }

    if (b == "held")
    {
      while (released.count (l.id ()) == 0)
        co_await delay (milliseconds (1));
    }

    if (b == "stuck")
    {
      asio::steady_timer t (co_await asio::this_coro::executor,
                            chrono::seconds (30));

      boost::system::error_code ec;
      co_await t.async_wait (asio::redirect_error (asio::use_awaitable, ec));
      co_return attempt_result::cancelled ();
    }

    co_await delay (milliseconds (5));
    l.sink ().write (0, "ab", 2);
    l.report (0.5, 2);

    co_await delay (milliseconds (5));
    l.sink ().write (2, "cd", 2);
    l.report (1.0, 4);

    co_return attempt_result::completed (l.sink ().commit (), 4);
  }
};

class memory_sink: public transfer_sink
{
public:
  string data;
  bool discarded = false;

  void
  write (uint64_t, const char* d, size_t n) override
  {
    if (!discarded)
      data.append (d, n);
  }

  void
  reset () override
  {
    data.clear ();
  }

  string
  commit () override
  {
    return "memory:" + data;
  }

  void
  discard () noexcept override
  {
    discarded = true;
  }

  uint64_t
  size () const override
  {
    return data.size ();
  }
};

class memory_sinks: public sink_factory
{
public:
  map<job_id, shared_ptr<memory_sink>> sinks;

  shared_ptr<transfer_sink>
  create (job_id id, const job_descriptor&) override
  {
    auto s (make_shared<memory_sink> ());
    sinks[id] = s;
    return s;
  }
};

struct fixture
{
  asio::io_context ioc;
  diagnostics diag {diagnostics::null ()};
  endpoint_registry registry;
  scripted_executor executor;
  memory_sinks sinks;
  progress_broadcaster broadcaster {ioc};
  queue_manager::traits_type traits;
  unique_ptr<queue_manager> queue;

  explicit
  fixture (queue_manager::traits_type t = queue_manager::traits_type ())
    : traits (t)
  {
    registry.add ("https://a.example", 0);
    registry.add ("https://b.example", 1);

    queue = make_unique<queue_manager> (
      ioc, registry, executor, sinks, broadcaster, diag, traits);
  }

  job_id
  enqueue (const string& behavior, const string& title = "Archangel")
  {
    job_descriptor d;
    d.title = title;
    d.artist = "Burial";
    d.external_reference = behavior;
    return queue->enqueue (move (d));
  }

  void
  run ()
  {
    asio::co_spawn (ioc, queue->drain (), asio::detached);
    ioc.run ();
    ioc.restart ();
  }
};

// Drain whatever a subscription has buffered.
//
static vector<progress_event>
collect (progress_subscription& s)
{
  vector<progress_event> r;
  while (optional<progress_event> e = s.poll ())
    r.push_back (move (*e));
  return r;
}

static size_t
count_kind (const vector<progress_event>& es, event_kind k)
{
  size_t n (0);
  for (const progress_event& e: es)
  {
    if (e.kind == k)
      ++n;
  }
  return n;
}

// Five jobs against a bound of two: never more than two active, all five
// complete, each subject sees a gapless sequence ending in one terminal
// event.
//
static void
test_bound ()
{
  fixture f;

  vector<progress_subscription> subs;
  for (job_id i (1); i <= 5; ++i)
    subs.push_back (f.broadcaster.subscribe (job_subject (i)));

  for (int i (0); i != 5; ++i)
    f.enqueue ("ok", "Track " + to_string (i));

  queue_statistics s (f.queue->statistics ());
  assert (s.active == 2 && s.queued == 3);

  f.run ();

  assert (f.executor.max_running == 2);
  assert (f.executor.calls.size () == 5);

  s = f.queue->statistics ();
  assert (s.completed == 5 && s.total () == 5);

  // Admission order.
  //
  assert (f.executor.calls[0].id == 1 && f.executor.calls[1].id == 2);

  for (progress_subscription& sub: subs)
  {
    vector<progress_event> es (collect (sub));

    assert (!es.empty ());
    assert (es.front ().kind == event_kind::queued);
    assert (es.back ().kind == event_kind::completed);

    for (size_t i (0); i != es.size (); ++i)
      assert (es[i].sequence == i + 1);

    size_t terminals (0);
    for (const progress_event& e: es)
    {
      if (e.terminal ())
        ++terminals;
    }
    assert (terminals == 1);
    assert (sub.ended ());
  }

  vector<job_snapshot> js (f.queue->list_jobs ());
  assert (js.size () == 5);
  assert (js[0].id == 1 && js[4].id == 5);
  assert (js[0].location == "memory:abcd");
  assert (js[0].bytes_written == 4);
  assert (js[0].progress == 1.0);
}

// With five jobs against a bound of two, each completion admits exactly one
// queued job, the oldest.
//
static void
test_admit_one ()
{
  fixture f;

  for (int i (0); i != 5; ++i)
    f.enqueue ("held", "Track " + std::to_string (i));

  queue_statistics s (f.queue->statistics ());
  assert (s.active == 2 && s.queued == 3);

  auto status = [&f] (job_id id)
  {
    return f.queue->find (id)->status;
  };

  asio::co_spawn (
    f.ioc,
    [&f, &status] () -> asio::awaitable<void>
    {
      f.executor.released.insert (1);

      while (f.queue->statistics ().completed != 1)
        co_await delay (milliseconds (1));

      queue_statistics s (f.queue->statistics ());
      assert (s.active == 2 && s.queued == 2);
      assert (status (2) == job_status::active);
      assert (status (3) == job_status::active);
      assert (status (4) == job_status::queued);

      f.executor.released.insert (3);

      while (f.queue->statistics ().completed != 2)
        co_await delay (milliseconds (1));

      s = f.queue->statistics ();
      assert (s.active == 2 && s.queued == 1);
      assert (status (2) == job_status::active);
      assert (status (4) == job_status::active);
      assert (status (5) == job_status::queued);

      for (job_id i (2); i <= 5; ++i)
        f.executor.released.insert (i);
    },
    asio::detached);

  f.run ();

  assert (f.executor.max_running == 2);
  assert (f.queue->statistics ().completed == 5);
}

// A connection-level failure flags the endpoint and the retry goes to a
// different one, starting over from zero progress.
//
static void
test_failover ()
{
  fixture f;

  progress_subscription sub (f.broadcaster.subscribe (job_subject (1)));

  f.enqueue ("flaky-1");
  f.run ();

  const auto& c (f.executor.calls);
  assert (c.size () == 2);
  assert (c[0].endpoint == "https://a.example" && c[0].attempt == 1);
  assert (c[1].endpoint == "https://b.example" && c[1].attempt == 2);

  assert (f.registry.suspected_down ("https://a.example"));
  assert (!f.registry.suspected_down ("https://b.example"));

  optional<job_snapshot> j (f.queue->find (1));
  assert (j && j->status == job_status::completed);
  assert (j->attempt == 2);
  assert (j->endpoint == "https://b.example");

  vector<progress_event> es (collect (sub));
  assert (count_kind (es, event_kind::retrying) == 1);

  // The new attempt reports its own progress from scratch.
  //
  size_t i (0);
  while (es[i].kind != event_kind::retrying)
    ++i;

  assert (*es[i].payload.attempt == 2);
  assert (es[i].payload.message == "connection reset");
  assert (es[i + 1].kind == event_kind::progress);
  assert (*es[i + 1].payload.progress == 0.5);
}

// Recoverable failures on every attempt end in failed after max_attempts.
//
static void
test_exhaust ()
{
  fixture f;

  f.enqueue ("flaky-9");
  f.run ();

  assert (f.executor.calls.size () == 3);

  optional<job_snapshot> j (f.queue->find (1));
  assert (j->status == job_status::failed);
  assert (j->attempt == 3);
  assert (j->last_error->find ("giving up after 3 attempts") == 0);

  // Partial output is thrown away.
  //
  assert (f.sinks.sinks[1]->discarded);

  // Round robin: both endpoints were tried before going back to the first.
  //
  assert (f.executor.calls[2].endpoint == "https://a.example" ||
          f.executor.calls[2].endpoint == "https://b.example");
  assert (f.executor.calls[0].endpoint != f.executor.calls[1].endpoint);
}

static void
test_fatal ()
{
  fixture f;

  progress_subscription sub (f.broadcaster.subscribe (job_subject (1)));

  f.enqueue ("fatal");
  f.run ();

  assert (f.executor.calls.size () == 1);

  optional<job_snapshot> j (f.queue->find (1));
  assert (j->status == job_status::failed);
  assert (j->last_error == "not authorized");

  vector<progress_event> es (collect (sub));
  assert (es.back ().kind == event_kind::failed);
  assert (es.back ().payload.message == "not authorized");
}

static void
test_no_endpoint ()
{
  asio::io_context ioc;
  diagnostics diag (diagnostics::null ());
  endpoint_registry registry;
  scripted_executor executor;
  memory_sinks sinks;
  progress_broadcaster broadcaster (ioc);
  queue_manager q (ioc, registry, executor, sinks, broadcaster, diag);

  job_descriptor d;
  d.title = "Archangel";
  d.artist = "Burial";
  d.external_reference = "ok";
  q.enqueue (d);

  ioc.run ();

  assert (executor.calls.empty ());

  optional<job_snapshot> j (q.find (1));
  assert (j->status == job_status::failed);
  assert (j->attempt == 3);
  assert (j->last_error->find ("no endpoint available") != string::npos);
}

// A queued job that is cancelled is never handed to the executor.
//
static void
test_cancel_queued ()
{
  queue_manager::traits_type t;
  t.concurrency = 1;
  fixture f (t);

  progress_subscription sub (f.broadcaster.subscribe (job_subject (2)));

  f.enqueue ("ok");
  f.enqueue ("ok");

  assert (f.queue->find (2)->status == job_status::queued);
  assert (f.queue->cancel (2));
  assert (f.queue->find (2)->status == job_status::cancelled);

  // Terminal and unknown jobs.
  //
  assert (!f.queue->cancel (2));
  assert (!f.queue->cancel (42));

  f.run ();

  assert (f.executor.calls.size () == 1);
  assert (f.executor.calls[0].id == 1);
  assert (f.queue->find (1)->status == job_status::completed);

  vector<progress_event> es (collect (sub));
  assert (es.size () == 2);
  assert (es[0].kind == event_kind::queued);
  assert (es[1].kind == event_kind::cancelled);
}

// An active job that acknowledges cancellation.
//
static void
test_cancel_active ()
{
  fixture f;

  f.enqueue ("slow");

  asio::co_spawn (f.ioc,
                  [&f] () -> asio::awaitable<void>
                  {
                    co_await delay (milliseconds (20));
                    assert (f.queue->cancel (1));
                  },
                  asio::detached);

  f.run ();

  optional<job_snapshot> j (f.queue->find (1));
  assert (j->status == job_status::cancelled);
  assert (f.sinks.sinks[1]->discarded);
}

// An active job that ignores cancellation is finalized after the grace
// period and its attempt is aborted.
//
static void
test_cancel_forced ()
{
  queue_manager::traits_type t;
  t.cancel_grace = milliseconds (30);
  fixture f (t);

  progress_subscription sub (f.broadcaster.subscribe (job_subject (1)));

  f.enqueue ("stuck");
  f.enqueue ("ok");

  asio::co_spawn (f.ioc,
                  [&f] () -> asio::awaitable<void>
                  {
                    co_await delay (milliseconds (10));
                    f.queue->cancel (1);
                  },
                  asio::detached);

  auto start (chrono::steady_clock::now ());
  f.run ();

  // The stuck attempt would have waited 30 seconds.
  //
  assert (chrono::steady_clock::now () - start < chrono::seconds (10));

  assert (f.queue->find (1)->status == job_status::cancelled);
  assert (f.queue->find (2)->status == job_status::completed);
  assert (f.sinks.sinks[1]->discarded);

  vector<progress_event> es (collect (sub));
  assert (count_kind (es, event_kind::cancelled) == 1);
  assert (es.back ().kind == event_kind::cancelled);
}

static void
test_pause_resume ()
{
  fixture f;

  f.queue->pause_all ();
  assert (f.queue->paused ());

  f.enqueue ("ok");
  f.enqueue ("ok");

  f.run ();

  assert (f.executor.calls.empty ());
  assert (f.queue->statistics ().queued == 2);

  f.queue->resume_all ();
  assert (f.queue->statistics ().active == 2);

  f.run ();

  assert (f.queue->statistics ().completed == 2);
}

static void
test_retention ()
{
  queue_manager::traits_type t;
  t.concurrency = 1;
  t.retention_limit = 2;
  fixture f (t);

  for (int i (0); i != 4; ++i)
    f.enqueue ("ok");

  f.run ();

  vector<job_snapshot> js (f.queue->list_jobs ());
  assert (js.size () == 2);
  assert (js[0].id == 3 && js[1].id == 4);

  // The broadcaster only remembers the retained subjects.
  //
  assert (!f.broadcaster.closed (job_subject (1)));
  assert (!f.broadcaster.closed (job_subject (2)));
  assert (f.broadcaster.closed (job_subject (3)));
  assert (f.broadcaster.closed (job_subject (4)));

  assert (!f.queue->remove (1));
  assert (f.queue->remove (3));
  assert (f.queue->clear_finished () == 1);
  assert (f.queue->list_jobs ().empty ());
}

static void
test_list_filter ()
{
  queue_manager::traits_type t;
  t.concurrency = 1;
  fixture f (t);

  f.enqueue ("ok");
  f.enqueue ("fatal");
  f.enqueue ("ok");

  assert (f.queue->list_jobs (job_status::queued).size () == 2);
  assert (f.queue->list_jobs (job_status::active).size () == 1);

  f.run ();

  assert (f.queue->list_jobs (job_status::completed).size () == 2);
  assert (f.queue->list_jobs (job_status::failed).size () == 1);

  // Active jobs cannot be removed; nothing is active anymore here.
  //
  assert (f.queue->remove (2));
  assert (!f.queue->find (2));
}

static void
test_invalid ()
{
  fixture f;

  bool thrown (false);
  try
  {
    f.enqueue ("ok", "");
  }
  catch (const invalid_job_spec&)
  {
    thrown = true;
  }

  assert (thrown);
  assert (f.queue->statistics ().total () == 0);
}

static void
test_cancel_all ()
{
  queue_manager::traits_type t;
  t.concurrency = 1;
  fixture f (t);

  f.enqueue ("slow");
  f.enqueue ("ok");
  f.enqueue ("ok");

  assert (f.queue->cancel_all () == 3);

  f.run ();

  assert (f.queue->statistics ().cancelled == 3);
  assert (f.executor.calls.size () == 1);
}

int
main ()
{
  test_bound ();
  test_admit_one ();
  test_failover ();
  test_exhaust ();
  test_fatal ();
  test_no_endpoint ();
  test_cancel_queued ();
  test_cancel_active ();
  test_cancel_forced ();
  test_pause_resume ();
  test_retention ();
  test_list_filter ();
  test_invalid ();
  test_cancel_all ();
}
