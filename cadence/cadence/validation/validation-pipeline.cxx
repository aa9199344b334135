#include <cadence/validation/validation-pipeline.hxx>

#include <mutex>
#include <utility>
#include <optional>
#include <algorithm>
#include <exception>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

#include <cadence/cadence-error.hxx>

using namespace std;

namespace cadence
{
  struct validation_pipeline::batch_state
  {
    subject_id subject;

    mutex mtx;
    vector<validated_track> tracks; // Input order.
    size_t next {0};                // Next record to hand out.
    size_t processed {0};
    size_t found {0};
    bool aborted {false};
    string reason;
  };

  static string
  display (const candidate_track& c)
  {
    return c.artist + " - " + c.title;
  }

  validation_pipeline::
  validation_pipeline (availability_checker& c,
                       progress_broadcaster& b,
                       diagnostics& d,
                       traits_type t)
    : checker_ (c), broadcaster_ (b), diag_ (d), traits_ (t)
  {
    if (traits_.concurrency == 0)
      throw invalid_argument ("validation concurrency must be positive");
  }

  asio::awaitable<validation_result> validation_pipeline::
  run (vector<candidate_track> cs, subject_id batch)
  {
    using namespace asio::experimental;

    auto st (make_shared<batch_state> ());
    st->subject = batch;
    st->tracks.reserve (cs.size ());

    for (candidate_track& c: cs)
    {
      validated_track t;
      t.candidate = move (c);
      t.album = t.candidate.album;
      st->tracks.push_back (move (t));
    }

    size_t n (min (traits_.concurrency, st->tracks.size ()));

    diag_.trace (batch + ": validating " +
                 std::to_string (st->tracks.size ()) + " records with " +
                 std::to_string (n) + " workers");

    if (n != 0)
    {
      auto ex (co_await asio::this_coro::executor);

      using op = decltype (asio::co_spawn (ex, work (st), asio::deferred));

      vector<op> ops;
      ops.reserve (n);

      for (size_t i (0); i != n; ++i)
        ops.push_back (asio::co_spawn (ex, work (st), asio::deferred));

      // Note that wait_for_one_error() cancels the other workers as soon as
      // one of them fails, which only happens on abort.
      //
      auto [ord, es] =
        co_await make_parallel_group (move (ops)).async_wait (
          wait_for_one_error (), asio::use_awaitable);

      if (st->aborted)
      {
        diag_.error (batch + ": validation aborted: " + st->reason);

        event_payload p;
        p.message = st->reason;
        p.total = st->tracks.size ();
        broadcaster_.publish (batch, event_kind::error, move (p));

        throw pipeline_abort (st->reason);
      }

      // Workers only fail on abort, anything else is unexpected.
      //
      for (const exception_ptr& e: es)
      {
        if (e != nullptr)
          rethrow_exception (e);
      }
    }

    validation_result r;
    r.tracks = move (st->tracks);
    r.found_count = st->found;

    diag_.trace (batch + ": " + std::to_string (r.found_count) + " of " +
                 std::to_string (r.tracks.size ()) + " records found");

    event_payload p;
    p.tracks = r.tracks;
    p.found_count = r.found_count;
    p.total = r.tracks.size ();
    p.progress = 1.0;
    broadcaster_.publish (batch, event_kind::complete, move (p));

    co_return r;
  }

  asio::awaitable<void> validation_pipeline::
  work (shared_ptr<batch_state> st)
  {
    const subject_id& batch (st->subject);
    size_t total (st->tracks.size ());

    for (;;)
    {
      size_t i;
      candidate_track c;
      double done;

      {
        lock_guard<mutex> l (st->mtx);

        if (st->aborted || st->next == total)
          co_return;

        i = st->next++;
        c = st->tracks[i].candidate;
        done = static_cast<double> (st->processed) / total;
      }

      {
        event_payload p;
        p.message = display (c);
        p.progress = done;
        p.total = total;
        broadcaster_.publish (batch, event_kind::validating, move (p));
      }

      optional<availability> a;
      optional<string> err;

      try
      {
        a = co_await checker_.check (c);
      }
      catch (const pipeline_abort& e)
      {
        lock_guard<mutex> l (st->mtx);

        if (!st->aborted)
        {
          st->aborted = true;
          st->reason = e.what ();
        }

        throw;
      }
      catch (const exception& e)
      {
        err = e.what ();
      }

      event_payload p;
      p.message = display (c);
      p.total = total;

      {
        lock_guard<mutex> l (st->mtx);

        // Whatever we got after the batch was aborted (most likely our own
        // cancellation) is of no interest.
        //
        if (st->aborted)
          co_return;

        validated_track& t (st->tracks[i]);

        if (a)
        {
          t.found = true;
          t.resolved_id = a->resolved_id;
          if (a->album)
            t.album = a->album;

          ++st->found;
          p.external_id = a->resolved_id;
        }
        else if (err)
        {
          t.error = err;
          p.message = display (c) + ": " + *err;
        }

        ++st->processed;
        p.progress = static_cast<double> (st->processed) / total;
      }

      if (err)
        diag_.warning (batch + ": lookup of " + display (c) + " failed: " +
                       *err);

      broadcaster_.publish (batch,
                            a ? event_kind::found : event_kind::not_found,
                            move (p));
    }
  }

  asio::awaitable<validation_result> validation_pipeline::
  generate (candidate_source& s,
            string username,
            string playlist_type,
            subject_id batch)
  {
    vector<candidate_track> cs;

    try
    {
      cs = co_await s.candidates (username, playlist_type);
    }
    catch (const exception& e)
    {
      diag_.error (batch + ": unable to obtain candidates for " + username +
                   ": " + e.what ());

      event_payload p;
      p.message = e.what ();
      broadcaster_.publish (batch, event_kind::error, move (p));

      throw;
    }

    diag_.trace (batch + ": " + std::to_string (cs.size ()) +
                 " candidates for " + username + " (" + playlist_type + ")");

    co_return co_await run (move (cs), move (batch));
  }
}
