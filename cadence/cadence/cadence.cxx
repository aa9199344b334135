#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <iostream>
#include <optional>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/json.hpp>

#include <cadence/cadence-error.hxx>
#include <cadence/cadence-options.hxx>
#include <cadence/diagnostics.hxx>
#include <cadence/config/engine-config.hxx>
#include <cadence/endpoint/endpoint-registry.hxx>
#include <cadence/http/http-client.hxx>
#include <cadence/job/job-types.hxx>
#include <cadence/progress/progress-broadcaster.hxx>
#include <cadence/progress/progress-event.hxx>
#include <cadence/queue/queue-manager.hxx>
#include <cadence/service/service-availability.hxx>
#include <cadence/service/service-candidates.hxx>
#include <cadence/service/service-resolver.hxx>
#include <cadence/transfer/transfer-executor.hxx>
#include <cadence/transfer/transfer-file-sink.hxx>
#include <cadence/validation/validation-pipeline.hxx>

#include <cadence/version.hxx>

using namespace std;

namespace asio = boost::asio;
namespace json = boost::json;

namespace cadence
{
  // Parse <ref>:<artist>:<title>. The title may itself contain colons.
  //
  static job_descriptor
  parse_track (const string& s, quality_tier q)
  {
    size_t a (s.find (':'));
    size_t b (a != string::npos ? s.find (':', a + 1) : string::npos);

    if (b == string::npos)
      throw invalid_argument ("invalid track '" + s +
                              "': expected <ref>:<artist>:<title>");

    job_descriptor d;
    d.external_reference = s.substr (0, a);
    d.artist = s.substr (a + 1, b - a - 1);
    d.title = s.substr (b + 1);
    d.quality = q;

    validate (d);
    return d;
  }

  // Everything that was asked for on the command line.
  //
  struct run_request
  {
    vector<job_descriptor> tracks;
    optional<fs::path> candidates;
    string user;
    string playlist_type;
    quality_tier quality;
  };

  // Wires the engine together and drives one run: validate the candidates
  // (if any), download everything, and relay the events to stdout as JSON
  // lines.
  //
  class engine_controller
  {
  public:
    engine_controller (asio::io_context& ioc,
                       const engine_config& c,
                       diagnostics& d)
      : ioc_ (ioc),
        diag_ (d),
        registry_ (c.endpoints, c.endpoint_cooldown),
        broadcaster_ (ioc_, c.broadcaster_traits ()),
        http_ (ioc_, http_traits ()),
        resolver_ (http_),
        fetcher_ (http_),
        executor_ (resolver_, fetcher_, diag_, c.executor_traits ()),
        sinks_ (c.output_directory),
        queue_ (ioc_,
                registry_,
                executor_,
                sinks_,
                broadcaster_,
                diag_,
                c.queue_traits ()),
        availability_ (http_, registry_, diag_),
        pipeline_ (availability_, broadcaster_, diag_, c.validation_traits ())
    {
    }

    // Return true if everything that was attempted succeeded.
    //
    asio::awaitable<bool>
    run (run_request r)
    {
      bool ok (true);

      if (r.candidates)
      {
        optional<validation_result> v;

        try
        {
          v = co_await validate (*r.candidates, r.user, r.playlist_type);
        }
        catch (const exception& e)
        {
          // Already published as the batch error event.
          //
          diag_.error ("candidate validation failed: " + string (e.what ()));
          ok = false;
        }

        if (v)
        {
          for (validated_track& t: v->tracks)
          {
            if (!t.found)
              continue;

            job_descriptor d;
            d.title = move (t.candidate.title);
            d.artist = move (t.candidate.artist);
            d.album = move (t.album);
            d.external_reference = move (*t.resolved_id);
            d.quality = r.quality;

            r.tracks.push_back (move (d));
          }
        }
      }

      if (r.tracks.empty ())
        co_return ok;

      // Hold admission until every job has a subscriber so that nothing
      // past the queued event is missed.
      //
      queue_.pause_all ();

      for (job_descriptor& d: r.tracks)
      {
        job_id id (queue_.enqueue (move (d)));
        relay (broadcaster_.subscribe (job_subject (id)));
      }

      queue_.resume_all ();

      co_await queue_.drain ();

      queue_statistics s (queue_.statistics ());

      diag_.trace (std::to_string (s.completed) + " completed, " +
                   std::to_string (s.failed) + " failed, " +
                   std::to_string (s.cancelled) + " cancelled");

      co_return ok && s.completed == s.total ();
    }

  private:
    static http_client_traits
    http_traits ()
    {
      http_client_traits r;
      r.user_agent = "cadence/" CADENCE_VERSION_STR;
      return r;
    }

    asio::awaitable<validation_result>
    validate (const fs::path& f, const string& user, const string& type)
    {
      json_candidate_source s (f);

      const subject_id batch ("validation");
      relay (broadcaster_.subscribe (batch));

      co_return co_await pipeline_.generate (s, user, type, batch);
    }

    // Print the subscription's events until it ends.
    //
    void
    relay (progress_subscription s)
    {
      auto p (make_shared<progress_subscription> (move (s)));

      asio::co_spawn (
        ioc_,
        [p] () -> asio::awaitable<void>
        {
          while (optional<progress_event> e = co_await p->next ())
          {
            if (e->kind == event_kind::ping)
              continue;

            cout << json::serialize (to_json (*e)) << endl;
          }
        },
        [this, subject = p->subject ()] (exception_ptr e)
        {
          if (!e)
            return;

          try
          {
            rethrow_exception (e);
          }
          catch (const subscription_overflow&)
          {
            diag_.warning (subject + ": output fell behind, events dropped");
          }
          catch (const exception& x)
          {
            diag_.error (subject + ": " + x.what ());
          }
        });
    }

    asio::io_context& ioc_;
    diagnostics& diag_;

    endpoint_registry registry_;
    progress_broadcaster broadcaster_;

    http_client http_;
    service_resolver resolver_;
    service_fetcher fetcher_;
    stream_transfer_executor executor_;
    file_sink_factory sinks_;
    queue_manager queue_;

    service_availability availability_;
    validation_pipeline pipeline_;
  };
}

int
main (int argc, char* argv[])
{
  using namespace cadence;

  try
  {
    options opt (argc, argv);

    if (opt.version ())
    {
      cout << "cadence " << CADENCE_VERSION_ID << "\n";
      return 0;
    }

    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: cadence [options]" << "\n"
        << "options:"                 << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (opt.verbose () && opt.quiet ())
      throw invalid_argument ("--verbose and --quiet are mutually exclusive");

    diagnostics diag (cerr,
                      opt.verbose () ? 2 : opt.quiet () ? 0 : 1);

    // Defaults, then the file, then the environment, then the command line.
    //
    engine_config conf;

    if (opt.config_specified ())
      conf.load (opt.config ());

    conf.load_environment ();

    if (opt.endpoint_specified ())
    {
      conf.endpoints.clear ();

      for (const string& u: opt.endpoint ())
      {
        int p (static_cast<int> (conf.endpoints.size ()));
        conf.endpoints.emplace_back (u, p);
      }
    }

    if (opt.jobs_specified ())
      conf.concurrency = opt.jobs ();

    if (opt.attempts_specified ())
      conf.max_attempts = opt.attempts ();

    if (opt.output_specified ())
      conf.output_directory = opt.output ();

    conf.validate ();

    run_request req;
    req.user = opt.user ();
    req.playlist_type = opt.playlist_type ();

    optional<quality_tier> q (parse_quality_tier (opt.quality ()));
    if (!q)
      throw invalid_argument ("unknown quality tier '" + opt.quality () + "'");

    req.quality = *q;

    for (const string& t: opt.track ())
      req.tracks.push_back (parse_track (t, req.quality));

    if (opt.candidates_specified ())
      req.candidates = fs::path (opt.candidates ());

    if (req.tracks.empty () && !req.candidates)
    {
      cerr << "error: nothing to do" << "\n"
           << "  info: specify --track or --candidates" << "\n";
      return 1;
    }

    if (conf.endpoints.empty ())
    {
      cerr << "error: no endpoints configured" << "\n"
           << "  info: specify --endpoint or list them in --config" << "\n";
      return 1;
    }

    asio::io_context ioc;
    engine_controller controller (ioc, conf, diag);

    int exit_code (1);

    asio::co_spawn (
      ioc,
      controller.run (move (req)),
      [&exit_code] (exception_ptr ex, bool ok)
      {
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
          }
          return;
        }

        exit_code = ok ? 0 : 1;
      });

    // Runs until the last relay has printed its subscription's terminal
    // event.
    //
    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
