#include <cadence/transfer/transfer-executor.hxx>

#include <memory>
#include <optional>
#include <exception>

#include <cadence/cadence-error.hxx>
#include <cadence/transfer/transfer-digest.hxx>
#include <cadence/transfer/transfer-timeout.hxx>

using namespace std;

namespace cadence
{
  stream_transfer_executor::
  stream_transfer_executor (stream_resolver& r,
                            stream_fetcher& f,
                            diagnostics& d,
                            traits_type t)
    : resolver_ (r), fetcher_ (f), diag_ (d), traits_ (t)
  {
  }

  asio::awaitable<attempt_result> stream_transfer_executor::
  execute (transfer_lease& l)
  {
    if (l.cancelled ())
      co_return attempt_result::cancelled ();

    string n (job_subject (l.id ()) + " attempt " +
              std::to_string (l.attempt ()));

    try
    {
      stream_location loc (
        co_await with_timeout (resolver_.resolve (l.endpoint (),
                                                  l.descriptor ()),
                               traits_.resolve_timeout,
                               "resolving " + l.endpoint ().url));

      if (loc.url.empty ())
        throw recoverable_transfer_error ("no stream location for " +
                                          l.descriptor ().external_reference);

      if (loc.digest && !transfer_digest::supported (loc.digest_algorithm))
        throw fatal_transfer_error ("unsupported digest algorithm '" +
                                    loc.digest_algorithm + "'");

      diag_.trace (n + ": resolved " + loc.url + " via " + l.endpoint ().url);

      if (l.cancelled ())
        co_return attempt_result::cancelled ();

      transfer_outcome o (
        co_await with_timeout (transfer (l, loc),
                               traits_.transfer_timeout,
                               "transfer from " + l.endpoint ().url));

      if (o.stopped)
        co_return attempt_result::cancelled ();

      // Integrity.
      //
      if (o.bytes == 0)
        throw recoverable_transfer_error ("empty transfer");

      if (loc.size && o.bytes != *loc.size)
        throw recoverable_transfer_error (
          "size mismatch: expected " + std::to_string (*loc.size) +
          " bytes, received " + std::to_string (o.bytes));

      if (loc.digest && !compare_digests (o.digest, *loc.digest))
        throw recoverable_transfer_error (
          loc.digest_algorithm + " mismatch: expected " + *loc.digest +
          ", computed " + o.digest);

      // Last chance to back out before the output becomes final.
      //
      if (l.cancelled ())
        co_return attempt_result::cancelled ();

      string p (l.sink ().commit ());

      diag_.trace (n + ": committed " + std::to_string (o.bytes) +
                   " bytes to " + p);

      co_return attempt_result::completed (move (p), o.bytes);
    }
    catch (const fatal_transfer_error& e)
    {
      co_return attempt_result::fatal (e.what ());
    }
    catch (const recoverable_transfer_error& e)
    {
      co_return attempt_result::recoverable (e.what (), e.connection_level ());
    }
    catch (const boost::system::system_error& e)
    {
      // An aborted operation after the token was set is just our own
      // cancellation unwinding.
      //
      if (e.code () == asio::error::operation_aborted && l.cancelled ())
        co_return attempt_result::cancelled ();

      co_return attempt_result::recoverable (e.what (), true);
    }
    catch (const exception& e)
    {
      co_return attempt_result::recoverable (e.what ());
    }
  }

  asio::awaitable<stream_transfer_executor::transfer_outcome>
  stream_transfer_executor::
  transfer (transfer_lease& l, const stream_location& loc)
  {
    transfer_outcome r;

    transfer_sink& s (l.sink ());
    s.reset ();

    unique_ptr<byte_stream> in (co_await fetcher_.open (loc));

    optional<uint64_t> total (loc.size ? loc.size : in->content_length ());

    optional<transfer_digest> d;
    if (loc.digest)
      d.emplace (loc.digest_algorithm);

    for (;;)
    {
      optional<string> c (co_await in->read ());

      if (!c)
        break;

      if (l.cancelled ())
      {
        r.stopped = true;
        co_return r;
      }

      if (c->empty ())
        continue;

      s.write (r.bytes, c->data (), c->size ());

      if (d)
        d->update (c->data (), c->size ());

      r.bytes += c->size ();

      double ratio (total && *total != 0
                    ? static_cast<double> (r.bytes) / *total
                    : 0.0);

      // A revoked lease means the job was finalized without us.
      //
      if (!l.report (ratio, r.bytes))
      {
        r.stopped = true;
        co_return r;
      }
    }

    if (d)
      r.digest = d->finish ();

    co_return r;
  }
}
