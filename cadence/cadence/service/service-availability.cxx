#include <cadence/service/service-availability.hxx>

#include <set>
#include <stdexcept>

#include <boost/json.hpp>
#include <boost/system/system_error.hpp>

#include <cadence/cadence-error.hxx>
#include <cadence/service/service-resolver.hxx>
#include <cadence/service/service-response.hxx>

using namespace std;

namespace cadence
{
  string service_availability::
  search_url (const string& e, const candidate_track& c)
  {
    return endpoint_base (e) + "/search/?s=" +
           url_encode (c.artist + ' ' + c.title);
  }

  // Track id as a string whether the service sends a number or a string.
  //
  static optional<string>
  track_id (const json::object& t)
  {
    const json::value* v (t.if_contains ("id"));

    if (v == nullptr)
      return nullopt;

    if (v->is_string ())
      return string (v->get_string ());

    if (v->is_int64 ())
      return std::to_string (v->get_int64 ());

    if (v->is_uint64 ())
      return std::to_string (v->get_uint64 ());

    return nullopt;
  }

  asio::awaitable<optional<availability>> service_availability::
  check (const candidate_track& c)
  {
    set<string> tried;
    string last ("no endpoint configured");

    for (;;)
    {
      optional<endpoint_candidate> e (registry_.next_candidate (tried));

      // The registry only hands out an excluded candidate when there is
      // nothing else left.
      //
      if (!e || tried.count (e->url) != 0)
        throw pipeline_abort ("availability service unreachable: " + last);

      tried.insert (e->url);

      http_response r;
      try
      {
        r = co_await client_.get (search_url (e->url, c));
      }
      catch (const boost::system::system_error& x)
      {
        // Our own cancellation is not the endpoint's fault.
        //
        if (x.code () == asio::error::operation_aborted)
          throw;

        last = e->url + ": " + x.what ();
      }

      if (r.status == 0 || r.status >= 500)
      {
        if (r.status != 0)
          last = e->url + ": status " + std::to_string (r.status);

        if (registry_.mark_down (e->url))
          diag_.warning ("endpoint " + e->url + " suspected down (" + last +
                         ")");
        continue;
      }

      if (r.status == 429)
      {
        last = e->url + ": rate limited";
        continue;
      }

      if (!r.success ())
        throw runtime_error ("search failed with status " +
                             std::to_string (r.status));

      registry_.mark_up (e->url);

      json::error_code ec;
      json::value v (json::parse (r.body, ec));

      if (ec)
        throw runtime_error ("malformed search response: " + ec.message ());

      json::array items (extract_items (v, "tracks"));

      if (items.empty ())
        co_return nullopt;

      const json::object* t (items.front ().if_object ());
      optional<string> id (t != nullptr ? track_id (*t) : nullopt);

      if (!id)
        throw runtime_error ("search result without track id");

      availability a;
      a.resolved_id = move (*id);

      if (const json::value* al = t->if_contains ("album"))
      {
        if (const json::object* o = al->if_object ())
        {
          const json::value* tl (o->if_contains ("title"));
          if (tl != nullptr && tl->is_string ())
            a.album = string (tl->get_string ());
        }
      }

      co_return a;
    }
  }
}
