#include <cadence/progress/progress-event.hxx>

#include <string>
#include <cassert>
#include <sstream>

#include <boost/json.hpp>

using namespace std;
using namespace cadence;

namespace json = boost::json;

static void
test_kinds ()
{
  for (event_kind k: {event_kind::queued,
                      event_kind::started,
                      event_kind::progress,
                      event_kind::retrying,
                      event_kind::completed,
                      event_kind::failed,
                      event_kind::cancelled,
                      event_kind::validating,
                      event_kind::found,
                      event_kind::not_found,
                      event_kind::complete,
                      event_kind::error,
                      event_kind::ping})
    assert (parse_event_kind (to_string (k)) == k);

  assert (to_string (event_kind::not_found) == "not_found");
  assert (!parse_event_kind ("done"));

  assert (terminal (event_kind::complete));
  assert (terminal (event_kind::error));
  assert (terminal (event_kind::cancelled));
  assert (!terminal (event_kind::retrying));
  assert (!terminal (event_kind::ping));
}

static void
test_json ()
{
  progress_event e;
  e.subject = "job-3";
  e.kind = event_kind::retrying;
  e.sequence = 4;
  e.timestamp = progress_event::clock_type::time_point (
    chrono::milliseconds (1700000000123));
  e.payload.attempt = 2;
  e.payload.message = "connection reset";
  e.payload.endpoint = "https://a.example";

  json::object o (to_json (e));
  assert (o.at ("type").as_string () == "retrying");
  assert (o.at ("subject").as_string () == "job-3");
  assert (o.at ("sequence").to_number<uint64_t> () == 4);
  assert (o.at ("timestamp").to_number<int64_t> () == 1700000000123);
  assert (o.at ("attempt").to_number<uint32_t> () == 2);
  assert (o.at ("message").as_string () == "connection reset");
  assert (o.at ("endpoint").as_string () == "https://a.example");

  // Absent members stay absent.
  //
  assert (!o.contains ("progress"));
  assert (!o.contains ("tracks"));

  ostringstream os;
  os << e;
  assert (os.str () == "job-3 #4 retrying attempt 2: connection reset");
}

static void
test_tracks ()
{
  validated_track f;
  f.candidate.title = "Archangel";
  f.candidate.artist = "Burial";
  f.candidate.external_id = "mb-1";
  f.found = true;
  f.resolved_id = "1234";
  f.album = "Untrue";

  validated_track n;
  n.candidate.title = "Unknown";
  n.candidate.artist = "Nobody";
  n.candidate.album = "Nowhere";
  n.error = "lookup failed";

  progress_event e;
  e.subject = "batch-1";
  e.kind = event_kind::complete;
  e.sequence = 7;
  e.payload.tracks = vector<validated_track> {f, n};
  e.payload.found_count = 1;

  json::object o (to_json (e));
  const json::array& a (o.at ("tracks").as_array ());
  assert (a.size () == 2);
  assert (o.at ("found_count").to_number<size_t> () == 1);

  const json::object& x (a[0].as_object ());
  assert (x.at ("found").as_bool ());
  assert (x.at ("resolved_id").as_string () == "1234");
  assert (x.at ("album").as_string () == "Untrue");
  assert (x.at ("external_id").as_string () == "mb-1");
  assert (!x.contains ("error"));

  const json::object& y (a[1].as_object ());
  assert (!y.at ("found").as_bool ());
  assert (y.at ("resolved_id").is_null ());
  assert (y.at ("album").as_string () == "Nowhere");
  assert (y.at ("error").as_string () == "lookup failed");
}

static void
test_sse ()
{
  progress_event p;
  p.subject = "job-1";
  p.kind = event_kind::ping;
  p.sequence = 3;

  assert (to_sse (p) == "data: {\"type\":\"ping\"}\n\n");

  progress_event e;
  e.subject = "job-1";
  e.kind = event_kind::progress;
  e.sequence = 2;
  e.payload.progress = 0.5;

  string s (to_sse (e));
  assert (s.compare (0, 6, "data: ") == 0);
  assert (s.size () > 8 && s.compare (s.size () - 2, 2, "\n\n") == 0);

  json::value v (json::parse (s.substr (6, s.size () - 8)));
  assert (v.at ("progress").as_double () == 0.5);
}

int
main ()
{
  test_kinds ();
  test_json ();
  test_tracks ();
  test_sse ();
}
