#include <cadence/progress/progress-event.hxx>

using namespace std;

namespace json = boost::json;

namespace cadence
{
  string
  to_string (event_kind k)
  {
    switch (k)
    {
    case event_kind::queued:     return "queued";
    case event_kind::started:    return "started";
    case event_kind::progress:   return "progress";
    case event_kind::retrying:   return "retrying";
    case event_kind::completed:  return "completed";
    case event_kind::failed:     return "failed";
    case event_kind::cancelled:  return "cancelled";
    case event_kind::validating: return "validating";
    case event_kind::found:      return "found";
    case event_kind::not_found:  return "not_found";
    case event_kind::complete:   return "complete";
    case event_kind::error:      return "error";
    case event_kind::ping:       return "ping";
    }
    return "ping";
  }

  optional<event_kind>
  parse_event_kind (const string& s)
  {
    if (s == "queued")     return event_kind::queued;
    if (s == "started")    return event_kind::started;
    if (s == "progress")   return event_kind::progress;
    if (s == "retrying")   return event_kind::retrying;
    if (s == "completed")  return event_kind::completed;
    if (s == "failed")     return event_kind::failed;
    if (s == "cancelled")  return event_kind::cancelled;
    if (s == "validating") return event_kind::validating;
    if (s == "found")      return event_kind::found;
    if (s == "not_found")  return event_kind::not_found;
    if (s == "complete")   return event_kind::complete;
    if (s == "error")      return event_kind::error;
    if (s == "ping")       return event_kind::ping;

    return nullopt;
  }

  ostream&
  operator<< (ostream& os, const progress_event& e)
  {
    os << e.subject << " #" << e.sequence << ' ' << e.kind;

    const event_payload& p (e.payload);

    if (p.attempt)
      os << " attempt " << *p.attempt;

    if (p.progress)
      os << ' ' << static_cast<int> (*p.progress * 100) << '%';

    if (p.message)
      os << ": " << *p.message;

    return os;
  }

  json::object
  to_json (const validated_track& t)
  {
    const candidate_track& c (t.candidate);

    json::object o;
    o["title"] = c.title;
    o["artist"] = c.artist;

    if (t.album)
      o["album"] = *t.album;
    else if (c.album)
      o["album"] = *c.album;
    else
      o["album"] = nullptr;

    if (c.external_id)
      o["external_id"] = *c.external_id;
    else
      o["external_id"] = nullptr;

    if (t.resolved_id)
      o["resolved_id"] = *t.resolved_id;
    else
      o["resolved_id"] = nullptr;

    o["found"] = t.found;

    if (t.error)
      o["error"] = *t.error;

    return o;
  }

  json::object
  to_json (const progress_event& e)
  {
    json::object o;
    o["type"] = to_string (e.kind);

    // Keep-alives carry nothing else; consumers only use them as a liveness
    // signal.
    //
    if (e.kind == event_kind::ping)
      return o;

    o["subject"] = e.subject;
    o["sequence"] = e.sequence;
    o["timestamp"] = chrono::duration_cast<chrono::milliseconds> (
      e.timestamp.time_since_epoch ()).count ();

    const event_payload& p (e.payload);

    if (p.message)     o["message"] = *p.message;
    if (p.progress)    o["progress"] = *p.progress;
    if (p.total)       o["total"] = *p.total;
    if (p.found_count) o["found_count"] = *p.found_count;
    if (p.external_id) o["external_id"] = *p.external_id;
    if (p.attempt)     o["attempt"] = *p.attempt;
    if (p.endpoint)    o["endpoint"] = *p.endpoint;

    if (p.tracks)
    {
      json::array a;
      a.reserve (p.tracks->size ());

      for (const validated_track& t: *p.tracks)
        a.push_back (to_json (t));

      o["tracks"] = move (a);
    }

    return o;
  }

  string
  to_sse (const progress_event& e)
  {
    return "data: " + json::serialize (to_json (e)) + "\n\n";
  }
}
