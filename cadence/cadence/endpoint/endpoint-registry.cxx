#include <cadence/endpoint/endpoint-registry.hxx>

#include <algorithm>

using namespace std;

namespace cadence
{
  endpoint_registry::
  endpoint_registry (duration c)
    : cooldown_ (c)
  {
  }

  endpoint_registry::
  endpoint_registry (vector<endpoint_candidate> cs, duration c)
    : cooldown_ (c)
  {
    for (const auto& x: cs)
      add (x.url, x.priority);
  }

  void endpoint_registry::
  add (string url, int priority)
  {
    lock_guard<mutex> l (mutex_);

    if (entry* e = find (url))
      e->candidate.priority = priority;
    else
      entries_.push_back (
        entry {endpoint_candidate (move (url), priority), nullopt, next_order_++});

    stable_sort (entries_.begin (), entries_.end (),
                 [] (const entry& x, const entry& y)
    {
      return x.candidate.priority != y.candidate.priority
        ? x.candidate.priority < y.candidate.priority
        : x.order < y.order;
    });
  }

  optional<endpoint_candidate> endpoint_registry::
  next_candidate (const set<string>& ex, time_point now)
  {
    lock_guard<mutex> l (mutex_);

    if (entries_.empty ())
      return nullopt;

    expire (now);

    auto excluded ([&ex] (const entry& e)
    {
      return ex.find (e.candidate.url) != ex.end ();
    });

    // Healthy and not excluded.
    //
    for (const entry& e: entries_)
      if (!excluded (e) && !e.down_since)
        return e.candidate;

    // Not excluded, health ignored.
    //
    for (const entry& e: entries_)
      if (!excluded (e))
        return e.candidate;

    // Everything is excluded. Rather than starve the caller we start over
    // from the top.
    //
    return entries_.front ().candidate;
  }

  bool endpoint_registry::
  mark_down (const string& url, time_point now)
  {
    lock_guard<mutex> l (mutex_);

    expire (now);

    entry* e (find (url));
    if (e == nullptr || e->down_since)
      return false;

    e->down_since = now;
    e->candidate.suspected_down = true;
    return true;
  }

  bool endpoint_registry::
  mark_up (const string& url)
  {
    lock_guard<mutex> l (mutex_);

    entry* e (find (url));
    if (e == nullptr || !e->down_since)
      return false;

    e->down_since = nullopt;
    e->candidate.suspected_down = false;
    return true;
  }

  bool endpoint_registry::
  suspected_down (const string& url, time_point now)
  {
    lock_guard<mutex> l (mutex_);

    expire (now);

    entry* e (find (url));
    return e != nullptr && e->down_since.has_value ();
  }

  vector<endpoint_candidate> endpoint_registry::
  candidates (time_point now)
  {
    lock_guard<mutex> l (mutex_);

    expire (now);

    vector<endpoint_candidate> r;
    r.reserve (entries_.size ());

    for (const entry& e: entries_)
      r.push_back (e.candidate);

    return r;
  }

  size_t endpoint_registry::
  size () const
  {
    lock_guard<mutex> l (mutex_);
    return entries_.size ();
  }

  void endpoint_registry::
  expire (time_point now)
  {
    for (entry& e: entries_)
    {
      if (e.down_since && now - *e.down_since >= cooldown_)
      {
        e.down_since = nullopt;
        e.candidate.suspected_down = false;
      }
    }
  }

  endpoint_registry::entry* endpoint_registry::
  find (const string& url)
  {
    auto i (find_if (entries_.begin (), entries_.end (),
                     [&url] (const entry& e) {return e.candidate.url == url;}));

    return i != entries_.end () ? &*i : nullptr;
  }
}
