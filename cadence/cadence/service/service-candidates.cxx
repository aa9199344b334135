#include <cadence/service/service-candidates.hxx>

#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

using namespace std;

namespace cadence
{
  static optional<string>
  member (const json::object& o, const char* n)
  {
    const json::value* v (o.if_contains (n));

    if (v == nullptr || v->is_null ())
      return nullopt;

    if (!v->is_string ())
      throw invalid_argument (string ("candidate member '") + n +
                              "' is not a string");

    return string (v->get_string ());
  }

  vector<candidate_track>
  parse_candidates (const json::value& v)
  {
    const json::array* a (v.if_array ());

    if (a == nullptr)
    {
      if (const json::object* o = v.if_object ())
      {
        if (const json::value* t = o->if_contains ("tracks"))
          a = t->if_array ();
      }
    }

    if (a == nullptr)
      throw invalid_argument ("expected an array of candidate records");

    vector<candidate_track> r;
    r.reserve (a->size ());

    for (const json::value& e: *a)
    {
      const json::object* o (e.if_object ());
      if (o == nullptr)
        throw invalid_argument ("candidate record is not an object");

      candidate_track c;

      optional<string> t (member (*o, "title"));
      optional<string> s (member (*o, "artist"));

      if (!t || t->empty () || !s || s->empty ())
        throw invalid_argument ("candidate record without title or artist");

      c.title = move (*t);
      c.artist = move (*s);
      c.album = member (*o, "album");
      c.external_id = member (*o, "external_id");

      if (!c.external_id)
        c.external_id = member (*o, "mbid");

      r.push_back (move (c));
    }

    return r;
  }

  asio::awaitable<vector<candidate_track>> json_candidate_source::
  candidates (const string&, const string&)
  {
    ifstream ifs (file_, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open " + file_.string ());

    string text ((istreambuf_iterator<char> (ifs)),
                 istreambuf_iterator<char> ());

    json::error_code ec;
    json::value v (json::parse (text, ec));

    if (ec)
      throw runtime_error (file_.string () + ": " + ec.message ());

    try
    {
      co_return parse_candidates (v);
    }
    catch (const invalid_argument& e)
    {
      throw runtime_error (file_.string () + ": " + e.what ());
    }
  }
}
