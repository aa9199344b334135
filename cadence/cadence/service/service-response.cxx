#include <cadence/service/service-response.hxx>

#include <regex>
#include <cctype>
#include <vector>
#include <stdexcept>

#include <openssl/evp.h>

#include <cadence/cadence-error.hxx>

using namespace std;

namespace cadence
{
  void
  throw_for_status (unsigned s, const string& what)
  {
    if (s >= 200 && s < 300)
      return;

    string m (what + " failed with status " + std::to_string (s));

    switch (s)
    {
    case 401:
    case 403:
    case 404:
    case 410:
      throw fatal_transfer_error (m);
    default:
      throw recoverable_transfer_error (m);
    }
  }

  json::array
  extract_items (const json::value& v, const string& key)
  {
    if (const json::array* a = v.if_array ())
    {
      if (!a->empty ())
      {
        if (const json::object* f = a->front ().if_object ())
        {
          if (const json::value* n = f->if_contains (key))
          {
            if (const json::object* o = n->if_object ())
            {
              if (const json::value* i = o->if_contains ("items"))
              {
                if (i->is_array ())
                  return i->get_array ();
              }

              return json::array ();
            }

            if (n->is_array ())
              return n->get_array ();
          }
        }
      }

      return *a;
    }

    if (const json::object* o = v.if_object ())
    {
      if (const json::value* n = o->if_contains (key))
      {
        if (const json::object* k = n->if_object ())
        {
          const json::value* i (k->if_contains ("items"));
          return i != nullptr && i->is_array ()
                 ? i->get_array ()
                 : json::array ();
        }
      }

      if (const json::value* i = o->if_contains ("items"))
      {
        if (i->is_array ())
          return i->get_array ();
      }
    }

    return json::array ();
  }

  // Stream URL from a decoded manifest, if any.
  //
  static optional<string>
  manifest_url (const string& text)
  {
    json::error_code ec;
    json::value m (json::parse (text, ec));

    if (!ec)
    {
      if (const json::object* o = m.if_object ())
      {
        if (const json::value* u = o->if_contains ("urls"))
        {
          if (const json::array* a = u->if_array ())
          {
            if (!a->empty () && a->front ().is_string ())
              return string (a->front ().get_string ());
          }
        }
      }
    }

    // Not JSON (DASH and friends): take the first URL in the text.
    //
    static const regex re (R"(https?://[^\s"<>]+)");

    smatch r;
    if (regex_search (text, r, re))
      return r.str ();

    return nullopt;
  }

  optional<string>
  extract_stream_url (const json::value& v)
  {
    vector<const json::object*> es;

    if (const json::array* a = v.if_array ())
    {
      for (const json::value& e: *a)
      {
        if (const json::object* o = e.if_object ())
          es.push_back (o);
      }
    }
    else if (const json::object* o = v.if_object ())
      es.push_back (o);

    for (const json::object* e: es)
    {
      const json::value* u (e->if_contains ("OriginalTrackUrl"));
      if (u != nullptr && u->is_string () && !u->get_string ().empty ())
        return string (u->get_string ());
    }

    for (const json::object* e: es)
    {
      const json::value* m (e->if_contains ("manifest"));
      if (m == nullptr || !m->is_string ())
        continue;

      string text;
      try
      {
        text = decode_base64 (string (m->get_string ()));
      }
      catch (const invalid_argument&)
      {
        continue; // Try the next entry.
      }

      if (optional<string> r = manifest_url (text))
        return r;
    }

    return nullopt;
  }

  string
  decode_base64 (const string& s)
  {
    string in;
    in.reserve (s.size () + 3);

    for (char c: s)
    {
      if (!isspace (static_cast<unsigned char> (c)))
        in += c;
    }

    // Padding may only appear at the end.
    //
    size_t eq (in.find ('='));
    if (eq != string::npos && in.find_first_not_of ('=', eq) != string::npos)
      throw invalid_argument ("invalid base64 padding");

    while (in.size () % 4 != 0)
      in += '=';

    if (in.empty ())
      return string ();

    // EVP_DecodeBlock() doesn't account for padding in the returned length
    // so we have to trim the trailing zero bytes ourselves.
    //
    string r (in.size () / 4 * 3, '\0');

    int n (EVP_DecodeBlock (reinterpret_cast<unsigned char*> (&r[0]),
                            reinterpret_cast<const unsigned char*> (in.data ()),
                            static_cast<int> (in.size ())));
    if (n < 0)
      throw invalid_argument ("invalid base64 data");

    size_t pad (0);
    for (size_t i (in.size ()); i != 0 && in[i - 1] == '='; --i)
      ++pad;

    if (pad > 2)
      throw invalid_argument ("invalid base64 padding");

    r.resize (static_cast<size_t> (n) - pad);
    return r;
  }
}
