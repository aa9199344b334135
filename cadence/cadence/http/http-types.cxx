#include <cadence/http/http-types.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace cadence
{
  static bool
  iequal (const string& x, const string& y)
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  string url_parts::
  origin () const
  {
    string r (scheme + "://" + host);

    if (!(secure () ? port == "443" : port == "80"))
      r += ':' + port;

    return r;
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;

      for (char& c: r.scheme)
        c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }
    else
      r.scheme = "http";

    if (r.scheme != "http" && r.scheme != "https")
      throw invalid_argument ("unsupported URL scheme '" + r.scheme + "'");

    // The authority ends at the start of the path or query.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.rfind (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = move (auth);
      r.port = r.secure () ? "443" : "80";
    }

    if (r.host.empty ())
      throw invalid_argument ("no host in URL '" + url + "'");

    if (r.port.empty ())
      throw invalid_argument ("empty port in URL '" + url + "'");

    // Drop the fragment, it never goes over the wire.
    //
    if (end < url.size ())
    {
      r.target = url.substr (end, url.find ('#', end) - end);

      if (r.target.empty () || r.target[0] != '/')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_location (const string& base, const string& loc)
  {
    if (loc.find ("://") != string::npos)
      return loc;

    url_parts b (parse_url (base));

    // Scheme-relative.
    //
    if (loc.compare (0, 2, "//") == 0)
      return b.scheme + ':' + loc;

    if (!loc.empty () && loc[0] == '/')
      return b.origin () + loc;

    // Relative to the directory of the base path.
    //
    string dir (b.target.substr (0, b.target.find ('?')));
    dir.erase (dir.rfind ('/') + 1);

    return b.origin () + dir + loc;
  }

  string
  url_encode (const string& s)
  {
    static const char hex[] = "0123456789ABCDEF";

    string r;
    r.reserve (s.size ());

    for (char c: s)
    {
      unsigned char u (static_cast<unsigned char> (c));

      if (isalnum (u) || c == '-' || c == '_' || c == '.' || c == '~')
        r += c;
      else
      {
        r += '%';
        r += hex[u >> 4];
        r += hex[u & 0x0F];
      }
    }

    return r;
  }

  optional<string> http_response::
  header (const string& n) const
  {
    for (const http_header& h: headers)
    {
      if (iequal (h.first, n))
        return h.second;
    }

    return nullopt;
  }
}
