#include <cadence/service/service-resolver.hxx>
#include <cadence/service/service-availability.hxx>

#include <string>
#include <vector>
#include <cassert>
#include <optional>
#include <stdexcept>

#include <boost/asio.hpp>

#include <cadence/cadence-error.hxx>
#include <cadence/diagnostics.hxx>
#include <cadence/endpoint/endpoint-registry.hxx>

using namespace std;
using namespace cadence;

namespace asio = boost::asio;

using tcp = asio::ip::tcp;

// One connection per canned response, request heads recorded.
//
static asio::awaitable<void>
serve (tcp::acceptor& a, vector<string> rs, vector<string>& heads)
{
  for (const string& r: rs)
  {
    tcp::socket s (co_await a.async_accept (asio::use_awaitable));

    string h;
    co_await asio::async_read_until (s,
                                     asio::dynamic_buffer (h),
                                     "\r\n\r\n",
                                     asio::use_awaitable);
    heads.push_back (h.substr (0, h.find ("\r\n")));

    co_await asio::async_write (s, asio::buffer (r), asio::use_awaitable);

    boost::system::error_code ec;
    s.shutdown (tcp::socket::shutdown_both, ec);
  }
}

static string
respond (const string& status, const string& body)
{
  return "HTTP/1.1 " + status + "\r\n" +
         "Content-Type: application/json\r\n" +
         "Content-Length: " + std::to_string (body.size ()) + "\r\n" +
         "Connection: close\r\n\r\n" +
         body;
}

struct fixture
{
  asio::io_context ioc;
  tcp::acceptor acceptor;
  vector<string> heads;
  diagnostics diag;
  http_client client;

  fixture ()
    : acceptor (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"), 0)),
      diag (diagnostics::null ()),
      client (ioc)
  {
  }

  string
  base () const
  {
    return "http://127.0.0.1:" +
           std::to_string (acceptor.local_endpoint ().port ());
  }

  // URL of a port nobody listens on.
  //
  string
  dead ()
  {
    tcp::acceptor a (ioc,
                     tcp::endpoint (asio::ip::make_address ("127.0.0.1"), 0));
    string r ("http://127.0.0.1:" +
              std::to_string (a.local_endpoint ().port ()));
    a.close ();
    return r;
  }

  void
  start (vector<string> rs)
  {
    asio::co_spawn (ioc, serve (acceptor, move (rs), heads), asio::detached);
  }

  template <typename F>
  void
  run (F f)
  {
    asio::co_spawn (ioc, f (), asio::detached);
    ioc.run ();
  }
};

static job_descriptor
descriptor (const string& ref)
{
  job_descriptor d;
  d.title = "Archangel";
  d.artist = "Burial";
  d.external_reference = ref;
  d.quality = quality_tier::lossless;
  return d;
}

static void
test_resolve ()
{
  fixture f;
  f.start ({
    respond ("200 OK",
             R"({"version": "2.0", "manifest": )"
             R"("eyJ1cmxzIjpbImh0dHBzOi8vY2RuLmV4YW1wbGUvYS5mbGFjIl19"})"),
    respond ("404 Not Found", R"({"detail": "Track not found"})"),
    respond ("503 Service Unavailable", ""),
    respond ("200 OK", R"({"id": 1})")});

  service_resolver r (f.client);
  endpoint_candidate e (f.base () + "/", 0);

  optional<stream_location> l;
  int fatal (0), recoverable (0);
  vector<string> messages;

  f.run ([&] () -> asio::awaitable<void>
         {
           l = co_await r.resolve (e, descriptor ("77"));

           for (int i (0); i != 3; ++i)
           {
             try
             {
               co_await r.resolve (e, descriptor ("78"));
             }
             catch (const fatal_transfer_error& x)
             {
               ++fatal;
               messages.push_back (x.what ());
             }
             catch (const recoverable_transfer_error& x)
             {
               ++recoverable;
               messages.push_back (x.what ());
             }
           }
         });

  assert (l && l->url == "https://cdn.example/a.flac");
  assert (!l->size && !l->digest);

  assert (fatal == 1 && recoverable == 2);
  assert (messages[0] == "track lookup failed with status 404");
  assert (messages[2] == "no stream URL in track response");

  assert (f.heads.size () == 4);
  assert (f.heads[0] == "GET /track/?id=77&quality=LOSSLESS HTTP/1.1");
}

static void
test_fetch ()
{
  fixture f;

  string body (20000, 'z');
  f.start ({respond ("200 OK", body), respond ("403 Forbidden", "")});

  service_fetcher s (f.client);

  string got;
  optional<uint64_t> length;
  bool refused (false);

  f.run ([&] () -> asio::awaitable<void>
         {
           stream_location l;
           l.url = f.base () + "/file.flac";

           unique_ptr<byte_stream> b (co_await s.open (l));
           length = b->content_length ();

           while (optional<string> c = co_await b->read ())
           {
             assert (c->size () <= 8192);
             got += *c;
           }

           try
           {
             co_await s.open (l);
           }
           catch (const fatal_transfer_error&)
           {
             refused = true;
           }
         });

  assert (got == body);
  assert (length == 20000);
  assert (refused);
}

static candidate_track
candidate (const string& artist, const string& title)
{
  candidate_track c;
  c.artist = artist;
  c.title = title;
  return c;
}

// Dead and failing endpoints are skipped and flagged.
//
static void
test_failover ()
{
  fixture f;
  f.start ({
    respond ("503 Service Unavailable", ""),
    respond ("200 OK",
             R"([{"tracks": {"items": [{"id": 42, "title": "Archangel",)"
             R"( "album": {"title": "Untrue"}}, {"id": 43}]}}])"),
    respond ("200 OK", R"({"items": []})"),
    respond ("400 Bad Request", "")});

  string dead (f.dead ());

  // The loopback endpoint shows up twice under different spellings so that
  // the 503 and the success come from distinct registry entries.
  //
  endpoint_registry reg ({endpoint_candidate (dead, 0),
                          endpoint_candidate (f.base (), 1),
                          endpoint_candidate (f.base () + "/", 2)});

  service_availability a (f.client, reg, f.diag);

  optional<availability> found;
  optional<availability> missing;
  bool failed (false);

  f.run ([&] () -> asio::awaitable<void>
         {
           found = co_await a.check (candidate ("Burial", "Archangel"));

           // The first two entries are flagged now so the third one is
           // preferred.
           //
           missing = co_await a.check (candidate ("Nobody", "Nothing"));

           try
           {
             co_await a.check (candidate ("Bad", "Request"));
           }
           catch (const runtime_error& e)
           {
             failed = dynamic_cast<const pipeline_abort*> (&e) == nullptr;
           }
         });

  assert (found);
  assert (found->resolved_id == "42");
  assert (found->album == "Untrue");

  assert (!missing);
  assert (failed);

  assert (reg.suspected_down (dead));
  assert (reg.suspected_down (f.base ()));
  assert (!reg.suspected_down (f.base () + "/"));

  assert (f.heads.size () == 4);
  assert (f.heads[0] == "GET /search/?s=Burial%20Archangel HTTP/1.1");
}

static void
test_unreachable ()
{
  fixture f;

  endpoint_registry reg ({endpoint_candidate (f.dead (), 0),
                          endpoint_candidate (f.dead () + "/", 1)});

  service_availability a (f.client, reg, f.diag);

  string reason;
  f.run ([&] () -> asio::awaitable<void>
         {
           try
           {
             co_await a.check (candidate ("Burial", "Archangel"));
           }
           catch (const pipeline_abort& e)
           {
             reason = e.what ();
           }
         });

  assert (reason.find ("availability service unreachable") == 0);
  assert (reg.candidates ()[0].suspected_down);
  assert (reg.candidates ()[1].suspected_down);

  // An empty registry is just as unreachable.
  //
  endpoint_registry none;
  service_availability b (f.client, none, f.diag);

  asio::io_context ioc;
  bool aborted (false);
  asio::co_spawn (ioc,
                  [&] () -> asio::awaitable<void>
                  {
                    try
                    {
                      co_await b.check (candidate ("A", "B"));
                    }
                    catch (const pipeline_abort&)
                    {
                      aborted = true;
                    }
                  },
                  asio::detached);
  ioc.run ();

  assert (aborted);
}

int
main ()
{
  test_resolve ();
  test_fetch ();
  test_failover ();
  test_unreachable ();
}
