#include <cadence/service/service-resolver.hxx>

#include <utility>
#include <optional>

#include <boost/json.hpp>

#include <cadence/cadence-error.hxx>
#include <cadence/service/service-response.hxx>

using namespace std;

namespace cadence
{
  string
  endpoint_base (const string& url)
  {
    string r (url);
    while (!r.empty () && r.back () == '/')
      r.pop_back ();
    return r;
  }

  string service_resolver::
  track_url (const endpoint_candidate& e, const job_descriptor& d)
  {
    return endpoint_base (e.url) +
           "/track/?id=" + url_encode (d.external_reference) +
           "&quality=" + to_service_string (d.quality);
  }

  asio::awaitable<stream_location> service_resolver::
  resolve (const endpoint_candidate& e, const job_descriptor& d)
  {
    http_response r (co_await client_.get (track_url (e, d)));
    throw_for_status (r.status, "track lookup");

    json::error_code ec;
    json::value v (json::parse (r.body, ec));

    if (ec)
      throw recoverable_transfer_error ("malformed track response: " +
                                        ec.message ());

    optional<string> u (extract_stream_url (v));

    // Another endpoint may well have a usable manifest for the same track.
    //
    if (!u)
      throw recoverable_transfer_error ("no stream URL in track response");

    stream_location l;
    l.url = move (*u);
    co_return l;
  }

  // Adapts the HTTP body stream.
  //
  class service_stream: public byte_stream
  {
  public:
    explicit
    service_stream (unique_ptr<http_body_stream> s)
      : stream_ (move (s)) {}

    asio::awaitable<optional<string>>
    read () override
    {
      co_return co_await stream_->read ();
    }

    optional<uint64_t>
    content_length () const override
    {
      return stream_->content_length ();
    }

  private:
    unique_ptr<http_body_stream> stream_;
  };

  asio::awaitable<unique_ptr<byte_stream>> service_fetcher::
  open (const stream_location& l)
  {
    unique_ptr<http_body_stream> s (co_await client_.open (l.url));
    throw_for_status (s->status (), "stream download");

    co_return make_unique<service_stream> (move (s));
  }
}
