#include <cadence/http/http-client.hxx>

#include <limits>
#include <utility>
#include <type_traits>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

using namespace std;

namespace cadence
{
  namespace beast = boost::beast;
  namespace http  = beast::http;

  using tcp = asio::ip::tcp;

  // Body stream over either beast::tcp_stream or its SSL wrapper.
  //
  template <typename S>
  class basic_body_stream: public http_body_stream
  {
  public:
    static constexpr bool secure = !is_same_v<S, beast::tcp_stream>;

    template <typename... A>
    explicit
    basic_body_stream (const http_client_traits& t, A&&... a)
      : traits_ (t), stream_ (forward<A> (a)...)
    {
      parser_.body_limit (numeric_limits<uint64_t>::max ());
    }

    // Many servers just drop the connection without a TLS close_notify so
    // we don't bother with a graceful shutdown either.
    //
    ~basic_body_stream () override
    {
      beast::error_code ec;
      beast::get_lowest_layer (stream_).socket ().shutdown (
        tcp::socket::shutdown_both, ec);
    }

    // Connect, send the request, and read the response header.
    //
    asio::awaitable<void>
    start (const url_parts& u, const tcp::resolver::results_type& addrs)
    {
      if constexpr (secure)
      {
        // Beast doesn't wrap SNI so drop down to OpenSSL.
        //
        if (!SSL_set_tlsext_host_name (stream_.native_handle (),
                                       u.host.c_str ()))
        {
          beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                                asio::error::get_ssl_category ());

          throw beast::system_error (ec, "unable to set SNI hostname");
        }

        // Besides the chain, the certificate must name the host.
        //
        if (traits_.verify_ssl)
          stream_.set_verify_callback (ssl::host_name_verification (u.host));
      }

      expire (traits_.connect_timeout);
      co_await beast::get_lowest_layer (stream_).async_connect (
        addrs, asio::use_awaitable);

      if constexpr (secure)
        co_await stream_.async_handshake (ssl::stream_base::client,
                                          asio::use_awaitable);

      // Host carries the port unless it is the default one.
      //
      string host (u.origin ().substr (u.scheme.size () + 3));

      http::request<http::empty_body> rq (http::verb::get, u.target, 11);
      rq.set (http::field::host, host);
      rq.set (http::field::user_agent, traits_.user_agent);
      rq.set (http::field::accept, "*/*");

      expire (traits_.request_timeout);
      co_await http::async_write (stream_, rq, asio::use_awaitable);
      co_await http::async_read_header (stream_,
                                        buffer_,
                                        parser_,
                                        asio::use_awaitable);
    }

    unsigned
    status () const override
    {
      return parser_.get ().result_int ();
    }

    string
    reason () const override
    {
      return string (parser_.get ().reason ());
    }

    vector<http_header>
    headers () const override
    {
      vector<http_header> r;
      for (const auto& f: parser_.get ())
        r.emplace_back (string (f.name_string ()), string (f.value ()));
      return r;
    }

    optional<string>
    header (const string& n) const override
    {
      auto i (parser_.get ().find (n));

      if (i == parser_.get ().end ())
        return nullopt;

      return string (i->value ());
    }

    optional<uint64_t>
    content_length () const override
    {
      if (auto n = parser_.content_length ())
        return *n;

      return nullopt;
    }

    asio::awaitable<optional<string>>
    read () override
    {
      while (!parser_.is_done ())
      {
        parser_.get ().body ().data = chunk_;
        parser_.get ().body ().size = sizeof (chunk_);

        expire (traits_.request_timeout);

        beast::error_code ec;
        co_await http::async_read (stream_,
                                   buffer_,
                                   parser_,
                                   asio::redirect_error (asio::use_awaitable,
                                                         ec));

        // Our chunk is full, which is what we want.
        //
        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec);

        size_t n (sizeof (chunk_) - parser_.get ().body ().size);
        if (n != 0)
          co_return string (chunk_, n);
      }

      co_return nullopt;
    }

  private:
    void
    expire (chrono::milliseconds t)
    {
      auto& l (beast::get_lowest_layer (stream_));

      if (t.count () != 0)
        l.expires_after (t);
      else
        l.expires_never ();
    }

    http_client_traits traits_;
    S stream_;
    beast::flat_buffer buffer_;
    http::response_parser<http::buffer_body> parser_;
    char chunk_[chunk_size];
  };

  http_client::
  http_client (asio::io_context& ioc, traits_type t)
    : ioc_ (ioc), traits_ (move (t)), ssl_ (ssl::context::tlsv12_client)
  {
    configure_ssl ();
  }

  void http_client::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_.set_default_verify_paths ();

    ssl_.set_verify_mode (traits_.verify_ssl
                          ? ssl::verify_peer
                          : ssl::verify_none);

    ssl_.set_options (ssl::context::default_workarounds |
                      ssl::context::no_sslv2 |
                      ssl::context::no_sslv3 |
                      ssl::context::single_dh_use);

    // Make sure a server name callback doesn't interfere with the SNI
    // handling done by the stream.
    //
    SSL_CTX_set_tlsext_servername_callback (ssl_.native_handle (), nullptr);
  }

  asio::awaitable<unique_ptr<http_body_stream>> http_client::
  open_once (const string& url)
  {
    url_parts u (parse_url (url));

    tcp::resolver r (ioc_);
    auto addrs (co_await r.async_resolve (u.host,
                                          u.port,
                                          asio::use_awaitable));

    if (u.secure ())
    {
      using stream = basic_body_stream<beast::ssl_stream<beast::tcp_stream>>;

      unique_ptr<stream> s (make_unique<stream> (traits_, ioc_, ssl_));
      co_await s->start (u, addrs);
      co_return unique_ptr<http_body_stream> (move (s));
    }
    else
    {
      using stream = basic_body_stream<beast::tcp_stream>;

      unique_ptr<stream> s (make_unique<stream> (traits_, ioc_));
      co_await s->start (u, addrs);
      co_return unique_ptr<http_body_stream> (move (s));
    }
  }

  asio::awaitable<unique_ptr<http_body_stream>> http_client::
  open (const string& url)
  {
    string u (url);

    for (uint8_t n (0);; ++n)
    {
      unique_ptr<http_body_stream> s (co_await open_once (u));

      if (!redirection (s->status ()) || n == traits_.max_redirects)
        co_return move (s);

      optional<string> l (s->header ("Location"));
      if (!l || l->empty ())
        co_return move (s);

      u = resolve_location (u, *l);
    }
  }

  asio::awaitable<http_response> http_client::
  get (const string& url)
  {
    unique_ptr<http_body_stream> s (co_await open (url));

    http_response r;
    r.status = s->status ();
    r.reason = s->reason ();
    r.headers = s->headers ();

    while (optional<string> c = co_await s->read ())
      r.body += *c;

    co_return r;
  }
}
