#pragma once

#include <memory>
#include <string>
#include <chrono>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <cadence/http/http-types.hxx>

namespace cadence
{
  namespace asio = boost::asio;
  namespace ssl  = boost::asio::ssl;

  struct http_client_traits
  {
    // Connection (including the TLS handshake) timeout. Zero means no
    // timeout.
    //
    std::chrono::milliseconds connect_timeout {30000};

    // Timeout of each individual write or read once connected. For streamed
    // bodies this is an idle timeout, not a bound on the whole transfer.
    //
    std::chrono::milliseconds request_timeout {60000};

    // Maximum number of redirects to follow (0 = do not follow).
    //
    std::uint8_t max_redirects = 10;

    // Whether to verify SSL certificates.
    //
    bool verify_ssl = false;

    // SSL certificate file path (empty = use system defaults).
    //
    std::string ssl_cert_file;

    std::string user_agent = "cadence";
  };

  // Response whose body is read incrementally.
  //
  // The status and headers are available as soon as the object is returned.
  // read() hands out the body in chunks of at most chunk_size bytes and
  // returns nullopt once it is exhausted. Network errors surface as
  // boost::system::system_error.
  //
  class http_body_stream
  {
  public:
    static constexpr std::size_t chunk_size = 8192;

    virtual
    ~http_body_stream () = default;

    virtual unsigned
    status () const = 0;

    virtual std::string
    reason () const = 0;

    virtual std::vector<http_header>
    headers () const = 0;

    // Case-insensitive lookup of the first header with this name.
    //
    virtual std::optional<std::string>
    header (const std::string& name) const = 0;

    virtual std::optional<std::uint64_t>
    content_length () const = 0;

    virtual asio::awaitable<std::optional<std::string>>
    read () = 0;
  };

  // HTTP/1.1 GET client over plain TCP or TLS (with SNI).
  //
  // Every request uses its own connection. Redirects are followed up to the
  // configured limit, after which the redirect response itself is returned.
  //
  class http_client
  {
  public:
    using traits_type = http_client_traits;

    explicit
    http_client (asio::io_context&, traits_type = traits_type ());

    http_client (const http_client&) = delete;
    http_client& operator= (const http_client&) = delete;

    // Perform a GET request and buffer the whole response.
    //
    asio::awaitable<http_response>
    get (const std::string& url);

    // Perform a GET request and return as soon as the response header has
    // been received.
    //
    asio::awaitable<std::unique_ptr<http_body_stream>>
    open (const std::string& url);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    void
    configure_ssl ();

    asio::awaitable<std::unique_ptr<http_body_stream>>
    open_once (const std::string& url);

    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_;
  };
}
