#include <utility>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

#include <cadence/cadence-error.hxx>

namespace cadence
{
  template <typename T>
  asio::awaitable<T>
  with_timeout (asio::awaitable<T> op,
                std::chrono::milliseconds timeout,
                std::string what)
  {
    using namespace asio::experimental;

    if (timeout.count () <= 0)
      co_return co_await std::move (op);

    auto ex (co_await asio::this_coro::executor);

    asio::steady_timer t (ex, timeout);

    // Note that wait_for_one() cancels the loser and then waits for it to
    // complete, so by the time we get here the operation has unwound whoever
    // won. We cannot use the awaitable || operator for this since it waits
    // for the first *successful* operation, which would turn a failure into
    // a timeout.
    //
    auto [ord, e, r, ec] =
      co_await make_parallel_group (
        asio::co_spawn (ex, std::move (op), asio::deferred),
        t.async_wait (asio::deferred)
      ).async_wait (wait_for_one (), asio::use_awaitable);

    if (ord[0] == 1)
      throw recoverable_transfer_error (what + " timed out");

    if (e)
      std::rethrow_exception (e);

    co_return std::move (r);
  }
}
