#pragma once

#include <chrono>
#include <string>

#include <boost/asio.hpp>

namespace cadence
{
  namespace asio = boost::asio;

  // Run an operation against a deadline.
  //
  // If the deadline expires first, the operation is cancelled and, once it
  // has unwound, recoverable_transfer_error is thrown with "<what> timed
  // out". Exceptions from the operation itself propagate unchanged. A zero
  // duration means no deadline.
  //
  // The result type must be default-constructible.
  //
  template <typename T>
  asio::awaitable<T>
  with_timeout (asio::awaitable<T> op,
                std::chrono::milliseconds timeout,
                std::string what);
}

#include <cadence/transfer/transfer-timeout.txx>
