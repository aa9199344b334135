#pragma once

#include <string>
#include <vector>
#include <optional>

#include <boost/asio.hpp>

#include <cadence/validation/validation-types.hxx>

namespace cadence
{
  namespace asio = boost::asio;

  // Looks a candidate up on the backing service.
  //
  // Return nullopt if the service does not have it. Throw pipeline_abort if
  // the service cannot be reached at all, which ends the whole batch. Any
  // other exception is a failed lookup of this one candidate.
  //
  class availability_checker
  {
  public:
    virtual
    ~availability_checker () = default;

    virtual asio::awaitable<std::optional<availability>>
    check (const candidate_track&) = 0;
  };

  // Produces candidate records for a user.
  //
  class candidate_source
  {
  public:
    virtual
    ~candidate_source () = default;

    virtual asio::awaitable<std::vector<candidate_track>>
    candidates (const std::string& username,
                const std::string& playlist_type) = 0;
  };
}
