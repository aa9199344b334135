#pragma once

#include <string>
#include <vector>
#include <utility>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <cadence/validation/validation-source.hxx>

namespace cadence
{
  namespace fs   = std::filesystem;
  namespace asio = boost::asio;
  namespace json = boost::json;

  // Candidate records read from a JSON file, either an array of
  //
  // {"title": ..., "artist": ..., "album": ..., "external_id": ...}
  //
  // objects or an object whose tracks member is such an array. The album and
  // external id are optional ("mbid" is accepted for the latter).
  //
  // The username and playlist type are not used to select records: the file
  // is the playlist.
  //
  class json_candidate_source: public candidate_source
  {
  public:
    explicit
    json_candidate_source (fs::path f)
      : file_ (std::move (f)) {}

    asio::awaitable<std::vector<candidate_track>>
    candidates (const std::string& username,
                const std::string& playlist_type) override;

  private:
    fs::path file_;
  };

  // Throw std::invalid_argument if the document is not of the above shape.
  //
  std::vector<candidate_track>
  parse_candidates (const json::value&);
}
