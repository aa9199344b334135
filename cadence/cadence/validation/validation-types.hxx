#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <optional>

namespace cadence
{
  // Candidate record as produced by a recommendation source. Nothing is
  // known about its availability yet.
  //
  struct candidate_track
  {
    std::string title;
    std::string artist;
    std::optional<std::string> album;
    std::optional<std::string> external_id; // Recommendation-side id.
  };

  // Outcome of an availability query.
  //
  struct availability
  {
    std::string resolved_id; // Service-side track id.
    std::optional<std::string> album;
  };

  // Candidate annotated with its availability.
  //
  struct validated_track
  {
    candidate_track candidate;
    bool found {false};
    std::optional<std::string> resolved_id;
    std::optional<std::string> album; // Resolved album, else the candidate's.
    std::optional<std::string> error; // Why the lookup failed, if it did.
  };

  // Aggregate result of a validation batch, in input order.
  //
  struct validation_result
  {
    std::vector<validated_track> tracks;
    std::size_t found_count {0};
  };
}
