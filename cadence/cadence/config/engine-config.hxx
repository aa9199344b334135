#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <boost/json.hpp>

#include <cadence/endpoint/endpoint-types.hxx>
#include <cadence/queue/queue-manager.hxx>
#include <cadence/progress/progress-broadcaster.hxx>
#include <cadence/transfer/transfer-executor.hxx>
#include <cadence/validation/validation-pipeline.hxx>

namespace cadence
{
  namespace fs   = std::filesystem;
  namespace json = boost::json;

  // Engine tunables.
  //
  // The values come from (later overriding earlier) the defaults below, an
  // optional JSON file, the environment, and the command line. In the file
  // the keys are the member names, durations are in milliseconds, and
  // endpoints are given as [{"url": ..., "priority": ...}].
  //
  struct engine_config
  {
    using milliseconds = std::chrono::milliseconds;

    std::size_t concurrency = 2;
    std::uint32_t max_attempts = 3;
    milliseconds cancel_grace {5000};
    milliseconds resolve_timeout {60000};
    milliseconds transfer_timeout {300000};
    milliseconds keepalive_interval {15000};
    std::size_t subscription_buffer = 256;
    std::size_t validation_concurrency = 4;
    milliseconds endpoint_cooldown {300000};
    std::size_t retention_limit = 0;
    fs::path output_directory = "music";
    std::vector<endpoint_candidate> endpoints;

    // Overlay the members present in the object. Throw
    // std::invalid_argument on an unknown key or a value of the wrong type.
    //
    void
    merge (const json::object&);

    // Read and merge a JSON configuration file. Throw std::runtime_error if
    // it cannot be read or parsed.
    //
    void
    load (const fs::path&);

    // Pick up CADENCE_MUSIC_DIR.
    //
    void
    load_environment ();

    // Throw std::invalid_argument if a bound or buffer size is zero.
    //
    void
    validate () const;

    queue_manager_traits
    queue_traits () const;

    progress_broadcaster_traits
    broadcaster_traits () const;

    stream_transfer_executor_traits
    executor_traits () const;

    validation_pipeline_traits
    validation_traits () const;
  };
}
