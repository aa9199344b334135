#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <cstdint>
#include <filesystem>

#include <cadence/transfer/transfer-sink.hxx>

namespace cadence
{
  namespace fs = std::filesystem;

  // Make a string usable as a single path component: characters that are
  // invalid in file names on common platforms become '_', leading and
  // trailing dots and spaces are stripped, and the result is capped at 200
  // characters. An empty result becomes "Unknown".
  //
  std::string
  sanitize_path_component (const std::string&);

  // Sink that writes to a partial file (<target>.part unless specified) and
  // renames it to <target> on commit. If <target> already exists by then, it
  // is kept and the partial file is removed.
  //
  class file_sink: public transfer_sink
  {
  public:
    explicit
    file_sink (fs::path target);

    file_sink (fs::path target, fs::path partial);

    ~file_sink () override;

    file_sink (const file_sink&) = delete;
    file_sink& operator= (const file_sink&) = delete;

    void
    write (std::uint64_t offset, const char* data, std::size_t size) override;

    void
    reset () override;

    std::string
    commit () override;

    void
    discard () noexcept override;

    std::uint64_t
    size () const override
    {
      return written_;
    }

    const fs::path&
    target () const noexcept
    {
      return target_;
    }

    const fs::path&
    partial () const noexcept
    {
      return partial_;
    }

  private:
    void
    open ();

    fs::path target_;
    fs::path partial_;
    std::ofstream ofs_;
    std::uint64_t written_ {0};
    bool committed_ {false};
    bool discarded_ {false};
  };

  // Creates file sinks named "<artist> - <title>.flac" in the output
  // directory, creating the directory if necessary. Each job writes to its
  // own "<artist> - <title>.flac.<id>.part".
  //
  class file_sink_factory: public sink_factory
  {
  public:
    explicit
    file_sink_factory (fs::path directory, std::string extension = ".flac");

    std::shared_ptr<transfer_sink>
    create (job_id, const job_descriptor&) override;

    const fs::path&
    directory () const noexcept
    {
      return directory_;
    }

  private:
    fs::path directory_;
    std::string extension_;
  };
}
