#pragma once

#include <mutex>
#include <string>
#include <ostream>

namespace cadence
{
  // Diagnostics sink.
  //
  // Lines go out as "<severity>: <text>", the same shape the driver uses for
  // its own errors. Verbosity 0 keeps only errors, 1 adds warnings (the
  // default), 2 and above add traces. A sink without a stream is silent.
  //
  class diagnostics
  {
  public:
    diagnostics ();

    explicit
    diagnostics (std::ostream& os, unsigned short verbosity = 1);

    diagnostics (const diagnostics&) = delete;
    diagnostics& operator= (const diagnostics&) = delete;

    // Quiet sink.
    //
    static diagnostics
    null ();

    void
    error (const std::string&);

    void
    warning (const std::string&);

    void
    trace (const std::string&);

    unsigned short
    verbosity () const noexcept
    {
      return verbosity_;
    }

    void
    verbosity (unsigned short v) noexcept
    {
      verbosity_ = v;
    }

  private:
    explicit
    diagnostics (std::ostream* os, unsigned short verbosity);

    void
    write (const char* severity, const std::string&);

    std::mutex mutex_;
    std::ostream* os_;
    unsigned short verbosity_;
  };
}
