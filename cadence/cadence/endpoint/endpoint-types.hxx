#pragma once

#include <string>
#include <ostream>
#include <utility>

namespace cadence
{
  // Backing-service endpoint candidate.
  //
  // Lower priority numbers are tried first. The health flag is advisory: it
  // biases the choice of the next candidate but never excludes one for good.
  //
  struct endpoint_candidate
  {
    std::string url;
    int priority {0};
    bool suspected_down {false};

    endpoint_candidate () = default;

    endpoint_candidate (std::string u, int p = 0)
      : url (std::move (u)), priority (p) {}

    bool
    empty () const noexcept
    {
      return url.empty ();
    }
  };

  inline bool
  operator== (const endpoint_candidate& x, const endpoint_candidate& y)
  {
    return x.url == y.url && x.priority == y.priority;
  }

  inline bool
  operator!= (const endpoint_candidate& x, const endpoint_candidate& y)
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& os, const endpoint_candidate& c)
  {
    os << c.url << " [priority " << c.priority;
    if (c.suspected_down)
      os << ", suspected down";
    return os << ']';
  }
}
