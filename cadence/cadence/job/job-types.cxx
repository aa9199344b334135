#include <cadence/job/job-types.hxx>

#include <cctype>
#include <algorithm>

#include <cadence/cadence-error.hxx>

using namespace std;

namespace cadence
{
  static string
  normalize (const string& s)
  {
    string r;
    r.reserve (s.size ());

    for (char c: s)
    {
      if (c == '_' || c == ' ')
        c = '-';

      r += static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }

    return r;
  }

  // quality_tier
  //
  string
  to_string (quality_tier q)
  {
    switch (q)
    {
    case quality_tier::hi_res_lossless:    return "hi-res-lossless";
    case quality_tier::lossless:           return "lossless";
    case quality_tier::high_bitrate_lossy: return "high-bitrate-lossy";
    case quality_tier::low_bitrate_lossy:  return "low-bitrate-lossy";
    }
    return "lossless";
  }

  string
  to_service_string (quality_tier q)
  {
    switch (q)
    {
    case quality_tier::hi_res_lossless:    return "HI_RES_LOSSLESS";
    case quality_tier::lossless:           return "LOSSLESS";
    case quality_tier::high_bitrate_lossy: return "HIGH";
    case quality_tier::low_bitrate_lossy:  return "LOW";
    }
    return "LOSSLESS";
  }

  optional<quality_tier>
  parse_quality_tier (const string& s)
  {
    string n (normalize (s));

    if (n == "hi-res-lossless")    return quality_tier::hi_res_lossless;
    if (n == "lossless")           return quality_tier::lossless;
    if (n == "high-bitrate-lossy" ||
        n == "high")               return quality_tier::high_bitrate_lossy;
    if (n == "low-bitrate-lossy"  ||
        n == "low")                return quality_tier::low_bitrate_lossy;

    return nullopt;
  }

  // job_status
  //
  string
  to_string (job_status s)
  {
    switch (s)
    {
    case job_status::queued:    return "queued";
    case job_status::active:    return "active";
    case job_status::completed: return "completed";
    case job_status::failed:    return "failed";
    case job_status::cancelled: return "cancelled";
    }
    return "queued";
  }

  optional<job_status>
  parse_job_status (const string& s)
  {
    string n (normalize (s));

    if (n == "queued")    return job_status::queued;
    if (n == "active")    return job_status::active;
    if (n == "completed") return job_status::completed;
    if (n == "failed")    return job_status::failed;
    if (n == "cancelled") return job_status::cancelled;

    return nullopt;
  }

  string
  job_subject (job_id id)
  {
    return "job-" + std::to_string (id);
  }

  static bool
  blank (const string& s)
  {
    return all_of (s.begin (), s.end (),
                   [] (unsigned char c) {return isspace (c) != 0;});
  }

  void
  validate (const job_descriptor& d)
  {
    if (blank (d.title))
      throw invalid_job_spec ("job title is missing");

    if (blank (d.artist))
      throw invalid_job_spec ("job artist is missing");

    if (blank (d.external_reference))
      throw invalid_job_spec ("job external reference is missing");
  }

  ostream&
  operator<< (ostream& os, const job_snapshot& s)
  {
    os << job_subject (s.id) << ' '
       << s.descriptor.artist << " - " << s.descriptor.title
       << " [" << s.status;

    if (s.status == job_status::active)
      os << ", attempt " << s.attempt << ", "
         << static_cast<int> (s.progress * 100) << '%';

    os << ']';

    if (s.last_error)
      os << ": " << *s.last_error;

    return os;
  }
}
