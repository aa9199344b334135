#include <cadence/config/engine-config.hxx>

#include <limits>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace std;

namespace cadence
{
  static uint64_t
  unsigned_value (const json::value& v, const string& k)
  {
    if (v.is_uint64 ())
      return v.get_uint64 ();

    if (v.is_int64 () && v.get_int64 () >= 0)
      return static_cast<uint64_t> (v.get_int64 ());

    throw invalid_argument ("configuration value '" + k +
                            "' must be a non-negative integer");
  }

  static string
  string_value (const json::value& v, const string& k)
  {
    if (!v.is_string ())
      throw invalid_argument ("configuration value '" + k +
                              "' must be a string");

    return string (v.get_string ());
  }

  static vector<endpoint_candidate>
  endpoint_values (const json::value& v)
  {
    const json::array* a (v.if_array ());
    if (a == nullptr)
      throw invalid_argument ("configuration value 'endpoints' must be an "
                              "array");

    vector<endpoint_candidate> r;

    for (const json::value& e: *a)
    {
      // Either a bare URL (priority by position) or an object.
      //
      if (e.is_string ())
      {
        r.emplace_back (string (e.get_string ()),
                        static_cast<int> (r.size ()));
        continue;
      }

      const json::object* o (e.if_object ());
      const json::value* u (o != nullptr ? o->if_contains ("url") : nullptr);

      if (u == nullptr)
        throw invalid_argument ("endpoint entry without url");

      endpoint_candidate c (string_value (*u, "url"),
                            static_cast<int> (r.size ()));

      if (const json::value* p = o->if_contains ("priority"))
      {
        if (!p->is_int64 () && !p->is_uint64 ())
          throw invalid_argument ("endpoint priority must be an integer");

        c.priority = static_cast<int> (p->to_number<int64_t> ());
      }

      if (c.url.empty ())
        throw invalid_argument ("endpoint entry with empty url");

      r.push_back (move (c));
    }

    return r;
  }

  void engine_config::
  merge (const json::object& o)
  {
    for (const auto& kv: o)
    {
      string k (kv.key ());
      const json::value& v (kv.value ());

      auto ms = [&v, &k] ()
      {
        return milliseconds (static_cast<milliseconds::rep> (
          unsigned_value (v, k)));
      };

      if      (k == "concurrency")            concurrency = unsigned_value (v, k);
      else if (k == "max_attempts")
      {
        uint64_t n (unsigned_value (v, k));
        if (n > numeric_limits<uint32_t>::max ())
          throw invalid_argument ("configuration value 'max_attempts' is "
                                  "out of range");
        max_attempts = static_cast<uint32_t> (n);
      }
      else if (k == "cancel_grace")           cancel_grace = ms ();
      else if (k == "resolve_timeout")        resolve_timeout = ms ();
      else if (k == "transfer_timeout")       transfer_timeout = ms ();
      else if (k == "keepalive_interval")     keepalive_interval = ms ();
      else if (k == "subscription_buffer")    subscription_buffer = unsigned_value (v, k);
      else if (k == "validation_concurrency") validation_concurrency = unsigned_value (v, k);
      else if (k == "endpoint_cooldown")      endpoint_cooldown = ms ();
      else if (k == "retention_limit")        retention_limit = unsigned_value (v, k);
      else if (k == "output_directory")       output_directory = string_value (v, k);
      else if (k == "endpoints")              endpoints = endpoint_values (v);
      else
        throw invalid_argument ("unknown configuration key '" + k + "'");
    }
  }

  void engine_config::
  load (const fs::path& f)
  {
    ifstream ifs (f, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open " + f.string ());

    string text ((istreambuf_iterator<char> (ifs)),
                 istreambuf_iterator<char> ());

    json::error_code ec;
    json::value v (json::parse (text, ec));

    if (ec)
      throw runtime_error (f.string () + ": " + ec.message ());

    const json::object* o (v.if_object ());
    if (o == nullptr)
      throw runtime_error (f.string () + ": expected a JSON object");

    try
    {
      merge (*o);
    }
    catch (const invalid_argument& e)
    {
      throw runtime_error (f.string () + ": " + e.what ());
    }
  }

  void engine_config::
  load_environment ()
  {
    if (const char* d = getenv ("CADENCE_MUSIC_DIR"))
    {
      if (*d != '\0')
        output_directory = d;
    }
  }

  void engine_config::
  validate () const
  {
    if (concurrency == 0)
      throw invalid_argument ("concurrency must be positive");

    if (max_attempts == 0)
      throw invalid_argument ("max_attempts must be positive");

    if (subscription_buffer == 0)
      throw invalid_argument ("subscription_buffer must be positive");

    if (validation_concurrency == 0)
      throw invalid_argument ("validation_concurrency must be positive");

    if (output_directory.empty ())
      throw invalid_argument ("output_directory must not be empty");
  }

  queue_manager_traits engine_config::
  queue_traits () const
  {
    queue_manager_traits r;
    r.concurrency = concurrency;
    r.max_attempts = max_attempts;
    r.cancel_grace = cancel_grace;
    r.retention_limit = retention_limit;
    return r;
  }

  progress_broadcaster_traits engine_config::
  broadcaster_traits () const
  {
    progress_broadcaster_traits r;
    r.buffer_capacity = subscription_buffer;
    r.keepalive_interval = keepalive_interval;
    return r;
  }

  stream_transfer_executor_traits engine_config::
  executor_traits () const
  {
    stream_transfer_executor_traits r;
    r.resolve_timeout = resolve_timeout;
    r.transfer_timeout = transfer_timeout;
    return r;
  }

  validation_pipeline_traits engine_config::
  validation_traits () const
  {
    validation_pipeline_traits r;
    r.concurrency = validation_concurrency;
    return r;
  }
}
