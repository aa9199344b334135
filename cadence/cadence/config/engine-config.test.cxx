#include <cadence/config/engine-config.hxx>

#include <string>
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

#include <boost/json.hpp>

using namespace std;
using namespace cadence;

namespace json = boost::json;

using chrono::milliseconds;

static fs::path
write_file (const string& name, const string& text)
{
  fs::path p (fs::temp_directory_path () /
              ("cadence-config-" + std::to_string (::getpid ()) + '-' + name));

  ofstream ofs (p, ios::binary);
  ofs << text;
  return p;
}

template <typename E, typename F>
static bool
throws (F f)
{
  try
  {
    f ();
  }
  catch (const E&)
  {
    return true;
  }
  return false;
}

static void
test_defaults ()
{
  engine_config c;
  c.validate ();

  queue_manager_traits q (c.queue_traits ());
  assert (q.concurrency == 2);
  assert (q.max_attempts == 3);
  assert (q.cancel_grace == milliseconds (5000));
  assert (q.retention_limit == 0);

  progress_broadcaster_traits b (c.broadcaster_traits ());
  assert (b.buffer_capacity == 256);
  assert (b.keepalive_interval == milliseconds (15000));

  stream_transfer_executor_traits x (c.executor_traits ());
  assert (x.resolve_timeout == milliseconds (60000));
  assert (x.transfer_timeout == milliseconds (300000));

  assert (c.validation_traits ().concurrency == 4);
  assert (c.endpoint_cooldown == chrono::minutes (5));
  assert (c.endpoints.empty ());
}

static void
test_merge ()
{
  engine_config c;
  c.merge (json::parse (R"({
    "concurrency": 5,
    "max_attempts": 1,
    "cancel_grace": 250,
    "keepalive_interval": 0,
    "retention_limit": 10,
    "output_directory": "/srv/music",
    "endpoints": [
      {"url": "https://b.example", "priority": 1},
      {"url": "https://a.example", "priority": -1},
      "https://c.example"
    ]})").as_object ());

  assert (c.concurrency == 5);
  assert (c.max_attempts == 1);
  assert (c.cancel_grace == milliseconds (250));
  assert (c.keepalive_interval == milliseconds (0));
  assert (c.retention_limit == 10);
  assert (c.output_directory == "/srv/music");

  // Untouched members keep their values.
  //
  assert (c.subscription_buffer == 256);

  assert (c.endpoints.size () == 3);
  assert (c.endpoints[0].url == "https://b.example");
  assert (c.endpoints[0].priority == 1);
  assert (c.endpoints[1].priority == -1);
  assert (c.endpoints[2].priority == 2); // Position.

  assert (throws<invalid_argument> ([] {
    engine_config c;
    c.merge (json::parse (R"({"concurency": 1})").as_object ());
  }));

  assert (throws<invalid_argument> ([] {
    engine_config c;
    c.merge (json::parse (R"({"concurrency": -1})").as_object ());
  }));

  assert (throws<invalid_argument> ([] {
    engine_config c;
    c.merge (json::parse (R"({"endpoints": [{"priority": 1}]})").as_object ());
  }));
}

static void
test_validate ()
{
  auto invalid = [] (void (*f) (engine_config&))
  {
    engine_config c;
    f (c);
    return throws<invalid_argument> ([&c] { c.validate (); });
  };

  assert (invalid ([] (engine_config& c) {c.concurrency = 0;}));
  assert (invalid ([] (engine_config& c) {c.max_attempts = 0;}));
  assert (invalid ([] (engine_config& c) {c.subscription_buffer = 0;}));
  assert (invalid ([] (engine_config& c) {c.validation_concurrency = 0;}));
  assert (invalid ([] (engine_config& c) {c.output_directory.clear ();}));
}

static void
test_load ()
{
  fs::path ok (write_file ("ok.json", R"({"concurrency": 3})"));
  fs::path bad (write_file ("bad.json", "{\"concurrency\": "));
  fs::path array (write_file ("array.json", "[]"));

  engine_config c;
  c.load (ok);
  assert (c.concurrency == 3);

  assert (throws<runtime_error> ([&bad] { engine_config c; c.load (bad); }));
  assert (throws<runtime_error> ([&array] { engine_config c; c.load (array); }));
  assert (throws<runtime_error> ([] {
    engine_config c;
    c.load ("/nonexistent/cadence.json");
  }));

  error_code ec;
  fs::remove (ok, ec);
  fs::remove (bad, ec);
  fs::remove (array, ec);

  // Environment.
  //
  ::setenv ("CADENCE_MUSIC_DIR", "/tmp/cadence-music", 1);
  c.load_environment ();
  assert (c.output_directory == "/tmp/cadence-music");

  ::setenv ("CADENCE_MUSIC_DIR", "", 1);
  c.load_environment ();
  assert (c.output_directory == "/tmp/cadence-music");

  ::unsetenv ("CADENCE_MUSIC_DIR");
}

int
main ()
{
  test_defaults ();
  test_merge ();
  test_validate ();
  test_load ();
}
