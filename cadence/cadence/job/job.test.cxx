#include <cadence/job/job.hxx>

#include <string>
#include <cassert>
#include <sstream>
#include <stdexcept>

#include <cadence/cadence-error.hxx>

using namespace std;
using namespace cadence;

static job_descriptor
descriptor ()
{
  job_descriptor d;
  d.title = "Archangel";
  d.artist = "Burial";
  d.album = "Untrue";
  d.external_reference = "1234";
  d.quality = quality_tier::hi_res_lossless;
  return d;
}

template <typename F>
static bool
throws_logic (F f)
{
  try
  {
    f ();
  }
  catch (const logic_error&)
  {
    return true;
  }
  return false;
}

// Required descriptor fields.
//
static void
test_validate ()
{
  validate (descriptor ());

  auto rejected ([] (job_descriptor d)
  {
    try
    {
      validate (d);
    }
    catch (const invalid_job_spec&)
    {
      return true;
    }
    return false;
  });

  job_descriptor d (descriptor ());
  d.title.clear ();
  assert (rejected (d));

  d = descriptor ();
  d.artist = "  ";
  assert (rejected (d));

  d = descriptor ();
  d.external_reference.clear ();
  assert (rejected (d));

  // Album is optional.
  //
  d = descriptor ();
  d.album = nullopt;
  assert (!rejected (d));
}

static void
test_names ()
{
  assert (to_string (quality_tier::hi_res_lossless) == "hi-res-lossless");
  assert (to_service_string (quality_tier::high_bitrate_lossy) == "HIGH");

  assert (parse_quality_tier ("LOSSLESS") == quality_tier::lossless);
  assert (parse_quality_tier ("HI_RES_LOSSLESS") ==
          quality_tier::hi_res_lossless);
  assert (parse_quality_tier ("low") == quality_tier::low_bitrate_lossy);
  assert (parse_quality_tier ("low-bitrate-lossy") ==
          quality_tier::low_bitrate_lossy);
  assert (!parse_quality_tier ("ultra"));

  assert (parse_job_status ("Cancelled") == job_status::cancelled);
  assert (!parse_job_status ("retrying"));

  assert (job_subject (42) == "job-42");

  assert (terminal (job_status::failed));
  assert (!terminal (job_status::active));
}

// Happy path: queued -> active -> completed.
//
static void
test_complete ()
{
  job j (1, descriptor ());
  assert (j.status () == job_status::queued);
  assert (j.attempt () == 0);

  j.start ();
  assert (j.status () == job_status::active);
  assert (j.attempt () == 1);

  j.assign_endpoint ("https://a.example");
  assert (j.endpoint () == "https://a.example");

  assert (j.advance (0.25, 100));
  assert (!j.advance (0.252, 101)); // Same whole percent.
  assert (!j.advance (0.1, 40));    // Never backwards.
  assert (j.progress () == 0.252);
  assert (j.advance (2.0, 400));    // Clamped.
  assert (j.progress () == 1.0);

  j.complete ("/music/a.flac", 400);

  job_snapshot s (j.snapshot ());
  assert (s.status == job_status::completed);
  assert (s.location == "/music/a.flac");
  assert (s.bytes_written == 400);
  assert (s.terminal ());

  ostringstream os;
  os << s;
  assert (os.str () == "job-1 Burial - Archangel [completed]");
}

// Retry resets progress and bumps the attempt by exactly one.
//
static void
test_retry ()
{
  job j (2, descriptor ());
  j.start ();
  j.advance (0.5, 10);

  j.retry ("connection reset");
  assert (j.status () == job_status::active);
  assert (j.attempt () == 2);
  assert (j.progress () == 0.0);
  assert (j.last_error () == "connection reset");

  // Progress restarts from zero in the new attempt.
  //
  assert (j.advance (0.1, 1));

  j.fail ("giving up");
  assert (j.status () == job_status::failed);
  assert (j.last_error () == "giving up");
}

// Terminal states admit no further transitions.
//
static void
test_terminal ()
{
  {
    job j (3, descriptor ());
    j.cancel ("cancelled");
    assert (j.status () == job_status::cancelled);

    assert (throws_logic ([&j] {j.start ();}));
    assert (throws_logic ([&j] {j.cancel ("again");}));
  }

  {
    job j (4, descriptor ());
    j.start ();
    j.complete ("x", 1);

    assert (throws_logic ([&j] {j.retry ("late");}));
    assert (throws_logic ([&j] {j.fail ("late");}));
    assert (throws_logic ([&j] {j.advance (0.5, 1);}));
    assert (throws_logic ([&j] {j.cancel ("late");}));
  }

  // Queued jobs cannot complete or retry.
  //
  {
    job j (5, descriptor ());
    assert (throws_logic ([&j] {j.complete ("x", 1);}));
    assert (throws_logic ([&j] {j.retry ("x");}));
  }
}

int
main ()
{
  test_validate ();
  test_names ();
  test_complete ();
  test_retry ();
  test_terminal ();
}
