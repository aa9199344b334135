#include <cadence/job/job.hxx>

#include <utility>
#include <stdexcept>

using namespace std;

namespace cadence
{
  job::
  job (job_id id, job_descriptor d)
    : id_ (id), descriptor_ (move (d))
  {
  }

  void job::
  start ()
  {
    require (job_status::queued, "start");

    status_ = job_status::active;
    attempt_ = 1;
    progress_ = 0.0;
    bytes_ = 0;
  }

  void job::
  retry (string e)
  {
    require (job_status::active, "retry");

    ++attempt_;
    progress_ = 0.0;
    bytes_ = 0;
    last_error_ = move (e);
  }

  void job::
  assign_endpoint (string u)
  {
    require (job_status::active, "assign endpoint to");
    endpoint_ = move (u);
  }

  bool job::
  advance (double r, uint64_t b)
  {
    require (job_status::active, "advance");

    if (r < 0.0) r = 0.0;
    if (r > 1.0) r = 1.0;

    if (b > bytes_)
      bytes_ = b;

    if (r <= progress_)
      return false;

    int p (static_cast<int> (progress_ * 100));
    progress_ = r;
    return static_cast<int> (progress_ * 100) != p;
  }

  void job::
  complete (string l, uint64_t b)
  {
    require (job_status::active, "complete");

    status_ = job_status::completed;
    progress_ = 1.0;
    bytes_ = b;
    location_ = move (l);
    last_error_ = nullopt;
  }

  void job::
  fail (string e)
  {
    require (job_status::active, "fail");

    status_ = job_status::failed;
    last_error_ = move (e);
  }

  void job::
  cancel (string r)
  {
    if (terminal ())
      throw logic_error ("cannot cancel " + job_subject (id_) + " in state " +
                         to_string (status_));

    status_ = job_status::cancelled;
    last_error_ = move (r);
  }

  job_snapshot job::
  snapshot () const
  {
    job_snapshot s;
    s.id = id_;
    s.descriptor = descriptor_;
    s.status = status_;
    s.progress = progress_;
    s.attempt = attempt_;
    s.bytes_written = bytes_;
    s.last_error = last_error_;
    s.endpoint = endpoint_;
    s.location = location_;
    return s;
  }

  void job::
  require (job_status s, const char* t) const
  {
    if (status_ != s)
      throw logic_error (string ("cannot ") + t + ' ' + job_subject (id_) +
                         " in state " + to_string (status_));
  }
}
