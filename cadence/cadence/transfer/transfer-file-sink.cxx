#include <cadence/transfer/transfer-file-sink.hxx>

#include <cstring>
#include <utility>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace cadence
{
  string
  sanitize_path_component (const string& s)
  {
    string r;
    r.reserve (s.size ());

    for (char c: s)
    {
      unsigned char u (static_cast<unsigned char> (c));
      r += (u < 0x20 || strchr ("<>:\"/\\|?*", c) != nullptr) ? '_' : c;
    }

    size_t b (r.find_first_not_of (". "));
    if (b == string::npos)
      return "Unknown";

    size_t e (r.find_last_not_of (". "));
    r = r.substr (b, e - b + 1);

    if (r.size () > 200)
      r.resize (200);

    return r;
  }

  // file_sink
  //
  file_sink::
  file_sink (fs::path target)
    : target_ (move (target))
  {
    partial_ = target_;
    partial_ += ".part";
  }

  file_sink::
  file_sink (fs::path target, fs::path partial)
    : target_ (move (target)), partial_ (move (partial))
  {
  }

  file_sink::
  ~file_sink ()
  {
    if (!committed_)
      discard ();
  }

  void file_sink::
  open ()
  {
    ofs_.open (partial_, ios::binary | ios::out | ios::trunc);

    if (!ofs_)
      throw runtime_error ("unable to open " + partial_.string () +
                           " for writing");
  }

  void file_sink::
  write (uint64_t offset, const char* data, size_t size)
  {
    if (discarded_)
      return;

    if (committed_)
      throw logic_error ("write to committed " + target_.string ());

    if (offset != written_)
      throw runtime_error ("out of order write to " + partial_.string () +
                           ": offset " + std::to_string (offset) +
                           ", expected " + std::to_string (written_));

    if (!ofs_.is_open ())
      open ();

    ofs_.write (data, static_cast<streamsize> (size));

    if (!ofs_)
      throw runtime_error ("unable to write to " + partial_.string ());

    written_ += size;
  }

  void file_sink::
  reset ()
  {
    if (discarded_ || committed_)
      return;

    if (ofs_.is_open ())
      ofs_.close ();

    error_code ec;
    fs::remove (partial_, ec);

    written_ = 0;
  }

  string file_sink::
  commit ()
  {
    if (discarded_)
      throw runtime_error ("output " + target_.string () + " was discarded");

    if (committed_)
      return target_.string ();

    if (!ofs_.is_open ())
      open ();

    ofs_.close ();

    if (!ofs_)
      throw runtime_error ("unable to flush " + partial_.string ());

    // If another job for the same track got there first, keep its output
    // and drop ours. Otherwise throws filesystem_error, which the executor
    // treats as a failed attempt.
    //
    if (fs::exists (target_))
    {
      error_code ec;
      fs::remove (partial_, ec);
    }
    else
      fs::rename (partial_, target_);

    committed_ = true;
    return target_.string ();
  }

  void file_sink::
  discard () noexcept
  {
    if (committed_ || discarded_)
      return;

    discarded_ = true;

    if (ofs_.is_open ())
      ofs_.close ();

    error_code ec;
    fs::remove (partial_, ec);
  }

  // file_sink_factory
  //
  file_sink_factory::
  file_sink_factory (fs::path d, string e)
    : directory_ (move (d)), extension_ (move (e))
  {
  }

  shared_ptr<transfer_sink> file_sink_factory::
  create (job_id id, const job_descriptor& d)
  {
    fs::create_directories (directory_);

    string n (sanitize_path_component (d.artist) + " - " +
              sanitize_path_component (d.title) + extension_);

    // Jobs for the same track share the target but never the partial file.
    //
    return make_shared<file_sink> (
      directory_ / n,
      directory_ / (n + '.' + std::to_string (id) + ".part"));
  }
}
