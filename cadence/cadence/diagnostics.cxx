#include <cadence/diagnostics.hxx>

#include <iostream>

using namespace std;

namespace cadence
{
  diagnostics::
  diagnostics ()
    : diagnostics (&cerr, 1)
  {
  }

  diagnostics::
  diagnostics (ostream& os, unsigned short v)
    : diagnostics (&os, v)
  {
  }

  diagnostics::
  diagnostics (ostream* os, unsigned short v)
    : os_ (os), verbosity_ (v)
  {
  }

  diagnostics diagnostics::
  null ()
  {
    return diagnostics (nullptr, 0);
  }

  void diagnostics::
  error (const string& m)
  {
    write ("error", m);
  }

  void diagnostics::
  warning (const string& m)
  {
    if (verbosity_ >= 1)
      write ("warning", m);
  }

  void diagnostics::
  trace (const string& m)
  {
    if (verbosity_ >= 2)
      write ("trace", m);
  }

  void diagnostics::
  write (const char* s, const string& m)
  {
    if (os_ == nullptr)
      return;

    // Workers on different threads may report at the same time; keep each
    // line whole.
    //
    lock_guard<mutex> l (mutex_);
    *os_ << s << ": " << m << '\n';
    os_->flush ();
  }
}
