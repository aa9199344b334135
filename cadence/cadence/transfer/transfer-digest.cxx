#include <cadence/transfer/transfer-digest.hxx>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace cadence
{
  static const EVP_MD*
  lookup (const string& name)
  {
    // Normalize "SHA-256" and friends to "sha256".
    //
    string n;
    for (char c: name)
    {
      if (c != '-' && c != '_')
        n += static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }

    if (n == "md5")    return EVP_md5 ();
    if (n == "sha1")   return EVP_sha1 ();
    if (n == "sha256") return EVP_sha256 ();
    if (n == "sha512") return EVP_sha512 ();

    return nullptr;
  }

  bool transfer_digest::
  supported (const string& algorithm)
  {
    return lookup (algorithm) != nullptr;
  }

  transfer_digest::
  transfer_digest (const string& algorithm)
    : algorithm_ (algorithm),
      md_ (lookup (algorithm)),
      ctx_ (EVP_MD_CTX_new ())
  {
    if (md_ == nullptr)
      throw invalid_argument ("unsupported digest algorithm '" +
                              algorithm + "'");

    if (ctx_ == nullptr)
      throw runtime_error ("unable to allocate digest context");

    reset ();
  }

  void transfer_digest::
  reset ()
  {
    if (EVP_DigestInit_ex (ctx_.get (), md_, nullptr) != 1)
      throw runtime_error ("unable to initialize " + algorithm_ + " digest");
  }

  void transfer_digest::
  update (const char* data, size_t size)
  {
    if (size == 0)
      return;

    if (EVP_DigestUpdate (ctx_.get (), data, size) != 1)
      throw runtime_error ("unable to update " + algorithm_ + " digest");
  }

  string transfer_digest::
  finish ()
  {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx_.get (), hash, &n) != 1)
      throw runtime_error ("unable to finalize " + algorithm_ + " digest");

    ostringstream os;
    for (unsigned int i (0); i < n; ++i)
      os << hex << setw (2) << setfill ('0') << static_cast<int> (hash[i]);

    reset ();
    return os.str ();
  }

  bool
  compare_digests (const string& x, const string& y)
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i < x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }
}
