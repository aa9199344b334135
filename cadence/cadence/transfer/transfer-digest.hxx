#pragma once

#include <memory>
#include <string>
#include <cstddef>

#include <openssl/evp.h>

namespace cadence
{
  // Incremental message digest over the bytes of a transfer.
  //
  // The algorithm is named the way stream locations name it ("sha256",
  // "sha-256", "SHA256", "md5", "sha1", "sha512"). An unknown name throws
  // std::invalid_argument; an OpenSSL failure throws std::runtime_error.
  //
  class transfer_digest
  {
  public:
    explicit
    transfer_digest (const std::string& algorithm = "sha256");

    void
    update (const char* data, std::size_t size);

    // Return the lowercase hex digest and start over.
    //
    std::string
    finish ();

    // Forget everything fed so far.
    //
    void
    reset ();

    const std::string&
    algorithm () const noexcept
    {
      return algorithm_;
    }

    // Return true if the name denotes a supported algorithm.
    //
    static bool
    supported (const std::string& algorithm);

  private:
    struct context_deleter
    {
      void
      operator() (EVP_MD_CTX* c) const noexcept
      {
        EVP_MD_CTX_free (c);
      }
    };

    std::string algorithm_;
    const EVP_MD* md_;
    std::unique_ptr<EVP_MD_CTX, context_deleter> ctx_;
  };

  // Compare two hex digests, ignoring case.
  //
  bool
  compare_digests (const std::string&, const std::string&);
}
