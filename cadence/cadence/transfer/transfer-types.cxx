#include <cadence/transfer/transfer-types.hxx>

using namespace std;

namespace cadence
{
  string
  to_string (attempt_status s)
  {
    switch (s)
    {
    case attempt_status::completed:   return "completed";
    case attempt_status::recoverable: return "recoverable";
    case attempt_status::fatal:       return "fatal";
    case attempt_status::cancelled:   return "cancelled";
    }
    return "recoverable";
  }
}
