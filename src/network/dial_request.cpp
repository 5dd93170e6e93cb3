#include "network/dial_request.hpp"

namespace peerdial {
namespace network {

const char* DialResultToString(DialResult result) {
  switch (result) {
    case DialResult::Success:
      return "success";
    case DialResult::ManagerStopped:
      return "manager_stopped";
    case DialResult::Aborted:
      return "aborted";
    case DialResult::Failed:
      return "failed";
  }
  return "unknown";
}

} // namespace network
} // namespace peerdial
