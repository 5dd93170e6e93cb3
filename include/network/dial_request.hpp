#pragma once

/*
 Dial request types shared by the DialScheduler and per-peer DialQueues

 - PeerId: stable string id; the only key correlating per-peer dial state
 - DialRequest: protocol named => "hot" request, absent or empty => "cold call"
 - DialResult: terminal classification delivered to the request callback
 - MakeOnceCallback: one-shot wrapper; every request callback goes through it
   so that it fires at most once no matter how many copies exist or which
   component (scheduler, queue, shutdown) resolves it first
*/

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace peerdial {
namespace network {

using PeerId = std::string;

// Terminal outcome of a dial request
enum class DialResult {
  Success,
  ManagerStopped,  // Scheduler not running; request was never buffered
  Aborted,         // Backpressure, superseded by a hot request, or cancelled
  Failed           // Dial attempt failed inside the queue
};

const char* DialResultToString(DialResult result);

using DialCallback = std::function<void(DialResult)>;

struct DialRequest {
  PeerId peer_id;
  std::optional<std::string> protocol;  // nullopt or empty = cold call
  bool use_fsm{false};                  // Dial mode flag, forwarded to the queue untouched
  DialCallback callback;                // May be empty
};

inline bool IsColdCall(const DialRequest& request) {
  return !request.protocol.has_value() || request.protocol->empty();
}

// Wrap a callback so it runs at most once across all copies of the wrapper.
// An empty callback becomes a no-op.
inline DialCallback MakeOnceCallback(DialCallback callback) {
  if (!callback) {
    return [](DialResult) {};
  }
  auto fired = std::make_shared<bool>(false);
  return [fired, callback = std::move(callback)](DialResult result) {
    if (*fired) {
      return;
    }
    *fired = true;
    callback(result);
  };
}

} // namespace network
} // namespace peerdial
