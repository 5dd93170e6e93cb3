#pragma once

/*
 DialQueue - per-peer dial queue contract consumed by the DialScheduler

 One instance exists per peer id. The queue buffers dial requests for its
 peer, runs them against the transport layer when started, tracks its own
 blacklist/backoff state, and reports back when it goes idle.

 The scheduler only:
 - reads state: id(), is_running(), length(), blacklisted(), blacklist_count()
 - calls lifecycle methods: Add(), Start(), Abort(), IsDialAllowed()
 - resets blacklist state via ResetBlacklist()

 Stop notification
 - Every queue receives a QueueStoppedCallback at construction and must call
   it with its id whenever it transitions from running to idle. This is the
   only way a parallel-dial slot is returned to the scheduler.

 Blacklist state
 - blacklisted() == 0: not blacklisted
 - 0 < blacklisted() < BLACKLIST_PERMANENT: temporary backoff (kept by cleanup)
 - blacklisted() == BLACKLIST_PERMANENT: never dialed again (evicted by cleanup)
*/

#include "network/dial_request.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>

namespace peerdial {
namespace network {

using QueueStoppedCallback = std::function<void(const PeerId&)>;

class DialQueue {
public:
  static constexpr uint64_t BLACKLIST_PERMANENT = std::numeric_limits<uint64_t>::max();

  virtual ~DialQueue() = default;

  // Buffer a dial request; callback is already one-shot wrapped by the caller
  virtual void Add(const std::optional<std::string>& protocol, bool use_fsm,
                   DialCallback callback) = 0;

  // Begin dialing buffered requests (no-op if already running)
  virtual void Start() = 0;

  // Cancel buffered and in-flight work, resolving callbacks with Aborted
  virtual void Abort() = 0;

  // False while under temporary blacklist backoff
  virtual bool IsDialAllowed() const = 0;

  // Clear blacklist state and failure count
  virtual void ResetBlacklist() = 0;

  virtual const PeerId& id() const = 0;
  virtual bool is_running() const = 0;
  virtual size_t length() const = 0;
  virtual uint64_t blacklisted() const = 0;
  virtual uint64_t blacklist_count() const = 0;

  bool is_permanently_blacklisted() const {
    return blacklisted() == BLACKLIST_PERMANENT;
  }
};

using DialQueuePtr = std::shared_ptr<DialQueue>;

// Creates the queue for a peer; the scheduler passes its own stop handler.
// A queue may outlive the scheduler (it is shared); calling the handler after
// the scheduler is destroyed, or after the queue was evicted, is a no-op.
using DialQueueFactory =
    std::function<DialQueuePtr(const PeerId&, QueueStoppedCallback)>;

} // namespace network
} // namespace peerdial
