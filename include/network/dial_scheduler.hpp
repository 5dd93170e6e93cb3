#pragma once

/*
 DialScheduler - admission control and scheduling for outbound dials

 Purpose
 - Multiplex every outbound dial request through a per-peer DialQueue
 - Enforce a global cap on simultaneously active dials (max_parallel_dials)
 - Prefer protocol-bearing ("hot") requests over speculative cold calls
 - Periodically evict per-peer queues that are no longer worth tracking

 State
 - hot_pending_:  peers with at least one protocol-bearing request, FIFO
 - cold_pending_: peers with only cold calls, FIFO, size <= max_cold_calls
 - dialing_:      peers currently holding a parallel-dial slot
 - queues_:       PeerId -> DialQueue, created lazily, reused while present
 A peer id is never in hot_pending_ and cold_pending_ at the same time.

 Admission (Add)
 1. Not running: callback(ManagerStopped) immediately, no queue touched
    Peer's queue mid-eviction: callback(Aborted) on the next tick
 2. Cold call while cold set is full: callback(Aborted) on the next tick
 3. Buffer into the peer's queue
 4. Peer already connected: start the queue now, bypassing the cap
 5. Queue under blacklist backoff: keep buffered, don't schedule
 6. Queue idle: hot -> hot set (leaving the cold set); cold -> cold set,
    unless already hot, in which case the cold call is Aborted on the next tick
 7. Run()

 Scheduling (Run)
 - Admits at most one peer per call: oldest hot peer, else oldest cold peer
 - Callers invoke it after every event that may free or fill a slot
 - OnQueueStopped() is the only path that returns a slot
 - Queues created here notify through a handler bound to their own instance:
   a stop reported by an evicted or replaced queue returns no slot, and one
   reported after the scheduler is destroyed is dropped

 Cleanup (Clean, every clean_interval)
 - Permanently blacklisted: abort, then remove
 - Temporarily blacklisted: keep (still in backoff)
 - Idle and peer not connected (unknown counts as not connected): abort, remove
 - Requests re-entering Add() for a peer while its queue aborts are Aborted
 - Running queues and queues with buffered requests are never evicted

 Threading
 - Single-threaded reactor: all methods, timer handlers and deferred
   callbacks run on io_context_. No locks.
 - "Next tick" callbacks are posted to io_context_.
*/

#include "network/dial_config.hpp"
#include "network/dial_queue.hpp"
#include "network/dial_request.hpp"
#include "network/peer_registry.hpp"
#include "util/ordered_set.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace peerdial {
namespace network {

class DialScheduler {
public:
  /**
   * @param io_context     Reactor that runs deferred callbacks and the cleanup timer
   * @param peer_registry  Connection state source; must outlive the scheduler
   * @param queue_factory  Creates the DialQueue for a peer
   * @param config         Limits (copied)
   */
  DialScheduler(boost::asio::io_context& io_context,
                const PeerRegistry& peer_registry,
                DialQueueFactory queue_factory,
                const DialConfig& config = DialConfig{});

  // Stops the scheduler (aborts all queues)
  ~DialScheduler();

  DialScheduler(const DialScheduler&) = delete;
  DialScheduler& operator=(const DialScheduler&) = delete;

  // Lifecycle
  void Start();
  void Stop();
  bool is_running() const { return running_; }

  // Admit a dial request (see header comment for the full sequence)
  void Add(DialRequest request);

  // Promote at most one pending peer into active dialing
  void Run();

  // Called by a DialQueue when it goes idle; frees its slot and calls Run()
  void OnQueueStopped(const PeerId& peer_id);

  // Cleanup sweep; normally driven by the timer, public for hosts and tests
  void Clean();

  // Reset the blacklist of the peer's queue (creates the queue if needed)
  void ClearBlacklist(const PeerId& peer_id);

  // Resolve or lazily create the queue for a peer
  DialQueuePtr GetQueue(const PeerId& peer_id);

  // Existing queue only; nullptr if the peer isn't tracked
  DialQueuePtr FindQueue(const PeerId& peer_id) const;

  // Stats (used primarily in tests, useful for monitoring)
  size_t queue_count() const { return queues_.size(); }
  size_t pending_count() const { return hot_pending_.Size(); }
  size_t cold_call_count() const { return cold_pending_.Size(); }
  size_t dialing_count() const { return dialing_.size(); }

  bool IsPending(const PeerId& peer_id) const { return hot_pending_.Contains(peer_id); }
  bool IsColdPending(const PeerId& peer_id) const { return cold_pending_.Contains(peer_id); }
  bool IsDialing(const PeerId& peer_id) const { return dialing_.count(peer_id) > 0; }

  const DialConfig& config() const { return config_; }

private:
  bool IsPeerConnected(const PeerId& peer_id) const;

  // Stop handler target; ignores queues no longer in the table
  void OnQueueInstanceStopped(const PeerId& peer_id, const DialQueuePtr& queue);

  // Resolve callback(result) on the next tick of io_context_
  void DeferCallback(DialCallback callback, DialResult result);

  // Abort the queue and drop every trace of the peer
  void EvictQueue(const PeerId& peer_id, const DialQueuePtr& queue);

  void ScheduleNextClean();

  boost::asio::io_context& io_context_;
  const PeerRegistry& peer_registry_;
  DialQueueFactory queue_factory_;
  DialConfig config_;

  bool running_{false};

  // Expires with the scheduler; checked by queue stop handlers
  std::shared_ptr<bool> alive_;

  util::InsertionOrderedSet<PeerId> hot_pending_;
  util::InsertionOrderedSet<PeerId> cold_pending_;
  std::unordered_set<PeerId> dialing_;
  std::unordered_map<PeerId, DialQueuePtr> queues_;

  // Peers whose queue is inside Abort() during eviction
  std::unordered_set<PeerId> evicting_;

  std::unique_ptr<boost::asio::steady_timer> clean_timer_;
};

} // namespace network
} // namespace peerdial
