#include "network/dial_scheduler.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <utility>
#include <vector>

namespace peerdial {
namespace network {

DialScheduler::DialScheduler(boost::asio::io_context& io_context,
                             const PeerRegistry& peer_registry,
                             DialQueueFactory queue_factory,
                             const DialConfig& config)
    : io_context_(io_context),
      peer_registry_(peer_registry),
      queue_factory_(std::move(queue_factory)),
      config_(config),
      alive_(std::make_shared<bool>(true)),
      clean_timer_(std::make_unique<boost::asio::steady_timer>(io_context)) {
  LOG_DIAL_TRACE("DialScheduler initialized (max_parallel_dials={}, max_cold_calls={}, clean_interval={}s)",
                 config_.max_parallel_dials, config_.max_cold_calls,
                 config_.clean_interval.count());
}

DialScheduler::~DialScheduler() {
  Stop();
}

void DialScheduler::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  ScheduleNextClean();
  LOG_DIAL_DEBUG("DialScheduler started");
}

void DialScheduler::Stop() {
  bool was_running = running_;

  // Clear running_ FIRST: callbacks fired by Abort() below may re-enter Add()
  // or OnQueueStopped(), both of which must now be no-ops
  running_ = false;

  hot_pending_.Clear();
  cold_pending_.Clear();
  dialing_.clear();

  clean_timer_->cancel();

  std::vector<std::pair<PeerId, DialQueuePtr>> queues(queues_.begin(), queues_.end());
  for (auto& [peer_id, queue] : queues) {
    queue->Abort();
    queues_.erase(peer_id);
  }

  if (was_running) {
    LOG_DIAL_DEBUG("DialScheduler stopped ({} queues aborted)", queues.size());
  }
}

void DialScheduler::Add(DialRequest request) {
  DialCallback callback = MakeOnceCallback(std::move(request.callback));

  if (!running_) {
    callback(DialResult::ManagerStopped);
    return;
  }

  if (request.peer_id.empty()) {
    LOG_DIAL_WARN("Rejecting dial request without peer id");
    DeferCallback(std::move(callback), DialResult::Aborted);
    return;
  }

  // The peer's queue is being torn down; buffering into it would orphan the request
  if (evicting_.count(request.peer_id) > 0) {
    LOG_DIAL_TRACE("Dial to {} rejected: queue is being evicted", request.peer_id);
    DeferCallback(std::move(callback), DialResult::Aborted);
    return;
  }

  const bool cold_call = IsColdCall(request);
  DialQueuePtr queue = GetQueue(request.peer_id);

  // Backpressure on speculative dials, independent of the peer's own queue
  if (cold_call && cold_pending_.Size() >= config_.max_cold_calls) {
    LOG_DIAL_TRACE("Cold call to {} rejected: {} cold calls pending (max {})",
                   request.peer_id, cold_pending_.Size(), config_.max_cold_calls);
    DeferCallback(std::move(callback), DialResult::Aborted);
    return;
  }

  queue->Add(request.protocol, request.use_fsm, callback);

  // Dials to connected peers are cheap; never block them behind the cap
  if (IsPeerConnected(queue->id())) {
    LOG_DIAL_TRACE("Peer {} already connected, starting its queue", queue->id());
    queue->Start();
    return;
  }

  if (!queue->IsDialAllowed()) {
    LOG_DIAL_TRACE("Dialing {} not allowed (blacklisted={}), request stays buffered",
                   queue->id(), queue->blacklisted());
    return;
  }

  if (!queue->is_running()) {
    if (!cold_call) {
      hot_pending_.Insert(queue->id());
      cold_pending_.Erase(queue->id());
    } else if (!hot_pending_.Contains(queue->id())) {
      cold_pending_.Insert(queue->id());
    } else {
      // A hot request already guarantees this peer gets dialed
      LOG_DIAL_TRACE("Cold call to {} superseded by pending hot request", queue->id());
      DeferCallback(std::move(callback), DialResult::Aborted);
      return;
    }
  }

  Run();
}

void DialScheduler::Run() {
  if (!running_) {
    return;
  }

  while (dialing_.size() < config_.max_parallel_dials) {
    std::optional<PeerId> next = hot_pending_.PopFront();
    if (!next) {
      next = cold_pending_.PopFront();
    }
    if (!next) {
      return;
    }

    auto it = queues_.find(*next);
    if (it == queues_.end()) {
      LOG_DIAL_WARN("Pending peer {} has no queue, skipping", *next);
      continue;
    }

    DialQueuePtr queue = it->second;
    dialing_.insert(queue->id());
    LOG_DIAL_TRACE("Dialing {} ({}/{} slots in use)", queue->id(), dialing_.size(),
                   config_.max_parallel_dials);
    queue->Start();
    return;
  }
}

void DialScheduler::OnQueueStopped(const PeerId& peer_id) {
  dialing_.erase(peer_id);
  Run();
}

void DialScheduler::OnQueueInstanceStopped(const PeerId& peer_id, const DialQueuePtr& queue) {
  // Late notification from a queue that was evicted or replaced: its slot is gone
  auto it = queues_.find(peer_id);
  if (!queue || it == queues_.end() || it->second != queue) {
    LOG_DIAL_TRACE("Ignoring stop notification from stale queue for {}", peer_id);
    return;
  }
  OnQueueStopped(peer_id);
}

void DialScheduler::Clean() {
  std::vector<std::pair<PeerId, DialQueuePtr>> to_evict;

  for (const auto& [peer_id, queue] : queues_) {
    if (queue->is_permanently_blacklisted()) {
      to_evict.emplace_back(peer_id, queue);
      continue;
    }

    // Still in backoff, keep tracking it
    if (queue->blacklisted() != 0) {
      continue;
    }

    // Connected peers keep their queue: they are likely to be dialed again soon
    if (!queue->is_running() && queue->length() == 0 && !IsPeerConnected(peer_id)) {
      to_evict.emplace_back(peer_id, queue);
    }
  }

  const size_t dialing_before = dialing_.size();
  size_t evicted = 0;
  for (const auto& [peer_id, queue] : to_evict) {
    // An earlier Abort() may have re-entered and replaced the entry
    auto it = queues_.find(peer_id);
    if (it == queues_.end() || it->second != queue) {
      continue;
    }
    EvictQueue(peer_id, queue);
    ++evicted;
  }

  LOG_DIAL_DEBUG("Dial queue cleanup: evicted {}, tracking {}", evicted, queues_.size());

  if (dialing_.size() < dialing_before) {
    Run();
  }

  if (running_) {
    ScheduleNextClean();
  }
}

void DialScheduler::ClearBlacklist(const PeerId& peer_id) {
  DialQueuePtr queue = GetQueue(peer_id);
  if (!queue) {
    LOG_DIAL_TRACE("ClearBlacklist({}) ignored: scheduler stopped", peer_id);
    return;
  }
  queue->ResetBlacklist();
}

DialQueuePtr DialScheduler::GetQueue(const PeerId& peer_id) {
  auto it = queues_.find(peer_id);
  if (it != queues_.end()) {
    return it->second;
  }

  // A stopped scheduler tracks no queues
  if (!running_) {
    return nullptr;
  }

  // The stop handler is bound to this queue instance and to the scheduler's
  // lifetime; notifications after either is gone are dropped
  auto self = std::make_shared<std::weak_ptr<DialQueue>>();
  std::weak_ptr<bool> alive = alive_;
  DialQueuePtr queue = queue_factory_(
      peer_id, [this, alive, self](const PeerId& id) {
        if (alive.expired()) {
          return;
        }
        OnQueueInstanceStopped(id, self->lock());
      });
  *self = queue;
  queues_.emplace(peer_id, queue);
  LOG_DIAL_TRACE("Created dial queue for {}", peer_id);
  return queue;
}

DialQueuePtr DialScheduler::FindQueue(const PeerId& peer_id) const {
  auto it = queues_.find(peer_id);
  return it == queues_.end() ? nullptr : it->second;
}

bool DialScheduler::IsPeerConnected(const PeerId& peer_id) const {
  // Unknown to the registry means not connected
  auto info = peer_registry_.Lookup(peer_id);
  return info.has_value() && info->IsConnected();
}

void DialScheduler::DeferCallback(DialCallback callback, DialResult result) {
  boost::asio::post(io_context_, [callback = std::move(callback), result]() {
    callback(result);
  });
}

void DialScheduler::EvictQueue(const PeerId& peer_id, const DialQueuePtr& queue) {
  hot_pending_.Erase(peer_id);
  cold_pending_.Erase(peer_id);

  evicting_.insert(peer_id);
  queue->Abort();
  evicting_.erase(peer_id);

  queues_.erase(peer_id);
  dialing_.erase(peer_id);

  LOG_DIAL_TRACE("Evicted dial queue for {} (blacklisted={})", peer_id, queue->blacklisted());
}

void DialScheduler::ScheduleNextClean() {
  if (!running_) {
    return;
  }

  clean_timer_->expires_after(config_.clean_interval);
  clean_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (!ec && running_) {
      Clean();
    }
  });
}

} // namespace network
} // namespace peerdial
