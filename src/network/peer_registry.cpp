#include "network/peer_registry.hpp"
#include "util/logging.hpp"

namespace peerdial {
namespace network {

void InMemoryPeerRegistry::AddPeer(const PeerId& peer_id, bool connected) {
  peers_[peer_id] = PeerInfo{peer_id, connected};
  LOG_NET_TRACE("PeerRegistry: added {} (connected={})", peer_id, connected);
}

bool InMemoryPeerRegistry::SetConnected(const PeerId& peer_id, bool connected) {
  auto it = peers_.find(peer_id);
  if (it == peers_.end()) {
    return false;
  }
  it->second.connected = connected;
  return true;
}

bool InMemoryPeerRegistry::RemovePeer(const PeerId& peer_id) {
  return peers_.erase(peer_id) > 0;
}

std::optional<PeerInfo> InMemoryPeerRegistry::Lookup(const PeerId& peer_id) const {
  auto it = peers_.find(peer_id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace network
} // namespace peerdial
