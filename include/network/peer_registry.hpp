#pragma once

/*
 PeerRegistry - answers "is this peer currently connected?"

 Lookup() returns std::nullopt when the peer is unknown. Callers in the dial
 path treat an unknown peer exactly like a disconnected one.

 InMemoryPeerRegistry is a simple peer book keyed by PeerId, used by hosts
 that track connection state themselves and by tests.
*/

#include "network/dial_request.hpp"
#include <cstddef>
#include <optional>
#include <unordered_map>

namespace peerdial {
namespace network {

struct PeerInfo {
  PeerId id;
  bool connected{false};

  bool IsConnected() const { return connected; }
};

class PeerRegistry {
public:
  virtual ~PeerRegistry() = default;

  virtual std::optional<PeerInfo> Lookup(const PeerId& peer_id) const = 0;
};

class InMemoryPeerRegistry : public PeerRegistry {
public:
  // Add or replace a peer entry
  void AddPeer(const PeerId& peer_id, bool connected = false);

  // Update connection state; returns false if the peer is unknown
  bool SetConnected(const PeerId& peer_id, bool connected);

  // Returns true if the peer existed
  bool RemovePeer(const PeerId& peer_id);

  std::optional<PeerInfo> Lookup(const PeerId& peer_id) const override;

  size_t Size() const { return peers_.size(); }

private:
  std::unordered_map<PeerId, PeerInfo> peers_;
};

} // namespace network
} // namespace peerdial
