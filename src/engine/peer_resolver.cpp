#include "engine/peer_resolver.hpp"

#include "common/logging/log.hpp"
#include "engine/tags.hpp"

namespace convgen::engine {

PeerResolver::PeerResolver(const Universe& universe, std::vector<std::string> peer_packages,
                           std::string tag_name)
    : universe_(universe), peer_packages_(std::move(peer_packages)), tag_name_(std::move(tag_name)) {}

auto PeerResolver::resolve(const Type& t) -> const Type* {
  if (auto it = cache_.find(t.name.name); it != cache_.end()) {
    return it->second;
  }

  std::string peer_name = t.name.name;
  if (auto name = tag_option(tag_name_, t.comments, "peerName"); name && !name->empty()) {
    log::debug("using custom peer name {} for input type {}", *name, t.name.qualified());
    peer_name = std::move(*name);
  }

  const Type* peer = nullptr;
  for (const auto& path : peer_packages_) {
    const auto* package = universe_.package(path);
    if (package && package->has(peer_name)) {
      peer = package->type(peer_name);
      break;
    }
  }

  cache_.emplace(t.name.name, peer);

  if (peer) {
    log::debug("found peer type {} for input type {}", peer->name.qualified(), t.name.qualified());
  }
  return peer;
}

}  // namespace convgen::engine
