#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "engine/types.hpp"
#include "engine/universe.hpp"

namespace convgen::engine {

/// Maps a type of the home package to its counterpart in the peer packages.
/// Lookups are memoized per simple name, misses included.
class PeerResolver {
 public:
  PeerResolver(const Universe& universe, std::vector<std::string> peer_packages, std::string tag_name);

  /// The peer type, or nullptr when no peer package declares one.
  auto resolve(const Type& t) -> const Type*;

  auto peer_packages() const -> const std::vector<std::string>& { return peer_packages_; }

 private:
  const Universe& universe_;
  std::vector<std::string> peer_packages_;
  std::string tag_name_;
  std::unordered_map<std::string, const Type*> cache_;
};

}  // namespace convgen::engine
