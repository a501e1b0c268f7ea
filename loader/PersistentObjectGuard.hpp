#pragma once

#include "world/World.hpp"

#include <string>

namespace loader {

// Decides what a level teardown must leave alone. Membership based: an
// object is protected because of the container it lives in, never because
// of what it is.
class PersistentObjectGuard {
public:
  PersistentObjectGuard(const world::World &world, std::string ownSegment);

  // Object lives in the permanent container or in a segment flagged as a
  // persistent container.
  bool IsProtected(const world::WorldObject &obj) const;
  bool IsProtected(uint32_t objectId) const;

  // Segment must never be unloaded by a level teardown.
  bool IsPersistentContainer(const std::string &segment) const;

  // The orchestrator's own bootstrap segment.
  const std::string &GetOwnSegment() const { return ownSegment; }

private:
  const world::World &world;
  std::string ownSegment;
};

} // namespace loader
