#pragma once

#include "loader/PersistentObjectGuard.hpp"
#include "world/World.hpp"

#include <string>

namespace loader {

// Adapter over the world's async segment primitives.
class SegmentLoader {
public:
  SegmentLoader(world::World &world, const PersistentObjectGuard &guard);

  // Already-present segments yield a finished handle. Unknown segments
  // yield nullptr and log a ResourceFault.
  world::SegmentOpPtr BeginLoad(const std::string &segment);

  // nullptr means there is nothing to wait for: the segment is not loaded,
  // or it is a persistent container and is skipped.
  world::SegmentOpPtr BeginUnload(const std::string &segment);

  // Drops a load handle that was never finalized.
  void Discard(const world::SegmentOpPtr &op);

  bool IsLoaded(const std::string &segment) const;

  world::World &GetWorld() { return world; }

private:
  world::World &world;
  const PersistentObjectGuard &guard;
};

} // namespace loader
