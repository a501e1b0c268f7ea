#include "loader/SegmentLoader.hpp"

#include "core/Log.hpp"

namespace loader {

SegmentLoader::SegmentLoader(world::World &world,
                             const PersistentObjectGuard &guard)
    : world(world), guard(guard) {}

world::SegmentOpPtr SegmentLoader::BeginLoad(const std::string &segment) {
  world::SegmentOpPtr op = world.BeginLoad(segment);
  if (!op) {
    LOG_ERROR("ResourceFault: segment '{}' cannot be loaded (not in catalog)",
              segment);
    return nullptr;
  }
  if (op->IsDone()) {
    LOG_DEBUG("SegmentLoader: '{}' already present", segment);
  }
  return op;
}

world::SegmentOpPtr SegmentLoader::BeginUnload(const std::string &segment) {
  if (guard.IsPersistentContainer(segment)) {
    LOG_DEBUG("SegmentLoader: '{}' is a persistent container, not unloading",
              segment);
    return nullptr;
  }
  return world.BeginUnload(segment);
}

void SegmentLoader::Discard(const world::SegmentOpPtr &op) { world.Discard(op); }

bool SegmentLoader::IsLoaded(const std::string &segment) const {
  return world.IsLoaded(segment);
}

} // namespace loader
