#include "loader/PersistentObjectGuard.hpp"

namespace loader {

PersistentObjectGuard::PersistentObjectGuard(const world::World &world,
                                             std::string ownSegment)
    : world(world), ownSegment(std::move(ownSegment)) {}

bool PersistentObjectGuard::IsProtected(const world::WorldObject &obj) const {
  if (obj.container == cfg::kPersistentContainer) {
    return true;
  }
  return IsPersistentContainer(obj.container);
}

bool PersistentObjectGuard::IsProtected(uint32_t objectId) const {
  const world::WorldObject *obj = world.FindObject(objectId);
  return obj != nullptr && IsProtected(*obj);
}

bool PersistentObjectGuard::IsPersistentContainer(
    const std::string &segment) const {
  const world::SegmentDef *def = world.FindSegment(segment);
  return def != nullptr && def->persistentContainer;
}

} // namespace loader
