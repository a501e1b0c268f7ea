#include "loader/Boot.hpp"

#include "core/Log.hpp"

namespace loader {

Signal Boot(Orchestrator &orchestrator, const LevelRegistry &registry) {
  world::World &world = orchestrator.GetWorld();
  const std::string &bootstrap = registry.GetBootstrapSegment();
  if (!world.IsLoaded(bootstrap)) {
    LOG_WARN("Boot: bootstrap segment '{}' is not loaded", bootstrap);
  }

  bool promoted = false;
  for (uint32_t id : world.RootObjects(bootstrap)) {
    const world::WorldObject *obj = world.FindObject(id);
    if (obj && obj->name == cfg::kViewpointRigObject) {
      promoted = world.MoveToPersistent(id);
      break;
    }
  }
  if (promoted) {
    LOG_INFO("Boot: '{}' moved to the permanent container",
             cfg::kViewpointRigObject);
  } else {
    LOG_WARN("Boot: '{}' not found in '{}', viewpoint will not persist",
             cfg::kViewpointRigObject, bootstrap);
  }

  return orchestrator.LoadLevel(registry.GetMainMenuLevel(), true);
}

} // namespace loader
