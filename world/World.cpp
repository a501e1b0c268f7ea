#include "world/World.hpp"

#include "core/Log.hpp"
#include "core/Rng.hpp"

#include <algorithm>

namespace world {

World::World(uint32_t seed) : rngState(seed) {}

bool World::DefineSegment(const SegmentDef &def) {
  if (def.name.empty()) {
    LOG_ERROR("World: segment definition without a name");
    return false;
  }
  if (catalog.count(def.name) != 0) {
    LOG_ERROR("World: segment '{}' defined twice", def.name);
    return false;
  }
  catalog[def.name] = def;
  failuresLeft[def.name] = std::max(0, def.failLoadAttempts);
  return true;
}

const SegmentDef *World::FindSegment(const std::string &name) const {
  auto it = catalog.find(name);
  return it == catalog.end() ? nullptr : &it->second;
}

bool World::IsLoaded(const std::string &segment) const {
  return std::find(loaded.begin(), loaded.end(), segment) != loaded.end();
}

bool World::LoadImmediate(const std::string &segment) {
  const SegmentDef *def = FindSegment(segment);
  if (!def) {
    LOG_ERROR("World: cannot load unknown segment '{}'", segment);
    return false;
  }
  if (IsLoaded(segment)) {
    return true;
  }
  loaded.push_back(segment);
  for (const auto &objName : def->objects) {
    Spawn(objName, segment);
  }
  LOG_DEBUG("World: segment '{}' loaded immediately", segment);
  return true;
}

SegmentOpPtr World::FindInFlight(OpKind kind, const std::string &segment) const {
  for (const auto &op : ops) {
    if (op->kind == kind && op->segment == segment && !op->done) {
      return op;
    }
  }
  return nullptr;
}

SegmentOpPtr World::BeginLoad(const std::string &segment) {
  const SegmentDef *def = FindSegment(segment);
  if (!def) {
    return nullptr;
  }

  const bool unloading = FindInFlight(OpKind::Unload, segment) != nullptr;
  if (IsLoaded(segment) && !unloading) {
    auto finished = std::make_shared<SegmentOp>(OpKind::Load, segment, 0, false);
    finished->staged = true;
    finished->done = true;
    finished->allowActivation = true;
    return finished;
  }

  if (auto existing = FindInFlight(OpKind::Load, segment)) {
    ++existing->claims;
    return existing;
  }

  const int ticks =
      std::max(1, def->loadTicks + core::NextInt(rngState, def->loadJitter));
  bool willFail = false;
  int &left = failuresLeft[segment];
  if (left > 0) {
    --left;
    willFail = true;
  }

  auto op = std::make_shared<SegmentOp>(OpKind::Load, segment, ticks, willFail);
  ops.push_back(op);
  return op;
}

SegmentOpPtr World::BeginUnload(const std::string &segment) {
  if (auto existing = FindInFlight(OpKind::Unload, segment)) {
    ++existing->claims;
    return existing;
  }
  if (!IsLoaded(segment)) {
    return nullptr;
  }
  const SegmentDef *def = FindSegment(segment);
  const int ticks = def ? std::max(1, def->unloadTicks) : 1;
  auto op = std::make_shared<SegmentOp>(OpKind::Unload, segment, ticks, false);
  ops.push_back(op);
  return op;
}

void World::Discard(const SegmentOpPtr &op) {
  if (!op || op->done || op->kind != OpKind::Load) {
    return;
  }
  if (--op->claims > 0) {
    return;
  }
  op->discarded = true;
  op->done = true;
  ops.erase(std::remove(ops.begin(), ops.end(), op), ops.end());
  LOG_DEBUG("World: staged load of '{}' discarded", op->segment);
}

SegmentOpPtr World::BeginLightingRecompute() {
  if (auto existing = FindInFlight(OpKind::Lighting, "")) {
    ++existing->claims;
    return existing;
  }
  auto op = std::make_shared<SegmentOp>(OpKind::Lighting, "",
                                        cfg::kLightingRecomputeTicks, false);
  ops.push_back(op);
  return op;
}

void World::FinalizeLoad(SegmentOp &op) {
  if (IsLoaded(op.segment)) {
    return;
  }
  const SegmentDef *def = FindSegment(op.segment);
  loaded.push_back(op.segment);
  if (def) {
    for (const auto &objName : def->objects) {
      Spawn(objName, op.segment);
    }
  }
  LOG_DEBUG("World: segment '{}' loaded", op.segment);
}

void World::FinalizeUnload(SegmentOp &op) {
  for (auto it = objects.begin(); it != objects.end();) {
    if (it->second.container == op.segment) {
      it = objects.erase(it);
    } else {
      ++it;
    }
  }
  loaded.erase(std::remove(loaded.begin(), loaded.end(), op.segment),
               loaded.end());
  if (foreground == op.segment) {
    foreground.clear();
  }
  LOG_DEBUG("World: segment '{}' unloaded", op.segment);
}

bool World::HasPendingOps() const {
  for (const auto &op : ops) {
    if (!op->done && !(op->staged && !op->allowActivation)) {
      return true;
    }
  }
  return false;
}

void World::Tick() {
  bool lightingDirty = false;

  // Ops started from the dirty callback join the next tick.
  const std::vector<SegmentOpPtr> current = ops;
  for (const auto &op : current) {
    if (op->done) {
      continue;
    }
    const SegmentDef *def = FindSegment(op->segment);
    switch (op->kind) {
    case OpKind::Load:
      if (op->staged) {
        if (op->allowActivation) {
          FinalizeLoad(*op);
          op->done = true;
          lightingDirty = lightingDirty || (def && def->lightProbes);
        }
      } else if (!FindInFlight(OpKind::Unload, op->segment)) {
        if (++op->elapsed >= op->totalTicks) {
          if (op->willFail) {
            op->failed = true;
            op->done = true;
            LOG_WARN("World: load of segment '{}' failed", op->segment);
          } else {
            op->staged = true;
          }
        }
      }
      break;
    case OpKind::Unload:
      if (++op->elapsed >= op->totalTicks) {
        FinalizeUnload(*op);
        op->done = true;
        lightingDirty = lightingDirty || (def && def->lightProbes);
      }
      break;
    case OpKind::Lighting:
      if (++op->elapsed >= op->totalTicks) {
        op->done = true;
        ++lightingRecomputes;
        LOG_DEBUG("World: lighting recompute #{} finished", lightingRecomputes);
      }
      break;
    }
  }

  ops.erase(std::remove_if(ops.begin(), ops.end(),
                           [](const SegmentOpPtr &op) { return op->done; }),
            ops.end());

  if (lightingDirty && onLightingDirty) {
    onLightingDirty();
  }
}

uint32_t World::Spawn(const std::string &name, const std::string &container) {
  WorldObject obj;
  obj.id = nextObjectId++;
  obj.name = name;
  obj.container = container;
  obj.origin = container;
  objects[obj.id] = obj;
  return obj.id;
}

bool World::Destroy(uint32_t id) { return objects.erase(id) != 0; }

bool World::MoveToPersistent(uint32_t id) {
  WorldObject *obj = FindObject(id);
  if (!obj) {
    return false;
  }
  if (obj->container != cfg::kPersistentContainer) {
    obj->container = cfg::kPersistentContainer;
    ++obj->revision;
  }
  return true;
}

WorldObject *World::FindObject(uint32_t id) {
  auto it = objects.find(id);
  return it == objects.end() ? nullptr : &it->second;
}

const WorldObject *World::FindObject(uint32_t id) const {
  auto it = objects.find(id);
  return it == objects.end() ? nullptr : &it->second;
}

const WorldObject *World::FindObjectByName(const std::string &name) const {
  for (const auto &entry : objects) {
    if (entry.second.name == name) {
      return &entry.second;
    }
  }
  return nullptr;
}

std::vector<uint32_t> World::RootObjects(const std::string &container) const {
  std::vector<uint32_t> ids;
  for (const auto &entry : objects) {
    if (entry.second.container == container) {
      ids.push_back(entry.first);
    }
  }
  return ids;
}

bool World::SetForeground(const std::string &segment) {
  if (!IsLoaded(segment)) {
    return false;
  }
  foreground = segment;
  return true;
}

void World::SetLightingDirtyCallback(std::function<void()> callback) {
  onLightingDirty = std::move(callback);
}

} // namespace world
