#pragma once

#include "world/SegmentOp.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace world {

// Catalog entry for a loadable segment: its content and simulated latency.
struct SegmentDef {
  std::string name;
  std::vector<std::string> objects;
  int loadTicks = cfg::kDefaultLoadTicks;
  int loadJitter = cfg::kDefaultLoadJitter;
  int unloadTicks = cfg::kDefaultUnloadTicks;
  // The next N load attempts fail once their latency elapses.
  int failLoadAttempts = 0;
  bool lightProbes = false;
  // Segment that hosts objects which must outlive every level.
  bool persistentContainer = false;
};

struct WorldObject {
  uint32_t id = 0;
  std::string name;
  // Segment the object currently lives in, or cfg::kPersistentContainer.
  std::string container;
  // Segment the object was spawned from.
  std::string origin;
  int revision = 0;
};

// Simulated scene layer. Owns the segment catalog, the loaded set, every
// live object and the async operations that move segments in and out.
class World {
public:
  explicit World(uint32_t seed = 1);

  bool DefineSegment(const SegmentDef &def);
  const SegmentDef *FindSegment(const std::string &name) const;

  bool IsLoaded(const std::string &segment) const;
  // Loaded segments in the order they finished loading.
  const std::vector<std::string> &LoadedSegments() const { return loaded; }

  // Synchronous load used at process start, before any loop runs.
  bool LoadImmediate(const std::string &segment);

  // Returns nullptr for an unknown segment. An already-loaded segment yields
  // a finished op; a load already in flight is shared.
  SegmentOpPtr BeginLoad(const std::string &segment);
  // Returns nullptr when the segment is not loaded.
  SegmentOpPtr BeginUnload(const std::string &segment);
  // Drops one claim on an unfinished load. The last claim cancels it.
  void Discard(const SegmentOpPtr &op);
  SegmentOpPtr BeginLightingRecompute();

  void Tick();
  // Ops that advance on their own. Loads parked at the staged threshold
  // without activation allowed do not count.
  bool HasPendingOps() const;
  int GetLightingRecomputeCount() const { return lightingRecomputes; }
  bool IsLightingRecomputeRunning() const {
    return FindInFlight(OpKind::Lighting, "") != nullptr;
  }

  uint32_t Spawn(const std::string &name, const std::string &container);
  bool Destroy(uint32_t id);
  bool MoveToPersistent(uint32_t id);
  WorldObject *FindObject(uint32_t id);
  const WorldObject *FindObject(uint32_t id) const;
  const WorldObject *FindObjectByName(const std::string &name) const;
  std::vector<uint32_t> RootObjects(const std::string &container) const;

  bool SetForeground(const std::string &segment);
  const std::string &GetForeground() const { return foreground; }

  void SetLightingDirtyCallback(std::function<void()> callback);

private:
  SegmentOpPtr FindInFlight(OpKind kind, const std::string &segment) const;
  void FinalizeLoad(SegmentOp &op);
  void FinalizeUnload(SegmentOp &op);

  std::map<std::string, SegmentDef> catalog;
  std::map<std::string, int> failuresLeft;
  std::vector<std::string> loaded;
  std::map<uint32_t, WorldObject> objects;
  std::vector<SegmentOpPtr> ops;
  std::string foreground;
  std::function<void()> onLightingDirty;

  uint32_t rngState;
  uint32_t nextObjectId = 1;
  int lightingRecomputes = 0;
};

} // namespace world
