#pragma once

#include "loader/Scheduler.hpp"
#include "loader/SegmentLoader.hpp"
#include "loader/Signal.hpp"
#include "world/SegmentOp.hpp"

#include <set>
#include <string>
#include <vector>

namespace loader {

enum class LevelState {
  None,
  Loading,
  Loaded,
  Activating,
  Active,
  Deactivated,
  Unloading,
};

const char *LevelStateName(LevelState state);

// Authored level definition: {name, segments, activeIndex}.
struct LevelDef {
  std::string name;
  std::vector<std::string> segments;
  int activeIndex = -1;
};

// What a level transition needs to run. Owned by the orchestrator.
struct LevelServices {
  SegmentLoader &loader;
  Scheduler &scheduler;
  const PersistentObjectGuard &guard;
};

// A named, ordered bundle of segments with its own lifecycle:
//
//   None -Load-> Loading -> Loaded -Activate-> Activating -> Active
//   Active -Deactivate-> Deactivated
//   Deactivated|Loaded -Unload-> Unloading -> None
//
// Re-issuing the transition that is in flight returns its signal. Any other
// call from the wrong state is logged as a StateConflictError and returns a
// completed signal carrying that error. A failed segment op puts the level
// back in the state the transition left.
class Level {
public:
  explicit Level(LevelDef def);

  Signal Load(const LevelServices &services);
  Signal Activate(const LevelServices &services);
  // Segments in `retain` are left untouched.
  Signal Deactivate(const LevelServices &services,
                    const std::set<std::string> &retain = {});
  Signal Unload(const LevelServices &services,
                const std::set<std::string> &retain = {});

  // Takes over segments that are already present: None -> Loaded.
  bool MarkAdopted();
  // Drops the transition in flight when its driving jobs are going away.
  // Loading and Unloading fall back to None, Activating to Loaded; the
  // level's signal fails with InvariantViolation.
  void Abandon(const LevelServices &services);

  const std::string &GetName() const { return name; }
  const std::vector<std::string> &GetSegments() const { return segments; }
  int GetPrimaryIndex() const { return primaryIndex; }
  LevelState GetState() const { return state; }
  const std::vector<world::SegmentOpPtr> &GetPendingOperations() const {
    return pending;
  }
  size_t GetStagedCount() const { return staged.size(); }
  const Signal &GetCurrentSignal() const { return signal; }
  bool ContainsSegment(const std::string &segment) const;
  std::set<std::string> SegmentSet() const;

private:
  Signal Conflict(const char *call);
  void SelectForeground(world::World &world);
  bool StepLoad(const LevelServices &services, Signal done);
  bool StepActivate(const LevelServices &services, Signal done);
  bool StepUnload(LevelState previous, Signal done);

  const std::string name;
  const std::vector<std::string> segments;
  const int primaryIndex;

  LevelState state = LevelState::None;
  // Handles of the transition in flight.
  std::vector<world::SegmentOpPtr> pending;
  // Load handles parked at the staged threshold while Loaded.
  std::vector<world::SegmentOpPtr> staged;
  Signal signal;
};

} // namespace loader
