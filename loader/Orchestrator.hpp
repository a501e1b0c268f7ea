#pragma once

#include "core/Config.hpp"
#include "loader/Level.hpp"
#include "loader/LevelRegistry.hpp"
#include "loader/PersistentObjectGuard.hpp"
#include "loader/Scheduler.hpp"
#include "loader/SegmentLoader.hpp"
#include "loader/Signal.hpp"
#include "world/World.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace loader {

// Tracks the loaded levels and sequences every switch so that at most one
// level is Active when a call completes. Construct one per process and
// pass it by reference; a second live instance is invalid and rejects
// every call with InvariantViolation.
//
// Nothing blocks: every call returns a Signal and the work advances on
// Tick(). ActivateAndUnloadOthers and UnloadAll run one after another in
// call order; a repeated switch to the same target joins the one in flight
// when it is still the last request queued.
class Orchestrator {
public:
  Orchestrator(LevelRegistry &registry, world::World &world);
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  bool IsValid() const { return valid; }

  Signal LoadLevel(const std::string &name, bool activateOnLoad = false);
  Signal ActivateAndUnloadOthers(const std::string &name);
  Signal UnloadAll();

  // Requests a lighting recompute. At most one runs at a time; a request
  // made while one runs schedules a single follow-up.
  void MarkLightingDirty();

  // Registers a level made of every segment currently loaded (except the
  // bootstrap segment) and tracks it as Loaded.
  Level *AdoptLoadedSegments(const std::string &name);

  void Tick();
  // Ticks until `signal` completes. False if maxTicks ran out first.
  bool RunUntil(const Signal &signal, int maxTicks = cfg::kMaxTicksPerCall);
  bool RunUntilIdle(int maxTicks = cfg::kMaxTicksPerCall);

  // Logs a ConfigurationError when the name is unknown.
  Level *GetLevel(const std::string &name) const;
  Level *FindLevel(const std::function<bool(const Level &)> &predicate) const;

  const std::vector<Level *> &GetTrackedLevels() const { return tracked; }
  bool IsTracked(const std::string &name) const;
  Level *GetActiveLevel() const;
  bool IsIdle() const;
  bool IsLightingJobRunning() const { return lightingRunning; }
  int GetLightingJobsStarted() const { return lightingJobs; }
  uint64_t GetTickCount() const { return tickCount; }

  world::World &GetWorld() { return world; }
  // Drives a level directly on this instance's scheduler.
  const LevelServices &GetServices() const { return services; }

private:
  struct SwitchTask;
  struct UnloadAllTask;
  struct LightingTask;

  Signal Reject(LoaderError error, const char *call,
                const std::string &name) const;
  Signal StartSwitch(Level *target, const Signal *pendingLoad);
  bool StepSwitch(SwitchTask &task);
  bool QuiesceOthers(SwitchTask &task);
  void FinishSwitch(SwitchTask &task, LoaderError error);
  bool StepUnloadAll(UnloadAllTask &task);
  void StartLightingJob();
  bool StepLighting(LightingTask &task);

  void Enqueue(const Signal &sequence);
  Signal *FindFoldableSwitch(const std::string &name);
  void Track(Level *level);
  void Untrack(Level *level);
  bool AnyActivating() const;

  LevelRegistry &registry;
  world::World &world;
  PersistentObjectGuard guard;
  SegmentLoader loader;
  Scheduler scheduler;
  LevelServices services;

  std::vector<Level *> tracked;
  // Switch sequences in flight, by target name.
  std::map<std::string, Signal> switchesInFlight;
  // Completion of the most recently queued sequence.
  Signal lastSequence;
  // Sequences queued and not yet complete, in call order.
  std::vector<Signal> queuedSequences;

  bool lightingRunning = false;
  bool lightingFollowUp = false;
  int lightingJobs = 0;

  bool valid = false;
  uint64_t tickCount = 0;

  static bool s_Live;
};

} // namespace loader
