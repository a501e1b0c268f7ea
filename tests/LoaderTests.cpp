#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "loader/Boot.hpp"
#include "loader/Level.hpp"
#include "loader/LevelRegistry.hpp"
#include "loader/Orchestrator.hpp"
#include "loader/Scheduler.hpp"
#include "loader/SegmentLoader.hpp"
#include "loader/Signal.hpp"
#include "world/World.hpp"

using loader::Level;
using loader::LevelDef;
using loader::LevelState;
using loader::LoaderError;
using loader::Signal;

namespace {

const char *kTestRegistry = R"({
  "bootstrap": "bootstrap",
  "mainMenu": "Menu",
  "segments": [
    {"name": "bootstrap", "objects": ["ViewpointRig", "BootSplash"], "loadTicks": 1, "unloadTicks": 1},
    {"name": "menu", "objects": ["MenuCanvas"]},
    {"name": "s1", "objects": ["Floor1", "Crate1"]},
    {"name": "s2", "objects": ["Floor2"]},
    {"name": "s3", "objects": ["Floor3"]},
    {"name": "s4", "objects": ["Floor4"], "loadTicks": 6},
    {"name": "s5", "objects": ["Floor5"]},
    {"name": "s6", "objects": ["Floor6"]},
    {"name": "s7", "objects": ["Floor7"]},
    {"name": "s8", "objects": ["Floor8"]},
    {"name": "shared", "objects": ["SharedProp"], "loadTicks": 2},
    {"name": "pc", "objects": ["Music"], "persistentContainer": true},
    {"name": "probe", "objects": ["ProbeVolume"], "lightProbes": true},
    {"name": "bad", "objects": ["Broken"], "failLoadAttempts": 1}
  ],
  "levels": [
    {"name": "Menu", "segments": ["menu"], "activeIndex": 0},
    {"name": "A", "segments": ["s1"], "activeIndex": 0},
    {"name": "B", "segments": ["s2"], "activeIndex": 0},
    {"name": "C", "segments": ["s3", "shared"], "activeIndex": 0},
    {"name": "D", "segments": ["s4", "shared"], "activeIndex": 1},
    {"name": "P", "segments": ["s5", "pc"], "activeIndex": 0},
    {"name": "Q", "segments": ["s6", "pc"], "activeIndex": 0},
    {"name": "F", "segments": ["bad"], "activeIndex": 0},
    {"name": "L", "segments": ["probe"], "activeIndex": -1},
    {"name": "K", "segments": ["bootstrap", "s8"], "activeIndex": 1},
    {"name": "BadIndex", "segments": ["s7"], "activeIndex": 5}
  ]
})";

// World + registry + orchestrator, with the bootstrap segment loaded.
struct Harness {
  world::World world;
  loader::LevelRegistry registry;
  std::unique_ptr<loader::Orchestrator> orchestrator;
  bool ok = false;

  Harness() {
    ok = loader::LoadRegistryFromString(registry, world, kTestRegistry,
                                        "test registry") &&
         world.LoadImmediate("bootstrap");
    orchestrator = std::make_unique<loader::Orchestrator>(registry, world);
    ok = ok && orchestrator->IsValid();
  }

  loader::Orchestrator &Orch() { return *orchestrator; }

  bool Run(const Signal &signal) { return orchestrator->RunUntil(signal, 500); }

  bool SwitchTo(const std::string &name) {
    Signal signal = orchestrator->ActivateAndUnloadOthers(name);
    return Run(signal) && signal.Succeeded();
  }
};

// Level driven directly, without an orchestrator.
struct LevelRig {
  world::World world;
  loader::LevelRegistry registry;
  loader::PersistentObjectGuard guard{world, cfg::kBootstrapSegment};
  loader::SegmentLoader segmentLoader{world, guard};
  loader::Scheduler scheduler;
  loader::LevelServices services{segmentLoader, scheduler, guard};
  bool ok = false;

  LevelRig() {
    ok = loader::LoadRegistryFromString(registry, world, kTestRegistry,
                                        "test registry");
  }

  void Tick() {
    world.Tick();
    scheduler.Tick();
  }

  bool RunUntil(const Signal &signal, int maxTicks = 200) {
    for (int i = 0; i < maxTicks && !signal.IsDone(); ++i) {
      Tick();
    }
    return signal.IsDone();
  }
};

bool PendingInvariantHolds(const Level &level) {
  const LevelState state = level.GetState();
  const bool inFlight = state == LevelState::Loading ||
                        state == LevelState::Activating ||
                        state == LevelState::Unloading;
  return inFlight || level.GetPendingOperations().empty();
}

int CountActive(const loader::LevelRegistry &registry) {
  int count = 0;
  for (const auto &level : registry.GetLevels()) {
    if (level->GetState() == LevelState::Active) {
      ++count;
    }
  }
  return count;
}

std::vector<std::string> TrackedNames(const loader::Orchestrator &orchestrator) {
  std::vector<std::string> names;
  for (const Level *level : orchestrator.GetTrackedLevels()) {
    names.push_back(level->GetName());
  }
  return names;
}

// --- Signal / Scheduler ---

bool TestSignalBasics() {
  Signal none;
  if (!none.IsDone() || !none.Succeeded()) {
    return false;
  }

  Signal pending = Signal::MakePending();
  Signal copy = pending;
  if (pending.IsDone() || !(copy == pending)) {
    return false;
  }
  copy.Fail(LoaderError::ResourceFault);
  pending.Resolve(); // already completed through the copy
  if (!pending.IsDone() || pending.Succeeded() ||
      pending.GetError() != LoaderError::ResourceFault) {
    return false;
  }

  Signal rejected = Signal::Rejected(LoaderError::StateConflict);
  return rejected.IsDone() && rejected.GetError() == LoaderError::StateConflict &&
         Signal::Completed().Succeeded() &&
         Signal::Completed() != Signal::Completed();
}

bool TestSchedulerDefersJobsStartedDuringTick() {
  loader::Scheduler scheduler;
  int outerSteps = 0;
  int innerSteps = 0;
  scheduler.Start("outer", [&]() {
    ++outerSteps;
    scheduler.Start("inner", [&]() {
      ++innerSteps;
      return true;
    });
    return true;
  });

  scheduler.Tick();
  if (outerSteps != 1 || innerSteps != 0 || scheduler.IsIdle()) {
    return false;
  }
  scheduler.Tick();
  return innerSteps == 1 && scheduler.IsIdle();
}

// --- Level state machine ---

bool TestLevelLifecycle() {
  LevelRig rig;
  if (!rig.ok) {
    return false;
  }
  Level level(LevelDef{"Two", {"s1", "s2"}, 0});

  Signal load = level.Load(rig.services);
  if (level.GetState() != LevelState::Loading ||
      level.GetPendingOperations().size() != 2) {
    return false;
  }
  while (!load.IsDone()) {
    rig.Tick();
    if (!PendingInvariantHolds(level)) {
      return false;
    }
  }
  if (!load.Succeeded() || level.GetState() != LevelState::Loaded ||
      !level.GetPendingOperations().empty() || level.GetStagedCount() != 2) {
    return false;
  }
  // Staged loads are not part of the world yet.
  if (rig.world.IsLoaded("s1") || rig.world.IsLoaded("s2")) {
    return false;
  }

  Signal activate = level.Activate(rig.services);
  if (level.GetState() != LevelState::Activating || !rig.RunUntil(activate) ||
      !activate.Succeeded()) {
    return false;
  }
  if (level.GetState() != LevelState::Active ||
      !level.GetPendingOperations().empty() ||
      rig.world.GetForeground() != "s1" || !rig.world.FindObjectByName("Floor2")) {
    return false;
  }

  Signal deactivate = level.Deactivate(rig.services);
  if (!deactivate.Succeeded() || level.GetState() != LevelState::Deactivated ||
      rig.world.FindObjectByName("Floor1") || rig.world.FindObjectByName("Floor2")) {
    return false;
  }

  Signal unload = level.Unload(rig.services);
  if (level.GetState() != LevelState::Unloading) {
    return false;
  }
  while (!unload.IsDone()) {
    rig.Tick();
    if (!PendingInvariantHolds(level)) {
      return false;
    }
  }
  return unload.Succeeded() && level.GetState() == LevelState::None &&
         level.GetPendingOperations().empty() && !rig.world.IsLoaded("s1") &&
         !rig.world.IsLoaded("s2");
}

bool TestLoadWhileLoadingReturnsSameSignal() {
  LevelRig rig;
  Level level(LevelDef{"A", {"s1"}, 0});
  Signal first = level.Load(rig.services);
  Signal second = level.Load(rig.services);
  if (!(first == second) || first.IsDone()) {
    return false;
  }
  return rig.RunUntil(first) && second.Succeeded() &&
         level.GetState() == LevelState::Loaded;
}

bool TestActivateWhileLoadingIsStateConflict() {
  LevelRig rig;
  Level level(LevelDef{"A", {"s1"}, 0});
  Signal load = level.Load(rig.services);

  Log::ClearRecent();
  Signal activate = level.Activate(rig.services);
  if (!activate.IsDone() || activate.GetError() != LoaderError::StateConflict ||
      level.GetState() != LevelState::Loading || !(level.GetCurrentSignal() == load)) {
    return false;
  }
  return Log::CountRecent("StateConflictError") >= 1 && rig.RunUntil(load) &&
         level.GetState() == LevelState::Loaded;
}

bool TestDeactivateAndUnloadRequireCompatibleState() {
  LevelRig rig;
  Level level(LevelDef{"A", {"s1"}, 0});

  Signal deactivate = level.Deactivate(rig.services);
  Signal unload = level.Unload(rig.services);
  Signal activate = level.Activate(rig.services);
  return deactivate.GetError() == LoaderError::StateConflict &&
         unload.GetError() == LoaderError::StateConflict &&
         activate.GetError() == LoaderError::StateConflict &&
         level.GetState() == LevelState::None && rig.scheduler.IsIdle();
}

bool TestInvalidPrimaryIndexLeavesForegroundUnset() {
  LevelRig rig;
  Level level(LevelDef{"BadIndex", {"s7"}, 5});
  if (!rig.RunUntil(level.Load(rig.services))) {
    return false;
  }
  Log::ClearRecent();
  Signal activate = level.Activate(rig.services);
  if (!rig.RunUntil(activate)) {
    return false;
  }
  return activate.Succeeded() && level.GetState() == LevelState::Active &&
         rig.world.GetForeground().empty() && Log::CountRecent("out of range") == 1;
}

bool TestAlreadyLoadedSegmentIsSkipped() {
  LevelRig rig;
  rig.world.LoadImmediate("s1");
  const std::vector<uint32_t> before = rig.world.RootObjects("s1");

  Level level(LevelDef{"Two", {"s1", "s2"}, 0});
  Signal load = level.Load(rig.services);
  const auto &pending = level.GetPendingOperations();
  if (pending.size() != 2 || !pending[0]->IsDone() || pending[1]->IsDone()) {
    return false;
  }
  if (!rig.RunUntil(load) || !rig.RunUntil(level.Activate(rig.services))) {
    return false;
  }
  // Same objects, not a second copy of the segment.
  return level.GetState() == LevelState::Active &&
         rig.world.RootObjects("s1") == before && rig.world.IsLoaded("s2");
}

bool TestUnloadFromLoadedDiscardsStagedLoads() {
  LevelRig rig;
  Level level(LevelDef{"A", {"s1"}, 0});
  if (!rig.RunUntil(level.Load(rig.services))) {
    return false;
  }
  Signal unload = level.Unload(rig.services);
  if (!rig.RunUntil(unload)) {
    return false;
  }
  for (int i = 0; i < 5; ++i) {
    rig.Tick();
  }
  return unload.Succeeded() && level.GetState() == LevelState::None &&
         level.GetStagedCount() == 0 && !rig.world.IsLoaded("s1") &&
         !rig.world.HasPendingOps();
}

bool TestUnknownSegmentIsResourceFault() {
  LevelRig rig;
  Level level(LevelDef{"Ghost", {"s1", "nope"}, 0});
  Signal load = level.Load(rig.services);
  for (int i = 0; i < 10; ++i) {
    rig.Tick();
  }
  return load.IsDone() && load.GetError() == LoaderError::ResourceFault &&
         level.GetState() == LevelState::None && !rig.world.IsLoaded("s1") &&
         !rig.world.HasPendingOps();
}

// --- Orchestrator ---

bool TestSwitchAToB() {
  Harness h;
  if (!h.ok) {
    return false;
  }
  Signal first = h.Orch().LoadLevel("A", true);
  if (!h.Run(first) || !first.Succeeded()) {
    return false;
  }
  if (!h.SwitchTo("B")) {
    return false;
  }
  const Level *b = h.registry.Find("B");
  return TrackedNames(h.Orch()) == std::vector<std::string>{"B"} &&
         b->GetState() == LevelState::Active && !h.Orch().IsTracked("A") &&
         h.registry.Find("A")->GetState() == LevelState::None &&
         !h.world.IsLoaded("s1") && h.world.IsLoaded("s2") &&
         h.world.GetForeground() == "s2" && h.world.FindObjectByName("Floor2") &&
         !h.world.FindObjectByName("Floor1");
}

bool TestActivateActiveLevelIsNoop() {
  Harness h;
  if (!h.SwitchTo("A") || !h.Run(h.Orch().LoadLevel("B"))) {
    return false;
  }
  const std::vector<std::string> trackedBefore = TrackedNames(h.Orch());
  std::vector<LevelState> statesBefore;
  for (const auto &level : h.registry.GetLevels()) {
    statesBefore.push_back(level->GetState());
  }

  Signal again = h.Orch().ActivateAndUnloadOthers("A");
  if (!again.IsDone() || !again.Succeeded()) {
    return false;
  }
  h.Orch().RunUntilIdle(100);

  std::vector<LevelState> statesAfter;
  for (const auto &level : h.registry.GetLevels()) {
    statesAfter.push_back(level->GetState());
  }
  return TrackedNames(h.Orch()) == trackedBefore && statesAfter == statesBefore;
}

bool TestUnknownLevelLogsConfigurationError() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  const std::vector<std::string> before = TrackedNames(h.Orch());

  Log::ClearRecent();
  Signal signal = h.Orch().ActivateAndUnloadOthers("Unknown");
  if (!signal.IsDone() || signal.GetError() != LoaderError::ConfigurationError) {
    return false;
  }
  Signal load = h.Orch().LoadLevel("AlsoUnknown");
  h.Orch().RunUntilIdle(100);
  return load.GetError() == LoaderError::ConfigurationError &&
         TrackedNames(h.Orch()) == before &&
         h.registry.Find("A")->GetState() == LevelState::Active &&
         Log::CountRecent("ConfigurationError") == 2;
}

bool TestPersistentSentinelSurvivesSwitches() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  const uint32_t sentinel = h.world.Spawn("Sentinel", "s1");
  if (!h.world.MoveToPersistent(sentinel)) {
    return false;
  }
  const world::WorldObject snapshot = *h.world.FindObject(sentinel);

  const char *cycle[] = {"B", "C", "P", "A", "D", "Q", "B", "A", "C", "D"};
  for (const char *target : cycle) {
    if (!h.SwitchTo(target)) {
      return false;
    }
  }
  const world::WorldObject *now = h.world.FindObject(sentinel);
  return now && now->name == snapshot.name && now->container == snapshot.container &&
         now->container == cfg::kPersistentContainer &&
         now->revision == snapshot.revision && now->origin == "s1";
}

bool TestAtMostOneActiveAcrossRandomSwitches() {
  Harness h;
  const char *targets[] = {"A", "B", "C", "D", "P", "Q", "L", "Menu"};
  uint32_t rng = 0xC0FFEEu;

  for (int i = 0; i < 40; ++i) {
    const std::string target = targets[core::NextInt(rng, 7)];
    Signal signal = h.Orch().ActivateAndUnloadOthers(target);
    int ticks = 0;
    while (!signal.IsDone()) {
      h.Orch().Tick();
      if (++ticks > 500 || CountActive(h.registry) > 1) {
        return false;
      }
      for (const auto &level : h.registry.GetLevels()) {
        if (!PendingInvariantHolds(*level)) {
          return false;
        }
      }
    }
    const Level *active = h.Orch().GetActiveLevel();
    if (!signal.Succeeded() || CountActive(h.registry) != 1 || !active ||
        active->GetName() != target ||
        TrackedNames(h.Orch()) != std::vector<std::string>{target}) {
      return false;
    }
  }
  return true;
}

bool TestBootstrapShedAfterSwitch() {
  Harness h;
  if (!h.world.IsLoaded(cfg::kBootstrapSegment) || !h.SwitchTo("A")) {
    return false;
  }
  return !h.world.IsLoaded(cfg::kBootstrapSegment) &&
         !h.world.FindObjectByName("BootSplash");
}

bool TestBootstrapKeptWhenTargetContainsIt() {
  Harness h;
  if (!h.SwitchTo("K") || !h.world.IsLoaded(cfg::kBootstrapSegment) ||
      h.world.GetForeground() != "s8") {
    return false;
  }
  // K's teardown leaves the bootstrap segment; the shed step removes it.
  if (!h.SwitchTo("A")) {
    return false;
  }
  return !h.world.IsLoaded(cfg::kBootstrapSegment) && !h.world.IsLoaded("s8") &&
         !h.Orch().IsTracked("K");
}

bool TestSharedSegmentRetained() {
  Harness h;
  if (!h.SwitchTo("C")) {
    return false;
  }
  const world::WorldObject *prop = h.world.FindObjectByName("SharedProp");
  if (!prop) {
    return false;
  }
  const uint32_t propId = prop->id;

  Signal signal = h.Orch().ActivateAndUnloadOthers("D");
  while (!signal.IsDone()) {
    h.Orch().Tick();
    if (!h.world.IsLoaded("shared") || !h.world.FindObject(propId)) {
      return false;
    }
  }
  return signal.Succeeded() && !h.Orch().IsTracked("C") &&
         !h.world.IsLoaded("s3") && h.world.IsLoaded("s4") &&
         h.world.FindObject(propId) && h.world.GetForeground() == "shared";
}

bool TestPersistentContainerSegmentKept() {
  Harness h;
  if (!h.SwitchTo("P")) {
    return false;
  }
  const world::WorldObject *music = h.world.FindObjectByName("Music");
  if (!music) {
    return false;
  }
  const uint32_t musicId = music->id;
  if (!h.SwitchTo("A")) {
    return false;
  }
  return !h.Orch().IsTracked("P") &&
         h.registry.Find("P")->GetState() == LevelState::None &&
         !h.world.IsLoaded("s5") && h.world.IsLoaded("pc") &&
         h.world.FindObject(musicId) != nullptr;
}

bool TestLoadFaultRevertsAndRetrySucceeds() {
  Harness h;
  Log::ClearRecent();
  Signal first = h.Orch().LoadLevel("F");
  if (!h.Run(first) || first.GetError() != LoaderError::ResourceFault) {
    return false;
  }
  h.Orch().RunUntilIdle(100);
  const Level *f = h.registry.Find("F");
  if (f->GetState() != LevelState::None || h.Orch().IsTracked("F") ||
      Log::CountRecent("ResourceFault") < 1) {
    return false;
  }

  Signal retry = h.Orch().LoadLevel("F");
  return h.Run(retry) && retry.Succeeded() && f->GetState() == LevelState::Loaded &&
         h.Orch().IsTracked("F");
}

bool TestSwitchToFailingLevelKeepsCurrentActive() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  Signal signal = h.Orch().ActivateAndUnloadOthers("F");
  if (!h.Run(signal) || signal.GetError() != LoaderError::ResourceFault) {
    return false;
  }
  h.Orch().RunUntilIdle(100);
  if (h.registry.Find("A")->GetState() != LevelState::Active ||
      h.Orch().IsTracked("F")) {
    return false;
  }
  // The injected fault is spent; re-issuing the call now succeeds.
  return h.SwitchTo("F") && !h.Orch().IsTracked("A");
}

bool TestUnloadAllClearsTrackedSet() {
  Harness h;
  if (!h.SwitchTo("A") || !h.Run(h.Orch().LoadLevel("B"))) {
    return false;
  }
  // C is still loading when UnloadAll is issued.
  h.Orch().LoadLevel("C");
  Signal signal = h.Orch().UnloadAll();
  if (!h.Run(signal) || !signal.Succeeded()) {
    return false;
  }
  for (const char *name : {"A", "B", "C"}) {
    if (h.registry.Find(name)->GetState() != LevelState::None) {
      return false;
    }
  }
  return h.Orch().GetTrackedLevels().empty() && !h.world.IsLoaded("s1") &&
         !h.world.IsLoaded("s2") && !h.world.IsLoaded("s3") &&
         !h.world.IsLoaded("shared");
}

bool TestLightingWaitsForActivation() {
  Harness h;
  if (!h.Run(h.Orch().LoadLevel("A"))) {
    return false;
  }
  h.Orch().MarkLightingDirty();
  Signal signal = h.Orch().ActivateAndUnloadOthers("A");
  if (!h.Orch().IsLightingJobRunning()) {
    return false;
  }

  bool sawActivating = false;
  for (int i = 0; i < 100 && !(signal.IsDone() && h.Orch().IsIdle()); ++i) {
    h.Orch().Tick();
    bool activating = false;
    for (const Level *level : h.Orch().GetTrackedLevels()) {
      activating = activating || level->GetState() == LevelState::Activating;
    }
    sawActivating = sawActivating || activating;
    if (activating && h.world.GetLightingRecomputeCount() == 0 &&
        h.world.IsLightingRecomputeRunning()) {
      return false;
    }
  }
  return sawActivating && signal.Succeeded() &&
         h.world.GetLightingRecomputeCount() == 1 &&
         h.Orch().GetLightingJobsStarted() == 1 && !h.Orch().IsLightingJobRunning();
}

bool TestLightingRequestsCoalesce() {
  Harness h;
  h.Orch().MarkLightingDirty();
  h.Orch().MarkLightingDirty();
  h.Orch().MarkLightingDirty();
  if (h.Orch().GetLightingJobsStarted() != 1) {
    return false;
  }
  h.Orch().RunUntilIdle(200);
  // One follow-up for every request made while the first job ran.
  return h.Orch().GetLightingJobsStarted() == 2 &&
         h.world.GetLightingRecomputeCount() == 2 && !h.Orch().IsLightingJobRunning();
}

bool TestProbeSegmentRaisesLightingDirty() {
  Harness h;
  if (!h.SwitchTo("L")) {
    return false;
  }
  h.Orch().RunUntilIdle(200);
  return h.world.GetLightingRecomputeCount() >= 1 &&
         !h.Orch().IsLightingJobRunning();
}

bool TestSecondOrchestratorRejected() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  Log::ClearRecent();
  {
    loader::Orchestrator second(h.registry, h.world);
    if (second.IsValid()) {
      return false;
    }
    Signal load = second.LoadLevel("B");
    Signal sw = second.ActivateAndUnloadOthers("B");
    Signal all = second.UnloadAll();
    if (load.GetError() != LoaderError::InvariantViolation ||
        sw.GetError() != LoaderError::InvariantViolation ||
        all.GetError() != LoaderError::InvariantViolation) {
      return false;
    }
    if (Log::CountRecent("InvariantViolation") < 4) {
      return false;
    }
  }
  // The first instance is untouched and still drives switches.
  return h.Orch().IsValid() && TrackedNames(h.Orch()) == std::vector<std::string>{"A"} &&
         h.SwitchTo("B");
}

bool TestNewOrchestratorAfterFirstDestroyed() {
  {
    Harness first;
    if (!first.ok) {
      return false;
    }
  }
  Harness second;
  return second.ok && second.SwitchTo("A");
}

bool TestOrchestratorReplacedMidLoad() {
  Harness h;
  Signal load = h.Orch().LoadLevel("A");
  h.Orch().Tick();
  const Level *a = h.registry.Find("A");
  if (a->GetState() != LevelState::Loading) {
    return false;
  }

  h.orchestrator.reset();
  if (!load.IsDone() || load.GetError() != LoaderError::InvariantViolation ||
      a->GetState() != LevelState::None || h.world.HasPendingOps()) {
    return false;
  }

  h.orchestrator = std::make_unique<loader::Orchestrator>(h.registry, h.world);
  return h.Orch().IsValid() && h.SwitchTo("A") &&
         a->GetState() == LevelState::Active &&
         TrackedNames(h.Orch()) == std::vector<std::string>{"A"} &&
         h.world.IsLoaded("s1");
}

bool TestOrchestratorReplacedMidSwitch() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  Signal toB = h.Orch().ActivateAndUnloadOthers("B");
  h.Orch().Tick();
  if (h.registry.Find("B")->GetState() != LevelState::Loading) {
    return false;
  }

  h.orchestrator.reset();
  if (!toB.IsDone() || toB.GetError() != LoaderError::InvariantViolation ||
      h.registry.Find("B")->GetState() != LevelState::None) {
    return false;
  }

  // The replacement picks up the level the first one left Active.
  h.orchestrator = std::make_unique<loader::Orchestrator>(h.registry, h.world);
  if (TrackedNames(h.Orch()) != std::vector<std::string>{"A"}) {
    return false;
  }
  return h.SwitchTo("B") && CountActive(h.registry) == 1 &&
         h.registry.Find("A")->GetState() == LevelState::None &&
         TrackedNames(h.Orch()) == std::vector<std::string>{"B"} &&
         !h.world.IsLoaded("s1");
}

bool TestSameTargetRequestsFold() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  Signal first = h.Orch().ActivateAndUnloadOthers("B");
  Signal second = h.Orch().ActivateAndUnloadOthers("B");
  Signal third = h.Orch().LoadLevel("B", true);
  if (!(first == second) || !(first == third)) {
    return false;
  }
  return h.Run(first) && first.Succeeded() &&
         TrackedNames(h.Orch()) == std::vector<std::string>{"B"};
}

bool TestConcurrentSwitchesEndWithOneActive() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  Signal toB = h.Orch().ActivateAndUnloadOthers("B");
  Signal toD = h.Orch().ActivateAndUnloadOthers("D");
  Signal toC = h.Orch().ActivateAndUnloadOthers("C");
  int ticks = 0;
  while (!(toB.IsDone() && toC.IsDone() && toD.IsDone())) {
    h.Orch().Tick();
    if (++ticks > 2000 || CountActive(h.registry) > 1) {
      return false;
    }
  }
  return toB.Succeeded() && toC.Succeeded() && toD.Succeeded() &&
         CountActive(h.registry) == 1 &&
         h.registry.Find("C")->GetState() == LevelState::Active &&
         TrackedNames(h.Orch()) == std::vector<std::string>{"C"} &&
         h.world.IsLoaded("shared") && !h.world.IsLoaded("s4");
}

bool TestLatestRequestWinsOverEarlierSameTarget() {
  Harness h;
  if (!h.SwitchTo("C")) {
    return false;
  }
  Signal firstA = h.Orch().ActivateAndUnloadOthers("A");
  Signal toB = h.Orch().ActivateAndUnloadOthers("B");
  Signal secondA = h.Orch().ActivateAndUnloadOthers("A");
  if (firstA == secondA) {
    return false;
  }
  if (!h.Run(secondA)) {
    return false;
  }
  return firstA.Succeeded() && toB.Succeeded() && secondA.Succeeded() &&
         h.registry.Find("A")->GetState() == LevelState::Active &&
         h.registry.Find("B")->GetState() == LevelState::None &&
         TrackedNames(h.Orch()) == std::vector<std::string>{"A"};
}

bool TestSwitchDrivesLoadedOtherThroughActivate() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  Signal loadB = h.Orch().LoadLevel("B");
  const Level *b = h.registry.Find("B");
  if (!h.Run(loadB) || b->GetState() != LevelState::Loaded) {
    return false;
  }

  Signal toC = h.Orch().ActivateAndUnloadOthers("C");
  bool sawActive = false;
  bool sawDeactivated = false;
  for (int i = 0; i < 500 && !toC.IsDone(); ++i) {
    h.Orch().Tick();
    if (CountActive(h.registry) > 1) {
      return false;
    }
    sawActive = sawActive || b->GetState() == LevelState::Active;
    sawDeactivated = sawDeactivated || b->GetState() == LevelState::Deactivated;
  }
  return toC.Succeeded() && sawActive && sawDeactivated &&
         b->GetState() == LevelState::None && !h.Orch().IsTracked("B") &&
         !h.world.IsLoaded("s2") &&
         h.registry.Find("C")->GetState() == LevelState::Active &&
         TrackedNames(h.Orch()) == std::vector<std::string>{"C"};
}

bool TestSwitchWaitsOnTargetActivationInFlight() {
  Harness h;
  if (!h.SwitchTo("A")) {
    return false;
  }
  Signal loadB = h.Orch().LoadLevel("B");
  Level *b = h.registry.Find("B");
  if (!h.Run(loadB) || b->GetState() != LevelState::Loaded) {
    return false;
  }

  Log::ClearRecent();
  Signal toB = h.Orch().ActivateAndUnloadOthers("B");
  Signal activate = b->Activate(h.Orch().GetServices());
  if (b->GetState() != LevelState::Activating) {
    return false;
  }
  return h.Run(toB) && toB.Succeeded() && activate.Succeeded() &&
         b->GetCurrentSignal() == activate &&
         b->GetState() == LevelState::Active &&
         TrackedNames(h.Orch()) == std::vector<std::string>{"B"} &&
         !h.world.IsLoaded("s1") && Log::CountRecent("StateConflictError") == 0;
}

bool TestLoadLevelActivateOnLoadedDelegates() {
  Harness h;
  if (!h.SwitchTo("A") || !h.Run(h.Orch().LoadLevel("B"))) {
    return false;
  }
  if (h.registry.Find("B")->GetState() != LevelState::Loaded) {
    return false;
  }
  Signal skip = h.Orch().LoadLevel("B");
  if (!skip.IsDone() || h.registry.Find("B")->GetState() != LevelState::Loaded) {
    return false;
  }
  Signal signal = h.Orch().LoadLevel("B", true);
  return h.Run(signal) && signal.Succeeded() &&
         h.registry.Find("B")->GetState() == LevelState::Active &&
         !h.Orch().IsTracked("A");
}

bool TestAdoptLoadedSegments() {
  Harness h;
  h.world.LoadImmediate("s1");
  h.world.LoadImmediate("s2");
  h.world.SetForeground("s2");

  Level *adopted = h.Orch().AdoptLoadedSegments("EditorSegments");
  if (!adopted || adopted->GetState() != LevelState::Loaded ||
      adopted->GetSegments() != std::vector<std::string>{"s1", "s2"} ||
      adopted->GetPrimaryIndex() != 1 || !h.Orch().IsTracked("EditorSegments")) {
    return false;
  }
  if (h.Orch().AdoptLoadedSegments("EditorSegments") != nullptr) {
    return false;
  }

  if (!h.SwitchTo("A")) {
    return false;
  }
  return !h.Orch().IsTracked("EditorSegments") &&
         adopted->GetState() == LevelState::None && h.world.IsLoaded("s1") &&
         !h.world.IsLoaded("s2") && h.world.FindObjectByName("Floor1");
}

bool TestFindLevelByPredicate() {
  Harness h;
  Level *found = h.Orch().FindLevel(
      [](const Level &level) { return level.ContainsSegment("pc"); });
  Level *none = h.Orch().FindLevel(
      [](const Level &level) { return level.GetSegments().size() > 5; });
  Log::ClearRecent();
  Level *missing = h.Orch().GetLevel("Nope");
  return found && found->GetName() == "P" && none == nullptr &&
         missing == nullptr && Log::CountRecent("ConfigurationError") == 1;
}

bool TestBootPromotesViewpointRig() {
  Harness h;
  Signal boot = loader::Boot(h.Orch(), h.registry);
  if (!h.Run(boot) || !boot.Succeeded()) {
    return false;
  }
  const world::WorldObject *rig = h.world.FindObjectByName(cfg::kViewpointRigObject);
  if (!rig || rig->container != cfg::kPersistentContainer) {
    return false;
  }
  const uint32_t rigId = rig->id;
  if (!h.SwitchTo("A") || !h.SwitchTo("C")) {
    return false;
  }
  return h.world.FindObject(rigId) != nullptr &&
         !h.world.IsLoaded(cfg::kBootstrapSegment) &&
         !h.world.FindObjectByName("BootSplash") &&
         h.registry.Find("C")->GetState() == LevelState::Active;
}

// --- Registry ---

bool TestRegistryParsing() {
  world::World world;
  loader::LevelRegistry registry;
  if (!loader::LoadRegistryFromString(registry, world, kTestRegistry)) {
    return false;
  }
  const Level *d = registry.Find("D");
  const world::SegmentDef *pc = world.FindSegment("pc");
  const world::SegmentDef *s4 = world.FindSegment("s4");
  return registry.Size() == 11 && d &&
         d->GetSegments() == std::vector<std::string>{"s4", "shared"} &&
         d->GetPrimaryIndex() == 1 && registry.Find("L")->GetPrimaryIndex() == -1 &&
         pc && pc->persistentContainer && s4 && s4->loadTicks == 6 &&
         s4->unloadTicks == cfg::kDefaultUnloadTicks &&
         registry.GetBootstrapSegment() == "bootstrap" &&
         registry.GetMainMenuLevel() == "Menu";
}

bool TestRegistryRejectsDuplicatesAndBadJson() {
  world::World world;
  loader::LevelRegistry registry;
  Log::ClearRecent();
  const bool dup = loader::LoadRegistryFromString(
      registry, world,
      R"({"segments": [{"name": "x"}],
          "levels": [{"name": "A", "segments": ["x"]},
                     {"name": "A", "segments": ["x"]}]})");
  if (dup || registry.Size() != 1 || Log::CountRecent("defined twice") != 1) {
    return false;
  }

  loader::LevelRegistry other;
  world::World otherWorld;
  const bool bad = loader::LoadRegistryFromString(other, otherWorld,
                                                  "{\"levels\": [", "broken");
  const bool noLevels =
      loader::LoadRegistryFromString(other, otherWorld, "{\"segments\": []}");
  return !bad && !noLevels && Log::CountRecent("JSON parse error") == 1;
}

bool TestSegmentTicksClamped() {
  world::World world;
  loader::LevelRegistry registry;
  if (!loader::LoadRegistryFromString(
          registry, world,
          R"({"segments": [{"name": "slow", "loadTicks": 2147483647,
                            "loadJitter": 2147483647, "unloadTicks": -4}],
              "levels": [{"name": "Slow", "segments": ["slow"]}]})")) {
    return false;
  }
  const world::SegmentDef *slow = world.FindSegment("slow");
  if (!slow || slow->loadTicks != cfg::kMaxSegmentTicks ||
      slow->loadJitter != cfg::kMaxSegmentTicks || slow->unloadTicks != 0) {
    return false;
  }

  uint32_t rng = 0xC0FFEEu;
  for (int i = 0; i < 64; ++i) {
    const int value = core::NextInt(rng, std::numeric_limits<int>::max());
    if (value < 0) {
      return false;
    }
  }
  return world.BeginLoad("slow") != nullptr;
}

bool TestRegistryTypeErrorLeavesStateUntouched() {
  world::World world;
  loader::LevelRegistry registry;
  Log::ClearRecent();
  const bool ok = loader::LoadRegistryFromString(
      registry, world,
      R"({"mainMenu": "A",
          "segments": [{"name": "x"}],
          "levels": [{"name": "A", "segments": ["x"]},
                     {"name": 7, "segments": ["x"]}]})",
      "typed");
  return !ok && world.FindSegment("x") == nullptr && registry.Size() == 0 &&
         registry.GetMainMenuLevel() == cfg::kMainMenuLevel &&
         Log::CountRecent("JSON type error") == 1;
}

bool TestValidateRegistry() {
  world::World world;
  loader::LevelRegistry registry;
  if (!loader::LoadRegistryFromString(registry, world, kTestRegistry)) {
    return false;
  }
  // BadIndex carries an out-of-range activeIndex.
  if (loader::ValidateRegistry(registry, world)) {
    return false;
  }

  world::World cleanWorld;
  loader::LevelRegistry clean;
  if (!loader::LoadRegistryFromString(
          clean, cleanWorld,
          R"({"mainMenu": "M",
              "segments": [{"name": "bootstrap"}, {"name": "m"}],
              "levels": [{"name": "M", "segments": ["m"], "activeIndex": 0}]})")) {
    return false;
  }
  if (!loader::ValidateRegistry(clean, cleanWorld)) {
    return false;
  }
  clean.Add(LevelDef{"Ghost", {"missing"}, 0});
  return !loader::ValidateRegistry(clean, cleanWorld);
}

} // namespace

int main() {
  Log::Init("loader_tests.log");
  int failed = 0;
  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("signal_basics", TestSignalBasics());
  run("scheduler_defers_jobs_started_during_tick",
      TestSchedulerDefersJobsStartedDuringTick());
  run("level_lifecycle", TestLevelLifecycle());
  run("load_while_loading_returns_same_signal",
      TestLoadWhileLoadingReturnsSameSignal());
  run("activate_while_loading_is_state_conflict",
      TestActivateWhileLoadingIsStateConflict());
  run("deactivate_and_unload_require_compatible_state",
      TestDeactivateAndUnloadRequireCompatibleState());
  run("invalid_primary_index_leaves_foreground_unset",
      TestInvalidPrimaryIndexLeavesForegroundUnset());
  run("already_loaded_segment_is_skipped", TestAlreadyLoadedSegmentIsSkipped());
  run("unload_from_loaded_discards_staged_loads",
      TestUnloadFromLoadedDiscardsStagedLoads());
  run("unknown_segment_is_resource_fault", TestUnknownSegmentIsResourceFault());
  run("switch_a_to_b", TestSwitchAToB());
  run("activate_active_level_is_noop", TestActivateActiveLevelIsNoop());
  run("unknown_level_logs_configuration_error",
      TestUnknownLevelLogsConfigurationError());
  run("persistent_sentinel_survives_switches",
      TestPersistentSentinelSurvivesSwitches());
  run("at_most_one_active_across_random_switches",
      TestAtMostOneActiveAcrossRandomSwitches());
  run("bootstrap_shed_after_switch", TestBootstrapShedAfterSwitch());
  run("bootstrap_kept_when_target_contains_it",
      TestBootstrapKeptWhenTargetContainsIt());
  run("shared_segment_retained", TestSharedSegmentRetained());
  run("persistent_container_segment_kept", TestPersistentContainerSegmentKept());
  run("load_fault_reverts_and_retry_succeeds",
      TestLoadFaultRevertsAndRetrySucceeds());
  run("switch_to_failing_level_keeps_current_active",
      TestSwitchToFailingLevelKeepsCurrentActive());
  run("unload_all_clears_tracked_set", TestUnloadAllClearsTrackedSet());
  run("lighting_waits_for_activation", TestLightingWaitsForActivation());
  run("lighting_requests_coalesce", TestLightingRequestsCoalesce());
  run("probe_segment_raises_lighting_dirty",
      TestProbeSegmentRaisesLightingDirty());
  run("second_orchestrator_rejected", TestSecondOrchestratorRejected());
  run("new_orchestrator_after_first_destroyed",
      TestNewOrchestratorAfterFirstDestroyed());
  run("orchestrator_replaced_mid_load", TestOrchestratorReplacedMidLoad());
  run("orchestrator_replaced_mid_switch", TestOrchestratorReplacedMidSwitch());
  run("same_target_requests_fold", TestSameTargetRequestsFold());
  run("concurrent_switches_end_with_one_active",
      TestConcurrentSwitchesEndWithOneActive());
  run("latest_request_wins_over_earlier_same_target",
      TestLatestRequestWinsOverEarlierSameTarget());
  run("switch_drives_loaded_other_through_activate",
      TestSwitchDrivesLoadedOtherThroughActivate());
  run("switch_waits_on_target_activation_in_flight",
      TestSwitchWaitsOnTargetActivationInFlight());
  run("load_level_activate_on_loaded_delegates",
      TestLoadLevelActivateOnLoadedDelegates());
  run("adopt_loaded_segments", TestAdoptLoadedSegments());
  run("find_level_by_predicate", TestFindLevelByPredicate());
  run("boot_promotes_viewpoint_rig", TestBootPromotesViewpointRig());
  run("registry_parsing", TestRegistryParsing());
  run("registry_rejects_duplicates_and_bad_json",
      TestRegistryRejectsDuplicatesAndBadJson());
  run("segment_ticks_clamped", TestSegmentTicksClamped());
  run("registry_type_error_leaves_state_untouched",
      TestRegistryTypeErrorLeavesStateUntouched());
  run("validate_registry", TestValidateRegistry());

  Log::Shutdown();
  return (failed == 0) ? 0 : 1;
}
