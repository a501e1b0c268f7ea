#include "loader/Orchestrator.hpp"

#include "core/Log.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace loader {

bool Orchestrator::s_Live = false;

enum class SwitchPhase {
  WaitTurn,
  Resolve,
  AwaitTarget,
  Quiesce,
  ActivateTarget,
  AwaitActivation,
  UnloadOthers,
  ShedBootstrap,
};

struct Orchestrator::SwitchTask {
  Level *target = nullptr;
  Signal done;
  Signal previous;
  Signal waitOn;
  bool hasPendingLoad = false;
  SwitchPhase phase = SwitchPhase::WaitTurn;
  std::set<std::string> retain;
  std::set<Level *> activationTried;
  std::vector<std::pair<Level *, Signal>> unloads;
  bool unloadsStarted = false;
  bool unloadFault = false;
  world::SegmentOpPtr shedOp;
  bool shedStarted = false;
  uint64_t startTick = 0;
};

enum class UnloadAllPhase { WaitTurn, Settle, AwaitUnloads };

struct Orchestrator::UnloadAllTask {
  Signal done;
  Signal previous;
  UnloadAllPhase phase = UnloadAllPhase::WaitTurn;
  std::vector<std::pair<Level *, Signal>> unloads;
};

enum class LightingPhase { WaitActivations, Yield, AwaitRecompute };

struct Orchestrator::LightingTask {
  LightingPhase phase = LightingPhase::WaitActivations;
  world::SegmentOpPtr op;
};

Orchestrator::Orchestrator(LevelRegistry &registry, world::World &world)
    : registry(registry), world(world),
      guard(world, registry.GetBootstrapSegment()), loader(world, guard),
      services{loader, scheduler, guard} {
  if (s_Live) {
    LOG_ERROR("InvariantViolation: an orchestrator is already alive, this "
              "instance rejects every call");
    return;
  }
  s_Live = true;
  valid = true;
  // Levels left loaded by an earlier instance stay under management.
  for (const auto &level : registry.GetLevels()) {
    if (level->GetState() != LevelState::None) {
      Track(level.get());
    }
  }
  world.SetLightingDirtyCallback([this]() { MarkLightingDirty(); });
  LOG_INFO("Orchestrator: ready ({} level(s), bootstrap '{}')", registry.Size(),
           guard.GetOwnSegment());
}

Orchestrator::~Orchestrator() {
  if (!valid) {
    return;
  }
  world.SetLightingDirtyCallback(nullptr);
  // The scheduler goes with this instance; nothing may be left waiting on it.
  for (Level *level : tracked) {
    level->Abandon(services);
  }
  for (Signal &sequence : queuedSequences) {
    sequence.Fail(LoaderError::InvariantViolation);
  }
  s_Live = false;
}

Signal Orchestrator::Reject(LoaderError error, const char *call,
                            const std::string &name) const {
  LOG_ERROR("{}: {}('{}') rejected, orchestrator is not valid",
            LoaderErrorName(error), call, name);
  return Signal::Rejected(error);
}

Level *Orchestrator::GetLevel(const std::string &name) const {
  Level *level = registry.Find(name);
  if (!level) {
    LOG_ERROR("ConfigurationError: level '{}' not found in registry", name);
  }
  return level;
}

Level *Orchestrator::FindLevel(
    const std::function<bool(const Level &)> &predicate) const {
  return registry.FindIf(predicate);
}

bool Orchestrator::IsTracked(const std::string &name) const {
  for (const Level *level : tracked) {
    if (level->GetName() == name) {
      return true;
    }
  }
  return false;
}

Level *Orchestrator::GetActiveLevel() const {
  for (Level *level : tracked) {
    if (level->GetState() == LevelState::Active) {
      return level;
    }
  }
  return nullptr;
}

bool Orchestrator::IsIdle() const {
  return scheduler.IsIdle() && !world.HasPendingOps();
}

void Orchestrator::Track(Level *level) {
  if (std::find(tracked.begin(), tracked.end(), level) == tracked.end()) {
    tracked.push_back(level);
  }
}

void Orchestrator::Untrack(Level *level) {
  tracked.erase(std::remove(tracked.begin(), tracked.end(), level),
                tracked.end());
}

void Orchestrator::Enqueue(const Signal &sequence) {
  queuedSequences.erase(std::remove_if(queuedSequences.begin(),
                                       queuedSequences.end(),
                                       [](const Signal &queued) {
                                         return queued.IsDone();
                                       }),
                        queuedSequences.end());
  queuedSequences.push_back(sequence);
  lastSequence = sequence;
}

// A switch to `name` can absorb a new request only while nothing else is
// queued behind it.
Signal *Orchestrator::FindFoldableSwitch(const std::string &name) {
  auto it = switchesInFlight.find(name);
  if (it == switchesInFlight.end() || it->second.IsDone() ||
      it->second != lastSequence) {
    return nullptr;
  }
  return &it->second;
}

bool Orchestrator::AnyActivating() const {
  for (const Level *level : tracked) {
    if (level->GetState() == LevelState::Activating) {
      return true;
    }
  }
  return false;
}

// --- Loop ---

void Orchestrator::Tick() {
  if (!valid) {
    return;
  }
  ++tickCount;
  world.Tick();
  scheduler.Tick();
}

bool Orchestrator::RunUntil(const Signal &signal, int maxTicks) {
  int ticks = 0;
  while (!signal.IsDone()) {
    if (ticks >= maxTicks) {
      LOG_WARN("RunUntil: signal still pending after {} ticks", ticks);
      return false;
    }
    Tick();
    ++ticks;
  }
  return true;
}

bool Orchestrator::RunUntilIdle(int maxTicks) {
  int ticks = 0;
  while (valid && !IsIdle()) {
    if (ticks >= maxTicks) {
      LOG_WARN("RunUntilIdle: still busy after {} ticks", ticks);
      return false;
    }
    Tick();
    ++ticks;
  }
  return true;
}

// --- LoadLevel ---

Signal Orchestrator::LoadLevel(const std::string &name, bool activateOnLoad) {
  if (!valid) {
    return Reject(LoaderError::InvariantViolation, "LoadLevel", name);
  }
  Level *level = GetLevel(name);
  if (!level) {
    return Signal::Rejected(LoaderError::ConfigurationError);
  }

  const LevelState state = level->GetState();
  if (state != LevelState::None) {
    if (activateOnLoad &&
        (state == LevelState::Loaded || state == LevelState::Loading)) {
      return ActivateAndUnloadOthers(name);
    }
    LOG_DEBUG("LoadLevel('{}'): already {}, not reloading", name,
              LevelStateName(state));
    return level->GetCurrentSignal();
  }

  Signal load = level->Load(services);
  if (load.IsDone() && !load.Succeeded()) {
    return load;
  }
  Track(level);

  // A level whose load fails leaves the tracked set.
  scheduler.Start("Track " + name, [this, level, load]() {
    if (!load.IsDone()) {
      return false;
    }
    if (!load.Succeeded() && level->GetState() == LevelState::None) {
      Untrack(level);
    }
    return true;
  });

  if (!activateOnLoad) {
    return load;
  }
  if (Signal *fold = FindFoldableSwitch(name)) {
    return *fold;
  }
  return StartSwitch(level, &load);
}

// --- ActivateAndUnloadOthers ---

Signal Orchestrator::ActivateAndUnloadOthers(const std::string &name) {
  if (!valid) {
    return Reject(LoaderError::InvariantViolation, "ActivateAndUnloadOthers",
                  name);
  }
  Level *target = GetLevel(name);
  if (!target) {
    return Signal::Rejected(LoaderError::ConfigurationError);
  }

  if (Signal *fold = FindFoldableSwitch(name)) {
    LOG_DEBUG("ActivateAndUnloadOthers('{}'): joining the switch in flight",
              name);
    return *fold;
  }

  // With nothing queued ahead, answer from the current state.
  if (lastSequence.IsDone()) {
    const LevelState state = target->GetState();
    if (state == LevelState::Active) {
      LOG_DEBUG("ActivateAndUnloadOthers('{}'): already active", name);
      return Signal::Completed();
    }
    if (state == LevelState::Deactivated || state == LevelState::Unloading) {
      LOG_ERROR("StateConflictError: cannot activate level '{}' from state {}",
                name, LevelStateName(state));
      return Signal::Rejected(LoaderError::StateConflict);
    }
  }
  return StartSwitch(target, nullptr);
}

Signal Orchestrator::StartSwitch(Level *target, const Signal *pendingLoad) {
  auto task = std::make_shared<SwitchTask>();
  task->target = target;
  task->done = Signal::MakePending();
  task->previous = lastSequence;
  task->startTick = tickCount;
  if (pendingLoad) {
    task->waitOn = *pendingLoad;
    task->hasPendingLoad = true;
  }

  Enqueue(task->done);
  switchesInFlight[target->GetName()] = task->done;
  LOG_INFO("Switch to '{}' requested", target->GetName());

  scheduler.Start("Switch " + target->GetName(),
                  [this, task]() { return StepSwitch(*task); });
  return task->done;
}

void Orchestrator::FinishSwitch(SwitchTask &task, LoaderError error) {
  const std::string &name = task.target->GetName();
  if (error == LoaderError::None) {
    LOG_INFO("Switch to '{}' complete in {} tick(s)", name,
             tickCount - task.startTick);
    task.done.Resolve();
  } else {
    LOG_ERROR("{}: switch to '{}' aborted", LoaderErrorName(error), name);
    task.done.Fail(error);
  }
  auto it = switchesInFlight.find(name);
  if (it != switchesInFlight.end() && it->second == task.done) {
    switchesInFlight.erase(it);
  }
}

bool Orchestrator::StepSwitch(SwitchTask &task) {
  Level *target = task.target;
  for (;;) {
    switch (task.phase) {
    case SwitchPhase::WaitTurn:
      if (!task.previous.IsDone()) {
        return false;
      }
      task.retain = target->SegmentSet();
      task.phase = task.hasPendingLoad ? SwitchPhase::AwaitTarget
                                       : SwitchPhase::Resolve;
      break;

    case SwitchPhase::Resolve:
      switch (target->GetState()) {
      case LevelState::Active:
        // Others may still be up; the usual teardown runs.
        LOG_DEBUG("Switch to '{}': already active", target->GetName());
        task.phase = SwitchPhase::Quiesce;
        break;
      case LevelState::Activating:
      case LevelState::Loading:
        task.waitOn = target->GetCurrentSignal();
        task.phase = SwitchPhase::AwaitTarget;
        break;
      case LevelState::None:
        task.waitOn = target->Load(services);
        if (task.waitOn.IsDone() && !task.waitOn.Succeeded()) {
          FinishSwitch(task, task.waitOn.GetError());
          return true;
        }
        Track(target);
        task.phase = SwitchPhase::AwaitTarget;
        break;
      case LevelState::Loaded:
        task.phase = SwitchPhase::Quiesce;
        break;
      case LevelState::Deactivated:
      case LevelState::Unloading:
        LOG_ERROR("StateConflictError: cannot activate level '{}' from state {}",
                  target->GetName(), LevelStateName(target->GetState()));
        FinishSwitch(task, LoaderError::StateConflict);
        return true;
      }
      break;

    case SwitchPhase::AwaitTarget:
      if (!task.waitOn.IsDone()) {
        return false;
      }
      if (!task.waitOn.Succeeded()) {
        if (target->GetState() == LevelState::None) {
          Untrack(target);
        }
        FinishSwitch(task, task.waitOn.GetError());
        return true;
      }
      task.phase = SwitchPhase::Quiesce;
      break;

    case SwitchPhase::Quiesce:
      if (!QuiesceOthers(task)) {
        return false;
      }
      task.phase = SwitchPhase::ActivateTarget;
      break;

    case SwitchPhase::ActivateTarget:
      if (target->GetState() == LevelState::Active) {
        task.phase = SwitchPhase::UnloadOthers;
        break;
      }
      if (target->GetState() != LevelState::Loaded) {
        LOG_ERROR("StateConflictError: level '{}' is {} when it should be "
                  "activated",
                  target->GetName(), LevelStateName(target->GetState()));
        FinishSwitch(task, LoaderError::StateConflict);
        return true;
      }
      task.waitOn = target->Activate(services);
      task.phase = SwitchPhase::AwaitActivation;
      break;

    case SwitchPhase::AwaitActivation:
      if (!task.waitOn.IsDone()) {
        return false;
      }
      if (!task.waitOn.Succeeded()) {
        FinishSwitch(task, task.waitOn.GetError());
        return true;
      }
      task.phase = SwitchPhase::UnloadOthers;
      break;

    case SwitchPhase::UnloadOthers:
      if (!task.unloadsStarted) {
        task.unloadsStarted = true;
        const std::vector<Level *> snapshot = tracked;
        for (Level *other : snapshot) {
          if (other == target) {
            continue;
          }
          const LevelState state = other->GetState();
          if (state == LevelState::Deactivated || state == LevelState::Loaded) {
            task.unloads.emplace_back(other,
                                      other->Unload(services, task.retain));
          } else if (state == LevelState::Unloading) {
            task.unloads.emplace_back(other, other->GetCurrentSignal());
          }
        }
      }
      for (const auto &entry : task.unloads) {
        if (!entry.second.IsDone()) {
          return false;
        }
      }
      for (const auto &entry : task.unloads) {
        if (entry.second.Succeeded() &&
            entry.first->GetState() == LevelState::None) {
          Untrack(entry.first);
        } else if (!entry.second.Succeeded()) {
          task.unloadFault = true;
        }
      }
      task.phase = SwitchPhase::ShedBootstrap;
      break;

    case SwitchPhase::ShedBootstrap:
      if (!task.shedStarted) {
        task.shedStarted = true;
        const std::string &own = guard.GetOwnSegment();
        if (world.IsLoaded(own) && !target->ContainsSegment(own)) {
          task.shedOp = loader.BeginUnload(own);
          if (task.shedOp) {
            LOG_INFO("Shedding bootstrap segment '{}'", own);
          }
        }
      }
      if (task.shedOp && !task.shedOp->IsDone()) {
        return false;
      }
      FinishSwitch(task, task.unloadFault ? LoaderError::ResourceFault
                                          : LoaderError::None);
      return true;
    }
  }
}

// Brings every other tracked level to a quiet state, latest first. Returns
// true once none is Active or mid-transition.
bool Orchestrator::QuiesceOthers(SwitchTask &task) {
  // Leave Active before anything else is activated.
  for (Level *other : tracked) {
    if (other != task.target && other->GetState() == LevelState::Active) {
      other->Deactivate(services, task.retain);
    }
  }

  const std::vector<Level *> snapshot = tracked;
  for (auto it = snapshot.rbegin(); it != snapshot.rend(); ++it) {
    Level *other = *it;
    if (other == task.target) {
      continue;
    }
    switch (other->GetState()) {
    case LevelState::Loading:
    case LevelState::Activating:
    case LevelState::Unloading:
      return false;
    case LevelState::Loaded:
      // A failed activation leaves it Loaded; it is unloaded from there.
      if (task.activationTried.insert(other).second) {
        other->Activate(services);
        return false;
      }
      break;
    case LevelState::Active:
      other->Deactivate(services, task.retain);
      break;
    case LevelState::None:
    case LevelState::Deactivated:
      break;
    }
  }
  return true;
}

// --- UnloadAll ---

Signal Orchestrator::UnloadAll() {
  if (!valid) {
    return Reject(LoaderError::InvariantViolation, "UnloadAll", "");
  }

  auto task = std::make_shared<UnloadAllTask>();
  task->done = Signal::MakePending();
  task->previous = lastSequence;
  Enqueue(task->done);
  LOG_INFO("UnloadAll requested ({} tracked)", tracked.size());

  scheduler.Start("UnloadAll", [this, task]() { return StepUnloadAll(*task); });
  return task->done;
}

bool Orchestrator::StepUnloadAll(UnloadAllTask &task) {
  switch (task.phase) {
  case UnloadAllPhase::WaitTurn:
    if (!task.previous.IsDone()) {
      return false;
    }
    task.phase = UnloadAllPhase::Settle;
    [[fallthrough]];
  case UnloadAllPhase::Settle: {
    for (const Level *level : tracked) {
      const LevelState state = level->GetState();
      if (state == LevelState::Loading || state == LevelState::Activating ||
          state == LevelState::Unloading) {
        return false;
      }
    }
    const std::vector<Level *> snapshot = tracked;
    for (Level *level : snapshot) {
      if (level->GetState() == LevelState::Active) {
        level->Deactivate(services);
      }
      const LevelState state = level->GetState();
      if (state == LevelState::Deactivated || state == LevelState::Loaded) {
        task.unloads.emplace_back(level, level->Unload(services));
      } else if (state == LevelState::None) {
        Untrack(level);
      }
    }
    task.phase = UnloadAllPhase::AwaitUnloads;
    return false;
  }
  case UnloadAllPhase::AwaitUnloads:
    break;
  }

  for (const auto &entry : task.unloads) {
    if (!entry.second.IsDone()) {
      return false;
    }
  }
  bool fault = false;
  for (const auto &entry : task.unloads) {
    if (entry.second.Succeeded() &&
        entry.first->GetState() == LevelState::None) {
      Untrack(entry.first);
    } else {
      fault = true;
    }
  }
  if (fault) {
    LOG_ERROR("ResourceFault: UnloadAll left {} level(s) tracked",
              tracked.size());
    task.done.Fail(LoaderError::ResourceFault);
  } else {
    LOG_INFO("UnloadAll complete");
    task.done.Resolve();
  }
  return true;
}

// --- Lighting ---

void Orchestrator::MarkLightingDirty() {
  if (!valid) {
    LOG_ERROR("InvariantViolation: MarkLightingDirty() on an invalid "
              "orchestrator");
    return;
  }
  if (lightingRunning) {
    lightingFollowUp = true;
    return;
  }
  StartLightingJob();
}

void Orchestrator::StartLightingJob() {
  lightingRunning = true;
  ++lightingJobs;
  auto task = std::make_shared<LightingTask>();
  scheduler.Start("Lighting recompute",
                  [this, task]() { return StepLighting(*task); });
}

bool Orchestrator::StepLighting(LightingTask &task) {
  switch (task.phase) {
  case LightingPhase::WaitActivations:
    if (!AnyActivating()) {
      task.phase = LightingPhase::Yield;
    }
    return false;
  case LightingPhase::Yield:
    if (AnyActivating()) {
      task.phase = LightingPhase::WaitActivations;
      return false;
    }
    task.op = world.BeginLightingRecompute();
    task.phase = LightingPhase::AwaitRecompute;
    return false;
  case LightingPhase::AwaitRecompute:
    if (!task.op->IsDone()) {
      return false;
    }
    break;
  }

  lightingRunning = false;
  if (lightingFollowUp) {
    lightingFollowUp = false;
    StartLightingJob();
  }
  return true;
}

// --- Adoption ---

Level *Orchestrator::AdoptLoadedSegments(const std::string &name) {
  if (!valid) {
    LOG_ERROR("InvariantViolation: AdoptLoadedSegments('{}') on an invalid "
              "orchestrator",
              name);
    return nullptr;
  }

  LevelDef def;
  def.name = name;
  for (const auto &segment : world.LoadedSegments()) {
    if (segment == guard.GetOwnSegment()) {
      continue;
    }
    if (segment == world.GetForeground()) {
      def.activeIndex = static_cast<int>(def.segments.size());
    }
    def.segments.push_back(segment);
  }
  if (def.segments.empty()) {
    LOG_WARN("AdoptLoadedSegments('{}'): nothing loaded to adopt", name);
    return nullptr;
  }

  Level *level = registry.Add(std::move(def));
  if (!level) {
    return nullptr;
  }
  level->MarkAdopted();
  Track(level);
  LOG_INFO("Adopted {} loaded segment(s) as level '{}'",
           level->GetSegments().size(), name);
  return level;
}

} // namespace loader
