#include "loader/Level.hpp"

#include "core/Log.hpp"

#include <algorithm>

namespace loader {

const char *LevelStateName(LevelState state) {
  switch (state) {
  case LevelState::None:
    return "None";
  case LevelState::Loading:
    return "Loading";
  case LevelState::Loaded:
    return "Loaded";
  case LevelState::Activating:
    return "Activating";
  case LevelState::Active:
    return "Active";
  case LevelState::Deactivated:
    return "Deactivated";
  case LevelState::Unloading:
    return "Unloading";
  }
  return "Unknown";
}

Level::Level(LevelDef def)
    : name(std::move(def.name)), segments(std::move(def.segments)),
      primaryIndex(def.activeIndex) {}

bool Level::ContainsSegment(const std::string &segment) const {
  return std::find(segments.begin(), segments.end(), segment) != segments.end();
}

std::set<std::string> Level::SegmentSet() const {
  return std::set<std::string>(segments.begin(), segments.end());
}

Signal Level::Conflict(const char *call) {
  LOG_ERROR("StateConflictError: {}() on level '{}' in state {}", call, name,
            LevelStateName(state));
  return Signal::Rejected(LoaderError::StateConflict);
}

Signal Level::Load(const LevelServices &services) {
  if (state == LevelState::Loading) {
    return signal;
  }
  if (state != LevelState::None) {
    return Conflict("Load");
  }

  std::vector<world::SegmentOpPtr> ops;
  ops.reserve(segments.size());
  for (const auto &segment : segments) {
    world::SegmentOpPtr op = services.loader.BeginLoad(segment);
    if (!op) {
      for (const auto &started : ops) {
        services.loader.Discard(started);
      }
      LOG_ERROR("ResourceFault: level '{}' could not start loading '{}'", name,
                segment);
      return Signal::Rejected(LoaderError::ResourceFault);
    }
    ops.push_back(std::move(op));
  }

  state = LevelState::Loading;
  pending = std::move(ops);
  staged.clear();
  signal = Signal::MakePending();
  LOG_INFO("Level '{}': loading {} segment(s)", name, segments.size());

  Signal done = signal;
  services.scheduler.Start("Load " + name, [this, services, done]() {
    return StepLoad(services, done);
  });
  return signal;
}

bool Level::StepLoad(const LevelServices &services, Signal done) {
  if (done != signal || state != LevelState::Loading) {
    return true;
  }

  bool allReady = true;
  for (const auto &op : pending) {
    if (op->Failed() || op->IsDiscarded()) {
      for (const auto &other : pending) {
        services.loader.Discard(other);
      }
      pending.clear();
      state = LevelState::None;
      LOG_ERROR("ResourceFault: level '{}' failed to load segment '{}'", name,
                op->GetSegment());
      done.Fail(LoaderError::ResourceFault);
      return true;
    }
    if (!op->ReadyToFinalize()) {
      allReady = false;
    }
  }
  if (!allReady) {
    return false;
  }

  staged = std::move(pending);
  pending.clear();
  state = LevelState::Loaded;
  LOG_INFO("Level '{}': loaded", name);
  done.Resolve();
  return true;
}

Signal Level::Activate(const LevelServices &services) {
  if (state == LevelState::Activating) {
    return signal;
  }
  if (state != LevelState::Loaded) {
    return Conflict("Activate");
  }

  state = LevelState::Activating;
  pending = std::move(staged);
  staged.clear();
  for (const auto &op : pending) {
    op->AllowActivation(true);
  }
  signal = Signal::MakePending();

  Signal done = signal;
  services.scheduler.Start("Activate " + name, [this, services, done]() {
    return StepActivate(services, done);
  });
  return signal;
}

bool Level::StepActivate(const LevelServices &services, Signal done) {
  if (done != signal || state != LevelState::Activating) {
    return true;
  }

  bool allDone = true;
  for (const auto &op : pending) {
    if (op->Failed() || op->IsDiscarded()) {
      for (const auto &other : pending) {
        if (other->ReadyToFinalize()) {
          staged.push_back(other);
        }
      }
      pending.clear();
      state = LevelState::Loaded;
      LOG_ERROR("ResourceFault: level '{}' failed to activate segment '{}'",
                name, op->GetSegment());
      done.Fail(LoaderError::ResourceFault);
      return true;
    }
    if (!op->IsDone()) {
      allDone = false;
    }
  }
  if (!allDone) {
    return false;
  }

  pending.clear();
  state = LevelState::Active;
  SelectForeground(services.loader.GetWorld());
  LOG_INFO("Level '{}': active", name);
  done.Resolve();
  return true;
}

void Level::SelectForeground(world::World &world) {
  if (primaryIndex == -1) {
    return;
  }
  if (primaryIndex < 0 || primaryIndex >= static_cast<int>(segments.size())) {
    LOG_ERROR("Level '{}': primary index {} out of range ({} segments), "
              "foreground left unset",
              name, primaryIndex, segments.size());
    return;
  }
  const std::string &segment = segments[primaryIndex];
  if (!world.SetForeground(segment)) {
    LOG_ERROR("Level '{}': segment '{}' not loaded, cannot set as foreground",
              name, segment);
  }
}

Signal Level::Deactivate(const LevelServices &services,
                         const std::set<std::string> &retain) {
  if (state != LevelState::Active) {
    return Conflict("Deactivate");
  }

  world::World &world = services.loader.GetWorld();
  int destroyed = 0;
  for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
    const std::string &segment = *it;
    if (segment == services.guard.GetOwnSegment() || retain.count(segment) ||
        !world.IsLoaded(segment)) {
      continue;
    }
    for (uint32_t id : world.RootObjects(segment)) {
      if (services.guard.IsProtected(id)) {
        continue;
      }
      if (world.Destroy(id)) {
        ++destroyed;
      }
    }
  }

  state = LevelState::Deactivated;
  signal = Signal::Completed();
  LOG_INFO("Level '{}': deactivated ({} object(s) destroyed)", name, destroyed);
  return signal;
}

Signal Level::Unload(const LevelServices &services,
                     const std::set<std::string> &retain) {
  if (state == LevelState::Unloading) {
    return signal;
  }
  if (state != LevelState::Deactivated && state != LevelState::Loaded) {
    return Conflict("Unload");
  }

  const LevelState previous = state;
  for (const auto &op : staged) {
    services.loader.Discard(op);
  }
  staged.clear();

  std::vector<world::SegmentOpPtr> ops;
  for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
    const std::string &segment = *it;
    if (segment == services.guard.GetOwnSegment()) {
      continue;
    }
    if (retain.count(segment)) {
      LOG_DEBUG("Level '{}': keeping '{}', still referenced", name, segment);
      continue;
    }
    if (world::SegmentOpPtr op = services.loader.BeginUnload(segment)) {
      ops.push_back(std::move(op));
    }
  }

  state = LevelState::Unloading;
  pending = std::move(ops);
  signal = Signal::MakePending();
  LOG_INFO("Level '{}': unloading {} segment(s)", name, pending.size());

  Signal done = signal;
  services.scheduler.Start("Unload " + name, [this, previous, done]() {
    return StepUnload(previous, done);
  });
  return signal;
}

bool Level::StepUnload(LevelState previous, Signal done) {
  if (done != signal || state != LevelState::Unloading) {
    return true;
  }

  bool allDone = true;
  for (const auto &op : pending) {
    if (op->Failed()) {
      pending.clear();
      state = previous;
      LOG_ERROR("ResourceFault: level '{}' failed to unload segment '{}'",
                name, op->GetSegment());
      done.Fail(LoaderError::ResourceFault);
      return true;
    }
    if (!op->IsDone()) {
      allDone = false;
    }
  }
  if (!allDone) {
    return false;
  }

  pending.clear();
  state = LevelState::None;
  LOG_INFO("Level '{}': unloaded", name);
  done.Resolve();
  return true;
}

bool Level::MarkAdopted() {
  if (state != LevelState::None) {
    return false;
  }
  state = LevelState::Loaded;
  staged.clear();
  signal = Signal::Completed();
  return true;
}

void Level::Abandon(const LevelServices &services) {
  switch (state) {
  case LevelState::Loading:
    for (const auto &op : pending) {
      services.loader.Discard(op);
    }
    state = LevelState::None;
    break;
  case LevelState::Activating:
    // Activation stays allowed, so these finalize on their own.
    for (const auto &op : pending) {
      if (op->ReadyToFinalize()) {
        staged.push_back(op);
      }
    }
    state = LevelState::Loaded;
    break;
  case LevelState::Unloading:
    // Unloads already started still complete in the world.
    state = LevelState::None;
    break;
  case LevelState::None:
  case LevelState::Loaded:
  case LevelState::Active:
  case LevelState::Deactivated:
    return;
  }
  pending.clear();
  LOG_WARN("Level '{}': transition abandoned, now {}", name,
           LevelStateName(state));
  signal.Fail(LoaderError::InvariantViolation);
}

} // namespace loader
