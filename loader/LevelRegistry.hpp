#pragma once

#include "core/Config.hpp"
#include "loader/Level.hpp"
#include "world/World.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace loader {

// Static catalog of every known level. Owns the Level objects; everything
// else refers to them by pointer.
class LevelRegistry {
public:
  // Returns nullptr (and logs) on an empty or duplicate name.
  Level *Add(LevelDef def);

  Level *Find(const std::string &name) const;
  Level *FindIf(const std::function<bool(const Level &)> &predicate) const;

  size_t Size() const { return levels.size(); }
  const std::vector<std::unique_ptr<Level>> &GetLevels() const {
    return levels;
  }

  const std::string &GetBootstrapSegment() const { return bootstrapSegment; }
  void SetBootstrapSegment(std::string segment) {
    bootstrapSegment = std::move(segment);
  }
  const std::string &GetMainMenuLevel() const { return mainMenuLevel; }
  void SetMainMenuLevel(std::string level) { mainMenuLevel = std::move(level); }

private:
  std::vector<std::unique_ptr<Level>> levels;
  std::string bootstrapSegment = cfg::kBootstrapSegment;
  std::string mainMenuLevel = cfg::kMainMenuLevel;
};

// Reads "segments" into the world catalog and "levels" into the registry.
// Returns false (and logs) on I/O or JSON errors.
bool LoadRegistryFromFile(LevelRegistry &registry, world::World &world,
                          const char *relativePath);
bool LoadRegistryFromString(LevelRegistry &registry, world::World &world,
                            const std::string &text,
                            const char *sourceName = "<inline>");

// Every level segment exists in the world catalog and every primary index
// is -1 or in range. Logs each problem found.
bool ValidateRegistry(const LevelRegistry &registry, const world::World &world);

} // namespace loader
