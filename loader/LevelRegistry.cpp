#include "loader/LevelRegistry.hpp"

#include "core/Log.hpp"

namespace loader {

Level *LevelRegistry::Add(LevelDef def) {
  if (def.name.empty()) {
    LOG_ERROR("ConfigurationError: level definition without a name");
    return nullptr;
  }
  if (Find(def.name)) {
    LOG_ERROR("ConfigurationError: level '{}' defined twice", def.name);
    return nullptr;
  }
  levels.push_back(std::make_unique<Level>(std::move(def)));
  return levels.back().get();
}

Level *LevelRegistry::Find(const std::string &name) const {
  for (const auto &level : levels) {
    if (level->GetName() == name) {
      return level.get();
    }
  }
  return nullptr;
}

Level *LevelRegistry::FindIf(
    const std::function<bool(const Level &)> &predicate) const {
  for (const auto &level : levels) {
    if (predicate(*level)) {
      return level.get();
    }
  }
  return nullptr;
}

} // namespace loader
