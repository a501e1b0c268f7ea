#include "loader/LevelRegistry.hpp"

#include "core/Assets.hpp"
#include "core/Log.hpp"
#include <algorithm>
#include <fstream>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace loader {

namespace {

int ReadTicks(const json &s_json, const char *key, int fallback,
              const std::string &segment) {
  const int raw = s_json.value(key, fallback);
  const int ticks = std::clamp(raw, 0, cfg::kMaxSegmentTicks);
  if (ticks != raw) {
    LOG_WARN("Segment '{}': {} {} clamped to {}", segment, key, raw, ticks);
  }
  return ticks;
}

world::SegmentDef ParseSegment(const json &s_json) {
  world::SegmentDef def;
  def.name = s_json.value("name", std::string());
  if (s_json.contains("objects") && s_json["objects"].is_array()) {
    for (const auto &obj : s_json["objects"]) {
      def.objects.push_back(obj.get<std::string>());
    }
  }
  def.loadTicks = ReadTicks(s_json, "loadTicks", cfg::kDefaultLoadTicks, def.name);
  def.loadJitter =
      ReadTicks(s_json, "loadJitter", cfg::kDefaultLoadJitter, def.name);
  def.unloadTicks =
      ReadTicks(s_json, "unloadTicks", cfg::kDefaultUnloadTicks, def.name);
  def.failLoadAttempts = s_json.value("failLoadAttempts", 0);
  def.lightProbes = s_json.value("lightProbes", false);
  def.persistentContainer = s_json.value("persistentContainer", false);
  return def;
}

LevelDef ParseLevel(const json &l_json) {
  LevelDef def;
  def.name = l_json.value("name", std::string());
  if (l_json.contains("segments") && l_json["segments"].is_array()) {
    for (const auto &seg : l_json["segments"]) {
      def.segments.push_back(seg.get<std::string>());
    }
  }
  def.activeIndex = l_json.value("activeIndex", -1);
  return def;
}

// Everything is parsed before the world or the registry is touched, so a
// json exception leaves both as they were.
bool ApplyRegistry(LevelRegistry &registry, world::World &world,
                   const json &data) {
  if (!data.contains("levels") || !data["levels"].is_array()) {
    LOG_ERROR("ConfigurationError: registry has no \"levels\" array");
    return false;
  }

  const std::string bootstrap =
      data.value("bootstrap", std::string(cfg::kBootstrapSegment));
  const std::string mainMenu =
      data.value("mainMenu", std::string(cfg::kMainMenuLevel));

  std::vector<world::SegmentDef> segments;
  if (data.contains("segments") && data["segments"].is_array()) {
    for (const auto &s_json : data["segments"]) {
      segments.push_back(ParseSegment(s_json));
    }
  }
  std::vector<LevelDef> levels;
  for (const auto &l_json : data["levels"]) {
    levels.push_back(ParseLevel(l_json));
  }

  registry.SetBootstrapSegment(bootstrap);
  registry.SetMainMenuLevel(mainMenu);
  bool ok = true;
  for (const auto &def : segments) {
    if (!world.DefineSegment(def)) {
      ok = false;
    }
  }
  for (auto &def : levels) {
    if (!registry.Add(std::move(def))) {
      ok = false;
    }
  }
  return ok;
}

} // namespace

bool LoadRegistryFromFile(LevelRegistry &registry, world::World &world,
                          const char *relativePath) {
  std::string fullPath = assets::Path(relativePath);
  std::ifstream f(fullPath);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open level registry: {}", fullPath);
    return false;
  }

  try {
    json data = json::parse(f);
    if (!ApplyRegistry(registry, world, data)) {
      LOG_ERROR("Level registry {} loaded with errors", relativePath);
      return false;
    }
    LOG_INFO("Level registry {}: {} level(s)", relativePath, registry.Size());
    return true;
  } catch (const json::parse_error &e) {
    LOG_ERROR("JSON parse error in {}: {}", relativePath, e.what());
    return false;
  } catch (const json::type_error &e) {
    LOG_ERROR("JSON type error in {}: {}", relativePath, e.what());
    return false;
  }
}

bool LoadRegistryFromString(LevelRegistry &registry, world::World &world,
                            const std::string &text, const char *sourceName) {
  try {
    json data = json::parse(text);
    return ApplyRegistry(registry, world, data);
  } catch (const json::parse_error &e) {
    LOG_ERROR("JSON parse error in {}: {}", sourceName, e.what());
    return false;
  } catch (const json::type_error &e) {
    LOG_ERROR("JSON type error in {}: {}", sourceName, e.what());
    return false;
  }
}

bool ValidateRegistry(const LevelRegistry &registry, const world::World &world) {
  bool allOk = true;

  if (!world.FindSegment(registry.GetBootstrapSegment())) {
    LOG_WARN("Bootstrap segment '{}' is not in the segment catalog",
             registry.GetBootstrapSegment());
  }
  if (!registry.Find(registry.GetMainMenuLevel())) {
    LOG_ERROR("ConfigurationError: main menu level '{}' is not defined",
              registry.GetMainMenuLevel());
    allOk = false;
  }

  for (const auto &level : registry.GetLevels()) {
    const auto &segments = level->GetSegments();
    if (segments.empty()) {
      LOG_ERROR("ConfigurationError: level '{}' has no segments",
                level->GetName());
      allOk = false;
    }
    for (const auto &segment : segments) {
      if (!world.FindSegment(segment)) {
        LOG_ERROR("ConfigurationError: level '{}' references unknown segment "
                  "'{}'",
                  level->GetName(), segment);
        allOk = false;
      }
    }
    const int index = level->GetPrimaryIndex();
    if (index < -1 || index >= static_cast<int>(segments.size())) {
      LOG_ERROR("ConfigurationError: level '{}' activeIndex {} out of range",
                level->GetName(), index);
      allOk = false;
    }
  }
  return allOk;
}

} // namespace loader
