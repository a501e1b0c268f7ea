#include <cstdio>
#include <iostream>
#include <string>

#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "loader/Boot.hpp"
#include "loader/LevelRegistry.hpp"
#include "loader/Orchestrator.hpp"
#include "world/World.hpp"

namespace {

void PrintStatus(const loader::Orchestrator &orchestrator) {
  std::printf("tracked:");
  for (const loader::Level *level : orchestrator.GetTrackedLevels()) {
    std::printf(" %s(%s)", level->GetName().c_str(),
                loader::LevelStateName(level->GetState()));
  }
  std::printf("\n");
}

} // namespace

int main() {
  Log::Init();
  CrashHandler::Init();
  LOG_INFO("LevelLoader starting...");

  world::World world;
  loader::LevelRegistry registry;
  if (!loader::LoadRegistryFromFile(registry, world, cfg::kRegistryPath)) {
    LOG_CRITICAL("No usable level registry, exiting");
    Log::Shutdown();
    return 1;
  }
  if (!world.LoadImmediate(registry.GetBootstrapSegment())) {
    LOG_CRITICAL("Bootstrap segment '{}' missing, exiting",
                 registry.GetBootstrapSegment());
    Log::Shutdown();
    return 1;
  }

  loader::Orchestrator orchestrator(registry, world);
  loader::Signal boot = loader::Boot(orchestrator, registry);
  orchestrator.RunUntil(boot);
  PrintStatus(orchestrator);

  // Each stdin line names a level to switch to.
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    if (line == "quit" || line == "exit") {
      break;
    }
    if (line == "status") {
      PrintStatus(orchestrator);
      continue;
    }

    loader::Signal signal = line == "unload"
                                ? orchestrator.UnloadAll()
                                : orchestrator.ActivateAndUnloadOthers(line);
    if (!orchestrator.RunUntil(signal)) {
      std::printf("%s: still running\n", line.c_str());
    } else if (signal.Succeeded()) {
      std::printf("%s: ok\n", line.c_str());
    } else {
      std::printf("%s: %s\n", line.c_str(),
                  loader::LoaderErrorName(signal.GetError()));
    }
    PrintStatus(orchestrator);
  }

  orchestrator.RunUntil(orchestrator.UnloadAll());
  LOG_INFO("LevelLoader shutting down");
  Log::Shutdown();
  return 0;
}
