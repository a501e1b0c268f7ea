// level_runner: headless level-switch driver
//
// Boots the loader against a registry, then switches through a sequence of
// levels, ticking the loop until each switch completes. Reports the tick
// cost of every switch and the final tracked set.
//
// Usage:
//   level_runner [options]
//     --registry <path>             Registry under assets/ (default: levels/registry.json)
//     --sequence <a,b,c>            Levels to switch to, in order
//     --seed <hex|dec>              Latency jitter seed (default: 0xC0FFEE)
//     --max-ticks <n>               Tick cap per switch (default: 10000)
//     --unload-all                  Finish with UnloadAll()
//     --validate                    Only validate the registry and exit
//     --json                        Output as JSON instead of plain text
//     --quiet                       Only output final summary line
//     -h, --help                    Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/Assets.hpp"
#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "loader/Boot.hpp"
#include "loader/LevelRegistry.hpp"
#include "loader/Orchestrator.hpp"
#include "world/World.hpp"

namespace {

struct RunnerArgs {
    std::string registryPath = cfg::kRegistryPath;
    std::vector<std::string> sequence;
    uint32_t seed = 0xC0FFEEu;
    int maxTicks = cfg::kMaxTicksPerCall;
    bool unloadAll = false;
    bool validateOnly = false;
    bool json = false;
    bool quiet = false;
    bool help = false;
};

struct SwitchResult {
    std::string target;
    const char* status = "ok";
    int ticks = 0;
    int activeCount = 0;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

std::vector<std::string> ParseNameList(const char* str) {
    std::vector<std::string> result;
    std::string current;
    for (const char* p = str; *p != '\0'; ++p) {
        if (*p == ',') {
            if (!current.empty()) result.push_back(current);
            current.clear();
        } else {
            current.push_back(*p);
        }
    }
    if (!current.empty()) result.push_back(current);
    return result;
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--registry") == 0) && i + 1 < argc) {
            args.registryPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--sequence") == 0) && i + 1 < argc) {
            args.sequence = ParseNameList(argv[++i]);
        } else if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
        } else if ((std::strcmp(argv[i], "--max-ticks") == 0) && i + 1 < argc) {
            args.maxTicks = std::atoi(argv[++i]);
            if (args.maxTicks < 1) args.maxTicks = 1;
            if (args.maxTicks > cfg::kMaxRunnerTicks) args.maxTicks = cfg::kMaxRunnerTicks;
        } else if (std::strcmp(argv[i], "--unload-all") == 0) {
            args.unloadAll = true;
        } else if (std::strcmp(argv[i], "--validate") == 0) {
            args.validateOnly = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "level_runner: headless level-switch driver\n"
        "\n"
        "Usage: level_runner [options]\n"
        "  --registry <path>             Registry under assets/ (default: levels/registry.json)\n"
        "  --sequence <a,b,c>            Levels to switch to, in order\n"
        "  --seed <hex|dec>              Latency jitter seed (default: 0xC0FFEE)\n"
        "  --max-ticks <n>               Tick cap per switch (default: 10000)\n"
        "  --unload-all                  Finish with UnloadAll()\n"
        "  --validate                    Only validate the registry\n"
        "  --json                        Output as JSON\n"
        "  --quiet                       Only final summary line\n"
        "  -h, --help                    This message\n"
    );
}

int CountActive(const loader::Orchestrator& orchestrator) {
    int count = 0;
    for (const loader::Level* level : orchestrator.GetTrackedLevels()) {
        if (level->GetState() == loader::LevelState::Active) ++count;
    }
    return count;
}

SwitchResult RunSwitch(loader::Orchestrator& orchestrator, const std::string& target,
                       loader::Signal signal, int maxTicks) {
    SwitchResult result;
    result.target = target;
    const uint64_t startTick = orchestrator.GetTickCount();
    if (!orchestrator.RunUntil(signal, maxTicks)) {
        result.status = "timeout";
    } else if (!signal.Succeeded()) {
        result.status = loader::LoaderErrorName(signal.GetError());
    }
    result.ticks = static_cast<int>(orchestrator.GetTickCount() - startTick);
    result.activeCount = CountActive(orchestrator);
    return result;
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }

    Log::Init();
    CrashHandler::Init();
    if (args.quiet || args.json) {
        Log::GetLogger()->set_level(spdlog::level::warn);
    }

    if (!assets::Exists(args.registryPath.c_str())) {
        std::fprintf(stderr, "registry not found: %s\n", assets::Path(args.registryPath.c_str()));
        Log::Shutdown();
        return 1;
    }

    world::World world(args.seed);
    loader::LevelRegistry registry;
    if (!loader::LoadRegistryFromFile(registry, world, args.registryPath.c_str())) {
        std::fprintf(stderr, "failed to load registry %s\n", args.registryPath.c_str());
        Log::Shutdown();
        return 1;
    }

    const bool valid = loader::ValidateRegistry(registry, world);
    if (args.validateOnly) {
        std::printf("%s: %zu level(s), %s\n", args.registryPath.c_str(), registry.Size(),
                    valid ? "valid" : "INVALID");
        Log::Shutdown();
        return valid ? 0 : 1;
    }

    if (!world.LoadImmediate(registry.GetBootstrapSegment())) {
        Log::Shutdown();
        return 1;
    }

    const auto wallStart = std::chrono::steady_clock::now();
    loader::Orchestrator orchestrator(registry, world);

    std::vector<SwitchResult> results;
    results.push_back(RunSwitch(orchestrator, registry.GetMainMenuLevel(),
                                loader::Boot(orchestrator, registry), args.maxTicks));
    for (const auto& target : args.sequence) {
        results.push_back(RunSwitch(orchestrator, target,
                                    orchestrator.ActivateAndUnloadOthers(target),
                                    args.maxTicks));
    }
    if (args.unloadAll) {
        results.push_back(RunSwitch(orchestrator, "<unload-all>", orchestrator.UnloadAll(),
                                    args.maxTicks));
    }
    orchestrator.RunUntilIdle(args.maxTicks);

    const double wallMs = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - wallStart).count();

    int failures = 0;
    for (const auto& r : results) {
        if (std::strcmp(r.status, "ok") != 0 || r.activeCount > 1) ++failures;
    }
    const loader::Level* active = orchestrator.GetActiveLevel();
    const char* activeName = active ? active->GetName().c_str() : "";

    if (args.json) {
        std::printf("{\n");
        std::printf("  \"seed\": \"0x%08X\",\n", args.seed);
        std::printf("  \"switches\": [\n");
        for (size_t i = 0; i < results.size(); ++i) {
            const auto& r = results[i];
            std::printf("    {\"target\": \"%s\", \"status\": \"%s\", \"ticks\": %d, \"active\": %d}%s\n",
                        r.target.c_str(), r.status, r.ticks, r.activeCount,
                        i + 1 < results.size() ? "," : "");
        }
        std::printf("  ],\n");
        std::printf("  \"tracked\": [");
        const auto& tracked = orchestrator.GetTrackedLevels();
        for (size_t i = 0; i < tracked.size(); ++i) {
            std::printf("%s\"%s\"", i == 0 ? "" : ", ", tracked[i]->GetName().c_str());
        }
        std::printf("],\n");
        std::printf("  \"active\": \"%s\",\n", activeName);
        std::printf("  \"lighting_recomputes\": %d,\n", world.GetLightingRecomputeCount());
        std::printf("  \"ticks_total\": %llu,\n",
                    static_cast<unsigned long long>(orchestrator.GetTickCount()));
        std::printf("  \"failures\": %d,\n", failures);
        std::printf("  \"wall_ms\": %.2f\n", wallMs);
        std::printf("}\n");
    } else if (args.quiet) {
        std::printf("seed=0x%08X  switches=%zu  failures=%d  active=%s  ticks=%llu  lighting=%d\n",
                    args.seed, results.size(), failures, activeName[0] ? activeName : "-",
                    static_cast<unsigned long long>(orchestrator.GetTickCount()),
                    world.GetLightingRecomputeCount());
    } else {
        std::printf("=== LevelLoader Headless Runner ===\n");
        std::printf("seed:       0x%08X\n", args.seed);
        std::printf("registry:   %s (%s)\n", args.registryPath.c_str(), valid ? "valid" : "INVALID");
        for (const auto& r : results) {
            std::printf("switch:     %-16s %-20s %5d ticks  active=%d\n", r.target.c_str(),
                        r.status, r.ticks, r.activeCount);
        }
        std::printf("tracked:   ");
        for (const loader::Level* level : orchestrator.GetTrackedLevels()) {
            std::printf(" %s(%s)", level->GetName().c_str(),
                        loader::LevelStateName(level->GetState()));
        }
        std::printf("\n");
        std::printf("active:     %s\n", activeName[0] ? activeName : "-");
        std::printf("lighting:   %d recompute(s)\n", world.GetLightingRecomputeCount());
        std::printf("wall:       %.2f ms\n", wallMs);
    }

    Log::Shutdown();
    return failures == 0 ? 0 : 1;
}
