#pragma once

namespace cfg {
// Segment that holds the process entry point. Loaded before any level.
constexpr const char *kBootstrapSegment = "bootstrap";
// Permanent container for objects that must outlive every level.
constexpr const char *kPersistentContainer = "persistent";
// Object in the bootstrap segment that boot promotes to the permanent container.
constexpr const char *kViewpointRigObject = "ViewpointRig";
constexpr const char *kMainMenuLevel = "MainMenu";

constexpr const char *kLoggerName = "LEVELLOADER";
constexpr const char *kLogFile = "levelloader.log";
constexpr int kLogRingSize = 256;

constexpr const char *kRegistryPath = "levels/registry.json";

// --- Simulated segment latency (ticks) ---
constexpr int kDefaultLoadTicks = 3;
constexpr int kDefaultLoadJitter = 0;
constexpr int kDefaultUnloadTicks = 2;
constexpr int kLightingRecomputeTicks = 4;
// Authored latencies and jitter are clamped to [0, kMaxSegmentTicks].
constexpr int kMaxSegmentTicks = 100000;

// A staged load reports this progress until activation is allowed.
constexpr float kStagedProgress = 0.9f;

// --- Loop caps ---
constexpr int kMaxTicksPerCall = 10000;
constexpr int kMaxRunnerTicks = 100000;
} // namespace cfg
