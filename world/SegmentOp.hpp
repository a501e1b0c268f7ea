#pragma once

#include "core/Config.hpp"

#include <memory>
#include <string>

namespace world {

enum class OpKind { Load, Unload, Lighting };

// Handle for one asynchronous world operation. Advanced by World::Tick().
//
// A load climbs to cfg::kStagedProgress and parks there until activation is
// allowed; the segment's contents join the world on the following tick.
// Unload and lighting ops finish after their tick count elapses.
class SegmentOp {
public:
  SegmentOp(OpKind kind, std::string segment, int totalTicks, bool willFail)
      : kind(kind), segment(std::move(segment)), totalTicks(totalTicks),
        willFail(willFail) {}

  OpKind GetKind() const { return kind; }
  const std::string &GetSegment() const { return segment; }

  float GetProgress() const {
    if (done && !failed) {
      return 1.0f;
    }
    if (totalTicks <= 0) {
      return kind == OpKind::Load ? cfg::kStagedProgress : 1.0f;
    }
    const float t = static_cast<float>(elapsed) / static_cast<float>(totalTicks);
    const float cap = kind == OpKind::Load ? cfg::kStagedProgress : 1.0f;
    return t >= 1.0f ? cap : t * cap;
  }

  // True once a load is staged or finished. Failed or discarded ops are
  // never ready.
  bool ReadyToFinalize() const {
    return !failed && !discarded && (staged || done);
  }
  bool IsDone() const { return done; }
  bool Failed() const { return failed; }
  bool IsDiscarded() const { return discarded; }

  void AllowActivation(bool allow) { allowActivation = allow; }
  bool IsActivationAllowed() const { return allowActivation; }

private:
  friend class World;

  OpKind kind;
  std::string segment;
  int totalTicks = 0;
  int elapsed = 0;
  bool willFail = false;
  bool staged = false;
  bool done = false;
  bool failed = false;
  bool discarded = false;
  bool allowActivation = false;
  // Number of callers sharing this in-flight op.
  int claims = 1;
};

using SegmentOpPtr = std::shared_ptr<SegmentOp>;

} // namespace world
