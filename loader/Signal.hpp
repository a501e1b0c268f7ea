#pragma once

#include <memory>

namespace loader {

enum class LoaderError {
  None,
  ConfigurationError,
  StateConflict,
  ResourceFault,
  InvariantViolation,
};

const char *LoaderErrorName(LoaderError error);

// Single-slot completion signal for one transition. Copies share the slot,
// so two callers awaiting the same transition hold equal signals.
// A default-constructed signal counts as already succeeded.
class Signal {
public:
  Signal() = default;

  static Signal MakePending();
  static Signal Completed();
  static Signal Rejected(LoaderError error);

  bool IsDone() const;
  bool Succeeded() const;
  LoaderError GetError() const;

  // No effect once the signal has completed.
  void Resolve();
  void Fail(LoaderError error);

  bool operator==(const Signal &other) const { return state == other.state; }
  bool operator!=(const Signal &other) const { return state != other.state; }

private:
  struct State {
    bool done = false;
    LoaderError error = LoaderError::None;
  };

  explicit Signal(std::shared_ptr<State> state) : state(std::move(state)) {}

  std::shared_ptr<State> state;
};

} // namespace loader
