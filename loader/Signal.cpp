#include "loader/Signal.hpp"

namespace loader {

const char *LoaderErrorName(LoaderError error) {
  switch (error) {
  case LoaderError::None:
    return "None";
  case LoaderError::ConfigurationError:
    return "ConfigurationError";
  case LoaderError::StateConflict:
    return "StateConflictError";
  case LoaderError::ResourceFault:
    return "ResourceFault";
  case LoaderError::InvariantViolation:
    return "InvariantViolation";
  }
  return "Unknown";
}

Signal Signal::MakePending() { return Signal(std::make_shared<State>()); }

Signal Signal::Completed() {
  Signal signal = MakePending();
  signal.Resolve();
  return signal;
}

Signal Signal::Rejected(LoaderError error) {
  Signal signal = MakePending();
  signal.Fail(error);
  return signal;
}

bool Signal::IsDone() const { return !state || state->done; }

bool Signal::Succeeded() const {
  return !state || (state->done && state->error == LoaderError::None);
}

LoaderError Signal::GetError() const {
  return state ? state->error : LoaderError::None;
}

void Signal::Resolve() {
  if (state && !state->done) {
    state->done = true;
  }
}

void Signal::Fail(LoaderError error) {
  if (state && !state->done) {
    state->done = true;
    state->error = error;
  }
}

} // namespace loader
