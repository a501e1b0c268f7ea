#include "CrashHandler.hpp"
#include "core/Log.hpp"
#include <backward.hpp>

namespace CrashHandler {

// Kept alive for the duration of the program
static backward::SignalHandling *s_SignalHandler = nullptr;

void Init() {
  if (s_SignalHandler) {
    return;
  }
  s_SignalHandler = new backward::SignalHandling();
  if (!s_SignalHandler->loaded()) {
    LOG_WARN("Crash handler: signal handlers not installed");
  }
}

} // namespace CrashHandler
