#pragma once

namespace CrashHandler {

// Installs backward-cpp signal handlers that print a stack trace on crash.
void Init();

} // namespace CrashHandler
