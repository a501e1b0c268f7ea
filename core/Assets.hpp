#pragma once

// Asset path helpers.
// Resolves paths against the nearest "assets" directory found from the
// working directory upward, so tools run from a build dir still find content.
//
// Usage:
//   LoadRegistryFromFile(registry, world, assets::Path("levels/registry.json"));

namespace assets {

// Returns "<assets dir>/<relative>". The buffer is thread-local and is
// overwritten by the next call on the same thread.
const char *Path(const char *relative);

bool Exists(const char *relative);

} // namespace assets
