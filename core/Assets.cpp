#include "core/Assets.hpp"
#include <filesystem>
#include <string>

namespace assets {

namespace fs = std::filesystem;

static fs::path FindAssetsDir() {
  fs::path current = fs::current_path();

  // Look up to 3 levels up for the assets directory
  for (int i = 0; i < 4; ++i) {
    if (fs::is_directory(current / "assets")) {
      return current / "assets";
    }
    if (!current.has_parent_path() || current.parent_path() == current) {
      break;
    }
    current = current.parent_path();
  }
  return {};
}

const char *Path(const char *relative) {
  static thread_local std::string s_PathBuf;
  fs::path dir = FindAssetsDir();
  if (dir.empty()) {
    dir = "assets";
  }
  s_PathBuf = (dir / relative).string();
  return s_PathBuf.c_str();
}

bool Exists(const char *relative) {
  std::error_code ec;
  return fs::exists(fs::path(Path(relative)), ec);
}

} // namespace assets
