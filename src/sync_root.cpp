#include "sync_root.hpp"

#include <unistd.h>

void provision_directory_tree(const std::filesystem::path& root, ErrorCode failure_code) {
  if(root.empty()) {
    throw SyncError(failure_code, "Sync root path is empty");
  }
  for(const auto* name : kSyncRootDirectories) {
    auto dir = root / name;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if(ec || !std::filesystem::is_directory(dir, ec)) {
      throw SyncError(failure_code,
                      "Cannot create sync tree at " + root.string() + " (" + dir.string() +
                      (ec ? ": " + ec.message() : std::string()) + ")");
    }
  }
}

void SyncRoot::ensure_tree() const {
  provision_directory_tree(root_, ErrorCode::LocalRootUnwritable);
  std::error_code ec;
  std::filesystem::create_directories(log_dir(), ec);
  if(ec) {
    throw SyncError(ErrorCode::LocalRootUnwritable,
                    "Cannot create log directory " + log_dir().string() + ": " + ec.message());
  }
}

bool is_writable_directory(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::error_code ec;
  if(!std::filesystem::is_directory(path, ec)) return false;
  return ::access(path.c_str(), W_OK) == 0;
}
