#pragma once

#include <array>
#include <filesystem>
#include <string>

#include "sync_error.hpp"

// The five directories every sync root carries, on both sides.
inline constexpr std::array<const char*, 5> kSyncRootDirectories = {
  "inbox",
  "outbox",
  "processed",
  "archive",
  ".state"
};

inline constexpr const char* kStagingSuffix = ".part";

class SyncRoot {
public:
  explicit SyncRoot(std::filesystem::path root) : root_(std::move(root)) {}

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path inbox() const { return root_ / "inbox"; }
  std::filesystem::path outbox() const { return root_ / "outbox"; }
  std::filesystem::path processed() const { return root_ / "processed"; }
  std::filesystem::path archive() const { return root_ / "archive"; }
  std::filesystem::path state_dir() const { return root_ / ".state"; }
  std::filesystem::path lock_dir() const { return state_dir() / "lock"; }
  std::filesystem::path log_dir() const { return state_dir() / "logs"; }

  // Creates the layout (plus the log directory) if missing; existing
  // directories are left untouched. Throws LOCAL_ROOT_UNWRITABLE.
  void ensure_tree() const;

private:
  std::filesystem::path root_;
};

// Shared by the local root and the mounted-filesystem mirror. Throws a
// SyncError carrying `failure_code` when a directory cannot be created.
void provision_directory_tree(const std::filesystem::path& root, ErrorCode failure_code);

bool is_writable_directory(const std::filesystem::path& path);
