#pragma once

#include <filesystem>

#include "log.hpp"

// Directory mutex over a sync root. Construction acquires (or throws
// LOCK_HELD / LOCAL_ROOT_UNWRITABLE without waiting), destruction releases.
// While held, SIGINT/SIGTERM/SIGHUP remove the lock before the process dies.
class SyncLock {
public:
  SyncLock(std::filesystem::path lock_dir, Logger* logger = nullptr);
  ~SyncLock();

  SyncLock(const SyncLock&) = delete;
  SyncLock& operator=(const SyncLock&) = delete;

  const std::filesystem::path& path() const { return lock_dir_; }
  std::filesystem::path marker() const { return lock_dir_ / "pid"; }

  void release();

private:
  std::filesystem::path lock_dir_;
  Logger* logger_ = nullptr;
  bool held_ = false;
  bool signal_cleanup_armed_ = false;
};
