#include "sync_lock.hpp"

#include <array>
#include <climits>
#include <csignal>
#include <cstring>
#include <fstream>
#include <signal.h>
#include <unistd.h>

#include "sync_error.hpp"

namespace {

// Paths are copied into fixed buffers so the handler only touches
// async-signal-safe calls.
char g_marker_path[PATH_MAX];
char g_lock_path[PATH_MAX];
volatile std::sig_atomic_t g_cleanup_armed = 0;

constexpr std::array<int, 3> kCleanupSignals = {SIGINT, SIGTERM, SIGHUP};
struct sigaction g_previous_actions[kCleanupSignals.size()];

extern "C" void release_lock_on_signal(int signo) {
  if(g_cleanup_armed) {
    ::unlink(g_marker_path);
    ::rmdir(g_lock_path);
    g_cleanup_armed = 0;
  }
  ::signal(signo, SIG_DFL);
  ::raise(signo);
}

bool arm_signal_cleanup(const std::filesystem::path& lock_dir,
                        const std::filesystem::path& marker) {
  if(g_cleanup_armed) return false;
  const auto lock_str = lock_dir.string();
  const auto marker_str = marker.string();
  if(lock_str.size() >= sizeof(g_lock_path) || marker_str.size() >= sizeof(g_marker_path)) {
    return false;
  }
  std::memcpy(g_lock_path, lock_str.c_str(), lock_str.size() + 1);
  std::memcpy(g_marker_path, marker_str.c_str(), marker_str.size() + 1);
  g_cleanup_armed = 1;

  struct sigaction action {};
  action.sa_handler = release_lock_on_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  for(std::size_t i = 0; i < kCleanupSignals.size(); ++i) {
    ::sigaction(kCleanupSignals[i], &action, &g_previous_actions[i]);
  }
  return true;
}

void disarm_signal_cleanup() {
  for(std::size_t i = 0; i < kCleanupSignals.size(); ++i) {
    ::sigaction(kCleanupSignals[i], &g_previous_actions[i], nullptr);
  }
  g_cleanup_armed = 0;
}

std::string read_marker(const std::filesystem::path& marker) {
  std::ifstream in(marker);
  std::string pid;
  if(in) in >> pid;
  return pid;
}

} // namespace

SyncLock::SyncLock(std::filesystem::path lock_dir, Logger* logger)
  : lock_dir_(std::move(lock_dir)), logger_(logger) {
  std::error_code ec;
  bool created = std::filesystem::create_directory(lock_dir_, ec);
  if(ec) {
    throw SyncError(ErrorCode::LocalRootUnwritable,
                    "Cannot create lock at " + lock_dir_.string() + ": " + ec.message());
  }
  if(!created) {
    auto owner = read_marker(marker());
    std::string message = "Another sync is in progress (lock at " + lock_dir_.string();
    if(!owner.empty()) message += ", pid " + owner;
    message += ")";
    throw SyncError(ErrorCode::LockHeld, message);
  }
  held_ = true;

  {
    std::ofstream out(marker(), std::ios::trunc);
    if(out) {
      out << ::getpid() << "\n";
    } else {
      log_warn(logger_, "Unable to write lock marker {}", marker().string());
    }
  }

  signal_cleanup_armed_ = arm_signal_cleanup(lock_dir_, marker());
  log_debug(logger_, "Acquired lock {}", lock_dir_.string());
}

SyncLock::~SyncLock() {
  release();
}

void SyncLock::release() {
  if(!held_) return;
  held_ = false;
  if(signal_cleanup_armed_) {
    disarm_signal_cleanup();
    signal_cleanup_armed_ = false;
  }
  std::error_code ec;
  std::filesystem::remove(marker(), ec);
  std::filesystem::remove(lock_dir_, ec);
  if(ec) {
    log_warn(logger_, "Unable to remove lock {}: {}", lock_dir_.string(), ec.message());
  } else {
    log_debug(logger_, "Released lock {}", lock_dir_.string());
  }
}
