#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "command_runner.hpp"
#include "remote_command.hpp"

enum class TransportKind {
  Ssh,
  UsbFs
};

const char* to_string(TransportKind kind);

struct TransportOptions {
  std::string remote_host;
  int remote_port = 0;
  std::string remote_root;
  std::string usb_mount;
  std::chrono::seconds timeout{30};
  bool verbose = false;
};

struct RemoteFile {
  std::string name;
  std::string path;
  std::optional<std::uint64_t> bytes;
};

std::string join_remote(const std::string& base, const std::string& leaf);
std::string remote_basename(const std::string& path);

// Everything the transfer engine needs from "the other side". Remote paths
// are plain strings: POSIX paths on the login host, or local paths under the
// mount point for the mounted-filesystem transport.
class Transport {
public:
  virtual ~Transport() = default;

  virtual TransportKind kind() const = 0;
  std::string name() const { return to_string(kind()); }

  // Configuration and local prerequisites only; never contacts the remote.
  virtual void health_check() = 0;
  // Read-only checks before a receive.
  virtual void check_receive_source() {}
  // Prerequisites for provision_tree alone; a transport may need less than
  // a full transfer does.
  virtual void check_provision() { health_check(); }
  virtual void provision_tree() = 0;
  virtual std::vector<RemoteFile> list_outbox() = 0;

  // Bulk copies into a staging path chosen by the caller.
  virtual void send_file(const std::filesystem::path& local, const std::string& remote_path) = 0;
  virtual void receive_file(const std::string& remote_path, const std::filesystem::path& local) = 0;

  // nullopt when no hashing tool is available at the remote.
  virtual std::optional<std::string> remote_digest(const std::string& remote_path) = 0;
  virtual void commit(const std::string& staging_path, const std::string& final_path) = 0;
  // Best-effort removal; failures are logged, never thrown.
  virtual void discard(const std::string& remote_path) = 0;
  virtual void archive_remote(const std::string& remote_path) = 0;
  virtual CommandOutcome run_remote_command(const RemoteCommand& command) = 0;

  virtual std::string remote_root() const = 0;
  std::string remote_dir(const std::string& sub) const { return join_remote(remote_root(), sub); }
};
