#pragma once

#include <memory>

#include "log.hpp"
#include "transport.hpp"

// Mounted-filesystem transport: the device's storage is reachable as a
// local path, so every remote operation is an ordinary filesystem call on
// usb_mount + remote_root.
class MountTransport : public Transport {
public:
  MountTransport(TransportOptions options, std::shared_ptr<Logger> logger);

  TransportKind kind() const override { return TransportKind::UsbFs; }

  void health_check() override;
  void check_receive_source() override;
  void provision_tree() override;
  std::vector<RemoteFile> list_outbox() override;

  void send_file(const std::filesystem::path& local, const std::string& remote_path) override;
  void receive_file(const std::string& remote_path, const std::filesystem::path& local) override;

  std::optional<std::string> remote_digest(const std::string& remote_path) override;
  void commit(const std::string& staging_path, const std::string& final_path) override;
  void discard(const std::string& remote_path) override;
  void archive_remote(const std::string& remote_path) override;
  CommandOutcome run_remote_command(const RemoteCommand& command) override;

  std::string remote_root() const override;

protected:
  void copy_file(const std::filesystem::path& source, const std::filesystem::path& destination);

  TransportOptions options_;
  std::shared_ptr<Logger> logger_;
};
