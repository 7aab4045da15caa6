#pragma once

#include <memory>

#include "log.hpp"
#include "transport.hpp"

// Login-session transport: remote commands over ssh, bulk copies over scp
// with compression and a one-shot fallback to the legacy scp protocol (-O)
// for servers that do not speak SFTP.
class SshTransport : public Transport {
public:
  SshTransport(TransportOptions options,
               std::shared_ptr<CommandRunner> runner,
               std::shared_ptr<Logger> logger);

  TransportKind kind() const override { return TransportKind::Ssh; }

  void health_check() override;
  void check_provision() override;
  // MISSING_TOOL unless `tool` resolves on PATH.
  void require_tool(const std::string& tool) const;
  void provision_tree() override;
  std::vector<RemoteFile> list_outbox() override;

  void send_file(const std::filesystem::path& local, const std::string& remote_path) override;
  void receive_file(const std::string& remote_path, const std::filesystem::path& local) override;

  std::optional<std::string> remote_digest(const std::string& remote_path) override;
  void commit(const std::string& staging_path, const std::string& final_path) override;
  void discard(const std::string& remote_path) override;
  void archive_remote(const std::string& remote_path) override;
  CommandOutcome run_remote_command(const RemoteCommand& command) override;

  std::string remote_root() const override { return options_.remote_root; }
  const std::string& remote_host() const { return options_.remote_host; }

  std::vector<std::string> ssh_argv(const std::string& command_line) const;
  std::vector<std::string> scp_argv(bool legacy_protocol,
                                    const std::string& source,
                                    const std::string& destination) const;
  std::string remote_spec(const std::string& remote_path) const;

  static RemoteCommand tree_command(const std::string& root);
  static RemoteCommand digest_command(const std::string& remote_path);

private:
  void check_destination() const;
  void run_checked(const RemoteCommand& command, const std::string& failure_message);
  void copy(const std::string& source,
            const std::string& destination,
            bool upload,
            const std::string& file_name);

  TransportOptions options_;
  std::shared_ptr<CommandRunner> runner_;
  std::shared_ptr<Logger> logger_;
};
