#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "command_runner.hpp"
#include "log.hpp"
#include "sync_result.hpp"
#include "sync_root.hpp"
#include "transport.hpp"

class SettingsManager;
class SyncLock;

enum class Operation {
  Send,
  Receive,
  ProvisionRemote,
  DiscoverRemoteStorage,
  TransportProbe
};

const char* to_string(Operation operation);
// Accepts the canonical names and the short aliases (setup-remote,
// discover-remote-dirs, auto); '_' and '-' are interchangeable.
std::optional<Operation> parse_operation(const std::string& value);

// Runs one invocation: validate, provision the local tree, lock, open the
// invocation log, resolve the transport, dispatch, and fold every outcome
// into a SyncResult. Never throws.
class SyncEngine {
public:
  using TransportFactory = std::function<std::unique_ptr<Transport>(TransportKind kind,
                                                                    const TransportOptions& options,
                                                                    std::shared_ptr<Logger> logger)>;

  struct Options {
    // ProcessRunner when empty.
    std::shared_ptr<CommandRunner> runner;
    // SshTransport / MountTransport when empty.
    TransportFactory transport_factory;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
  };

  SyncEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~SyncEngine();

  SyncResult run();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  // <state_dir setting>, else $XDG_STATE_HOME/plansync, else
  // ~/.local/state/plansync.
  std::filesystem::path state_dir() const;
  TransportOptions transport_options() const;

private:
  void execute(SyncResult& result, std::unique_ptr<SyncLock>& lock);
  Operation validate() const;
  SyncSuccess dispatch(Operation operation, const SyncRoot& root);
  SyncSuccess discover(const TransportOptions& transport_options);
  std::unique_ptr<Transport> make_transport(TransportKind kind, const TransportOptions& transport_options);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
};
