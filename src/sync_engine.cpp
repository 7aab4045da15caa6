#include "sync_engine.hpp"

#include <algorithm>
#include <cstdlib>
#include <unistd.h>

#include "mount_transport.hpp"
#include "remote_discovery.hpp"
#include "settings_manager.hpp"
#include "ssh_transport.hpp"
#include "sync_error.hpp"
#include "sync_lock.hpp"
#include "transfer_engine.hpp"
#include "transport_selector.hpp"
#include "utils.hpp"

namespace {

struct OperationName {
  const char* name;
  Operation operation;
};

constexpr OperationName kOperationNames[] = {
  {"send", Operation::Send},
  {"receive", Operation::Receive},
  {"provision-remote", Operation::ProvisionRemote},
  {"setup-remote", Operation::ProvisionRemote},
  {"discover-remote-storage", Operation::DiscoverRemoteStorage},
  {"discover-remote-dirs", Operation::DiscoverRemoteStorage},
  {"transport-probe", Operation::TransportProbe},
  {"auto", Operation::TransportProbe}
};

} // namespace

const char* to_string(Operation operation) {
  switch(operation) {
    case Operation::Send: return "send";
    case Operation::Receive: return "receive";
    case Operation::ProvisionRemote: return "provision-remote";
    case Operation::DiscoverRemoteStorage: return "discover-remote-storage";
    case Operation::TransportProbe: return "transport-probe";
  }
  return "unknown";
}

std::optional<Operation> parse_operation(const std::string& value) {
  std::string normalized = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  std::replace(normalized.begin(), normalized.end(), '_', '-');
  for(const auto& entry : kOperationNames) {
    if(normalized == entry.name) return entry.operation;
  }
  return std::nullopt;
}

SyncEngine::SyncEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("plansync")) {
  if(!options_.runner) {
    options_.runner = std::make_shared<ProcessRunner>();
  }
}

SyncEngine::~SyncEngine() = default;

std::filesystem::path SyncEngine::state_dir() const {
  auto configured = settings_->get<std::string>("state_dir");
  if(!configured.empty()) return configured;
  if(const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "plansync";
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".local" / "state" / "plansync";
  }
  return std::filesystem::current_path() / ".plansync-state";
}

TransportOptions SyncEngine::transport_options() const {
  TransportOptions out;
  out.remote_host = settings_->get<std::string>("remote_host");
  out.remote_port = settings_->get<int>("remote_port");
  out.remote_root = settings_->get<std::string>("remote_root");
  out.usb_mount = settings_->get<std::string>("usb_mount");
  out.timeout = std::chrono::seconds(settings_->get<int>("timeout"));
  out.verbose = settings_->get<bool>("verbose");
  return out;
}

Operation SyncEngine::validate() const {
  auto requested = settings_->get<std::string>("operation");
  if(requested.empty()) {
    throw SyncError(ErrorCode::MissingArg, "An operation is required");
  }
  auto operation = parse_operation(requested);
  if(!operation) {
    throw SyncError(ErrorCode::Unsupported, "Unknown operation '" + requested + "'");
  }
  if(settings_->get<std::string>("local_root").empty()) {
    throw SyncError(ErrorCode::MissingArg, "--local-root is required");
  }
  if(settings_->get<int>("timeout") <= 0) {
    throw SyncError(ErrorCode::InvalidArg, "--timeout must be a positive number of seconds");
  }
  int port = settings_->get<int>("remote_port");
  if(port < 0 || port > 65535) {
    throw SyncError(ErrorCode::InvalidArg, "Invalid --remote-port '" + std::to_string(port) + "'");
  }
  if(settings_->get<int>("cache_ttl") < 0) {
    throw SyncError(ErrorCode::InvalidArg, "--cache-ttl must not be negative");
  }
  if(settings_->get<int>("discovery_depth") < 0) {
    throw SyncError(ErrorCode::InvalidArg, "--discovery-depth must not be negative");
  }
  if(settings_->get<int>("jobs") < 1) {
    throw SyncError(ErrorCode::InvalidArg, "--jobs must be at least 1");
  }
  return *operation;
}

SyncResult SyncEngine::run() {
  init(settings_->get<bool>("verbose"));

  SyncResult result;
  std::unique_ptr<SyncLock> lock;
  try {
    execute(result, lock);
  } catch(const SyncError& e) {
    logger_->error("{}: {}", to_string(e.code()), e.what());
    result.outcome = SyncFailure{e.code(), e.what()};
  } catch(const std::exception& e) {
    logger_->error("Unexpected failure: {}", e.what());
    result.outcome = SyncFailure{ErrorCode::InternalError, e.what()};
  }

  close_invocation_log();
  lock.reset();

  auto elapsed = std::chrono::steady_clock::now() - options_.started_at;
  result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
  return result;
}

// The lock is taken before the log is opened so a contended invocation
// leaves no trace in the sync root.
void SyncEngine::execute(SyncResult& result, std::unique_ptr<SyncLock>& lock) {
  auto operation = validate();

  SyncRoot root(settings_->get<std::string>("local_root"));
  root.ensure_tree();

  lock = std::make_unique<SyncLock>(root.lock_dir(), logger_.get());

  auto log_path = root.log_dir() / ("transfer-" + timestamp_compact_ms() + ".log");
  if(!open_invocation_log(log_path)) {
    throw SyncError(ErrorCode::LocalRootUnwritable, "Unable to create log file " + log_path.string());
  }
  result.log_path = log_path;

  logger_->info("{} started (pid {})", to_string(operation), static_cast<long>(::getpid()));
  logger_->debug("Settings: {}", settings_->get_json().dump());
  if(settings_->get<int>("jobs") > 1) {
    logger_->debug("--jobs {} requested; transfers run sequentially", settings_->get<int>("jobs"));
  }

  auto success = dispatch(operation, root);
  logger_->info("{} finished", to_string(operation));
  result.outcome = std::move(success);
}

std::unique_ptr<Transport> SyncEngine::make_transport(TransportKind kind,
                                                      const TransportOptions& transport_options) {
  if(options_.transport_factory) {
    auto transport = options_.transport_factory(kind, transport_options, logger_);
    if(transport) return transport;
  }
  if(kind == TransportKind::UsbFs) {
    return std::make_unique<MountTransport>(transport_options, logger_);
  }
  return std::make_unique<SshTransport>(transport_options, options_.runner, logger_);
}

SyncSuccess SyncEngine::dispatch(Operation operation, const SyncRoot& root) {
  const auto transport_opts = transport_options();
  const bool dry_run = settings_->get<bool>("dry_run");

  if(operation == Operation::DiscoverRemoteStorage) {
    auto success = discover(transport_opts);
    success.dry_run = dry_run;
    return success;
  }

  auto kind = select_transport(settings_->get<std::string>("transport"), transport_opts.usb_mount);
  logger_->info("Using transport {}", to_string(kind));

  SyncSuccess success;
  success.transport = to_string(kind);
  success.dry_run = dry_run;
  if(operation == Operation::TransportProbe) {
    return success;
  }

  auto transport = make_transport(kind, transport_opts);

  if(operation == Operation::ProvisionRemote) {
    transport->check_provision();
    if(dry_run) {
      logger_->info("[dry-run] would provision {}", transport->remote_root());
      success.extra["setup"] = "planned";
    } else {
      transport->provision_tree();
      success.extra["setup"] = "created";
    }
    return success;
  }

  TransferOptions transfer_options;
  transfer_options.dry_run = dry_run;
  transfer_options.archive = settings_->get<bool>("archive");
  transfer_options.ack_remote = settings_->get<bool>("ack_remote");
  TransferEngine engine(root, *transport, transfer_options, logger_);

  success.batch = (operation == Operation::Send) ? engine.send() : engine.receive();
  return success;
}

SyncSuccess SyncEngine::discover(const TransportOptions& transport_opts) {
  auto requested = settings_->get<std::string>("transport");
  auto choice = parse_transport_choice(requested);
  if(!choice) {
    throw SyncError(ErrorCode::NoTransportAvailable, "Unknown transport '" + requested + "'");
  }
  if(*choice == TransportChoice::UsbFs) {
    throw SyncError(ErrorCode::Unsupported, "Remote storage discovery requires the ssh transport");
  }

  auto roots = split_list(settings_->get<std::string>("discovery_roots"), ',');
  if(roots.empty()) {
    throw SyncError(ErrorCode::InvalidArg, "--discovery-roots names no directory");
  }

  DiscoveryOptions discovery_options;
  discovery_options.roots = std::move(roots);
  discovery_options.depth = settings_->get<int>("discovery_depth");
  discovery_options.refresh = settings_->get<bool>("refresh_cache");

  SshTransport transport(transport_opts, options_.runner, logger_);
  DiscoveryCache cache(state_dir() / "remote_dirs",
                       std::chrono::seconds(settings_->get<int>("cache_ttl")),
                       logger_);
  RemoteDiscovery discovery(transport, std::move(cache), std::move(discovery_options), logger_);
  auto report = discovery.discover();

  SyncSuccess success;
  success.transport = to_string(TransportKind::Ssh);
  success.extra["dirs"] = std::move(report.dirs);
  success.extra["cache"] = report.cache_hit ? "hit" : "miss";
  return success;
}
