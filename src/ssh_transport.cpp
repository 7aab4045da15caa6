#include "ssh_transport.hpp"

#include <algorithm>
#include <cctype>

#include "sync_error.hpp"
#include "sync_root.hpp"
#include "utils.hpp"

namespace {

constexpr const char* kMissingHashMarker = "MISSING_HASH_TOOL";
constexpr int kCommandNotFound = 127;

std::vector<std::string> common_options() {
  return {"-o", "BatchMode=yes", "-o", "StrictHostKeyChecking=accept-new"};
}

} // namespace

SshTransport::SshTransport(TransportOptions options,
                           std::shared_ptr<CommandRunner> runner,
                           std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    runner_(std::move(runner)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("ssh")) {}

void SshTransport::require_tool(const std::string& tool) const {
  if(!runner_->has_tool(tool)) {
    throw SyncError(ErrorCode::MissingTool, "Required tool '" + tool + "' not found in PATH");
  }
}

void SshTransport::health_check() {
  require_tool("ssh");
  require_tool("scp");
  check_destination();
}

// Creating the tree runs one remote mkdir; scp is not involved.
void SshTransport::check_provision() {
  require_tool("ssh");
  check_destination();
}

void SshTransport::check_destination() const {
  if(options_.remote_host.empty()) {
    throw SyncError(ErrorCode::MissingArg, "--remote-host is required for ssh transport");
  }
  if(options_.remote_root.empty()) {
    throw SyncError(ErrorCode::MissingArg, "--remote-root is required for ssh transport");
  }
}

std::vector<std::string> SshTransport::ssh_argv(const std::string& command_line) const {
  std::vector<std::string> argv{"ssh"};
  auto opts = common_options();
  argv.insert(argv.end(), opts.begin(), opts.end());
  argv.push_back("-o");
  argv.push_back("ConnectTimeout=" + std::to_string(options_.timeout.count()));
  if(options_.remote_port > 0) {
    argv.push_back("-p");
    argv.push_back(std::to_string(options_.remote_port));
  }
  argv.push_back(options_.remote_host);
  argv.push_back(command_line);
  return argv;
}

// scp spells the port flag -P, unlike ssh.
std::vector<std::string> SshTransport::scp_argv(bool legacy_protocol,
                                                 const std::string& source,
                                                 const std::string& destination) const {
  std::vector<std::string> argv{"scp"};
  if(legacy_protocol) argv.push_back("-O");
  argv.push_back("-C");
  if(options_.verbose) argv.push_back("-v");
  auto opts = common_options();
  argv.insert(argv.end(), opts.begin(), opts.end());
  if(options_.remote_port > 0) {
    argv.push_back("-P");
    argv.push_back(std::to_string(options_.remote_port));
  }
  argv.push_back("--");
  argv.push_back(source);
  argv.push_back(destination);
  return argv;
}

std::string SshTransport::remote_spec(const std::string& remote_path) const {
  return options_.remote_host + ":" + shell_quote(remote_path);
}

RemoteCommand SshTransport::tree_command(const std::string& root) {
  RemoteCommand command("mkdir");
  command.arg("-p");
  for(const auto* name : kSyncRootDirectories) {
    command.arg(join_remote(root, name));
  }
  return command;
}

RemoteCommand SshTransport::digest_command(const std::string& remote_path) {
  RemoteCommand command;
  command.raw("if command -v sha256sum >/dev/null 2>&1; then sha256sum -b").arg(remote_path)
         .raw("; elif command -v openssl >/dev/null 2>&1; then openssl dgst -sha256 -r").arg(remote_path)
         .raw(std::string("; else echo ") + kMissingHashMarker + "; exit " +
              std::to_string(kCommandNotFound) + "; fi");
  return command;
}

CommandOutcome SshTransport::run_remote_command(const RemoteCommand& command) {
  auto argv = ssh_argv(command.str());
  logger_->info("CMD: {}", format_argv(argv));
  auto outcome = runner_->run(argv, options_.timeout);
  if(!outcome.ok()) {
    logger_->warn("ssh {} failed: {}", options_.remote_host, outcome.summary());
  }
  return outcome;
}

void SshTransport::run_checked(const RemoteCommand& command, const std::string& failure_message) {
  auto outcome = run_remote_command(command);
  if(!outcome.ok()) {
    throw SyncError(ErrorCode::SshCmdFailed, failure_message + " (" + outcome.summary() + ")");
  }
}

void SshTransport::provision_tree() {
  run_checked(tree_command(options_.remote_root),
              "Failed to create remote tree at " + options_.remote_root);
}

std::vector<RemoteFile> SshTransport::list_outbox() {
  auto outbox = remote_dir("outbox");
  // An outbox that does not exist yet lists as empty. Only a dry run reaches
  // this, since a real receive provisions the tree first.
  RemoteCommand command("test");
  command.raw("! -d").arg(outbox)
         .raw("|| find").arg(outbox).raw("-maxdepth 1 -type f -print0");
  auto outcome = run_remote_command(command);
  if(!outcome.ok()) {
    throw SyncError(ErrorCode::SshCmdFailed,
                    "Failed to list remote outbox " + outbox + " (" + outcome.summary() + ")");
  }

  std::vector<RemoteFile> files;
  std::size_t start = 0;
  while(start < outcome.out.size()) {
    auto end = outcome.out.find('\0', start);
    if(end == std::string::npos) end = outcome.out.size();
    std::string path = outcome.out.substr(start, end - start);
    start = end + 1;
    if(path.empty()) continue;
    auto name = remote_basename(path);
    if(ends_with(name, kStagingSuffix)) {
      logger_->debug("Skipping staging artifact {}", path);
      continue;
    }
    files.push_back(RemoteFile{name, path, std::nullopt});
  }
  std::sort(files.begin(), files.end(),
            [](const RemoteFile& a, const RemoteFile& b){ return a.name < b.name; });
  return files;
}

void SshTransport::copy(const std::string& source,
                        const std::string& destination,
                        bool upload,
                        const std::string& file_name) {
  const char* direction = upload ? "upload" : "download";
  auto primary = scp_argv(false, source, destination);
  logger_->info("CMD: {}", format_argv(primary));
  auto first = runner_->run(primary, options_.timeout);
  if(first.ok()) return;

  auto legacy = scp_argv(true, source, destination);
  logger_->warn("scp {} of {} failed ({}), retrying with legacy protocol",
                direction, file_name, first.summary());
  logger_->info("CMD: {}", format_argv(legacy));
  auto second = runner_->run(legacy, options_.timeout);
  if(second.ok()) return;

  std::string detail = first.summary() + " | legacy:-O -> " + second.summary();
  logger_->error("scp {} of {} failed: {}", direction, file_name, detail);
  throw SyncError(ErrorCode::ScpFailed,
                  std::string(upload ? "Upload" : "Download") + " failed for " + file_name +
                  " - scp: " + detail);
}

void SshTransport::send_file(const std::filesystem::path& local, const std::string& remote_path) {
  copy(local.string(), remote_spec(remote_path), true, local.filename().string());
}

void SshTransport::receive_file(const std::string& remote_path, const std::filesystem::path& local) {
  copy(remote_spec(remote_path), local.string(), false, remote_basename(remote_path));
}

std::optional<std::string> SshTransport::remote_digest(const std::string& remote_path) {
  auto outcome = run_remote_command(digest_command(remote_path));
  if(trim_whitespace(outcome.out) == kMissingHashMarker ||
     (outcome.launched && !outcome.timed_out && outcome.exit_code == kCommandNotFound)) {
    return std::nullopt;
  }
  if(!outcome.ok()) {
    throw SyncError(ErrorCode::SshCmdFailed,
                    "Remote hash of " + remote_path + " failed (" + outcome.summary() + ")");
  }
  std::string token;
  for(char ch : outcome.out) {
    if(std::isspace(static_cast<unsigned char>(ch))) {
      if(!token.empty()) break;
      continue;
    }
    token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  if(!is_sha256_hex(token)) {
    logger_->warn("Unexpected remote hash output for {}: '{}'", remote_path, outcome.out);
    return std::nullopt;
  }
  return token;
}

void SshTransport::commit(const std::string& staging_path, const std::string& final_path) {
  RemoteCommand command("mv");
  command.arg(staging_path).arg(final_path);
  run_checked(command, "Failed to finalize " + remote_basename(final_path) + " on remote");
}

void SshTransport::discard(const std::string& remote_path) {
  RemoteCommand command("rm");
  command.arg("-f").arg(remote_path);
  auto outcome = run_remote_command(command);
  if(!outcome.ok()) {
    logger_->warn("Unable to remove remote staging file {}", remote_path);
  }
}

void SshTransport::archive_remote(const std::string& remote_path) {
  auto archive = remote_dir("archive");
  RemoteCommand command("mkdir");
  command.arg("-p").arg(archive)
         .then(RemoteCommand("mv").arg(remote_path).arg(join_remote(archive, remote_basename(remote_path))));
  run_checked(command, "Failed to archive remote " + remote_path);
}
