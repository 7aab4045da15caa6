#include "mount_transport.hpp"

#include <algorithm>

#include "sync_error.hpp"
#include "sync_root.hpp"
#include "utils.hpp"

MountTransport::MountTransport(TransportOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("usb-fs")) {}

std::string MountTransport::remote_root() const {
  std::string relative = options_.remote_root;
  while(!relative.empty() && relative.front() == '/') relative.erase(relative.begin());
  return (std::filesystem::path(options_.usb_mount) / relative).lexically_normal().string();
}

void MountTransport::health_check() {
  if(options_.usb_mount.empty()) {
    throw SyncError(ErrorCode::MissingArg, "--usb-mount is required for usb-fs transport");
  }
  if(options_.remote_root.empty()) {
    throw SyncError(ErrorCode::MissingArg, "--remote-root is required (path under mount)");
  }
  if(!is_writable_directory(options_.usb_mount)) {
    throw SyncError(ErrorCode::PathNotWritable, "USB mount not writable: " + options_.usb_mount);
  }
}

void MountTransport::check_receive_source() {
  auto outbox = remote_dir("outbox");
  std::error_code ec;
  if(!std::filesystem::is_directory(outbox, ec)) {
    throw SyncError(ErrorCode::PathNotFound, "USB outbox not found: " + outbox);
  }
}

void MountTransport::provision_tree() {
  logger_->info("Provisioning {}", remote_root());
  provision_directory_tree(remote_root(), ErrorCode::PathNotWritable);
}

std::vector<RemoteFile> MountTransport::list_outbox() {
  std::vector<RemoteFile> files;
  auto outbox = std::filesystem::path(remote_dir("outbox"));
  std::error_code ec;
  std::filesystem::directory_iterator it(outbox, ec);
  if(ec) {
    throw SyncError(ErrorCode::PathNotFound,
                    "Cannot list USB outbox " + outbox.string() + ": " + ec.message());
  }
  for(const auto& entry : it) {
    std::error_code entry_ec;
    if(!entry.is_regular_file(entry_ec)) continue;
    auto name = entry.path().filename().string();
    if(ends_with(name, kStagingSuffix)) {
      logger_->debug("Skipping staging artifact {}", entry.path().string());
      continue;
    }
    auto size = entry.file_size(entry_ec);
    std::optional<std::uint64_t> bytes;
    if(!entry_ec) bytes = static_cast<std::uint64_t>(size);
    files.push_back(RemoteFile{name, entry.path().string(), bytes});
  }
  std::sort(files.begin(), files.end(),
            [](const RemoteFile& a, const RemoteFile& b){ return a.name < b.name; });
  return files;
}

void MountTransport::copy_file(const std::filesystem::path& source,
                               const std::filesystem::path& destination) {
  logger_->info("COPY: {} -> {}", source.string(), destination.string());
  std::error_code ec;
  std::filesystem::create_directories(destination.parent_path(), ec);
  if(!ec) {
    std::filesystem::copy_file(source, destination,
                               std::filesystem::copy_options::overwrite_existing, ec);
  }
  if(ec) {
    throw SyncError(ErrorCode::PathNotWritable,
                    "Copy " + source.string() + " -> " + destination.string() +
                    " failed: " + ec.message());
  }
}

void MountTransport::send_file(const std::filesystem::path& local, const std::string& remote_path) {
  copy_file(local, remote_path);
}

void MountTransport::receive_file(const std::string& remote_path, const std::filesystem::path& local) {
  copy_file(remote_path, local);
}

std::optional<std::string> MountTransport::remote_digest(const std::string& remote_path) {
  return sha256_file(remote_path);
}

void MountTransport::commit(const std::string& staging_path, const std::string& final_path) {
  logger_->info("RENAME: {} -> {}", staging_path, final_path);
  std::error_code ec;
  std::filesystem::rename(staging_path, final_path, ec);
  if(ec) {
    throw SyncError(ErrorCode::PathNotWritable,
                    "Failed to finalize " + final_path + ": " + ec.message());
  }
}

void MountTransport::discard(const std::string& remote_path) {
  std::error_code ec;
  std::filesystem::remove(remote_path, ec);
  if(ec) {
    logger_->warn("Unable to remove staging file {}: {}", remote_path, ec.message());
  }
}

void MountTransport::archive_remote(const std::string& remote_path) {
  auto archive = std::filesystem::path(remote_dir("archive"));
  auto destination = archive / remote_basename(remote_path);
  logger_->info("RENAME: {} -> {}", remote_path, destination.string());
  std::error_code ec;
  std::filesystem::create_directories(archive, ec);
  if(!ec) std::filesystem::rename(remote_path, destination, ec);
  if(ec) {
    throw SyncError(ErrorCode::PathNotWritable,
                    "Failed to archive " + remote_path + ": " + ec.message());
  }
}

CommandOutcome MountTransport::run_remote_command(const RemoteCommand& command) {
  logger_->debug("usb-fs transport has no remote shell; skipping: {}", command.str());
  CommandOutcome outcome;
  outcome.exit_code = 0;
  return outcome;
}
