#include "transfer_engine.hpp"

#include <algorithm>

#include "sync_error.hpp"
#include "utils.hpp"

TransferEngine::TransferEngine(SyncRoot root,
                               Transport& transport,
                               TransferOptions options,
                               std::shared_ptr<Logger> logger)
  : root_(std::move(root)),
    transport_(transport),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")) {}

std::vector<std::filesystem::path> TransferEngine::pending_outbox() const {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  std::filesystem::directory_iterator it(root_.outbox(), ec);
  if(ec) {
    throw SyncError(ErrorCode::LocalRootUnwritable,
                    "Cannot list " + root_.outbox().string() + ": " + ec.message());
  }
  for(const auto& entry : it) {
    std::error_code entry_ec;
    if(!entry.is_regular_file(entry_ec)) continue;
    if(ends_with(entry.path().filename().string(), kStagingSuffix)) continue;
    files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());
  return files;
}

void TransferEngine::prepare_remote() {
  if(options_.dry_run) {
    logger_->info("[dry-run] would provision remote tree at {}", transport_.remote_root());
    return;
  }
  transport_.provision_tree();
}

TransferBatch TransferEngine::send() {
  transport_.health_check();
  prepare_remote();

  TransferBatch batch;
  auto files = pending_outbox();
  logger_->info("Sending {} file(s) over {}", files.size(), transport_.name());
  for(const auto& file : files) {
    batch.add(send_one(file));
  }
  return batch;
}

TransferItem TransferEngine::send_one(const std::filesystem::path& source) {
  TransferItem item;
  item.name = source.filename().string();
  item.action = TransferAction::Sent;

  std::error_code ec;
  auto size = std::filesystem::file_size(source, ec);
  if(ec) {
    throw SyncError(ErrorCode::PathNotFound, "Cannot stat " + source.string() + ": " + ec.message());
  }
  item.bytes = static_cast<std::uint64_t>(size);

  auto digest = sha256_file(source);
  if(!digest) {
    throw SyncError(ErrorCode::PathNotFound, "Cannot read " + source.string());
  }
  item.sha256 = *digest;

  const auto inbox = transport_.remote_dir("inbox");
  const auto staging = join_remote(inbox, item.name + kStagingSuffix);
  const auto final_path = join_remote(inbox, item.name);

  if(options_.dry_run) {
    logger_->info("[dry-run] would copy {} -> {} ({} bytes, sha256 {})",
                  source.string(), staging, item.bytes, item.sha256);
    logger_->info("[dry-run] would verify and rename {} -> {}", staging, final_path);
    if(options_.archive) {
      logger_->info("[dry-run] would archive {} into {}", source.string(), root_.archive().string());
    }
    return item;
  }

  transport_.send_file(source, staging);

  auto remote = transport_.remote_digest(staging);
  if(!remote) {
    transport_.discard(staging);
    throw SyncError(ErrorCode::ChecksumUnavailable,
                    "Remote cannot compute SHA-256 for " + item.name);
  }
  if(*remote != item.sha256) {
    logger_->error("Checksum mismatch for {}: local {} remote {}", item.name, item.sha256, *remote);
    transport_.discard(staging);
    throw SyncError(ErrorCode::ChecksumMismatch,
                    "Checksum mismatch after upload for " + item.name);
  }

  transport_.commit(staging, final_path);
  logger_->info("Sent {} ({} bytes, sha256 {})", item.name, item.bytes, item.sha256);

  if(options_.archive) {
    archive_local(source);
  }
  return item;
}

void TransferEngine::archive_local(const std::filesystem::path& source) {
  auto destination = root_.archive() / (timestamp_compact() + "-" + source.filename().string());
  std::error_code ec;
  std::filesystem::create_directories(root_.archive(), ec);
  ec.clear();
  std::filesystem::rename(source, destination, ec);
  if(ec) {
    std::error_code copy_ec;
    std::filesystem::copy_file(source, destination,
                               std::filesystem::copy_options::overwrite_existing, copy_ec);
    if(!copy_ec) std::filesystem::remove(source, copy_ec);
    if(copy_ec) {
      logger_->warn("Unable to archive {}: {}", source.string(), copy_ec.message());
      return;
    }
  }
  logger_->info("Archived {} -> {}", source.string(), destination.string());
}

TransferBatch TransferEngine::receive() {
  transport_.health_check();
  transport_.check_receive_source();
  prepare_remote();

  TransferBatch batch;
  auto files = transport_.list_outbox();
  logger_->info("Receiving {} file(s) over {}", files.size(), transport_.name());
  for(const auto& file : files) {
    batch.add(receive_one(file));
  }
  return batch;
}

TransferItem TransferEngine::receive_one(const RemoteFile& source) {
  TransferItem item;
  item.name = source.name;
  item.action = TransferAction::Received;

  const auto staging = root_.inbox() / (source.name + kStagingSuffix);
  const auto final_path = root_.inbox() / source.name;

  if(options_.dry_run) {
    item.bytes = source.bytes.value_or(0);
    logger_->info("[dry-run] would copy {} -> {}", source.path, staging.string());
    logger_->info("[dry-run] would verify and rename {} -> {}", staging.string(), final_path.string());
    if(options_.ack_remote) {
      logger_->info("[dry-run] would archive remote {}", source.path);
    }
    return item;
  }

  auto expected = transport_.remote_digest(source.path);
  if(!expected) {
    throw SyncError(ErrorCode::ChecksumUnavailable,
                    "Remote cannot compute SHA-256 for " + source.name);
  }

  std::error_code ec;
  try {
    transport_.receive_file(source.path, staging);
  } catch(const SyncError&) {
    std::filesystem::remove(staging, ec);
    throw;
  }

  auto local = sha256_file(staging);
  if(!local) {
    std::filesystem::remove(staging, ec);
    throw SyncError(ErrorCode::LocalRootUnwritable, "Cannot read downloaded " + staging.string());
  }
  if(*local != *expected) {
    logger_->error("Checksum mismatch for {}: remote {} local {}", source.name, *expected, *local);
    std::filesystem::remove(staging, ec);
    throw SyncError(ErrorCode::ChecksumMismatch,
                    "Checksum mismatch after download for " + source.name);
  }

  std::filesystem::rename(staging, final_path, ec);
  if(ec) {
    throw SyncError(ErrorCode::LocalRootUnwritable,
                    "Failed to finalize " + final_path.string() + ": " + ec.message());
  }
  item.sha256 = *local;
  auto size = std::filesystem::file_size(final_path, ec);
  item.bytes = ec ? 0 : static_cast<std::uint64_t>(size);
  logger_->info("Received {} ({} bytes, sha256 {})", item.name, item.bytes, item.sha256);

  if(options_.ack_remote) {
    try {
      transport_.archive_remote(source.path);
    } catch(const SyncError& e) {
      logger_->warn("Remote acknowledgment failed for {}: {}", source.name, e.what());
    }
  }
  return item;
}
