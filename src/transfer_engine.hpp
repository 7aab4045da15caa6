#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "log.hpp"
#include "sync_result.hpp"
#include "sync_root.hpp"
#include "transport.hpp"

struct TransferOptions {
  bool dry_run = false;
  bool archive = true;
  bool ack_remote = false;
};

// Moves files one at a time through staging -> verify -> rename. The first
// failure aborts the batch by throwing SyncError; files already committed
// stay committed.
class TransferEngine {
public:
  TransferEngine(SyncRoot root,
                 Transport& transport,
                 TransferOptions options,
                 std::shared_ptr<Logger> logger);

  // local outbox -> remote inbox
  TransferBatch send();
  // remote outbox -> local inbox
  TransferBatch receive();

  std::vector<std::filesystem::path> pending_outbox() const;

private:
  TransferItem send_one(const std::filesystem::path& source);
  TransferItem receive_one(const RemoteFile& source);
  void archive_local(const std::filesystem::path& source);
  void prepare_remote();

  SyncRoot root_;
  Transport& transport_;
  TransferOptions options_;
  std::shared_ptr<Logger> logger_;
};
