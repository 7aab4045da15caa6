#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sync_error.hpp"

enum class TransferAction {
  Sent,
  Received
};

const char* to_string(TransferAction action);

struct TransferItem {
  std::string name;
  std::uint64_t bytes = 0;
  std::string sha256;
  TransferAction action = TransferAction::Sent;
};

struct TransferBatch {
  std::vector<TransferItem> files;
  std::uint64_t bytes = 0;

  void add(TransferItem item) {
    bytes += item.bytes;
    files.push_back(std::move(item));
  }
};

struct SyncSuccess {
  std::string transport;
  std::optional<TransferBatch> batch;
  // Operation-specific fields (setup, dirs, cache).
  nlohmann::json extra = nlohmann::json::object();
  bool dry_run = false;
};

struct SyncFailure {
  ErrorCode code = ErrorCode::InternalError;
  std::string message;
};

struct SyncResult {
  std::variant<SyncSuccess, SyncFailure> outcome;
  std::optional<std::filesystem::path> log_path;
  std::int64_t duration_ms = 0;

  bool ok() const { return std::holds_alternative<SyncSuccess>(outcome); }
  const SyncSuccess* success() const { return std::get_if<SyncSuccess>(&outcome); }
  const SyncFailure* failure() const { return std::get_if<SyncFailure>(&outcome); }
  int exit_code() const { return ok() ? 0 : 1; }
};

nlohmann::json make_transfer_item(const TransferItem& item);
nlohmann::json make_result_record(const SyncResult& result);
