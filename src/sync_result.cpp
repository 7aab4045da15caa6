#include "sync_result.hpp"

const char* to_string(TransferAction action) {
  return action == TransferAction::Sent ? "sent" : "received";
}

nlohmann::json make_transfer_item(const TransferItem& item) {
  nlohmann::json j;
  j["name"] = item.name;
  j["bytes"] = item.bytes;
  j["sha256"] = item.sha256;
  j["action"] = to_string(item.action);
  return j;
}

nlohmann::json make_result_record(const SyncResult& result) {
  nlohmann::json j;
  if(const auto* ok = result.success()) {
    j["status"] = "ok";
    j["transport"] = ok->transport;
    if(ok->batch) {
      auto files = nlohmann::json::array();
      for(const auto& item : ok->batch->files) {
        files.push_back(make_transfer_item(item));
      }
      j["files"] = std::move(files);
      j["bytes"] = ok->batch->bytes;
    }
    for(const auto& field : ok->extra.items()) {
      j[field.key()] = field.value();
    }
    if(ok->dry_run) j["dry_run"] = true;
  } else if(const auto* err = result.failure()) {
    j["status"] = "error";
    j["code"] = to_string(err->code);
    j["message"] = err->message;
  }
  if(result.log_path) {
    j["log_path"] = result.log_path->string();
  }
  j["duration_ms"] = result.duration_ms;
  return j;
}
