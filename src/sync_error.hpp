#pragma once

#include <stdexcept>
#include <string>

// Wire codes of the failure record. The names are part of the output
// contract; do not rename.
enum class ErrorCode {
  LockHeld,
  LocalRootUnwritable,
  MissingArg,
  InvalidArg,
  MissingTool,
  PathNotWritable,
  PathNotFound,
  SshCmdFailed,
  SshUnreachable,
  ScpFailed,
  ChecksumMismatch,
  ChecksumUnavailable,
  NoTransportAvailable,
  Unsupported,
  InternalError
};

const char* to_string(ErrorCode code);

class SyncError : public std::runtime_error {
public:
  SyncError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};
