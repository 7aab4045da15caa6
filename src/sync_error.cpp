#include "sync_error.hpp"

const char* to_string(ErrorCode code) {
  switch(code) {
    case ErrorCode::LockHeld:             return "LOCK_HELD";
    case ErrorCode::LocalRootUnwritable:  return "LOCAL_ROOT_UNWRITABLE";
    case ErrorCode::MissingArg:           return "MISSING_ARG";
    case ErrorCode::InvalidArg:           return "INVALID_ARG";
    case ErrorCode::MissingTool:          return "MISSING_TOOL";
    case ErrorCode::PathNotWritable:      return "PATH_NOT_WRITABLE";
    case ErrorCode::PathNotFound:         return "PATH_NOT_FOUND";
    case ErrorCode::SshCmdFailed:         return "SSH_CMD_FAILED";
    case ErrorCode::SshUnreachable:       return "SSH_UNREACHABLE";
    case ErrorCode::ScpFailed:            return "SCP_FAILED";
    case ErrorCode::ChecksumMismatch:     return "CHECKSUM_MISMATCH";
    case ErrorCode::ChecksumUnavailable:  return "CHECKSUM_UNAVAILABLE";
    case ErrorCode::NoTransportAvailable: return "NO_TRANSPORT_AVAILABLE";
    case ErrorCode::Unsupported:          return "UNSUPPORTED";
    case ErrorCode::InternalError:        return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}
