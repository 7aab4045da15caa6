#include "transport_selector.hpp"

#include <algorithm>
#include <cctype>

#include "sync_error.hpp"
#include "sync_root.hpp"

std::optional<TransportChoice> parse_transport_choice(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  if(lowered.empty() || lowered == "auto") return TransportChoice::Auto;
  if(lowered == "ssh" || lowered == "login") return TransportChoice::Ssh;
  if(lowered == "usb-fs" || lowered == "usb_fs" || lowered == "mount") return TransportChoice::UsbFs;
  return std::nullopt;
}

bool mount_healthy(const std::string& usb_mount) {
  return !usb_mount.empty() && is_writable_directory(usb_mount);
}

TransportKind select_transport(const std::string& requested, const std::string& usb_mount) {
  auto choice = parse_transport_choice(requested);
  if(!choice) {
    throw SyncError(ErrorCode::NoTransportAvailable, "No transport available for '" + requested + "'");
  }
  switch(*choice) {
    case TransportChoice::Ssh:   return TransportKind::Ssh;
    case TransportChoice::UsbFs: return TransportKind::UsbFs;
    case TransportChoice::Auto:  break;
  }
  return mount_healthy(usb_mount) ? TransportKind::UsbFs : TransportKind::Ssh;
}
