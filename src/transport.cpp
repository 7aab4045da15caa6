#include "transport.hpp"

const char* to_string(TransportKind kind) {
  switch(kind) {
    case TransportKind::Ssh:   return "ssh";
    case TransportKind::UsbFs: return "usb-fs";
  }
  return "ssh";
}

std::string join_remote(const std::string& base, const std::string& leaf) {
  if(base.empty()) return leaf;
  if(leaf.empty()) return base;
  if(base.back() == '/') return base + leaf;
  return base + "/" + leaf;
}

std::string remote_basename(const std::string& path) {
  auto trimmed = path;
  while(trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
  auto pos = trimmed.find_last_of('/');
  if(pos == std::string::npos) return trimmed;
  return trimmed.substr(pos + 1);
}
