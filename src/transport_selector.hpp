#pragma once

#include <optional>
#include <string>

#include "transport.hpp"

enum class TransportChoice {
  Auto,
  Ssh,
  UsbFs
};

std::optional<TransportChoice> parse_transport_choice(const std::string& value);

// A mount is only preferred when it is present and writable; an unmounted or
// read-only volume falls back to the login transport.
bool mount_healthy(const std::string& usb_mount);

// Throws NO_TRANSPORT_AVAILABLE for an unknown choice.
TransportKind select_transport(const std::string& requested, const std::string& usb_mount);
