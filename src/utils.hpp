#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Streams the file through SHA-256. nullopt when it cannot be read.
std::optional<std::string> sha256_file(const std::filesystem::path& file);
bool is_sha256_hex(const std::string& candidate);

// Replaces every character outside [A-Za-z0-9._-] with '_'.
std::string sanitize_host(const std::string& host);

// Local time as YYYYmmdd-HHMMSS, the prefix used for archived files.
std::string timestamp_compact(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());
// Same as timestamp_compact with a trailing -mmm millisecond field.
std::string timestamp_compact_ms(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

// Strips leading and trailing whitespace.
std::string trim_whitespace(std::string value);
bool ends_with(const std::string& value, const std::string& suffix);
std::vector<std::string> split_list(const std::string& value, char separator);
