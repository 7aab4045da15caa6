#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "remote_command.hpp"
#include "ssh_transport.hpp"

inline constexpr std::chrono::seconds kDefaultDiscoveryTTL{300};
inline constexpr int kDefaultDiscoveryDepth = 2;
inline constexpr const char* kDefaultDiscoveryRoots = "/storage/weightlifting";

struct DiscoveredDir {
  std::string path;
  std::uint64_t free_bytes = 0;
  std::string owner;
  bool writable = false;
};

nlohmann::json make_discovered_dir(const DiscoveredDir& dir);

// One JSON array per host under <state_dir>/remote_dirs. Reads and writes are
// unlocked; a lost write only costs one extra live query.
class DiscoveryCache {
public:
  DiscoveryCache(std::filesystem::path directory,
                 std::chrono::seconds ttl = kDefaultDiscoveryTTL,
                 std::shared_ptr<Logger> logger = nullptr);

  std::filesystem::path path_for(const std::string& host) const;
  std::optional<nlohmann::json> load_fresh(const std::string& host) const;
  bool store(const std::string& host, const nlohmann::json& dirs) const;

private:
  std::filesystem::path directory_;
  std::chrono::seconds ttl_;
  std::shared_ptr<Logger> logger_;
};

struct DiscoveryOptions {
  std::vector<std::string> roots{kDefaultDiscoveryRoots};
  int depth = kDefaultDiscoveryDepth;
  bool refresh = false;
};

struct DiscoveryReport {
  nlohmann::json dirs = nlohmann::json::array();
  bool cache_hit = false;
};

class RemoteDiscovery {
public:
  RemoteDiscovery(SshTransport& transport,
                  DiscoveryCache cache,
                  DiscoveryOptions options,
                  std::shared_ptr<Logger> logger);

  // Throws MISSING_ARG, MISSING_TOOL or SSH_UNREACHABLE.
  DiscoveryReport discover();

  static RemoteCommand enumeration_command(const std::vector<std::string>& roots, int depth);
  static std::vector<DiscoveredDir> parse_listing(const std::string& output, Logger* logger = nullptr);
  // Writable first, then most free space, then path.
  static void rank(std::vector<DiscoveredDir>& dirs);

private:
  SshTransport& transport_;
  DiscoveryCache cache_;
  DiscoveryOptions options_;
  std::shared_ptr<Logger> logger_;
};
