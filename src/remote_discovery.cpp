#include "remote_discovery.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "sync_error.hpp"
#include "utils.hpp"

nlohmann::json make_discovered_dir(const DiscoveredDir& dir) {
  nlohmann::json j;
  j["path"] = dir.path;
  j["free_bytes"] = dir.free_bytes;
  j["owner"] = dir.owner;
  j["writable"] = dir.writable;
  return j;
}

DiscoveryCache::DiscoveryCache(std::filesystem::path directory,
                               std::chrono::seconds ttl,
                               std::shared_ptr<Logger> logger)
  : directory_(std::move(directory)),
    ttl_(ttl),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery-cache")) {}

std::filesystem::path DiscoveryCache::path_for(const std::string& host) const {
  return directory_ / (sanitize_host(host) + ".json");
}

std::optional<nlohmann::json> DiscoveryCache::load_fresh(const std::string& host) const {
  auto path = path_for(host);
  std::error_code ec;
  auto mtime = std::filesystem::last_write_time(path, ec);
  if(ec) return std::nullopt;

  auto age = std::filesystem::file_time_type::clock::now() - mtime;
  if(age >= ttl_) {
    logger_->debug("Cache {} is stale", path.string());
    return std::nullopt;
  }

  std::ifstream in(path);
  if(!in) return std::nullopt;
  try {
    nlohmann::json doc;
    in >> doc;
    if(!doc.is_array()) {
      logger_->warn("Ignoring malformed cache {}", path.string());
      return std::nullopt;
    }
    return doc;
  } catch(const std::exception& e) {
    logger_->warn("Failed to parse {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

bool DiscoveryCache::store(const std::string& host, const nlohmann::json& dirs) const {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  auto path = path_for(host);
  auto temp = path;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::trunc);
    if(!out) {
      logger_->warn("Unable to write {}", temp.string());
      return false;
    }
    out << dirs.dump();
    if(!out) {
      logger_->warn("Unable to write {}", temp.string());
      return false;
    }
  }
  std::filesystem::rename(temp, path, ec);
  if(ec) {
    logger_->warn("Unable to replace {}: {}", path.string(), ec.message());
    std::filesystem::remove(temp, ec);
    return false;
  }
  return true;
}

RemoteDiscovery::RemoteDiscovery(SshTransport& transport,
                                 DiscoveryCache cache,
                                 DiscoveryOptions options,
                                 std::shared_ptr<Logger> logger)
  : transport_(transport),
    cache_(std::move(cache)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")) {}

// Prints one "free_kib<TAB>owner<TAB>writable<TAB>path" line per directory.
// The path goes last so embedded tabs survive parsing.
RemoteCommand RemoteDiscovery::enumeration_command(const std::vector<std::string>& roots, int depth) {
  RemoteCommand command;
  command.raw("for d in").args(roots).raw("; do")
         .raw("[ -d \"$d\" ] || continue;")
         .raw("find \"$d\" -maxdepth " + std::to_string(std::max(depth, 0)) +
              " -type d 2>/dev/null | while IFS= read -r p; do")
         .raw("fb=$(df -Pk \"$p\" 2>/dev/null | awk 'NR==2{print $4}');")
         .raw("[ -n \"$fb\" ] || fb=0;")
         .raw("owner=$(stat -c %U \"$p\" 2>/dev/null || echo '');")
         .raw("if [ -w \"$p\" ]; then w=1; else w=0; fi;")
         .raw("printf '%s\\t%s\\t%s\\t%s\\n' \"$fb\" \"$owner\" \"$w\" \"$p\";")
         .raw("done; done");
  return command;
}

std::vector<DiscoveredDir> RemoteDiscovery::parse_listing(const std::string& output, Logger* logger) {
  std::vector<DiscoveredDir> dirs;
  std::istringstream in(output);
  std::string line;
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) continue;
    auto first = line.find('\t');
    auto second = first == std::string::npos ? first : line.find('\t', first + 1);
    auto third = second == std::string::npos ? second : line.find('\t', second + 1);
    if(third == std::string::npos) {
      log_warn(logger, "Skipping malformed discovery line '{}'", line);
      continue;
    }
    DiscoveredDir dir;
    try {
      dir.free_bytes = std::stoull(line.substr(0, first)) * 1024ULL;
    } catch(const std::exception&) {
      log_warn(logger, "Skipping discovery line with bad free space '{}'", line);
      continue;
    }
    dir.owner = line.substr(first + 1, second - first - 1);
    dir.writable = line.substr(second + 1, third - second - 1) == "1";
    dir.path = line.substr(third + 1);
    if(dir.path.empty()) continue;
    dirs.push_back(std::move(dir));
  }
  return dirs;
}

void RemoteDiscovery::rank(std::vector<DiscoveredDir>& dirs) {
  std::stable_sort(dirs.begin(), dirs.end(), [](const DiscoveredDir& a, const DiscoveredDir& b){
    if(a.writable != b.writable) return a.writable;
    if(a.free_bytes != b.free_bytes) return a.free_bytes > b.free_bytes;
    return a.path < b.path;
  });
}

DiscoveryReport RemoteDiscovery::discover() {
  transport_.require_tool("ssh");
  const auto& host = transport_.remote_host();
  if(host.empty()) {
    throw SyncError(ErrorCode::MissingArg, "--remote-host is required");
  }

  DiscoveryReport report;
  if(!options_.refresh) {
    if(auto cached = cache_.load_fresh(host)) {
      logger_->info("Discovery cache hit for {} ({})", host, cache_.path_for(host).string());
      report.dirs = std::move(*cached);
      report.cache_hit = true;
      return report;
    }
  }

  auto outcome = transport_.run_remote_command(enumeration_command(options_.roots, options_.depth));
  if(!outcome.ok()) {
    throw SyncError(ErrorCode::SshUnreachable,
                    "Failed to connect or run discovery via SSH (" + outcome.summary() +
                    ") on " + host);
  }

  auto dirs = parse_listing(outcome.out, logger_.get());
  rank(dirs);
  for(const auto& dir : dirs) {
    report.dirs.push_back(make_discovered_dir(dir));
  }
  logger_->info("Discovered {} candidate directories on {}", dirs.size(), host);
  if(!cache_.store(host, report.dirs)) {
    logger_->warn("Discovery cache for {} not updated", host);
  }
  return report;
}
