#pragma once

#include "command_runner.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace plansync::test {

inline std::filesystem::path make_workspace(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() / "plansync_tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

inline void remove_workspace(const std::filesystem::path& root) {
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) throw std::runtime_error("cannot write " + path.string());
  out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

inline std::vector<std::string> list_names(const std::filesystem::path& dir) {
  std::vector<std::string> names;
  std::error_code ec;
  for(std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    names.push_back(it->path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

// relative path -> content ("<dir>" for directories). Paths under any of
// `skip` are left out.
inline std::map<std::string, std::string> snapshot_tree(const std::filesystem::path& root,
                                                        const std::set<std::string>& skip = {}) {
  std::map<std::string, std::string> out;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(root, ec), end;
  for(; !ec && it != end; it.increment(ec)) {
    auto relative = std::filesystem::relative(it->path(), root).generic_string();
    auto top = relative.substr(0, relative.find('/'));
    if(skip.count(top)) {
      if(it->is_directory()) it.disable_recursion_pending();
      continue;
    }
    out[relative] = it->is_directory() ? "<dir>" : read_file(it->path());
  }
  return out;
}

// SHA-256 of an in-memory string, hex encoded like sha256_file.
inline std::string digest_of(const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if(EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_Digest failed");
  }
  return hex_from_bytes(std::vector<unsigned char>(digest, digest + digest_len));
}

inline void configure(SettingsManager& settings, const std::string& key, const nlohmann::json& value) {
  std::string error;
  if(!settings.set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

// Undoes shell_quote on the path half of a "host:'path'" scp operand.
inline std::string unquote_remote_operand(const std::string& operand) {
  if(!operand.empty() && operand.front() == '/') return operand;
  auto colon = operand.find(':');
  std::string quoted = colon == std::string::npos ? operand : operand.substr(colon + 1);
  std::string out;
  bool in_quotes = false;
  for(std::size_t i = 0; i < quoted.size(); ++i) {
    char ch = quoted[i];
    if(ch == '\'') {
      in_quotes = !in_quotes;
    } else if(ch == '\\' && !in_quotes && i + 1 < quoted.size()) {
      out.push_back(quoted[++i]);
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

// Stands in for ssh and scp with the "remote host" being this machine: the
// remote command line runs under /bin/sh, scp becomes a file copy. Faults
// are injected per instance and every argv is recorded.
class FakeCommandRunner : public CommandRunner {
public:
  std::set<std::string> missing_tools;
  bool unreachable = false;
  bool hash_tool_missing = false;
  // Modern-protocol scp calls fail; the legacy (-O) retry still works.
  bool fail_modern_scp = false;
  bool fail_all_scp = false;
  // Appended to every uploaded file after the copy.
  std::string upload_corruption;

  CommandOutcome run(const std::vector<std::string>& argv,
                     std::chrono::seconds timeout) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(argv);
    }
    if(argv.empty()) return failed(2, "empty argv");
    if(argv.front() == "ssh") return run_ssh(argv, timeout);
    if(argv.front() == "scp") return run_scp(argv);
    return failed(127, argv.front() + ": not emulated");
  }

  bool has_tool(const std::string& name) const override {
    return missing_tools.count(name) == 0;
  }

  std::vector<std::vector<std::string>> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  std::size_t count_calls(const std::string& program,
                          const std::string& containing = std::string()) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(),
      [&](const std::vector<std::string>& argv){
        if(argv.empty() || argv.front() != program) return false;
        if(containing.empty()) return true;
        return std::find(argv.begin(), argv.end(), containing) != argv.end();
      }));
  }

private:
  static CommandOutcome failed(int code, const std::string& err) {
    CommandOutcome outcome;
    outcome.exit_code = code;
    outcome.err = err;
    return outcome;
  }

  CommandOutcome run_ssh(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    if(unreachable) {
      return failed(255, "ssh: connect to host " + argv[argv.size() - 2] + " port 22: Connection refused");
    }
    const auto& command = argv.back();
    if(hash_tool_missing && command.find("sha256sum") != std::string::npos) {
      auto outcome = failed(127, "");
      outcome.out = "MISSING_HASH_TOOL\n";
      return outcome;
    }
    return shell_.run({"/bin/sh", "-c", command}, timeout);
  }

  CommandOutcome run_scp(const std::vector<std::string>& argv) {
    bool legacy = std::find(argv.begin(), argv.end(), "-O") != argv.end();
    if(fail_all_scp || (fail_modern_scp && !legacy)) {
      return failed(1, legacy ? "scp: protocol error: lost connection"
                              : "scp: subsystem request failed on channel 0");
    }
    auto separator = std::find(argv.begin(), argv.end(), "--");
    if(separator == argv.end() || std::distance(separator, argv.end()) != 3) {
      return failed(1, "usage: scp");
    }
    const std::string& source_operand = *(separator + 1);
    const std::string& destination_operand = *(separator + 2);
    bool upload = !source_operand.empty() && source_operand.front() == '/';
    std::filesystem::path source = unquote_remote_operand(source_operand);
    std::filesystem::path destination = unquote_remote_operand(destination_operand);

    std::error_code ec;
    std::filesystem::copy_file(source, destination,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if(ec) return failed(1, "scp: " + source.string() + ": " + ec.message());
    if(upload && !upload_corruption.empty()) {
      std::ofstream out(destination, std::ios::binary | std::ios::app);
      out << upload_corruption;
    }
    CommandOutcome outcome;
    outcome.exit_code = 0;
    return outcome;
  }

  ProcessRunner shell_;
  mutable std::mutex mutex_;
  std::vector<std::vector<std::string>> calls_;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

} // namespace plansync::test
