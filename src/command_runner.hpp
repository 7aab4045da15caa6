#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct CommandOutcome {
  bool launched = true;
  bool timed_out = false;
  int exit_code = -1;
  std::string out;
  std::string err;

  bool ok() const { return launched && !timed_out && exit_code == 0; }
  // One-line description for error messages: exit status plus trimmed stderr.
  std::string summary() const;
};

// Seam between the transports and the operating system. Tests substitute a
// runner that emulates ssh/scp against a local directory.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  virtual CommandOutcome run(const std::vector<std::string>& argv,
                             std::chrono::seconds timeout) = 0;
  virtual bool has_tool(const std::string& name) const = 0;
};

// fork/exec runner. stdout and stderr are captured through pipes read on an
// asio io_context; when the deadline fires the child's process group is
// killed and the outcome is marked timed_out.
class ProcessRunner : public CommandRunner {
public:
  CommandOutcome run(const std::vector<std::string>& argv,
                     std::chrono::seconds timeout) override;
  bool has_tool(const std::string& name) const override;
};

std::optional<std::filesystem::path> find_in_path(const std::string& name);
std::string format_argv(const std::vector<std::string>& argv);
