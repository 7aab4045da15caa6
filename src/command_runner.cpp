#include "command_runner.hpp"

#include <asio.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "remote_command.hpp"
#include "utils.hpp"

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{20};

void close_pair(int fds[2]) {
  if(fds[0] >= 0) ::close(fds[0]);
  if(fds[1] >= 0) ::close(fds[1]);
  fds[0] = fds[1] = -1;
}

} // namespace

std::string CommandOutcome::summary() const {
  std::string status;
  if(!launched) {
    status = "not started";
  } else if(timed_out) {
    status = "timed out";
  } else {
    status = "exit=" + std::to_string(exit_code);
  }
  auto detail = trim_whitespace(err);
  for(auto& ch : detail) {
    if(ch == '\n' || ch == '\r') ch = ' ';
  }
  if(detail.empty()) return status;
  return status + ": " + detail;
}

CommandOutcome ProcessRunner::run(const std::vector<std::string>& argv,
                                  std::chrono::seconds timeout) {
  CommandOutcome outcome;
  if(argv.empty()) {
    outcome.launched = false;
    outcome.err = "empty command";
    return outcome;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if(::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
    outcome.launched = false;
    outcome.err = std::string("pipe: ") + std::strerror(errno);
    close_pair(out_pipe);
    close_pair(err_pipe);
    return outcome;
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for(const auto& item : argv) c_argv.push_back(const_cast<char*>(item.c_str()));
  c_argv.push_back(nullptr);

  pid_t pid = ::fork();
  if(pid < 0) {
    outcome.launched = false;
    outcome.err = std::string("fork: ") + std::strerror(errno);
    close_pair(out_pipe);
    close_pair(err_pipe);
    return outcome;
  }

  if(pid == 0) {
    // child: own process group so a timeout can take down ssh and its helpers
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if(devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(c_argv[0], c_argv.data());
    _exit(127);
  }

  ::setpgid(pid, pid);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  asio::io_context io;
  asio::posix::stream_descriptor out_stream(io, out_pipe[0]);
  asio::posix::stream_descriptor err_stream(io, err_pipe[0]);
  asio::steady_timer deadline(io, timeout);

  // The deadline covers the whole child lifetime, not just its output. Once
  // both pipes hit EOF the child is polled with WNOHANG until it exits.
  int status = 0;
  bool reaped = false;
  bool wait_failed = false;
  asio::steady_timer reap_poll(io);
  std::function<void()> try_reap = [&]() {
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if(result == pid) {
      reaped = true;
      deadline.cancel();
      return;
    }
    if(result < 0 && errno != EINTR) {
      wait_failed = true;
      deadline.cancel();
      return;
    }
    reap_poll.expires_after(kReapPollInterval);
    reap_poll.async_wait([&](const std::error_code& ec) {
      if(!ec) try_reap();
    });
  };

  int pending_reads = 2;
  auto on_read_done = [&](const std::error_code&, std::size_t) {
    if(--pending_reads == 0) try_reap();
  };
  asio::async_read(out_stream, asio::dynamic_buffer(outcome.out), on_read_done);
  asio::async_read(err_stream, asio::dynamic_buffer(outcome.err), on_read_done);

  deadline.async_wait([&](const std::error_code& ec) {
    if(ec) return;
    outcome.timed_out = true;
    ::kill(-pid, SIGKILL);
    std::error_code ignored;
    out_stream.close(ignored);
    err_stream.close(ignored);
  });

  io.run();

  if(wait_failed || !reaped) {
    outcome.exit_code = -1;
    return outcome;
  }
  if(WIFEXITED(status)) {
    outcome.exit_code = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    outcome.exit_code = 128 + WTERMSIG(status);
  }
  return outcome;
}

bool ProcessRunner::has_tool(const std::string& name) const {
  return find_in_path(name).has_value();
}

std::optional<std::filesystem::path> find_in_path(const std::string& name) {
  if(name.empty()) return std::nullopt;
  if(name.find('/') != std::string::npos) {
    if(::access(name.c_str(), X_OK) == 0) return std::filesystem::path(name);
    return std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  if(!path_env) return std::nullopt;
  for(const auto& dir : split_list(path_env, ':')) {
    auto candidate = std::filesystem::path(dir) / name;
    std::error_code ec;
    if(std::filesystem::is_regular_file(candidate, ec) &&
       ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::string format_argv(const std::vector<std::string>& argv) {
  std::string line;
  for(const auto& item : argv) {
    if(!line.empty()) line.push_back(' ');
    bool plain = !item.empty() &&
      item.find_first_of(" \t\n'\"\\$`*?&;|<>(){}") == std::string::npos;
    line += plain ? item : shell_quote(item);
  }
  return line;
}
