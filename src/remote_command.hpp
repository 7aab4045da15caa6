#pragma once

#include <string>
#include <vector>

// Single-quotes a value for a POSIX shell. Embedded single quotes become '\''.
std::string shell_quote(const std::string& value);

// Builds one command line for the remote shell. Arguments added with arg()
// are always quoted; raw() is reserved for fixed program names, operators and
// script text written in this code base, never for caller-supplied values.
class RemoteCommand {
public:
  RemoteCommand() = default;
  explicit RemoteCommand(const std::string& program);

  RemoteCommand& arg(const std::string& value);
  RemoteCommand& args(const std::vector<std::string>& values);
  RemoteCommand& raw(const std::string& fragment);
  RemoteCommand& then(const RemoteCommand& next);

  const std::string& str() const { return line_; }
  bool empty() const { return line_.empty(); }

private:
  void append(const std::string& piece);

  std::string line_;
};
