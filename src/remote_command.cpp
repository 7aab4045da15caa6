#include "remote_command.hpp"

std::string shell_quote(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for(char ch : value) {
    if(ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

RemoteCommand::RemoteCommand(const std::string& program) {
  append(program);
}

void RemoteCommand::append(const std::string& piece) {
  if(!line_.empty()) line_.push_back(' ');
  line_ += piece;
}

RemoteCommand& RemoteCommand::arg(const std::string& value) {
  append(shell_quote(value));
  return *this;
}

RemoteCommand& RemoteCommand::args(const std::vector<std::string>& values) {
  for(const auto& value : values) arg(value);
  return *this;
}

RemoteCommand& RemoteCommand::raw(const std::string& fragment) {
  if(!fragment.empty()) append(fragment);
  return *this;
}

RemoteCommand& RemoteCommand::then(const RemoteCommand& next) {
  if(next.empty()) return *this;
  if(line_.empty()) {
    line_ = next.line_;
  } else {
    line_ += " && " + next.line_;
  }
  return *this;
}
