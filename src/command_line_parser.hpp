#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto a SettingsManager. Positional arguments fill the keys named
// in argv_spec in index order; "--key value" and "-alias value" set anything
// in the settings table. Bad input throws SyncError(INVALID_ARG).
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "plansync",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","operation"}}
                    }));

  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
