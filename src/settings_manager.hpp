#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// One row per setting. Option names accept '-' and '_' interchangeably.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","operation"},       {"aliases", {"op"}},             {"type","string"}, {"default",""},      {"description","send | receive | provision-remote | discover-remote-storage | transport-probe"}},
  {{"key","transport"},       {"aliases", {"t"}},              {"type","string"}, {"default","auto"},  {"description","ssh, usb-fs or auto"}},
  {{"key","local_root"},      {"aliases", {"root","lr"}},      {"type","string"}, {"default",""},      {"description","Local sync root"}},
  {{"key","remote_host"},     {"aliases", {"host"}},           {"type","string"}, {"default",""},      {"description","user@host for the ssh transport"}},
  {{"key","remote_port"},     {"aliases", {"port","p"}},       {"type","int"},    {"default",0},       {"description","ssh port (0 = ssh default)"}},
  {{"key","remote_root"},     {"aliases", {"rr"}},             {"type","string"}, {"default",""},      {"description","Remote sync root (under the mount for usb-fs)"}},
  {{"key","usb_mount"},       {"aliases", {"mount"}},          {"type","string"}, {"default",""},      {"description","Mount point of the device storage"}},
  {{"key","dry_run"},         {"aliases", {"n"}},              {"type","bool"},   {"default",false},   {"description","Log intended changes without making them"}},
  {{"key","timeout"},         {"aliases", nlohmann::json::array()},{"type","int"},    {"default",30},      {"description","Seconds allowed per external command"}},
  {{"key","verbose"},         {"aliases", {"v"}},              {"type","bool"},   {"default",false},   {"description","Debug logging on stderr"}},
  {{"key","archive"},         {"aliases", nlohmann::json::array()},{"type","bool"},   {"default",true},    {"description","Archive local sources after send"}},
  {{"key","ack_remote"},      {"aliases", {"ack"}},            {"type","bool"},   {"default",false},   {"description","Archive remote sources after receive"}},
  {{"key","refresh_cache"},   {"aliases", {"refresh"}},        {"type","bool"},   {"default",false},   {"description","Ignore the discovery cache"}},
  {{"key","jobs"},            {"aliases", {"j"}},              {"type","int"},    {"default",1},       {"description","Accepted for compatibility; transfers are sequential"}},
  {{"key","cache_ttl"},       {"aliases", {"ttl"}},            {"type","int"},    {"default",300},     {"description","Discovery cache lifetime in seconds"}},
  {{"key","state_dir"},       {"aliases", nlohmann::json::array()},{"type","string"}, {"default",""},      {"description","Persistent state directory (default $XDG_STATE_HOME/plansync)"}},
  {{"key","discovery_roots"}, {"aliases", {"roots"}},          {"type","string"}, {"default","/storage/weightlifting"}, {"description","Comma-separated remote roots to scan"}},
  {{"key","discovery_depth"}, {"aliases", {"depth"}},          {"type","int"},    {"default",2},       {"description","Directory depth scanned under each root"}},
  {{"key","config"},          {"aliases", {"c"}},              {"type","string"}, {"default",""},      {"description","JSON settings file applied before the command line"}},
  {{"key","help"},            {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},   {"description","Show command help and exit"}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load_from_file(const std::filesystem::path& path, std::string& error);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  nlohmann::json get_json() const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  // Lower case, '-' folded to '_'.
  static std::string normalize_token(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const std::vector<SettingSpec>& setting_specs() const { return setting_specs_; }

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  bool merge_from_json(const nlohmann::json& doc, std::string& error);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::normalize_token(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::normalize_token(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = normalize_token(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path, std::string& error) {
  std::ifstream in(path);
  if(!in) {
    error = "cannot read " + path.string();
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    error = "failed to parse " + path.string() + ": " + e.what();
    return false;
  }
  if(!doc.is_object()) {
    error = path.string() + " must contain a JSON object";
    return false;
  }
  return merge_from_json(doc, error);
}

// Unknown keys are skipped with a warning; a known key with the wrong type
// fails the whole load.
inline bool SettingsManager::merge_from_json(const nlohmann::json& doc, std::string& error) {
  if(!doc.is_object()) {
    error = "expected a JSON object";
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      log_warn(nullptr, "Ignoring unknown setting '{}'", item.key());
      continue;
    }
    std::string item_error;
    if(!convert_and_store(*spec, item.value(), item_error)) {
      error = "setting '" + item.key() + "': " + item_error;
      return false;
    }
  }
  return true;
}

inline nlohmann::json SettingsManager::get_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs()) {
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                                  const nlohmann::json& value,
                                                  std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                             const std::string& value,
                                                             std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception&) {
      error = "expected integer";
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                                const std::string& value,
                                                std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::string SettingsManager::normalize_token(std::string value) {
  value = to_lower(std::move(value));
  std::replace(value.begin(), value.end(), '-', '_');
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
