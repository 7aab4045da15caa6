#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "sync_result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

// Pushes two plans from a scratch sync root onto a scratch "device" mount
// and prints the result record.
int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "sync_engine_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "desktop" / "outbox", ec);
  fs::create_directories(base / "device", ec);

  for(const char* name : {"week-01.json", "week-02.json"}) {
    std::ofstream out(base / "desktop" / "outbox" / name);
    out << nlohmann::json{{"plan", name}, {"sets", 5}, {"reps", 5}}.dump();
  }

  auto settings = std::make_shared<SettingsManager>();
  auto configure = [](const std::shared_ptr<SettingsManager>& settings,
                      const std::string& key,
                      const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure(settings, "operation", "send");
  configure(settings, "local_root", (base / "desktop").string());
  configure(settings, "usb_mount", (base / "device").string());
  configure(settings, "remote_root", "/plans");

  SyncEngine engine(settings, SyncEngine::Options{});
  auto result = engine.run();
  std::cout << make_result_record(result).dump(2) << "\n";

  fs::remove_all(base, ec);
  return result.exit_code();
}
