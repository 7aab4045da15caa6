#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "sync_error.hpp"
#include "sync_result.hpp"

namespace {

// Exactly one line on stdout per invocation; everything else goes to stderr.
int emit(const SyncResult& result) {
  print_out(nullptr, "{}", make_result_record(result).dump());
  return result.exit_code();
}

SyncResult failure(ErrorCode code,
                   const std::string& message,
                   std::chrono::steady_clock::time_point started_at) {
  SyncResult result;
  result.outcome = SyncFailure{code, message};
  auto elapsed = std::chrono::steady_clock::now() - started_at;
  result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
  return result;
}

} // namespace

int main(int argc, char** argv){
  const auto started_at = std::chrono::steady_clock::now();
  init(false);
  Logger logger("plansync-main");

  try {
    auto settings = std::make_shared<SettingsManager>();
    CommandLineParser parser("plansync");
    try {
      parser.parse(argc, argv, *settings);

      // Config file first, then the command line again so it wins.
      auto config = settings->get<std::string>("config");
      if(!config.empty()) {
        std::string error;
        if(!settings->load_from_file(config, error)) {
          throw SyncError(ErrorCode::InvalidArg, error);
        }
        parser.parse(argc, argv, *settings);
      }
    } catch(const SyncError& e) {
      logger.error("{}", e.what());
      parser.usage();
      return emit(failure(e.code(), e.what(), started_at));
    }

    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    SyncEngine::Options options;
    options.started_at = started_at;
    SyncEngine engine(settings, options);
    return emit(engine.run());
  } catch(const std::exception& e) {
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return emit(failure(ErrorCode::InternalError, e.what(), started_at));
  }
}
