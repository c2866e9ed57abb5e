#include "splicerelay/common/logging.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace splicerelay::common {

spdlog::level::level_enum Logging::ParseLevel(const std::string& level) noexcept {
  if (level == "debug") {
    return spdlog::level::debug;
  } else if (level == "info") {
    return spdlog::level::info;
  } else if (level == "warn") {
    return spdlog::level::warn;
  } else if (level == "error") {
    return spdlog::level::err;
  } else {
    return spdlog::level::info;
  }
}

void Logging::Initialize(const std::string& level, const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks;

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  sinks.push_back(console_sink);

  if (!log_file.empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, 1024 * 1024 * 10, 5); // 10MB, 5 files
    file_sink->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":"%t","message":"%v"})");
    sinks.push_back(file_sink);
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_level(ParseLevel(level));

  spdlog::drop(kLoggerName);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);
}

} // namespace splicerelay::common
