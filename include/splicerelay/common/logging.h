#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace splicerelay::common {

// Name of the logger registered by Logging::Initialize
inline constexpr char kLoggerName[] = "splicerelay";

class Logging {
public:
  // Initialize logging: colored console sink, plus a rotating file sink when
  // log_file is non-empty. Replaces a previously registered logger.
  static void Initialize(const std::string& level = "info", const std::string& log_file = "");

  // Map "debug", "info", "warn", "error" to a spdlog level (info otherwise)
  [[nodiscard]] static spdlog::level::level_enum ParseLevel(const std::string& level) noexcept;
};

} // namespace splicerelay::common
