#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace splicerelay::common {

inline constexpr size_t kDefaultBufferSize = 32 * 1024;       // 32KB per buffered pump
inline constexpr size_t kDefaultSpliceChunkSize = 64 * 1024;  // one default pipe capacity

// Relay engine configuration
struct RelayConfig {
  size_t buffer_size_bytes = kDefaultBufferSize;
  size_t splice_chunk_bytes = kDefaultSpliceChunkSize;
#ifdef __linux__
  bool splice_available = true;
#else
  bool splice_available = false;
#endif
  // Directional pairs the fast path must not be used for, "<source>-><destination>"
  // with kinds pipe, tcp or unix (e.g. "tcp->unix")
  std::vector<std::string> disabled_pairs;
  std::string log_level = "info";
  std::string log_file;
};

// Configuration loader
class ConfigLoader {
public:
  // Load relay config from YAML file
  [[nodiscard]] static RelayConfig LoadRelayConfig(const std::string& config_path);

  // Parse relay config from YAML content
  [[nodiscard]] static RelayConfig ParseRelayConfig(const std::string& content);

private:
  // Helper to parse YAML (flat key: value subset)
  static std::unordered_map<std::string, std::string> ParseYaml(const std::string& content);
};

}
