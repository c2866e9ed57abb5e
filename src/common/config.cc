#include "splicerelay/common/config.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace splicerelay::common {

namespace {

void Trim(std::string& value) {
  value.erase(0, value.find_first_not_of(" \t\r"));
  value.erase(value.find_last_not_of(" \t\r") + 1);
}

// Helper to get string value with default
std::string GetString(const std::unordered_map<std::string, std::string>& config, const std::string& key,
                      const std::string& default_value) {
  auto it = config.find(key);
  return it != config.end() ? it->second : default_value;
}

// Helper to get size_t value with default
size_t GetSizeT(const std::unordered_map<std::string, std::string>& config, const std::string& key,
                size_t default_value) {
  auto it = config.find(key);
  if (it == config.end()) {
    return default_value;
  }
  try {
    size_t parsed = 0;
    auto value = std::stoull(it->second, &parsed);
    if (parsed != it->second.size() || value == 0) {
      return default_value;
    }
    return static_cast<size_t>(value);
  } catch (const std::exception&) {
    return default_value;
  }
}

// Helper to get bool value with default
bool GetBool(const std::unordered_map<std::string, std::string>& config, const std::string& key, bool default_value) {
  auto it = config.find(key);
  if (it == config.end()) {
    return default_value;
  }
  if (it->second == "true" || it->second == "yes" || it->second == "1") {
    return true;
  }
  if (it->second == "false" || it->second == "no" || it->second == "0") {
    return false;
  }
  return default_value;
}

// Split a comma separated list, e.g. "tcp->unix, pipe->tcp"
std::vector<std::string> GetList(const std::unordered_map<std::string, std::string>& config,
                                 const std::string& key) {
  std::vector<std::string> items;
  auto it = config.find(key);
  if (it == config.end()) {
    return items;
  }

  std::string value = it->second;
  if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
    value = value.substr(1, value.size() - 2);
  }

  std::istringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    Trim(item);
    if (item.size() >= 2 && item.front() == '"' && item.back() == '"') {
      item = item.substr(1, item.size() - 2);
    }
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

} // namespace

std::unordered_map<std::string, std::string> ConfigLoader::ParseYaml(const std::string& content) {
  std::unordered_map<std::string, std::string> result;
  std::istringstream stream(content);
  std::string line;

  while (std::getline(stream, line)) {
    // Skip empty lines and comments
    auto first = line.find_first_not_of(" \t");
    if (first == std::string::npos || line[first] == '#') {
      continue;
    }

    // Find colon separator
    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);
    Trim(key);
    Trim(value);

    // Remove quotes if present
    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
      value = value.substr(1, value.length() - 2);
    }

    result[key] = value;
  }

  return result;
}

RelayConfig ConfigLoader::ParseRelayConfig(const std::string& content) {
  auto config = ParseYaml(content);

  RelayConfig relay_config;
  relay_config.buffer_size_bytes = GetSizeT(config, "buffer_size_bytes", kDefaultBufferSize);
  relay_config.splice_chunk_bytes = GetSizeT(config, "splice_chunk_bytes", kDefaultSpliceChunkSize);
  relay_config.splice_available = GetBool(config, "splice_available", relay_config.splice_available);
  relay_config.disabled_pairs = GetList(config, "disabled_pairs");
  relay_config.log_level = GetString(config, "log_level", "info");
  relay_config.log_file = GetString(config, "log_file", "");

  return relay_config;
}

RelayConfig ConfigLoader::LoadRelayConfig(const std::string& config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + config_path);
  }

  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return ParseRelayConfig(content);
}

} // namespace splicerelay::common
