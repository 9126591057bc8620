#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace apg::config {

constexpr const char* kDefaultConfigPath = "/etc/apgcheck/apgcheck.conf";
constexpr const char* kConfigPathEnv = "APGCHECK_CONFIG_PATH";

// Settings read from the optional JSON config file. Unset members keep the
// built-in default; command-line flags override anything set here.
class AppConfigFromFile {
  public:
    std::optional<int> format_version;
    std::optional<std::uint64_t> max_entry_bytes;
    std::optional<std::uint64_t> max_total_bytes;
    std::optional<std::uint64_t> max_metadata_bytes;
    std::optional<std::string> scratch_base_dir;
    std::optional<bool> color;
    std::optional<std::string> log_level;

    // Result::err is ENOENT when the file does not exist.
    Result LoadFile(const std::string &path);

    void Reset();
};

} // namespace apg::config
