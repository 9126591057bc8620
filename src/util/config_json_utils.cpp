#include "util/config_json_utils.hpp"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <filesystem>
#include <fstream>

namespace apg::config::detail {

namespace {

// Each getter leaves `out` untouched when the key is absent and fails when
// the value has the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key,
                        std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key,
                     std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->is_number_integer() && it->get<long long>() >= 0) {
        out = static_cast<std::uint64_t>(it->get<long long>());
        return true;
    }
    err = std::string(key) + " must be a non-negative integer";
    return false;
}

bool GetIntIfPresent(const nlohmann::json& j, const char* key,
                     std::optional<int>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_number_integer()) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    // Large unsigned values would wrap when read as signed.
    const bool too_big = it->is_number_unsigned() &&
                         it->get<std::uint64_t>() > static_cast<std::uint64_t>(INT_MAX);
    const std::int64_t value = too_big ? std::int64_t{INT_MAX} + 1 : it->get<std::int64_t>();
    if (value < INT_MIN || value > INT_MAX) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key,
                      std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result::Fail(ErrorKind::Io, "cannot open " + path, ENOENT);
    }

    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::Io, "cannot open " + path);
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Usage, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(ErrorKind::Usage, "root must be JSON object: " + path);
    }

    return Result::Ok();
}

bool FillConfigFromJson(const nlohmann::json& j, AppConfigFromFile& cfg, std::string& err) {
    return GetIntIfPresent(j, "FormatVersion", cfg.format_version, err) &&
           GetU64IfPresent(j, "MaxEntryBytes", cfg.max_entry_bytes, err) &&
           GetU64IfPresent(j, "MaxTotalBytes", cfg.max_total_bytes, err) &&
           GetU64IfPresent(j, "MaxMetadataBytes", cfg.max_metadata_bytes, err) &&
           GetStringIfPresent(j, "ScratchBaseDir", cfg.scratch_base_dir, err) &&
           GetBoolIfPresent(j, "Color", cfg.color, err) &&
           GetStringIfPresent(j, "LogLevel", cfg.log_level, err);
}

} // namespace apg::config::detail
