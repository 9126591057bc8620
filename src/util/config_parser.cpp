#include "util/config_parser.hpp"

#include "apg/package_extractor.hpp"
#include "util/config_json_utils.hpp"

#include <optional>
#include <string>

namespace apg::config {

namespace {

// Config may lower the built-in size ceiling but never raise it.
bool WithinCeiling(const std::optional<std::uint64_t>& value, const char* key, std::string& err) {
    if (!value || *value <= PackageExtractor::kDefaultMaxEntryBytes)
        return true;
    err = std::string(key) + " must not exceed " +
          std::to_string(PackageExtractor::kDefaultMaxEntryBytes);
    return false;
}

} // namespace

void AppConfigFromFile::Reset() {
    format_version.reset();
    max_entry_bytes.reset();
    max_total_bytes.reset();
    max_metadata_bytes.reset();
    scratch_base_dir.reset();
    color.reset();
    log_level.reset();
}

Result AppConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    auto load = detail::LoadJsonObjectFromFile(path, json);
    if (!load.is_ok()) {
        return load;
    }

    std::string err;
    if (!detail::FillConfigFromJson(json, *this, err) ||
        !WithinCeiling(max_entry_bytes, "MaxEntryBytes", err) ||
        !WithinCeiling(max_metadata_bytes, "MaxMetadataBytes", err)) {
        Reset();
        return Result::Fail(ErrorKind::Usage, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace apg::config
