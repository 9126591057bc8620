#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace apg::config::detail {

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);
bool FillConfigFromJson(const nlohmann::json& j, AppConfigFromFile& cfg, std::string& err);

} // namespace apg::config::detail
