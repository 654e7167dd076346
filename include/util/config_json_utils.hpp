#pragma once

#include "util/merger_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace takeout::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, MergerConfigFromFile& cfg, std::string& err);

} // namespace takeout::config::detail
