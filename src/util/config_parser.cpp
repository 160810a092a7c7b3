#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

namespace wdi::config {

void InstallerConfigFromFile::Reset() {
    output_directory.reset();
    browsers.clear();
    command_timeout_ms.reset();
    http_timeout_ms.reset();
    connect_timeout_ms.reset();
    github_api_base.reset();
    github_token.reset();
    progress.reset();
    parallel.reset();
    log_level.reset();
    error_.clear();
}

bool InstallerConfigFromFile::LoadFile(const std::string &path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        error_ = err;
        LogWarn("Config: %s", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        error_ = err + " in " + path;
        LogWarn("Config: %s", error_.c_str());
        return false;
    }

    LogDebug("Config loaded from %s", path.c_str());
    return true;
}

bool InstallerConfigFromFile::LoadString(const std::string &text) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(text, json, err) || !detail::FillConfigFromJson(json, *this, err)) {
        error_ = err;
        return false;
    }
    return true;
}

} // namespace wdi::config
