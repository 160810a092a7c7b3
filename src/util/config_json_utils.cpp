#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace wdi::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return false;
    auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, InstallerConfigFromFile& cfg, std::string& err) {
    GetStringIfPresent(j, "OutputDirectory", cfg.output_directory);
    if (cfg.output_directory && cfg.output_directory->empty()) {
        err = "OutputDirectory must not be empty";
        return false;
    }

    if (auto it = j.find("Browsers"); it != j.end()) {
        if (!it->is_array()) {
            err = "Browsers must be an array of strings";
            return false;
        }
        for (const auto& item : *it) {
            if (!item.is_string() || item.get<std::string>().empty()) {
                err = "Browsers must be an array of non-empty strings";
                return false;
            }
            cfg.browsers.push_back(item.get<std::string>());
        }
    }

    GetU64IfPresent(j, "CommandTimeoutMs", cfg.command_timeout_ms);
    GetU64IfPresent(j, "HttpTimeoutMs", cfg.http_timeout_ms);
    GetU64IfPresent(j, "ConnectTimeoutMs", cfg.connect_timeout_ms);

    GetStringIfPresent(j, "GitHubApiBase", cfg.github_api_base);
    GetStringIfPresent(j, "GitHubToken", cfg.github_token);

    GetBoolIfPresent(j, "Progress", cfg.progress);
    GetBoolIfPresent(j, "Parallel", cfg.parallel);

    if (GetStringIfPresent(j, "LogLevel", cfg.log_level) && !ParseLogLevel(*cfg.log_level)) {
        err = "unknown LogLevel: " + *cfg.log_level;
        return false;
    }

    return true;
}

} // namespace wdi::config::detail
