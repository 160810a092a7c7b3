#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wdi::config {

class InstallerConfigFromFile {
public:
    std::optional<std::string> output_directory;
    std::vector<std::string> browsers;

    std::optional<std::uint64_t> command_timeout_ms;
    std::optional<std::uint64_t> http_timeout_ms;
    std::optional<std::uint64_t> connect_timeout_ms;

    std::optional<std::string> github_api_base;
    std::optional<std::string> github_token;

    std::optional<bool> progress;
    std::optional<bool> parallel;
    std::optional<std::string> log_level;

    bool LoadFile(const std::string &path);
    bool LoadString(const std::string &text);

    const std::string &Error() const { return error_; }

    void Reset();

private:
    std::string error_;
};

} // namespace wdi::config
