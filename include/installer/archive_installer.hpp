#pragma once

#include "installer/archive_entry_extractor.hpp"
#include "net/http_client.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace wdi {

class ArchiveInstaller {
public:
    struct Options {
        std::string github_api_base = "https://api.github.com";
        std::string github_token;

        bool safe_paths_only = true;
        std::uint64_t max_entry_bytes = 512ULL * 1024 * 1024;

        IProgress* progress_sink = nullptr;
    };

    ArchiveInstaller();
    explicit ArchiveInstaller(std::shared_ptr<const IHttpClient> http);
    ArchiveInstaller(std::shared_ptr<const IHttpClient> http, Options opt);

    // tag_name of the latest release of `repo` ("owner/name"), returned verbatim ("v1.2.3").
    Result FetchLatestGitHubTag(std::string_view repo, std::string& out_tag) const;

    // Downloads `archive_url`, extracts `name_in_archive` and writes it executable to
    // `output_directory/output_name`. Nothing is written unless the entry was read completely.
    Result InstallBinary(const std::string& archive_url,
                         std::string_view name_in_archive,
                         std::string_view output_name,
                         const std::string& output_directory,
                         bool is_zip,
                         std::string& out_path) const;

private:
    std::shared_ptr<const IHttpClient> http_;
    Options opt_{};
};

} // namespace wdi
