#include "installer/archive_installer.hpp"

#include "crypto/sha256.hpp"
#include "installer/archive_path_policy.hpp"
#include "installer/release_parser.hpp"
#include "io/atomic_file_writer.hpp"
#include "io/buffer_reader.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <span>
#include <vector>

namespace fs = std::filesystem;

namespace wdi {

namespace {

constexpr mode_t kExecutableMode = 0755;

std::shared_ptr<const IHttpClient> DefaultHttpClient() {
    static const std::shared_ptr<const IHttpClient> kDefault = std::make_shared<CurlHttpClient>();
    return kDefault;
}

std::string Snippet(const std::string& body) {
    constexpr size_t kMax = 200;
    return body.size() > kMax ? body.substr(0, kMax) + "..." : body;
}

} // namespace

ArchiveInstaller::ArchiveInstaller() : http_(DefaultHttpClient()) {}

ArchiveInstaller::ArchiveInstaller(std::shared_ptr<const IHttpClient> http)
    : http_(http ? std::move(http) : DefaultHttpClient()) {}

ArchiveInstaller::ArchiveInstaller(std::shared_ptr<const IHttpClient> http, Options opt)
    : http_(http ? std::move(http) : DefaultHttpClient()), opt_(std::move(opt)) {}

Result ArchiveInstaller::FetchLatestGitHubTag(std::string_view repo, std::string& out_tag) const {
    out_tag.clear();
    if (repo.empty() || repo.find('/') == std::string_view::npos) {
        return Result::Fail(ErrorKind::InvalidArgument,
                            "Repository must look like owner/name: '" + std::string(repo) + "'");
    }

    HttpRequest req;
    req.url = opt_.github_api_base + "/repos/" + std::string(repo) + "/releases/latest";
    req.headers.emplace_back("Accept", "application/vnd.github+json");
    if (!opt_.github_token.empty()) {
        req.headers.emplace_back("Authorization", "Bearer " + opt_.github_token);
    }

    LogDebug("[%.*s] querying latest release", (int)repo.size(), repo.data());

    HttpResponse resp;
    auto r = http_->Get(req, resp);
    if (!r.is_ok()) {
        // Timeouts and cancellation keep their own kind.
        if (r.kind == ErrorKind::DownloadFailure) return r.As(ErrorKind::RemoteResolutionFailure);
        return r;
    }
    if (!resp.IsSuccess()) {
        return Result::Fail(ErrorKind::RemoteResolutionFailure, static_cast<int>(resp.status),
                            "Latest release lookup for " + std::string(repo) + " returned HTTP " +
                                std::to_string(resp.status) + ": " + Snippet(resp.BodyText()));
    }

    auto tag = ParseLatestReleaseTag(resp.BodyText());
    if (!tag) {
        return Result::Fail(ErrorKind::RemoteResolutionFailure,
                            "Latest release of " + std::string(repo) + ": " + tag.error());
    }
    out_tag = std::move(*tag);

    LogInfo("[%.*s] latest release tag %s", (int)repo.size(), repo.data(), out_tag.c_str());
    return Result::Ok();
}

Result ArchiveInstaller::InstallBinary(const std::string& archive_url,
                                       std::string_view name_in_archive,
                                       std::string_view output_name,
                                       const std::string& output_directory,
                                       bool is_zip,
                                       std::string& out_path) const {
    out_path.clear();
    if (archive_url.empty()) return Result::Fail(ErrorKind::InvalidArgument, "archive URL is empty");
    if (output_directory.empty()) return Result::Fail(ErrorKind::InvalidArgument, "output directory is empty");
    auto name_res = ArchivePathPolicy::ValidateOutputName(output_name);
    if (!name_res.is_ok()) return name_res;

    const std::string tag(output_name);

    HttpRequest req;
    req.url = archive_url;
    req.progress_sink = opt_.progress_sink;
    req.progress_tag = tag;

    LogInfo("[%s] download %s", tag.c_str(), archive_url.c_str());

    HttpResponse resp;
    auto r = http_->Get(req, resp);
    if (!r.is_ok()) return r;
    if (!resp.IsSuccess()) {
        return Result::Fail(ErrorKind::DownloadFailure, static_cast<int>(resp.status),
                            "Download of " + archive_url + " returned HTTP " + std::to_string(resp.status));
    }

    const std::span<const std::uint8_t> archive_bytes(resp.body.data(), resp.body.size());
    // Provenance only; nothing is compared against this digest.
    LogInfo("[%s] downloaded %zu bytes sha256=%s", tag.c_str(), resp.body.size(),
            Sha256Hex(archive_bytes).c_str());

    ArchiveEntryExtractor::Options xopt;
    xopt.safe_paths_only = opt_.safe_paths_only;
    xopt.max_entry_bytes = opt_.max_entry_bytes;
    ArchiveEntryExtractor extractor(xopt);

    BufferReader reader(archive_bytes);
    std::vector<std::uint8_t> binary;
    r = extractor.ExtractEntry(reader, is_zip ? ArchiveFormat::Zip : ArchiveFormat::Tar, name_in_archive, binary);
    if (!r.is_ok()) {
        r.msg += " [" + archive_url + "]";
        return r;
    }

    const fs::path dst_dir(output_directory);
    std::error_code ec;
    fs::create_directories(dst_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "create_directories failed: " + dst_dir.string() + ": " + ec.message());
    }

    const std::string target = (dst_dir / fs::path(tag)).string();

    AtomicFileWriter writer;
    r = AtomicFileWriter::Open(target, writer);
    if (!r.is_ok()) return r;

    r = writer.WriteAll(std::span<const std::uint8_t>(binary.data(), binary.size()));
    if (!r.is_ok()) return r;

    r = writer.Commit(kExecutableMode);
    if (!r.is_ok()) return r;

    LogInfo("[%s] installed %s (%zu bytes)", tag.c_str(), target.c_str(), binary.size());
    out_path = target;
    return Result::Ok();
}

} // namespace wdi
