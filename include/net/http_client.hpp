#pragma once

#include "util/progress.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wdi {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    // Optional download progress reporting under `progress_tag`.
    IProgress* progress_sink = nullptr;
    std::string progress_tag;
};

struct HttpResponse {
    long status = 0;
    std::vector<std::uint8_t> body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
    std::string BodyText() const { return std::string(body.begin(), body.end()); }
};

// "GET a URL, get the bytes." Transport failures are DownloadFailure, Timeout or Cancelled;
// an HTTP error status is not a failure here and is left to the caller.
class IHttpClient {
  public:
    virtual ~IHttpClient() = default;
    virtual Result Get(const HttpRequest& req, HttpResponse& out) const = 0;
};

class CurlHttpClient final : public IHttpClient {
  public:
    struct Options {
        std::chrono::milliseconds connect_timeout{15000};
        std::chrono::milliseconds total_timeout{300000};
        std::string user_agent = "webdriver-installer";
        std::uint64_t max_body_bytes = 512ULL * 1024 * 1024;
    };

    CurlHttpClient() = default;
    explicit CurlHttpClient(Options opt) : opt_(std::move(opt)) {}

    Result Get(const HttpRequest& req, HttpResponse& out) const override;

  private:
    Options opt_{};
};

// RAII for curl_global_init/curl_global_cleanup; create once in main before any thread starts.
class CurlGlobal {
  public:
    CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
    ~CurlGlobal();

    bool ok() const { return ok_; }

  private:
    bool ok_ = false;
};

} // namespace wdi
