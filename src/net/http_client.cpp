#include "net/http_client.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>

namespace wdi {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

struct TransferCtx {
    HttpResponse* response = nullptr;
    const HttpRequest* request = nullptr;
    std::uint64_t max_body_bytes = 0;
    bool too_large = false;
};

size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    const size_t n = size * nmemb;
    if (ctx->response->body.size() + n > ctx->max_body_bytes) {
        ctx->too_large = true;
        return 0;
    }
    const auto* p = reinterpret_cast<const std::uint8_t*>(ptr);
    ctx->response->body.insert(ctx->response->body.end(), p, p + n);
    return n;
}

int XferInfoCb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    if (g_cancel.load(std::memory_order_relaxed)) return 1;

    auto* ctx = static_cast<TransferCtx*>(userdata);
    if (ctx->request->progress_sink && dlnow > 0) {
        ProgressEvent event{};
        event.component = ctx->request->progress_tag;
        event.done = static_cast<std::uint64_t>(dlnow);
        event.total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0;
        ctx->request->progress_sink->OnProgress(event);
    }
    return 0;
}

} // namespace

Result CurlHttpClient::Get(const HttpRequest& req, HttpResponse& out) const {
    out = HttpResponse{};
    if (req.url.empty()) return Result::Fail(ErrorKind::InvalidArgument, "empty URL");

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(ErrorKind::DownloadFailure, "curl_easy_init failed");

    std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
    for (const auto& [name, value] : req.headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) return Result::Fail(ErrorKind::DownloadFailure, "curl_slist_append failed");
        (void)headers.release();
        headers.reset(appended);
    }

    TransferCtx ctx;
    ctx.response = &out;
    ctx.request = &req;
    ctx.max_body_bytes = opt_.max_body_bytes;

    char errbuf[CURL_ERROR_SIZE]{};

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c, CURLOPT_USERAGENT, opt_.user_agent.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, WriteCb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, XferInfoCb);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(opt_.connect_timeout.count()));
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(opt_.total_timeout.count()));
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);

    LogDebug("GET %s", req.url.c_str());
    const CURLcode rc = curl_easy_perform(c);

    if (rc != CURLE_OK) {
        const std::string detail = errbuf[0] != '\0' ? std::string(errbuf) : curl_easy_strerror(rc);
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            return Result::Fail(ErrorKind::Timeout, static_cast<int>(rc),
                                "request timed out: " + req.url + ": " + detail);
        }
        if (rc == CURLE_ABORTED_BY_CALLBACK) {
            return Result::Fail(ErrorKind::Cancelled, static_cast<int>(rc), "request cancelled: " + req.url);
        }
        if (ctx.too_large) {
            return Result::Fail(ErrorKind::DownloadFailure, static_cast<int>(rc),
                                "response exceeds " + std::to_string(opt_.max_body_bytes) +
                                    " bytes: " + req.url);
        }
        return Result::Fail(ErrorKind::DownloadFailure, static_cast<int>(rc),
                            "request failed: " + req.url + ": " + detail);
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);
    LogDebug("GET %s -> %ld (%zu bytes)", req.url.c_str(), out.status, out.body.size());
    return Result::Ok();
}

CurlGlobal::CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

} // namespace wdi
