/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Streaming GET using the libcurl easy API; one easy handle per transfer.
 * - Honors timeouts, TLS verify/CA, proxy, headers, user agent and redirects.
 * - Cooperative cancellation is checked from the write and xferinfo callbacks, so a stalled
 *   connection still notices a cancel request.
 */

#include <enginecache/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string>
#include <string_view>

namespace enginecache::downloader {

namespace {

std::once_flag g_curlInitOnce;

void ensure_curl_global_init() {
    std::call_once(g_curlInitOnce, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsError;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IOError;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A new status line starts a new header block (redirect hops)
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->contentLength.reset();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    }

    return total;
}

struct WriteContext {
    const ByteSink* sink{nullptr};
    const ProgressCallback* onProgress{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    const HeaderParseContext* headers{nullptr};
    std::string url;
    std::uint64_t downloaded{0};
    bool cancelRequested{false};
    std::optional<Error> sinkError;
};

bool cancel_requested(WriteContext* ctx) {
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return true;
    }
    return false;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (cancel_requested(ctx)) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r) {
        ctx->sinkError = r.error();
        return 0;
    }

    ctx->downloaded += static_cast<std::uint64_t>(total);
    if (ctx->onProgress && *ctx->onProgress) {
        ProgressEvent ev;
        ev.url = ctx->url;
        ev.downloadedBytes = ctx->downloaded;
        ev.totalBytes = ctx->headers->contentLength;
        if (ev.totalBytes && *ev.totalBytes > 0) {
            ev.percentage =
                static_cast<float>((static_cast<long double>(ctx->downloaded) * 100.0L) /
                                   static_cast<long double>(*ev.totalBytes));
        }
        ev.stage = ProgressStage::Downloading;
        (*ctx->onProgress)(ev);
    }

    return total;
}

// Invoked periodically even when no data arrives; non-zero aborts the transfer.
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    return (ctx != nullptr && cancel_requested(ctx)) ? 1 : 0;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const HttpRequestOptions& options) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long long>(options.connectTimeout.count(),
                                                           options.timeout.count())));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }
    if (!options.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_curl_global_init(); }
    ~CurlHttpAdapter() override = default;

    Result<HttpResponseInfo> get(std::string_view url, const HttpRequestOptions& options,
                                 const ByteSink& sink, const ShouldCancel& shouldCancel,
                                 const ProgressCallback& onProgress) override {
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "No sink provided"};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        curl_slist* list = build_header_list(options.headers);

        HeaderParseContext hctx{};
        WriteContext wctx;
        wctx.sink = &sink;
        wctx.onProgress = &onProgress;
        wctx.shouldCancel = &shouldCancel;
        wctx.headers = &hctx;
        wctx.url = urlStr;

        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);
        // Fail on HTTP >= 400 before the error body reaches the sink
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

        configure_common(curl, options);

        if (onProgress) {
            ProgressEvent ev;
            ev.url = urlStr;
            ev.stage = ProgressStage::Connecting;
            onProgress(ev);
        }

        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled: " + urlStr};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc == CURLE_HTTP_RETURNED_ERROR || http_status >= 400) {
            const auto code = (http_status == 404 || http_status == 410) ? ErrorCode::NotFound
                                                                         : ErrorCode::ServerError;
            return Error{code, "HTTP error " + std::to_string(http_status) + " for " + urlStr};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + urlStr);
        }

        HttpResponseInfo info;
        info.status = http_status;
        info.contentLength = hctx.contentLength;
        return info;
    }
};

} // namespace

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_shared<CurlHttpAdapter>();
}

Result<std::string> fetchText(IHttpAdapter& http, std::string_view url,
                              const HttpRequestOptions& options, const ShouldCancel& shouldCancel,
                              std::size_t maxBytes) {
    std::string body;
    ByteSink sink = [&](std::span<const std::byte> data) -> Result<void> {
        if (body.size() + data.size() > maxBytes) {
            return Error{ErrorCode::PolicyViolation,
                         "Response exceeds " + std::to_string(maxBytes) + " bytes"};
        }
        body.append(reinterpret_cast<const char*>(data.data()), data.size());
        return {};
    };
    auto r = http.get(url, options, sink, shouldCancel, {});
    if (!r) {
        return r.error();
    }
    return body;
}

} // namespace enginecache::downloader
