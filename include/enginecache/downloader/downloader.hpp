#pragma once

/*
 * Engine package downloader - public types and service interfaces.
 *
 * Design principles:
 * - Packages are streamed into a staging file under the store root, never into an install slot
 * - Staging and installations share a filesystem so the final move is an atomic rename
 * - Progress reporting is rate-bounded and cancellation is cooperative
 * - Transport (IHttpAdapter), integrity verification and the fetch loop are separate services
 */

#include <enginecache/core/cancellation.h>
#include <enginecache/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace enginecache::downloader {

/**
 * Progress stages during a single engine installation.
 */
enum class ProgressStage { Resolving, Connecting, Downloading, Verifying, Finalizing };

constexpr const char* stageToString(ProgressStage stage) {
    switch (stage) {
        case ProgressStage::Resolving: return "resolving";
        case ProgressStage::Connecting: return "connecting";
        case ProgressStage::Downloading: return "downloading";
        case ProgressStage::Verifying: return "verifying";
        case ProgressStage::Finalizing: return "finalizing";
    }
    return "unknown";
}

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Per-request transport options.
 */
struct HttpRequestOptions {
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{std::chrono::minutes(10)};
    std::chrono::milliseconds connectTimeout{30000};
    bool followRedirects{true};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent{"enginecache"};
};

/**
 * Downloader configuration.
 */
struct DownloaderConfig {
    HttpRequestOptions http{};
    // Minimum spacing between Downloading progress events delivered to callers.
    std::chrono::milliseconds progressInterval{100};
    std::uint64_t maxBytes{0}; // 0 = unlimited
};

/**
 * Streaming progress event for a single transfer.
 */
struct ProgressEvent {
    std::string url;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    std::optional<float> percentage{}; // 0.0 - 100.0 (approx)
    ProgressStage stage{ProgressStage::Downloading};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

/**
 * Response metadata reported by an HTTP GET.
 */
struct HttpResponseInfo {
    long status{0};
    std::optional<std::uint64_t> contentLength{};
};

/**
 * Outcome of a completed package fetch.
 */
struct FetchResult {
    std::filesystem::path path;
    std::uint64_t bytesWritten{0};
    std::string sha256; // lower-case hex digest computed while streaming
    std::chrono::milliseconds elapsed{0};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ByteSink = std::function<Result<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 *
 * get() streams the response body to the sink, which may be called many times on the calling
 * thread. Returning an error from the sink aborts the transfer and that error is returned.
 * A cancelled transfer fails with ErrorCode::OperationCancelled; HTTP status >= 400 fails with
 * ErrorCode::NotFound (404/410) or ErrorCode::ServerError.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    virtual Result<HttpResponseInfo> get(std::string_view url, const HttpRequestOptions& options,
                                         const ByteSink& sink, const ShouldCancel& shouldCancel,
                                         const ProgressCallback& onProgress) = 0;
};

/**
 * Fetches one package URL into a staging file.
 *
 * On any failure (including cancellation) the destination file is removed before returning.
 */
class IPackageDownloader {
public:
    virtual ~IPackageDownloader() = default;

    virtual Result<FetchResult> fetch(const std::string& url,
                                      const std::filesystem::path& destinationTempPath,
                                      const ProgressCallback& onProgress,
                                      const std::stop_token& cancel) = 0;
};

/**
 * Integrity verifier: SHA-256 signatures in lower-case hex, optionally prefixed "sha256:".
 */
class IntegrityVerifier {
public:
    /// Hash the full file and compare. HashMismatch on mismatch, IOError if unreadable.
    Result<void> verify(const std::filesystem::path& filePath,
                        std::string_view expectedSignature) const;

    /// Compare an already computed digest with the expected signature.
    Result<void> verifyDigest(std::string_view actualHex, std::string_view expectedSignature) const;

    /// Compute the signature of a file as stored in the manifest (bare lower-case hex).
    Result<std::string> computeSignature(const std::filesystem::path& filePath) const;

    /// Strip an optional "sha256:" prefix and lower-case the digest.
    static std::string normalizeSignature(std::string_view signature);
};

/**
 * Fetch a (small) document fully into memory. Used for the build manifest.
 */
Result<std::string> fetchText(IHttpAdapter& http, std::string_view url,
                              const HttpRequestOptions& options, const ShouldCancel& shouldCancel,
                              std::size_t maxBytes = 64ull * 1024ull * 1024ull);

// Factories
std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IPackageDownloader> makePackageDownloader(std::shared_ptr<IHttpAdapter> http,
                                                          DownloaderConfig config);

} // namespace enginecache::downloader
