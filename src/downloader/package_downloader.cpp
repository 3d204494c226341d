/*
 * PackageDownloader (single-stream):
 * - Stream the package once using IHttpAdapter::get
 * - Write to a staging file through DiskWriter; compute SHA-256 while streaming
 * - Throttle Downloading progress to DownloaderConfig::progressInterval
 * - Cooperative cancellation; any failure removes the staging file
 */

#include <enginecache/crypto/hasher.h>
#include <enginecache/downloader/disk_writer.h>
#include <enginecache/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace enginecache::downloader {

namespace {

using clock_t = std::chrono::steady_clock;

// Forwards at most one Downloading event per interval; other stages always pass through.
class ProgressThrottle {
public:
    ProgressThrottle(ProgressCallback target, std::chrono::milliseconds interval)
        : target_(std::move(target)), interval_(interval) {}

    void operator()(const ProgressEvent& ev) {
        if (!target_)
            return;
        if (ev.stage == ProgressStage::Downloading) {
            const auto now = clock_t::now();
            std::lock_guard<std::mutex> lk(mutex_);
            if (last_ && now - *last_ < interval_) {
                pending_ = ev;
                return;
            }
            last_ = now;
            pending_.reset();
        }
        target_(ev);
    }

    // Emit the most recent suppressed event so callers always see the final byte count.
    void flush() {
        std::optional<ProgressEvent> ev;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            ev.swap(pending_);
        }
        if (ev && target_)
            target_(*ev);
    }

private:
    ProgressCallback target_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::optional<clock_t::time_point> last_;
    std::optional<ProgressEvent> pending_;
};

class PackageDownloader final : public IPackageDownloader {
public:
    PackageDownloader(std::shared_ptr<IHttpAdapter> http, DownloaderConfig cfg)
        : http_(std::move(http)), config_(std::move(cfg)) {}

    Result<FetchResult> fetch(const std::string& url,
                              const std::filesystem::path& destinationTempPath,
                              const ProgressCallback& onProgress,
                              const std::stop_token& cancel) override {
        if (url.empty()) {
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        }
        if (!http_) {
            return Error{ErrorCode::InvalidState, "No HTTP adapter configured"};
        }
        if (cancel.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Cancelled before transfer"};
        }

        const auto start = clock_t::now();
        DiskWriter writer;
        auto openRes = writer.open(destinationTempPath);
        if (!openRes) {
            writer.discard();
            return openRes.error();
        }

        try {
            crypto::SHA256Hasher hasher;
            ProgressThrottle throttle(onProgress, config_.progressInterval);
            ProgressCallback forward =
                onProgress ? ProgressCallback([&](const ProgressEvent& ev) { throttle(ev); })
                           : ProgressCallback{};

            ByteSink sink = [&](std::span<const std::byte> data) -> Result<void> {
                auto wr = writer.write(data);
                if (!wr) {
                    return wr;
                }
                hasher.update(data);
                if (config_.maxBytes > 0 && writer.bytesWritten() > config_.maxBytes) {
                    return Error{ErrorCode::PolicyViolation,
                                 "Package exceeds configured max_bytes (" +
                                     std::to_string(config_.maxBytes) + ")"};
                }
                return {};
            };

            auto got = http_->get(url, config_.http, sink, asShouldCancel(cancel), forward);
            throttle.flush();
            if (!got) {
                writer.discard();
                if (got.error().code == ErrorCode::OperationCancelled) {
                    spdlog::info("Download cancelled: {}", url);
                } else {
                    spdlog::warn("Download failed for {}: {}", url, got.error().message);
                }
                return got.error();
            }

            const auto& info = got.value();
            if (info.contentLength && *info.contentLength != writer.bytesWritten()) {
                writer.discard();
                return Error{ErrorCode::NetworkError,
                             "Truncated transfer: expected " +
                                 std::to_string(*info.contentLength) + " bytes, got " +
                                 std::to_string(writer.bytesWritten())};
            }

            auto fin = writer.finish();
            if (!fin) {
                writer.discard();
                return fin.error();
            }

            FetchResult out;
            out.path = destinationTempPath;
            out.bytesWritten = writer.bytesWritten();
            out.sha256 = hasher.finalize();
            out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_t::now() -
                                                                                start);

            if (onProgress) {
                ProgressEvent ev;
                ev.url = url;
                ev.downloadedBytes = out.bytesWritten;
                ev.totalBytes = out.bytesWritten;
                ev.percentage = 100.0f;
                ev.stage = ProgressStage::Finalizing;
                onProgress(ev);
            }

            spdlog::debug("Fetched {} ({} bytes in {}ms)", url, out.bytesWritten,
                          out.elapsed.count());
            return out;
        } catch (const std::exception& ex) {
            writer.discard();
            return Error{ErrorCode::InternalError, std::string("Exception during download: ") +
                                                       ex.what()};
        }
    }

private:
    std::shared_ptr<IHttpAdapter> http_;
    DownloaderConfig config_;
};

} // namespace

std::unique_ptr<IPackageDownloader> makePackageDownloader(std::shared_ptr<IHttpAdapter> http,
                                                          DownloaderConfig config) {
    return std::make_unique<PackageDownloader>(std::move(http), std::move(config));
}

} // namespace enginecache::downloader
