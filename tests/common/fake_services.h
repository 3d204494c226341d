// In-memory stand-ins for the transport and clock used by engine cache tests

#pragma once

#include <enginecache/core/clock.h>
#include <enginecache/crypto/hasher.h>
#include <enginecache/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace enginecache::test {

inline std::string sha256Of(std::string_view data) {
    return crypto::SHA256Hasher::hash(
        std::span<const std::byte>(reinterpret_cast<const std::byte*>(data.data()), data.size()));
}

class FakeClock final : public IClock {
public:
    explicit FakeClock(TimePoint start = fromUnixSeconds(1'700'000'000)) : now_(start) {}

    TimePoint now() const override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lk(mu_);
            hook.swap(onNextNow_);
        }
        if (hook)
            hook();
        std::lock_guard<std::mutex> lk(mu_);
        return now_;
    }

    /// Run `fn` once, inside the next now() call, before it returns.
    void onNextNow(std::function<void()> fn) {
        std::lock_guard<std::mutex> lk(mu_);
        onNextNow_ = std::move(fn);
    }

    void advance(std::chrono::seconds d) {
        std::lock_guard<std::mutex> lk(mu_);
        now_ += d;
    }

    void set(TimePoint tp) {
        std::lock_guard<std::mutex> lk(mu_);
        now_ = tp;
    }

private:
    mutable std::mutex mu_;
    TimePoint now_;
    mutable std::function<void()> onNextNow_;
};

/**
 * URL-keyed HTTP adapter.
 *
 * Each URL serves a queue of responses; the last one repeats once the queue drains. Transfers
 * of a URL passed to hold() park after sending their first chunk until release() or until they
 * are cancelled.
 */
class FakeHttpAdapter final : public downloader::IHttpAdapter {
public:
    struct Response {
        std::string body;
        std::optional<Error> error;
    };

    void setBody(const std::string& url, std::string body) {
        std::lock_guard<std::mutex> lk(mu_);
        routes_[url] = {Response{std::move(body), std::nullopt}};
    }

    void setError(const std::string& url, Error error) {
        std::lock_guard<std::mutex> lk(mu_);
        routes_[url] = {Response{{}, std::move(error)}};
    }

    void setSequence(const std::string& url, std::deque<Response> responses) {
        std::lock_guard<std::mutex> lk(mu_);
        routes_[url] = std::move(responses);
    }

    void setChunkSize(std::size_t n) { chunk_ = std::max<std::size_t>(1, n); }

    void hold(const std::string& url) {
        std::lock_guard<std::mutex> lk(mu_);
        held_.insert(url);
    }

    void release() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            held_.clear();
        }
        cv_.notify_all();
    }

    std::size_t calls(const std::string& url) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    /// Number of transfers currently parked by hold().
    std::size_t parked() const {
        std::lock_guard<std::mutex> lk(mu_);
        return parked_;
    }

    bool waitForParked(std::size_t n,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) const {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (parked() >= n)
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return parked() >= n;
    }

    Result<downloader::HttpResponseInfo> get(std::string_view url,
                                             const downloader::HttpRequestOptions&,
                                             const downloader::ByteSink& sink,
                                             const ShouldCancel& shouldCancel,
                                             const downloader::ProgressCallback& onProgress)
        override {
        const std::string key(url);
        Response response;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++calls_[key];
            auto it = routes_.find(key);
            if (it == routes_.end() || it->second.empty()) {
                return Error{ErrorCode::NotFound, "HTTP 404 for " + key};
            }
            response = it->second.front();
            if (it->second.size() > 1)
                it->second.pop_front();
        }
        if (response.error) {
            return *response.error;
        }

        const auto& body = response.body;
        const std::uint64_t total = body.size();
        std::size_t offset = 0;
        bool first = true;
        while (offset < body.size() || first) {
            if (shouldCancel && shouldCancel()) {
                return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
            }
            const std::size_t n = std::min(chunk_, body.size() - offset);
            if (n > 0) {
                auto r = sink(std::span<const std::byte>(
                    reinterpret_cast<const std::byte*>(body.data() + offset), n));
                if (!r)
                    return r.error();
                offset += n;
            }
            if (onProgress) {
                downloader::ProgressEvent ev;
                ev.url = key;
                ev.downloadedBytes = offset;
                ev.totalBytes = total;
                ev.stage = downloader::ProgressStage::Downloading;
                onProgress(ev);
            }
            if (first) {
                first = false;
                if (!parkWhileHeld(key, shouldCancel)) {
                    return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
                }
            }
        }

        downloader::HttpResponseInfo info;
        info.status = 200;
        info.contentLength = total;
        return info;
    }

private:
    // Returns false when cancelled while parked.
    bool parkWhileHeld(const std::string& url, const ShouldCancel& shouldCancel) {
        std::unique_lock<std::mutex> lk(mu_);
        if (held_.count(url) == 0)
            return true;
        ++parked_;
        bool cancelled = false;
        while (held_.count(url) != 0) {
            if (shouldCancel && shouldCancel()) {
                cancelled = true;
                break;
            }
            cv_.wait_for(lk, std::chrono::milliseconds(5));
        }
        --parked_;
        return !cancelled;
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::map<std::string, std::deque<Response>> routes_;
    std::map<std::string, std::size_t> calls_;
    std::size_t chunk_{4096};
    std::set<std::string> held_;
    std::size_t parked_{0};
};

} // namespace enginecache::test
