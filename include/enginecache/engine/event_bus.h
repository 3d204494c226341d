#pragma once

#include <enginecache/core/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace enginecache::engine {

// Bounded ring buffer shared between one publisher and one polling subscriber.
// Multiple producers are safe; pushes to a full queue fail and the event is dropped.
// Capacity must be > 0 (not required to be power-of-two).
template <typename T> class EventQueue {
public:
    explicit EventQueue(std::size_t capacity)
        : buf_((capacity ? capacity : 1) + 1), cap_((capacity ? capacity : 1) + 1), head_(0),
          tail_(0) {}

    bool try_push(const T& v) noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        auto head = head_.load(std::memory_order_relaxed);
        auto next = inc(head);
        if (next == tail_.load(std::memory_order_acquire))
            return false; // full
        buf_[head] = v;
        head_.store(next, std::memory_order_release);
        return true;
    }
    bool try_pop(T& out) noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        auto tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return false; // empty
        out = std::move(buf_[tail]);
        tail_.store(inc(tail), std::memory_order_release);
        return true;
    }
    std::optional<T> try_pop() {
        T out;
        if (!try_pop(out))
            return std::nullopt;
        return out;
    }
    bool empty() const noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }
    std::size_t capacity() const noexcept { return cap_ - 1; }
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    void noteDropped() noexcept { dropped_.fetch_add(1, std::memory_order_relaxed); }

private:
    std::size_t inc(std::size_t i) const noexcept { return (++i == cap_) ? 0 : i; }
    mutable std::mutex mu_;
    std::vector<T> buf_;
    const std::size_t cap_;
    std::atomic<std::size_t> head_;
    std::atomic<std::size_t> tail_;
    std::atomic<std::uint64_t> dropped_{0};
};

enum class EngineEventKind { Installed, Evicted, Progress, Failed };

constexpr const char* eventKindToString(EngineEventKind kind) {
    switch (kind) {
        case EngineEventKind::Installed: return "installed";
        case EngineEventKind::Evicted: return "evicted";
        case EngineEventKind::Progress: return "progress";
        case EngineEventKind::Failed: return "failed";
    }
    return "unknown";
}

struct EngineEvent {
    EngineEventKind kind{EngineEventKind::Progress};
    EngineVersion version;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes;
    std::optional<Error> error; // Failed only
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

using EngineEventQueue = EventQueue<EngineEvent>;

/**
 * Fan-out of engine events to subscriber queues.
 *
 * Subscribers own their queue; dropping the last reference unsubscribes. Publishing never
 * blocks on a slow subscriber.
 */
class EngineEventBus {
public:
    static constexpr std::size_t kDefaultCapacity = 256;

    std::shared_ptr<EngineEventQueue> subscribe(std::size_t capacity = kDefaultCapacity) {
        auto q = std::make_shared<EngineEventQueue>(capacity);
        std::lock_guard<std::mutex> lk(mu_);
        subscribers_.push_back(q);
        return q;
    }

    void publish(const EngineEvent& ev) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = subscribers_.begin(); it != subscribers_.end();) {
            if (auto q = it->lock()) {
                if (!q->try_push(ev))
                    q->noteDropped();
                ++it;
            } else {
                it = subscribers_.erase(it);
            }
        }
        published_.fetch_add(1, std::memory_order_relaxed);
    }

    std::uint64_t published() const noexcept { return published_.load(std::memory_order_relaxed); }

private:
    std::mutex mu_;
    std::vector<std::weak_ptr<EngineEventQueue>> subscribers_;
    std::atomic<std::uint64_t> published_{0};
};

} // namespace enginecache::engine
