#pragma once

#include <enginecache/core/types.h>

#include <chrono>
#include <cstdint>
#include <memory>

namespace enginecache {

// Wall-clock source for installation timestamps; injectable so retention can be tested.
class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock final : public IClock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

inline std::shared_ptr<IClock> makeSystemClock() {
    return std::make_shared<SystemClock>();
}

inline std::int64_t toUnixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline TimePoint fromUnixSeconds(std::int64_t seconds) {
    return TimePoint{std::chrono::seconds{seconds}};
}

} // namespace enginecache
