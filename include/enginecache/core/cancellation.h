#pragma once

// Cooperative cancellation uses std::stop_source / std::stop_token. Transfer loops poll a
// ShouldCancel callback; owners that must react immediately attach a std::stop_callback.

#include <functional>
#include <stop_token>
#include <utility>

namespace enginecache {

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP

// Empty when the token can never be stopped, so loops skip the poll entirely.
[[nodiscard]] inline ShouldCancel asShouldCancel(std::stop_token token) {
    if (!token.stop_possible())
        return {};
    return [token = std::move(token)] { return token.stop_requested(); };
}

} // namespace enginecache
