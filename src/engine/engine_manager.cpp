#include <enginecache/engine/engine_manager.h>

#include <utility>

namespace enginecache::engine {

void PinRegistry::add(const EngineVersion& version) {
    std::lock_guard<std::mutex> lk(mutex_);
    ++counts_[version];
}

void PinRegistry::release(const EngineVersion& version) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = counts_.find(version);
    if (it == counts_.end())
        return;
    if (--it->second == 0)
        counts_.erase(it);
}

bool PinRegistry::isPinned(const EngineVersion& version) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return counts_.count(version) != 0;
}

std::set<EngineVersion> PinRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::set<EngineVersion> out;
    for (const auto& [version, count] : counts_)
        out.insert(version);
    return out;
}

std::unique_lock<std::mutex> PinRegistry::holdUnpinned(const EngineVersion& version) {
    std::unique_lock<std::mutex> lk(mutex_);
    if (counts_.count(version) != 0)
        return {};
    return lk;
}

EnginePin::EnginePin(std::shared_ptr<PinRegistry> registry, EngineVersion version)
    : registry_(std::move(registry)), version_(std::move(version)) {
    if (registry_)
        registry_->add(version_);
}

EnginePin::EnginePin(EnginePin&& other) noexcept
    : registry_(std::move(other.registry_)), version_(std::move(other.version_)) {}

EnginePin& EnginePin::operator=(EnginePin&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = std::move(other.registry_);
        version_ = std::move(other.version_);
    }
    return *this;
}

void EnginePin::release() noexcept {
    if (registry_) {
        registry_->release(version_);
        registry_.reset();
    }
}

} // namespace enginecache::engine
