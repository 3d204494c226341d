#pragma once

#include <enginecache/core/types.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace enginecache::crypto {

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Convenience method for hashing files; throws std::runtime_error on read failure
    virtual std::string hashFile(const std::filesystem::path& path) = 0;
};

// SHA-256 implementation (OpenSSL EVP)
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    std::string hashFile(const std::filesystem::path& path) override;

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IContentHasher> createSHA256Hasher();

// Lower-case hex of raw digest bytes
std::string toHexLower(const unsigned char* bytes, std::size_t len);

} // namespace enginecache::crypto
