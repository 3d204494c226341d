/*
 * Integrity verification for engine packages (SHA-256 via the crypto hasher).
 *
 * Manifest signatures are lower-case hex digests, optionally written as "sha256:<hex>".
 * Comparison is exact after normalization.
 */

#include <enginecache/crypto/hasher.h>
#include <enginecache/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>
#include <string>
#include <string_view>

namespace enginecache::downloader {

std::string IntegrityVerifier::normalizeSignature(std::string_view signature) {
    constexpr std::string_view kPrefix = "sha256:";
    if (signature.size() >= kPrefix.size()) {
        bool prefixed = true;
        for (std::size_t i = 0; i < kPrefix.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(signature[i])) != kPrefix[i]) {
                prefixed = false;
                break;
            }
        }
        if (prefixed) {
            signature.remove_prefix(kPrefix.size());
        }
    }
    std::string out;
    out.reserve(signature.size());
    for (unsigned char c : signature) {
        if (std::isspace(c))
            continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

Result<std::string>
IntegrityVerifier::computeSignature(const std::filesystem::path& filePath) const {
    try {
        auto hasher = crypto::createSHA256Hasher();
        return hasher->hashFile(filePath);
    } catch (const std::exception& e) {
        return Error{ErrorCode::IOError, std::string("Failed to hash ") + filePath.string() +
                                             ": " + e.what()};
    }
}

Result<void> IntegrityVerifier::verifyDigest(std::string_view actualHex,
                                             std::string_view expectedSignature) const {
    const auto expected = normalizeSignature(expectedSignature);
    const auto actual = normalizeSignature(actualHex);
    if (expected.empty()) {
        return Error{ErrorCode::InvalidArgument, "Expected signature is empty"};
    }
    if (actual != expected) {
        return Error{ErrorCode::HashMismatch,
                     "Signature mismatch (expected " + expected + ", got " + actual + ")"};
    }
    return {};
}

Result<void> IntegrityVerifier::verify(const std::filesystem::path& filePath,
                                       std::string_view expectedSignature) const {
    auto digest = computeSignature(filePath);
    if (!digest) {
        return digest.error();
    }
    auto r = verifyDigest(digest.value(), expectedSignature);
    if (!r) {
        spdlog::warn("Integrity check failed for {}: {}", filePath.string(), r.error().message);
    }
    return r;
}

} // namespace enginecache::downloader
