#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace kreuzberg::crypto {

/**
 * @brief Incremental SHA-256 over OpenSSL EVP
 *
 * finalize() returns the lowercase hex digest and resets the hasher so it can
 * be reused.
 */
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);

    /**
     * @brief Feed a length-prefixed field so adjacent fields cannot collide
     */
    void updateField(std::span<const std::byte> data);

    std::string finalize();

    static std::string hash(std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace kreuzberg::crypto
