#pragma once

#include <array>
#include <cstdint>

#include "util/IHasher.hpp"

namespace gitpulse {

/**
 * @brief Streaming SHA-1 (FIPS 180-4), the object id function of git
 */
class Sha1Hasher : public IHasher {
public:
    Sha1Hasher();

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;
    const char* name() const override { return "sha1"; }
    size_t digestSize() const override { return 20; }

    /// One-shot helper: hex SHA-1 of a buffer
    static std::string hexDigest(const std::string& data);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 5> h{};
    std::array<uint8_t, 64> block{};
    size_t blockFill{0};
    uint64_t totalBytes{0};
};

}
