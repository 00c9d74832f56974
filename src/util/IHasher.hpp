#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gitpulse {

/**
 * @brief Hash algorithm seam used by the object store
 *
 * Object ids are the lowercase hex digest of "<type> <size>\0<payload>".
 * Only SHA-1 repositories are supported, but tree parsing reads the
 * binary id width from digestSize() rather than hard-coding 20.
 */
class IHasher {
public:
    virtual ~IHasher() = default;

    virtual void reset() = 0;
    virtual void update(const uint8_t* data, size_t len) = 0;
    virtual void update(const std::string& data) = 0;
    virtual std::vector<uint8_t> digest() = 0;
    virtual const char* name() const = 0;
    virtual size_t digestSize() const = 0;

    /// Lowercase hex of a binary digest
    static std::string toHex(const uint8_t* bytes, size_t len);
    static std::string toHex(const std::vector<uint8_t>& bytes);

    /// Binary form of a hex id; throws std::invalid_argument on odd length or non-hex input
    static std::vector<uint8_t> fromHex(const std::string& hex);
};

class HasherFactory {
public:
    /// SHA-1, the object format of every repository we read
    static std::unique_ptr<IHasher> createDefault();

    /// Hasher by name, nullptr when the algorithm is not supported
    static std::unique_ptr<IHasher> create(const std::string& algorithm);
};

}
