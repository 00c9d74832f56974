#include "util/Sha1Hasher.hpp"

#include <algorithm>
#include <cstddef>

namespace gitpulse {

namespace {

constexpr uint32_t rol(uint32_t value, unsigned bits) {
    return (value << bits) | (value >> (32 - bits));
}

uint32_t loadBigEndian(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

}

Sha1Hasher::Sha1Hasher() { reset(); }

void Sha1Hasher::reset() {
    h = {0x67452301u, 0xEFCDAB89u, 0x98BADCFEu, 0x10325476u, 0xC3D2E1F0u};
    block.fill(0);
    blockFill = 0;
    totalBytes = 0;
}

void Sha1Hasher::compress(const uint8_t* data) {
    uint32_t w[80];
    for (int t = 0; t < 16; ++t) {
        w[t] = loadBigEndian(data + t * 4);
    }
    for (int t = 16; t < 80; ++t) {
        w[t] = rol(w[t - 3] ^ w[t - 8] ^ w[t - 14] ^ w[t - 16], 1);
    }

    uint32_t a = h[0], b = h[1], c = h[2], d = h[3], e = h[4];
    for (int t = 0; t < 80; ++t) {
        uint32_t f;
        uint32_t k;
        if (t < 20) {
            f = (b & c) | (~b & d);
            k = 0x5A827999u;
        } else if (t < 40) {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1u;
        } else if (t < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDCu;
        } else {
            f = b ^ c ^ d;
            k = 0xCA62C1D6u;
        }
        uint32_t next = rol(a, 5) + f + e + k + w[t];
        e = d;
        d = c;
        c = rol(b, 30);
        b = a;
        a = next;
    }

    h[0] += a;
    h[1] += b;
    h[2] += c;
    h[3] += d;
    h[4] += e;
}

void Sha1Hasher::update(const uint8_t* data, size_t len) {
    totalBytes += len;
    while (len > 0) {
        size_t take = std::min(len, block.size() - blockFill);
        std::copy(data, data + take, block.begin() + static_cast<std::ptrdiff_t>(blockFill));
        blockFill += take;
        data += take;
        len -= take;
        if (blockFill == block.size()) {
            compress(block.data());
            blockFill = 0;
        }
    }
}

void Sha1Hasher::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> Sha1Hasher::digest() {
    const uint64_t bitLength = totalBytes * 8;

    uint8_t pad = 0x80;
    update(&pad, 1);
    pad = 0x00;
    while (blockFill != 56) {
        update(&pad, 1);
    }
    uint8_t lengthBytes[8];
    for (int i = 0; i < 8; ++i) {
        lengthBytes[i] = static_cast<uint8_t>(bitLength >> (56 - 8 * i));
    }
    update(lengthBytes, sizeof(lengthBytes));

    std::vector<uint8_t> out;
    out.reserve(20);
    for (uint32_t word : h) {
        out.push_back(static_cast<uint8_t>(word >> 24));
        out.push_back(static_cast<uint8_t>(word >> 16));
        out.push_back(static_cast<uint8_t>(word >> 8));
        out.push_back(static_cast<uint8_t>(word));
    }
    reset();
    return out;
}

std::string Sha1Hasher::hexDigest(const std::string& data) {
    Sha1Hasher hasher;
    hasher.update(data);
    return IHasher::toHex(hasher.digest());
}

}
