// =============================================================================
// random.cpp - Block entropy seed and weighted draw
// =============================================================================

#include "cardex/random.hpp"
#include <algorithm>
#include <openssl/sha.h>

namespace cardex {

namespace {

void append_u64(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

std::array<uint8_t, SHA256_DIGEST_LENGTH> sha256(const std::vector<uint8_t>& data) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
    SHA256(data.data(), data.size(), digest.data());
    return digest;
}

std::vector<uint8_t> encode(const EntropyContext& ctx) {
    std::vector<uint8_t> buf;
    buf.reserve(8 + 8 + 20 + 8 + 32);
    append_u64(buf, ctx.timestamp);
    append_u64(buf, ctx.block_number);
    buf.insert(buf.end(), ctx.caller.begin(), ctx.caller.end());
    append_u64(buf, ctx.nonce);
    return buf;
}

} // namespace

BlockEntropySeed::BlockEntropySeed(const Salt& salt)
    : salt_(salt) {}

uint64_t BlockEntropySeed::seed(const EntropyContext& ctx) {
    std::vector<uint8_t> buf = encode(ctx);

    {
        std::lock_guard lock(mutex_);
        buf.insert(buf.end(), salt_.begin(), salt_.end());
    }

    auto digest = sha256(buf);
    uint64_t r = 0;
    for (size_t i = 0; i < 8; ++i) {
        r = (r << 8) | digest[i];
    }
    return r;
}

void BlockEntropySeed::rotate_salt(const EntropyContext& ctx) {
    std::lock_guard lock(mutex_);

    std::vector<uint8_t> buf(salt_.begin(), salt_.end());
    std::vector<uint8_t> block = encode(ctx);
    buf.insert(buf.end(), block.begin(), block.end());

    auto digest = sha256(buf);
    std::copy(digest.begin(), digest.end(), salt_.begin());
}

BlockEntropySeed::Salt BlockEntropySeed::salt() const {
    std::lock_guard lock(mutex_);
    return salt_;
}

BlockEntropySeed::Salt BlockEntropySeed::salt_from_seed(const std::string& seed) {
    Salt salt{};
    SHA256(reinterpret_cast<const unsigned char*>(seed.data()), seed.size(), salt.data());
    return salt;
}

std::optional<size_t> weighted_draw(uint64_t seed, const std::vector<uint32_t>& probabilities) {
    uint64_t r = seed % PROBABILITY_TOTAL;

    uint64_t cumulative = 0;
    for (size_t i = 0; i < probabilities.size(); ++i) {
        cumulative += probabilities[i];
        if (r < cumulative) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace cardex
