#ifndef CARDEX_RANDOM_HPP
#define CARDEX_RANDOM_HPP

#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace cardex {

// =============================================================================
// Entropy Context
// =============================================================================

struct EntropyContext {
    uint64_t timestamp;      // Block timestamp
    uint64_t block_number;   // Block height
    Address caller;
    uint64_t nonce;          // Per-draw counter of the consumer
};

// =============================================================================
// SeedSource - Narrow seam for draw randomness
// =============================================================================
//
// A verifiable randomness source can replace BlockEntropySeed without
// touching the draw.

class SeedSource {
public:
    virtual ~SeedSource() = default;

    virtual uint64_t seed(const EntropyContext& ctx) = 0;

    // Mixes fresh block data into the secret salt
    virtual void rotate_salt(const EntropyContext& ctx) = 0;
};

// =============================================================================
// BlockEntropySeed - SHA-256 over block data and a rotatable secret salt
// =============================================================================
//
// NOT cryptographically secure: anyone who learns the salt and sees the
// block data can predict the draw. Rotating the salt only narrows the window.

class BlockEntropySeed : public SeedSource {
public:
    using Salt = std::array<uint8_t, 32>;

    explicit BlockEntropySeed(const Salt& salt = {});

    uint64_t seed(const EntropyContext& ctx) override;
    void rotate_salt(const EntropyContext& ctx) override;

    Salt salt() const;

    // SHA-256 of an operator-supplied seed string
    static Salt salt_from_seed(const std::string& seed);

private:
    Salt salt_;
    mutable std::mutex mutex_;
};

// =============================================================================
// Weighted Draw
// =============================================================================

constexpr uint32_t PROBABILITY_TOTAL = 10000;  // Basis points

// r = seed % 10000; returns the first index whose cumulative probability
// exceeds r. Lower indices win ties, so index 0 is structurally favored.
// Returns nullopt if probabilities sum to no more than r (malformed input).
std::optional<size_t> weighted_draw(uint64_t seed, const std::vector<uint32_t>& probabilities);

} // namespace cardex

#endif // CARDEX_RANDOM_HPP
