#ifndef CARDEX_CARD_SET_HPP
#define CARDEX_CARD_SET_HPP

#include <optional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "types.hpp"
#include "clock.hpp"
#include "ledger.hpp"
#include "payout.hpp"
#include "random.hpp"
#include "system_state.hpp"
#include "vault.hpp"

namespace cardex {

class MarketListener;

// =============================================================================
// Card Set (mintable pack)
// =============================================================================

struct CardSet {
    uint64_t id;
    std::string name;
    std::vector<std::string> card_uris;
    std::vector<uint32_t> probabilities;   // Basis points, sum == 10000
    uint64_t remaining_supply;
    I128 price_x18;                        // Native token
    bool burned;

    bool available() const { return !burned && remaining_supply > 0; }
};

struct MintResult {
    int32_t error_code;
    uint64_t token_id;
    uint32_t card_index;
    std::string uri;
};

// =============================================================================
// CardSetRegistry - Weighted-random pack minting
// =============================================================================

class CardSetRegistry {
public:
    CardSetRegistry(SystemState& system, AssetLedger& ledger, Vault& vault,
                    PayoutLedger& payouts, const Clock& clock, SeedSource& seeds,
                    const Address& self = addresses::CARD_SETS);
    ~CardSetRegistry() = default;

    // Non-copyable
    CardSetRegistry(const CardSetRegistry&) = delete;
    CardSetRegistry& operator=(const CardSetRegistry&) = delete;

    const Address& address() const { return self_; }

    // =========================================================================
    // Admin
    // =========================================================================

    CreateResult create_card_set(const Address& caller, const std::string& name,
                                 const std::vector<std::string>& card_uris,
                                 const std::vector<uint32_t>& probabilities,
                                 uint64_t supply, I128 price_x18);

    int32_t burn_card_set(const Address& caller, uint64_t set_id);

    int32_t update_secret_salt(const Address& caller);

    // =========================================================================
    // Minting
    // =========================================================================

    // Caller pays `payment_x18` in native token from its vault balance and
    // receives one token drawn from the set's weighted pool
    MintResult mint_from_card_set(const Address& caller, uint64_t set_id, I128 payment_x18);

    // =========================================================================
    // Views
    // =========================================================================

    std::optional<CardSet> get_card_set(uint64_t set_id) const;
    uint64_t card_set_count() const;
    std::vector<CardSet> available_card_sets() const;

    void set_listener(MarketListener* listener);

private:
    SystemState& system_;
    AssetLedger& ledger_;
    Vault& vault_;
    PayoutLedger& payouts_;
    const Clock& clock_;
    SeedSource& seeds_;
    Address self_;

    std::vector<CardSet> sets_;   // Indexed by id
    uint64_t draw_nonce_{0};
    MarketListener* listener_{nullptr};
    mutable std::shared_mutex mutex_;

    EntropyContext entropy(const Address& caller) const;
};

} // namespace cardex

#endif // CARDEX_CARD_SET_HPP
