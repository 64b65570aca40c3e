#ifndef CARDEX_MARKETPLACE_HPP
#define CARDEX_MARKETPLACE_HPP

#include <memory>

#include "auction.hpp"
#include "card_set.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "dutch_auction.hpp"
#include "ledger.hpp"
#include "listing.hpp"
#include "payout.hpp"
#include "random.hpp"
#include "system_state.hpp"
#include "vault.hpp"

namespace cardex {

class MarketListener;

// =============================================================================
// Marketplace - Owns and wires every engine component
// =============================================================================
//
// Construction order matches the dependency order: custody and ownership
// first, then the state machines that settle against them.

class Marketplace {
public:
    // `seeds` replaces the block-entropy seed source when given
    Marketplace(const Config& config, const Clock& clock,
                std::unique_ptr<SeedSource> seeds = nullptr);
    ~Marketplace() = default;

    // Non-copyable
    Marketplace(const Marketplace&) = delete;
    Marketplace& operator=(const Marketplace&) = delete;

    // Routes every component's events to one listener (nullptr detaches)
    void set_listener(MarketListener* listener);

    // Switches every sale component's fee recipient at once
    int32_t set_platform_fee_recipient(const Address& caller, const Address& recipient);

    const Clock& clock() const { return clock_; }

    SystemState& system() { return system_; }
    Vault& vault() { return vault_; }
    TokenLedger& tokens() { return tokens_; }
    PayoutLedger& payouts() { return payouts_; }
    CardSetRegistry& card_sets() { return card_sets_; }
    ListingBook& listings() { return listings_; }
    AuctionHouse& auctions() { return auctions_; }
    DutchAuctionHouse& dutch_auctions() { return dutch_auctions_; }

private:
    const Clock& clock_;
    std::unique_ptr<SeedSource> seeds_;

    SystemState system_;
    Vault vault_;
    TokenLedger tokens_;
    PayoutLedger payouts_;

    CardSetRegistry card_sets_;
    ListingBook listings_;
    AuctionHouse auctions_;
    DutchAuctionHouse dutch_auctions_;
};

} // namespace cardex

#endif // CARDEX_MARKETPLACE_HPP
