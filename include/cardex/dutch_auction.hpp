#ifndef CARDEX_DUTCH_AUCTION_HPP
#define CARDEX_DUTCH_AUCTION_HPP

#include <optional>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "types.hpp"
#include "clock.hpp"
#include "ledger.hpp"
#include "payout.hpp"
#include "system_state.hpp"
#include "vault.hpp"

namespace cardex {

class MarketListener;

// =============================================================================
// Dutch Auction
// =============================================================================

struct DutchAuction {
    uint64_t id;
    Address seller;
    uint64_t token_id;
    I128 start_price_x18;
    I128 end_price_x18;
    uint64_t start_time;
    uint64_t duration;        // Seconds
    uint32_t decay_exponent;  // 1 = linear
    Currency currency;
    bool active;
};

// price(t) = start - (start - end) * (t / duration)^k, t clamped to duration.
// Fixed point x18 with truncation at every step.
I128 dutch_price(const DutchAuction& auction, uint64_t now);

// =============================================================================
// DutchAuctionHouse - Descending-price auctions
// =============================================================================

class DutchAuctionHouse {
public:
    DutchAuctionHouse(SystemState& system, AssetLedger& ledger, Vault& vault,
                      PayoutLedger& payouts, const Clock& clock, const FeeSchedule& fees,
                      const Address& self = addresses::DUTCH_HOUSE);
    ~DutchAuctionHouse() = default;

    // Non-copyable
    DutchAuctionHouse(const DutchAuctionHouse&) = delete;
    DutchAuctionHouse& operator=(const DutchAuctionHouse&) = delete;

    const Address& address() const { return self_; }

    CreateResult create_dutch_auction(const Address& caller, uint64_t token_id,
                                      I128 start_price_x18, I128 end_price_x18,
                                      uint64_t duration, uint32_t decay_exponent,
                                      const Currency& currency);

    // NOT_FOUND if the auction does not exist
    int32_t get_current_price(uint64_t auction_id, I128& price_x18) const;

    // Native: `payment_x18` is the attached value and is settled in full.
    // Token: `payment_x18` is the buyer's ceiling; the current price is pulled.
    int32_t buy(const Address& caller, uint64_t auction_id, I128 payment_x18);

    int32_t cancel_dutch_auction(const Address& caller, uint64_t auction_id);

    // Fees
    int32_t set_platform_fee_recipient(const Address& caller, const Address& recipient);
    int32_t set_marketplace_fee_bps(const Address& caller, uint32_t fee_bps);
    FeeSchedule fee_schedule() const;

    // Views
    std::optional<DutchAuction> get_dutch_auction(uint64_t auction_id) const;
    uint64_t total_dutch_auctions() const;

    void set_listener(MarketListener* listener);

private:
    SystemState& system_;
    AssetLedger& ledger_;
    Vault& vault_;
    PayoutLedger& payouts_;
    const Clock& clock_;
    FeeSchedule fees_;
    Address self_;

    std::vector<DutchAuction> auctions_;
    MarketListener* listener_{nullptr};
    mutable std::shared_mutex mutex_;
};

} // namespace cardex

#endif // CARDEX_DUTCH_AUCTION_HPP
