#ifndef CARDEX_AUCTION_HPP
#define CARDEX_AUCTION_HPP

#include <map>
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
// English Auction Types
// =============================================================================

enum class AuctionStatus : uint8_t {
    CREATED = 0,
    COMPLETED = 1,
    CANCELLED = 2
};

// Longest anti-sniping extension a single bid can trigger
constexpr uint64_t MAX_TIME_BUFFER = 30 * 24 * 3600;

struct AuctionParams {
    uint64_t token_id;
    uint64_t quantity;
    Currency currency;
    I128 min_bid_x18;
    I128 buyout_bid_x18;     // 0 = no buyout
    uint64_t time_buffer;    // Seconds
    uint32_t bid_buffer_bps;
    uint64_t start_time;     // 0 = now
    uint64_t end_time;
};

struct Bid {
    Address bidder;
    I128 amount_x18;
};

struct EnglishAuction {
    uint64_t id;
    Address seller;
    uint64_t token_id;
    uint64_t quantity;
    Currency currency;
    I128 min_bid_x18;
    I128 buyout_bid_x18;
    uint64_t time_buffer;
    uint32_t bid_buffer_bps;
    uint64_t start_time;
    uint64_t end_time;
    AuctionStatus status;
    std::optional<Bid> winning_bid;
    bool tokens_collected;
    bool payout_collected;
};

// =============================================================================
// AuctionHouse - Ascending auctions with anti-sniping buffers
// =============================================================================
//
// The asset and the winning bid sit in the house's escrow account until
// collection. Outbid refunds are pushed immediately; a refund the recipient
// rejects is kept as a pending refund and paid by withdraw_refund.

class AuctionHouse {
public:
    AuctionHouse(SystemState& system, AssetLedger& ledger, Vault& vault,
                 PayoutLedger& payouts, const Clock& clock, const FeeSchedule& fees,
                 const Address& self = addresses::AUCTION_HOUSE);
    ~AuctionHouse() = default;

    // Non-copyable
    AuctionHouse(const AuctionHouse&) = delete;
    AuctionHouse& operator=(const AuctionHouse&) = delete;

    const Address& address() const { return self_; }

    // =========================================================================
    // Auction Lifecycle
    // =========================================================================

    CreateResult create_auction(const Address& caller, const AuctionParams& params);

    int32_t bid_in_auction(const Address& caller, uint64_t auction_id, I128 amount_x18);

    int32_t collect_auction_tokens(const Address& caller, uint64_t auction_id);
    int32_t collect_auction_payout(const Address& caller, uint64_t auction_id);

    int32_t cancel_auction(const Address& caller, uint64_t auction_id);

    // Pays out a refund that was queued because the push was rejected
    int32_t withdraw_refund(const Address& caller, uint64_t auction_id);

    // =========================================================================
    // Fees
    // =========================================================================

    int32_t set_platform_fee_recipient(const Address& caller, const Address& recipient);
    int32_t set_marketplace_fee_bps(const Address& caller, uint32_t fee_bps);
    FeeSchedule fee_schedule() const;

    // =========================================================================
    // Views
    // =========================================================================

    std::optional<EnglishAuction> get_auction(uint64_t auction_id) const;
    uint64_t total_auctions() const;

    // Inclusive id range; INVALID_RANGE if start > end or end >= total
    int32_t get_all_auctions(uint64_t start_id, uint64_t end_id,
                             std::vector<EnglishAuction>& out) const;
    int32_t get_all_valid_auctions(uint64_t start_id, uint64_t end_id,
                                   std::vector<EnglishAuction>& out) const;

    std::optional<Bid> get_winning_bid(uint64_t auction_id) const;
    bool is_auction_expired(uint64_t auction_id) const;
    bool is_new_winning_bid(uint64_t auction_id, I128 amount_x18) const;
    I128 pending_refund(uint64_t auction_id, const Address& bidder) const;

    void set_listener(MarketListener* listener);

private:
    SystemState& system_;
    AssetLedger& ledger_;
    Vault& vault_;
    PayoutLedger& payouts_;
    const Clock& clock_;
    FeeSchedule fees_;
    Address self_;

    std::vector<EnglishAuction> auctions_;                     // Indexed by id
    std::map<std::pair<uint64_t, Address>, I128> pending_refunds_;
    MarketListener* listener_{nullptr};
    mutable std::shared_mutex mutex_;

    EnglishAuction* find(uint64_t auction_id);
    const EnglishAuction* find(uint64_t auction_id) const;

    bool outbids(const EnglishAuction& auction, I128 amount_x18) const;
    bool has_ended(const EnglishAuction& auction, uint64_t now) const;

    void refund_previous(const EnglishAuction& auction, const Bid& previous);
    void notify_closed(const EnglishAuction& auction, const Address& closer);
};

} // namespace cardex

#endif // CARDEX_AUCTION_HPP
