#ifndef CARDEX_EVENTS_HPP
#define CARDEX_EVENTS_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace cardex {

struct CardSet;
struct Listing;
struct EnglishAuction;
struct DutchAuction;

// =============================================================================
// Event Records
// =============================================================================

struct MintEvent {
    uint64_t set_id;
    uint64_t token_id;
    uint32_t card_index;
    std::string uri;
    Address owner;
    uint64_t remaining_supply;
};

struct SaleEvent {
    uint64_t listing_id;
    Address seller;
    Address buyer;
    uint64_t token_id;
    uint64_t quantity;
    Currency currency;
    I128 total_price_x18;
    I128 fee_x18;
    I128 proceeds_x18;
};

struct BidEvent {
    uint64_t auction_id;
    Address bidder;
    I128 amount_x18;
    uint64_t end_time;       // End time after any extension
    bool buyout;
};

struct RefundEvent {
    uint64_t auction_id;
    Address bidder;
    Currency currency;
    I128 amount_x18;
    bool queued;             // true = push failed, now pending withdrawal
};

struct AuctionClosedEvent {
    uint64_t auction_id;
    Address closer;
    uint64_t token_id;
    Address seller;
    Address winner;
    bool tokens_collected;
    bool payout_collected;
};

struct DutchSaleEvent {
    uint64_t auction_id;
    Address seller;
    Address buyer;
    uint64_t token_id;
    Currency currency;
    I128 price_x18;          // Decayed price at purchase
    I128 paid_x18;           // Amount settled
    I128 fee_x18;
    I128 proceeds_x18;
};

struct WithdrawalEvent {
    Address to;
    Currency currency;
    I128 amount_x18;
};

// =============================================================================
// MarketListener - Callback interface for state transitions
// =============================================================================
//
// Callbacks run inside the emitting component's critical section and must
// not call back into the engine.

class MarketListener {
public:
    virtual ~MarketListener() = default;

    // Card sets
    virtual void on_card_set_created(const CardSet& set) {}
    virtual void on_card_set_burned(uint64_t set_id) {}
    virtual void on_card_minted(const MintEvent& event) {}
    virtual void on_secret_salt_updated(const Address& by) {}

    // Listings
    virtual void on_listing_created(const Listing& listing) {}
    virtual void on_listing_updated(const Listing& listing) {}
    virtual void on_listing_cancelled(const Listing& listing) {}
    virtual void on_buyer_approved(uint64_t listing_id, const Address& buyer, bool approved) {}
    virtual void on_currency_approved(uint64_t listing_id, const Currency& currency, I128 price_x18) {}
    virtual void on_sale(const SaleEvent& event) {}

    // English auctions
    virtual void on_auction_created(const EnglishAuction& auction) {}
    virtual void on_bid(const BidEvent& event, const EnglishAuction& auction) {}
    virtual void on_refund(const RefundEvent& event) {}
    virtual void on_auction_closed(const AuctionClosedEvent& event, const EnglishAuction& auction) {}
    virtual void on_auction_cancelled(const EnglishAuction& auction) {}

    // Dutch auctions
    virtual void on_dutch_auction_created(const DutchAuction& auction) {}
    virtual void on_dutch_sale(const DutchSaleEvent& event) {}
    virtual void on_dutch_auction_cancelled(const DutchAuction& auction) {}

    // Funds and admin
    virtual void on_withdrawal(const WithdrawalEvent& event) {}
    virtual void on_paused(const Address& by) {}
    virtual void on_unpaused(const Address& by) {}
};

} // namespace cardex

#endif // CARDEX_EVENTS_HPP
