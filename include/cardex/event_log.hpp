#ifndef CARDEX_EVENT_LOG_HPP
#define CARDEX_EVENT_LOG_HPP

#include <mutex>
#include <ostream>

#include "events.hpp"

namespace cardex {

// =============================================================================
// JsonEventLog - One JSON object per line for every engine event
// =============================================================================
//
// Amounts are decimal strings (they do not fit a JSON number), addresses
// 0x-prefixed hex. Every line carries "event" and "seq".

class JsonEventLog : public MarketListener {
public:
    explicit JsonEventLog(std::ostream& out);

    uint64_t events_written() const;

    // Card sets
    void on_card_set_created(const CardSet& set) override;
    void on_card_set_burned(uint64_t set_id) override;
    void on_card_minted(const MintEvent& event) override;
    void on_secret_salt_updated(const Address& by) override;

    // Listings
    void on_listing_created(const Listing& listing) override;
    void on_listing_updated(const Listing& listing) override;
    void on_listing_cancelled(const Listing& listing) override;
    void on_buyer_approved(uint64_t listing_id, const Address& buyer, bool approved) override;
    void on_currency_approved(uint64_t listing_id, const Currency& currency, I128 price_x18) override;
    void on_sale(const SaleEvent& event) override;

    // English auctions
    void on_auction_created(const EnglishAuction& auction) override;
    void on_bid(const BidEvent& event, const EnglishAuction& auction) override;
    void on_refund(const RefundEvent& event) override;
    void on_auction_closed(const AuctionClosedEvent& event, const EnglishAuction& auction) override;
    void on_auction_cancelled(const EnglishAuction& auction) override;

    // Dutch auctions
    void on_dutch_auction_created(const DutchAuction& auction) override;
    void on_dutch_sale(const DutchSaleEvent& event) override;
    void on_dutch_auction_cancelled(const DutchAuction& auction) override;

    // Funds and admin
    void on_withdrawal(const WithdrawalEvent& event) override;
    void on_paused(const Address& by) override;
    void on_unpaused(const Address& by) override;

private:
    std::ostream& out_;
    uint64_t seq_{0};
    mutable std::mutex mutex_;

    template <typename Json>
    void write(const char* name, Json&& body);
};

} // namespace cardex

#endif // CARDEX_EVENT_LOG_HPP
