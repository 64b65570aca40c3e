#ifndef CARDEX_LISTING_HPP
#define CARDEX_LISTING_HPP

#include <map>
#include <optional>
#include <set>
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
// Listing Types
// =============================================================================

enum class ListingStatus : uint8_t {
    ACTIVE = 0,
    COMPLETED = 1,   // Consumed by a sale
    CANCELLED = 2
};

struct ListingParams {
    uint64_t token_id;
    uint64_t quantity;
    Currency currency;
    I128 price_per_token_x18;
    uint64_t start_time;     // 0 = now
    uint64_t end_time;
    bool reserved;
};

struct Listing {
    uint64_t id;
    Address seller;
    uint64_t token_id;
    uint64_t quantity;
    Currency currency;
    I128 price_per_token_x18;
    uint64_t start_time;
    uint64_t end_time;
    bool reserved;
    std::set<Address> approved_buyers;
    std::map<Currency, I128> approved_currencies;  // currency -> price per token
    ListingStatus status;

    // Unit price in `currency`, nullopt if not accepted
    std::optional<I128> price_for(const Currency& currency) const;
};

// =============================================================================
// ListingBook - Fixed-price listings
// =============================================================================
//
// Listings never escrow the asset. The seller keeps the token and the book
// must be an operator for the seller until the sale.

class ListingBook {
public:
    ListingBook(SystemState& system, AssetLedger& ledger, Vault& vault,
                PayoutLedger& payouts, const Clock& clock, const FeeSchedule& fees,
                const Address& self = addresses::LISTING_BOOK);
    ~ListingBook() = default;

    // Non-copyable
    ListingBook(const ListingBook&) = delete;
    ListingBook& operator=(const ListingBook&) = delete;

    const Address& address() const { return self_; }

    // =========================================================================
    // Seller Operations
    // =========================================================================

    // Overwrites the caller's active listing for the same token in place
    CreateResult create_listing(const Address& caller, const ListingParams& params);
    int32_t update_listing(const Address& caller, uint64_t listing_id, const ListingParams& params);
    int32_t cancel_listing(const Address& caller, uint64_t listing_id);

    int32_t approve_buyer_for_listing(const Address& caller, uint64_t listing_id,
                                      const Address& buyer, bool approved);

    // price_per_token_x18 == 0 removes the currency
    int32_t approve_currency_for_listing(const Address& caller, uint64_t listing_id,
                                         const Currency& currency, I128 price_per_token_x18);

    // =========================================================================
    // Buying
    // =========================================================================

    // Native currency: `payment_x18` is the value the caller attaches and must
    // equal the total. Token currency: payment must be 0 and the total is
    // pulled through the caller's allowance to the book.
    int32_t buy_from_listing(const Address& caller, uint64_t listing_id, const Address& buyer,
                             uint64_t quantity, const Currency& currency,
                             I128 expected_total_x18, I128 payment_x18);

    // =========================================================================
    // Fees
    // =========================================================================

    int32_t set_platform_fee_recipient(const Address& caller, const Address& recipient);
    int32_t set_marketplace_fee_bps(const Address& caller, uint32_t fee_bps);
    FeeSchedule fee_schedule() const;

    // =========================================================================
    // Views
    // =========================================================================

    uint64_t total_listings() const;
    std::optional<Listing> get_listing(uint64_t listing_id) const;

    // Inclusive id range; INVALID_RANGE if start > end or end >= total
    int32_t get_all_listings(uint64_t start_id, uint64_t end_id, std::vector<Listing>& out) const;

    // Active, inside the sale window and still transferable by the book
    int32_t get_all_valid_listings(uint64_t start_id, uint64_t end_id,
                                   std::vector<Listing>& out) const;

    void set_listener(MarketListener* listener);

private:
    SystemState& system_;
    AssetLedger& ledger_;
    Vault& vault_;
    PayoutLedger& payouts_;
    const Clock& clock_;
    FeeSchedule fees_;
    Address self_;

    std::vector<Listing> listings_;                            // Indexed by id
    std::map<std::pair<Address, uint64_t>, uint64_t> active_;  // (seller, token) -> id
    MarketListener* listener_{nullptr};
    mutable std::shared_mutex mutex_;

    int32_t validate_params(const Address& caller, ListingParams& params) const;
    static void apply_params(Listing& listing, const ListingParams& params);
    bool is_valid(const Listing& listing, uint64_t now) const;
    Listing* find(uint64_t listing_id);
};

} // namespace cardex

#endif // CARDEX_LISTING_HPP
