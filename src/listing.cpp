// =============================================================================
// listing.cpp - Fixed-Price Listing Book Implementation
// =============================================================================

#include "cardex/listing.hpp"
#include "cardex/events.hpp"

namespace cardex {

std::optional<I128> Listing::price_for(const Currency& c) const {
    if (c == currency) return price_per_token_x18;
    auto it = approved_currencies.find(c);
    if (it == approved_currencies.end()) return std::nullopt;
    return it->second;
}

ListingBook::ListingBook(SystemState& system, AssetLedger& ledger, Vault& vault,
                         PayoutLedger& payouts, const Clock& clock, const FeeSchedule& fees,
                         const Address& self)
    : system_(system), ledger_(ledger), vault_(vault), payouts_(payouts),
      clock_(clock), fees_(fees), self_(self) {}

// =============================================================================
// Seller Operations
// =============================================================================

int32_t ListingBook::validate_params(const Address& caller, ListingParams& params) const {
    auto owner = ledger_.owner_of(params.token_id);
    if (!owner || *owner != caller) {
        return errors::NOT_OWNER;
    }
    if (!ledger_.is_approved_for_all(caller, self_)) {
        return errors::NOT_APPROVED;
    }
    if (params.quantity != 1) {
        return errors::INVALID_QUANTITY;
    }
    if (params.currency.is_zero()) {
        return errors::INVALID_CURRENCY;
    }
    if (params.price_per_token_x18 <= 0 || params.price_per_token_x18 > MAX_AMOUNT_X18) {
        return errors::INVALID_PRICE;
    }

    if (params.start_time == 0) {
        params.start_time = clock_.now();
    }
    if (params.end_time <= params.start_time) {
        return errors::INVALID_WINDOW;
    }
    return errors::OK;
}

CreateResult ListingBook::create_listing(const Address& caller, const ListingParams& params) {
    ListingParams p = params;
    int32_t result = validate_params(caller, p);
    if (result != errors::OK) {
        return {result, 0};
    }

    std::unique_lock lock(mutex_);

    // One live listing per (seller, token)
    auto key = std::make_pair(caller, p.token_id);
    auto it = active_.find(key);
    if (it != active_.end()) {
        Listing& existing = listings_[it->second];
        apply_params(existing, p);
        if (listener_) listener_->on_listing_updated(existing);
        return {errors::OK, existing.id};
    }

    Listing listing;
    listing.seller = caller;
    listing.token_id = p.token_id;
    listing.status = ListingStatus::ACTIVE;
    apply_params(listing, p);

    listing.id = listings_.size();
    active_[key] = listing.id;
    listings_.push_back(std::move(listing));

    if (listener_) listener_->on_listing_created(listings_.back());
    return {errors::OK, listings_.back().id};
}

int32_t ListingBook::update_listing(const Address& caller, uint64_t listing_id,
                                    const ListingParams& params) {
    std::unique_lock lock(mutex_);

    Listing* listing = find(listing_id);
    if (!listing) {
        return errors::NOT_FOUND;
    }
    if (listing->seller != caller) {
        return errors::NOT_CREATOR;
    }
    if (listing->status != ListingStatus::ACTIVE) {
        return errors::NOT_ACTIVE;
    }
    if (params.token_id != listing->token_id) {
        return errors::INVALID_PARAMS;
    }

    ListingParams p = params;
    int32_t result = validate_params(caller, p);
    if (result != errors::OK) {
        return result;
    }

    apply_params(*listing, p);

    if (listener_) listener_->on_listing_updated(*listing);
    return errors::OK;
}

int32_t ListingBook::cancel_listing(const Address& caller, uint64_t listing_id) {
    std::unique_lock lock(mutex_);

    Listing* listing = find(listing_id);
    if (!listing) {
        return errors::NOT_FOUND;
    }
    if (listing->seller != caller) {
        return errors::NOT_CREATOR;
    }
    if (listing->status != ListingStatus::ACTIVE) {
        return errors::NOT_ACTIVE;
    }

    listing->status = ListingStatus::CANCELLED;
    active_.erase({listing->seller, listing->token_id});

    if (listener_) listener_->on_listing_cancelled(*listing);
    return errors::OK;
}

int32_t ListingBook::approve_buyer_for_listing(const Address& caller, uint64_t listing_id,
                                               const Address& buyer, bool approved) {
    std::unique_lock lock(mutex_);

    Listing* listing = find(listing_id);
    if (!listing) {
        return errors::NOT_FOUND;
    }
    if (listing->seller != caller) {
        return errors::NOT_CREATOR;
    }
    if (!listing->reserved) {
        return errors::NOT_RESERVED;
    }

    if (approved) {
        listing->approved_buyers.insert(buyer);
    } else {
        listing->approved_buyers.erase(buyer);
    }

    if (listener_) listener_->on_buyer_approved(listing_id, buyer, approved);
    return errors::OK;
}

int32_t ListingBook::approve_currency_for_listing(const Address& caller, uint64_t listing_id,
                                                  const Currency& currency,
                                                  I128 price_per_token_x18) {
    std::unique_lock lock(mutex_);

    Listing* listing = find(listing_id);
    if (!listing) {
        return errors::NOT_FOUND;
    }
    if (listing->seller != caller) {
        return errors::NOT_CREATOR;
    }
    if (currency.is_zero() || currency == listing->currency) {
        return errors::INVALID_CURRENCY;
    }
    if (price_per_token_x18 < 0 || price_per_token_x18 > MAX_AMOUNT_X18) {
        return errors::INVALID_PRICE;
    }

    if (price_per_token_x18 == 0) {
        listing->approved_currencies.erase(currency);
    } else {
        listing->approved_currencies[currency] = price_per_token_x18;
    }

    if (listener_) listener_->on_currency_approved(listing_id, currency, price_per_token_x18);
    return errors::OK;
}

// =============================================================================
// Buying
// =============================================================================

int32_t ListingBook::buy_from_listing(const Address& caller, uint64_t listing_id,
                                      const Address& buyer, uint64_t quantity,
                                      const Currency& currency, I128 expected_total_x18,
                                      I128 payment_x18) {
    if (system_.is_paused()) {
        return errors::PAUSED;
    }
    if (addresses::is_zero(buyer)) {
        return errors::INVALID_PARAMS;
    }

    std::unique_lock lock(mutex_);

    Listing* listing = find(listing_id);
    if (!listing) {
        return errors::NOT_FOUND;
    }
    if (listing->status != ListingStatus::ACTIVE) {
        return errors::NOT_ACTIVE;
    }

    uint64_t now = clock_.now();
    if (now > listing->end_time) {
        return errors::EXPIRED;
    }
    if (now < listing->start_time) {
        return errors::NOT_STARTED;
    }
    if (listing->reserved && listing->approved_buyers.count(buyer) == 0) {
        return errors::NOT_APPROVED_BUYER;
    }
    if (quantity == 0 || quantity > listing->quantity) {
        return errors::INVALID_QUANTITY;
    }

    auto unit_price = listing->price_for(currency);
    if (!unit_price) {
        return errors::CURRENCY_NOT_ACCEPTED;
    }

    I128 total = *unit_price * static_cast<I128>(quantity);
    if (expected_total_x18 != total) {
        return errors::PRICE_MISMATCH;
    }
    if (currency.is_native() ? payment_x18 != total : payment_x18 != 0) {
        return errors::PAYMENT_MISMATCH;
    }

    if (!currency.is_native() && vault_.allowance(caller, self_, currency) < total) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }
    if (vault_.get_balance(caller, currency) < total) {
        return errors::INSUFFICIENT_BALANCE;
    }

    // Seller may have moved the token or revoked the book since listing
    auto owner = ledger_.owner_of(listing->token_id);
    if (!owner || *owner != listing->seller) {
        return errors::NOT_OWNER;
    }
    if (!ledger_.is_approved_for_all(listing->seller, self_)) {
        return errors::NOT_APPROVED;
    }

    I128 allowance_before = vault_.allowance(caller, self_, currency);
    int32_t result = vault_.pull_payment(caller, self_, currency, total);
    if (result != errors::OK) {
        return result;
    }

    result = ledger_.transfer(self_, listing->seller, buyer, listing->token_id);
    if (result != errors::OK) {
        int32_t refunded = vault_.rollback(self_, caller, currency, total);
        if (refunded != errors::OK) return refunded;
        if (!currency.is_native()) {
            int32_t restored = vault_.approve(caller, self_, currency, allowance_before);
            if (restored != errors::OK) return restored;
        }
        return result;
    }

    FeeSplit split{0, 0};
    result = payouts_.distribute(self_, currency, total, listing->seller,
                                 fees_.fee_recipient, fees_.fee_bps, &split);
    if (result != errors::OK) {
        return result;  // Funds stay escrowed under the book's account
    }

    listing->status = ListingStatus::COMPLETED;
    active_.erase({listing->seller, listing->token_id});

    if (listener_) {
        SaleEvent event{listing->id, listing->seller, buyer, listing->token_id, quantity,
                        currency, total, split.fee_x18, split.proceeds_x18};
        listener_->on_sale(event);
    }
    return errors::OK;
}

// =============================================================================
// Fees
// =============================================================================

int32_t ListingBook::set_platform_fee_recipient(const Address& caller, const Address& recipient) {
    if (!system_.is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(recipient)) {
        return errors::INVALID_PARAMS;
    }

    std::unique_lock lock(mutex_);
    fees_.fee_recipient = recipient;
    return errors::OK;
}

int32_t ListingBook::set_marketplace_fee_bps(const Address& caller, uint32_t fee_bps) {
    if (!system_.is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (fee_bps > bps::MAX_FEE) {
        return errors::INVALID_FEE;
    }

    std::unique_lock lock(mutex_);
    fees_.fee_bps = fee_bps;
    return errors::OK;
}

FeeSchedule ListingBook::fee_schedule() const {
    std::shared_lock lock(mutex_);
    return fees_;
}

// =============================================================================
// Views
// =============================================================================

uint64_t ListingBook::total_listings() const {
    std::shared_lock lock(mutex_);
    return listings_.size();
}

std::optional<Listing> ListingBook::get_listing(uint64_t listing_id) const {
    std::shared_lock lock(mutex_);
    if (listing_id >= listings_.size()) return std::nullopt;
    return listings_[listing_id];
}

int32_t ListingBook::get_all_listings(uint64_t start_id, uint64_t end_id,
                                      std::vector<Listing>& out) const {
    std::shared_lock lock(mutex_);
    if (start_id > end_id || end_id >= listings_.size()) {
        return errors::INVALID_RANGE;
    }

    out.clear();
    for (uint64_t id = start_id; id <= end_id; ++id) {
        out.push_back(listings_[id]);
    }
    return errors::OK;
}

int32_t ListingBook::get_all_valid_listings(uint64_t start_id, uint64_t end_id,
                                            std::vector<Listing>& out) const {
    std::shared_lock lock(mutex_);
    if (start_id > end_id || end_id >= listings_.size()) {
        return errors::INVALID_RANGE;
    }

    uint64_t now = clock_.now();
    out.clear();
    for (uint64_t id = start_id; id <= end_id; ++id) {
        if (is_valid(listings_[id], now)) {
            out.push_back(listings_[id]);
        }
    }
    return errors::OK;
}

void ListingBook::set_listener(MarketListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

// =============================================================================
// Internal Helpers
// =============================================================================

// Approved buyers and alternate currencies survive an update
void ListingBook::apply_params(Listing& listing, const ListingParams& params) {
    listing.quantity = params.quantity;
    listing.currency = params.currency;
    listing.price_per_token_x18 = params.price_per_token_x18;
    listing.start_time = params.start_time;
    listing.end_time = params.end_time;
    listing.reserved = params.reserved;
    listing.approved_currencies.erase(params.currency);
}

bool ListingBook::is_valid(const Listing& listing, uint64_t now) const {
    if (listing.status != ListingStatus::ACTIVE) return false;
    if (now < listing.start_time || now > listing.end_time) return false;

    auto owner = ledger_.owner_of(listing.token_id);
    return owner && *owner == listing.seller &&
           ledger_.is_approved_for_all(listing.seller, self_);
}

Listing* ListingBook::find(uint64_t listing_id) {
    if (listing_id >= listings_.size()) return nullptr;
    return &listings_[listing_id];
}

} // namespace cardex
