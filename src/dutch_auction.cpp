// =============================================================================
// dutch_auction.cpp - Dutch Auction House Implementation
// =============================================================================

#include "cardex/dutch_auction.hpp"
#include "cardex/events.hpp"

#include <algorithm>

namespace cardex {

I128 dutch_price(const DutchAuction& auction, uint64_t now) {
    uint64_t elapsed = now > auction.start_time ? now - auction.start_time : 0;
    uint64_t t = std::min(elapsed, auction.duration);

    // (t / duration)^k in x18, truncating after each multiply
    I128 ratio = static_cast<I128>(t) * X18_ONE / static_cast<I128>(auction.duration);
    I128 factor = X18_ONE;
    for (uint32_t i = 0; i < auction.decay_exponent && factor > 0; ++i) {
        factor = x18::mul(factor, ratio);
    }

    I128 spread = auction.start_price_x18 - auction.end_price_x18;
    return auction.start_price_x18 - x18::mul_frac(spread, factor);
}

DutchAuctionHouse::DutchAuctionHouse(SystemState& system, AssetLedger& ledger, Vault& vault,
                                     PayoutLedger& payouts, const Clock& clock,
                                     const FeeSchedule& fees, const Address& self)
    : system_(system), ledger_(ledger), vault_(vault), payouts_(payouts),
      clock_(clock), fees_(fees), self_(self) {}

CreateResult DutchAuctionHouse::create_dutch_auction(const Address& caller, uint64_t token_id,
                                                     I128 start_price_x18, I128 end_price_x18,
                                                     uint64_t duration, uint32_t decay_exponent,
                                                     const Currency& currency) {
    if (end_price_x18 <= 0 || start_price_x18 <= end_price_x18 ||
        start_price_x18 > MAX_AMOUNT_X18) {
        return {errors::INVALID_PRICE, 0};
    }
    if (duration == 0 || decay_exponent == 0) {
        return {errors::INVALID_PARAMS, 0};
    }
    if (currency.is_zero()) {
        return {errors::INVALID_CURRENCY, 0};
    }

    auto owner = ledger_.owner_of(token_id);
    if (!owner || *owner != caller) {
        return {errors::NOT_OWNER, 0};
    }
    if (!ledger_.is_approved_for_all(caller, self_)) {
        return {errors::NOT_APPROVED, 0};
    }

    std::unique_lock lock(mutex_);

    int32_t result = ledger_.transfer(self_, caller, self_, token_id);
    if (result != errors::OK) {
        return {result, 0};
    }

    DutchAuction auction;
    auction.id = auctions_.size();
    auction.seller = caller;
    auction.token_id = token_id;
    auction.start_price_x18 = start_price_x18;
    auction.end_price_x18 = end_price_x18;
    auction.start_time = clock_.now();
    auction.duration = duration;
    auction.decay_exponent = decay_exponent;
    auction.currency = currency;
    auction.active = true;
    auctions_.push_back(auction);

    if (listener_) listener_->on_dutch_auction_created(auctions_.back());
    return {errors::OK, auction.id};
}

int32_t DutchAuctionHouse::get_current_price(uint64_t auction_id, I128& price_x18) const {
    std::shared_lock lock(mutex_);
    if (auction_id >= auctions_.size()) {
        return errors::NOT_FOUND;
    }

    price_x18 = dutch_price(auctions_[auction_id], clock_.now());
    return errors::OK;
}

int32_t DutchAuctionHouse::buy(const Address& caller, uint64_t auction_id, I128 payment_x18) {
    if (system_.is_paused()) {
        return errors::PAUSED;
    }

    std::unique_lock lock(mutex_);

    if (auction_id >= auctions_.size()) {
        return errors::NOT_FOUND;
    }
    DutchAuction& auction = auctions_[auction_id];
    if (!auction.active) {
        return errors::NOT_ACTIVE;
    }

    I128 price = dutch_price(auction, clock_.now());
    if (payment_x18 < price) {
        return errors::INSUFFICIENT_PAYMENT;
    }

    I128 settled = auction.currency.is_native() ? payment_x18 : price;
    I128 allowance_before = vault_.allowance(caller, self_, auction.currency);

    int32_t result = vault_.pull_payment(caller, self_, auction.currency, settled);
    if (result != errors::OK) {
        return result;
    }

    result = ledger_.transfer(self_, self_, caller, auction.token_id);
    if (result != errors::OK) {
        int32_t refunded = vault_.rollback(self_, caller, auction.currency, settled);
        if (refunded != errors::OK) return refunded;
        if (!auction.currency.is_native()) {
            int32_t restored = vault_.approve(caller, self_, auction.currency, allowance_before);
            if (restored != errors::OK) return restored;
        }
        return result;
    }

    auction.active = false;

    FeeSplit split{0, 0};
    result = payouts_.distribute(self_, auction.currency, settled, auction.seller,
                                 fees_.fee_recipient, fees_.fee_bps, &split);
    if (result != errors::OK) {
        return result;  // Funds stay escrowed under the house's account
    }

    if (listener_) {
        DutchSaleEvent event{auction.id, auction.seller, caller, auction.token_id,
                             auction.currency, price, settled,
                             split.fee_x18, split.proceeds_x18};
        listener_->on_dutch_sale(event);
    }
    return errors::OK;
}

int32_t DutchAuctionHouse::cancel_dutch_auction(const Address& caller, uint64_t auction_id) {
    std::unique_lock lock(mutex_);

    if (auction_id >= auctions_.size()) {
        return errors::NOT_FOUND;
    }
    DutchAuction& auction = auctions_[auction_id];
    if (auction.seller != caller) {
        return errors::NOT_CREATOR;
    }
    if (!auction.active) {
        return errors::NOT_ACTIVE;
    }

    int32_t result = ledger_.transfer(self_, self_, auction.seller, auction.token_id);
    if (result != errors::OK) {
        return result;
    }

    auction.active = false;

    if (listener_) listener_->on_dutch_auction_cancelled(auction);
    return errors::OK;
}

// =============================================================================
// Fees
// =============================================================================

int32_t DutchAuctionHouse::set_platform_fee_recipient(const Address& caller,
                                                      const Address& recipient) {
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

int32_t DutchAuctionHouse::set_marketplace_fee_bps(const Address& caller, uint32_t fee_bps) {
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

FeeSchedule DutchAuctionHouse::fee_schedule() const {
    std::shared_lock lock(mutex_);
    return fees_;
}

// =============================================================================
// Views
// =============================================================================

std::optional<DutchAuction> DutchAuctionHouse::get_dutch_auction(uint64_t auction_id) const {
    std::shared_lock lock(mutex_);
    if (auction_id >= auctions_.size()) return std::nullopt;
    return auctions_[auction_id];
}

uint64_t DutchAuctionHouse::total_dutch_auctions() const {
    std::shared_lock lock(mutex_);
    return auctions_.size();
}

void DutchAuctionHouse::set_listener(MarketListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

} // namespace cardex
