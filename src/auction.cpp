// =============================================================================
// auction.cpp - English Auction House Implementation
// =============================================================================

#include "cardex/auction.hpp"
#include "cardex/events.hpp"

namespace cardex {

AuctionHouse::AuctionHouse(SystemState& system, AssetLedger& ledger, Vault& vault,
                           PayoutLedger& payouts, const Clock& clock, const FeeSchedule& fees,
                           const Address& self)
    : system_(system), ledger_(ledger), vault_(vault), payouts_(payouts),
      clock_(clock), fees_(fees), self_(self) {}

// =============================================================================
// Auction Lifecycle
// =============================================================================

CreateResult AuctionHouse::create_auction(const Address& caller, const AuctionParams& params) {
    auto owner = ledger_.owner_of(params.token_id);
    if (!owner || *owner != caller) {
        return {errors::NOT_OWNER, 0};
    }
    if (!ledger_.is_approved_for_all(caller, self_)) {
        return {errors::NOT_APPROVED, 0};
    }
    if (params.quantity != 1) {
        return {errors::INVALID_QUANTITY, 0};
    }
    if (params.currency.is_zero()) {
        return {errors::INVALID_CURRENCY, 0};
    }
    if (params.min_bid_x18 <= 0 || params.min_bid_x18 > MAX_AMOUNT_X18 ||
        params.buyout_bid_x18 < 0 || params.buyout_bid_x18 > MAX_AMOUNT_X18) {
        return {errors::INVALID_PARAMS, 0};
    }
    if (params.buyout_bid_x18 != 0 && params.buyout_bid_x18 <= params.min_bid_x18) {
        return {errors::INVALID_PARAMS, 0};
    }
    if (params.time_buffer == 0 || params.time_buffer > MAX_TIME_BUFFER ||
        params.bid_buffer_bps == 0) {
        return {errors::INVALID_PARAMS, 0};
    }

    uint64_t start = params.start_time == 0 ? clock_.now() : params.start_time;
    if (params.end_time <= start) {
        return {errors::INVALID_WINDOW, 0};
    }

    std::unique_lock lock(mutex_);

    // Escrow the asset for the auction's lifetime
    int32_t result = ledger_.transfer(self_, caller, self_, params.token_id);
    if (result != errors::OK) {
        return {result, 0};
    }

    EnglishAuction auction;
    auction.id = auctions_.size();
    auction.seller = caller;
    auction.token_id = params.token_id;
    auction.quantity = params.quantity;
    auction.currency = params.currency;
    auction.min_bid_x18 = params.min_bid_x18;
    auction.buyout_bid_x18 = params.buyout_bid_x18;
    auction.time_buffer = params.time_buffer;
    auction.bid_buffer_bps = params.bid_buffer_bps;
    auction.start_time = start;
    auction.end_time = params.end_time;
    auction.status = AuctionStatus::CREATED;
    auction.tokens_collected = false;
    auction.payout_collected = false;
    auctions_.push_back(std::move(auction));

    if (listener_) listener_->on_auction_created(auctions_.back());
    return {errors::OK, auctions_.back().id};
}

int32_t AuctionHouse::bid_in_auction(const Address& caller, uint64_t auction_id, I128 amount_x18) {
    if (system_.is_paused()) {
        return errors::PAUSED;
    }

    std::unique_lock lock(mutex_);

    EnglishAuction* auction = find(auction_id);
    if (!auction) {
        return errors::NOT_FOUND;
    }
    if (auction->status != AuctionStatus::CREATED) {
        return errors::NOT_ACTIVE;
    }

    uint64_t now = clock_.now();
    if (now < auction->start_time) {
        return errors::NOT_STARTED;
    }
    if (now > auction->end_time) {
        return errors::EXPIRED;
    }

    if (amount_x18 <= 0 || amount_x18 > MAX_AMOUNT_X18) {
        return errors::INVALID_AMOUNT;
    }

    bool buyout = auction->buyout_bid_x18 > 0 && amount_x18 >= auction->buyout_bid_x18;
    if (!buyout && !outbids(*auction, amount_x18)) {
        return errors::BID_TOO_LOW;
    }

    int32_t result = vault_.pull_payment(caller, self_, auction->currency, amount_x18);
    if (result != errors::OK) {
        return result;
    }

    // Previous bidder is made whole before the new bid takes over
    if (auction->winning_bid) {
        refund_previous(*auction, *auction->winning_bid);
    }
    auction->winning_bid = Bid{caller, amount_x18};

    if (!buyout) {
        // now <= end_time here, so the remaining time cannot wrap
        if (auction->end_time - now < auction->time_buffer) {
            auction->end_time = now + auction->time_buffer;
        }
        if (listener_) {
            BidEvent event{auction->id, caller, amount_x18, auction->end_time, false};
            listener_->on_bid(event, *auction);
        }
        return errors::OK;
    }

    // Buyout settles on the spot. A step that fails here stays open for
    // collect_auction_tokens / collect_auction_payout.
    auction->end_time = now;
    auction->status = AuctionStatus::COMPLETED;

    if (ledger_.transfer(self_, self_, caller, auction->token_id) == errors::OK) {
        auction->tokens_collected = true;
    }
    if (payouts_.distribute(self_, auction->currency, amount_x18, auction->seller,
                            fees_.fee_recipient, fees_.fee_bps) == errors::OK) {
        auction->payout_collected = true;
    }

    if (listener_) {
        BidEvent event{auction->id, caller, amount_x18, auction->end_time, true};
        listener_->on_bid(event, *auction);
    }
    notify_closed(*auction, caller);
    return errors::OK;
}

int32_t AuctionHouse::collect_auction_tokens(const Address& caller, uint64_t auction_id) {
    std::unique_lock lock(mutex_);

    EnglishAuction* auction = find(auction_id);
    if (!auction) {
        return errors::NOT_FOUND;
    }
    if (!has_ended(*auction, clock_.now())) {
        return errors::NOT_ENDED;
    }
    if (!auction->winning_bid) {
        return errors::NO_WINNER;
    }
    if (auction->winning_bid->bidder != caller) {
        return errors::NOT_WINNER;
    }
    if (auction->tokens_collected) {
        return errors::ALREADY_COLLECTED;
    }

    int32_t result = ledger_.transfer(self_, self_, caller, auction->token_id);
    if (result != errors::OK) {
        return result;
    }

    auction->tokens_collected = true;
    auction->status = AuctionStatus::COMPLETED;

    notify_closed(*auction, caller);
    return errors::OK;
}

int32_t AuctionHouse::collect_auction_payout(const Address& caller, uint64_t auction_id) {
    std::unique_lock lock(mutex_);

    EnglishAuction* auction = find(auction_id);
    if (!auction) {
        return errors::NOT_FOUND;
    }
    if (auction->seller != caller) {
        return errors::NOT_CREATOR;
    }
    if (!has_ended(*auction, clock_.now())) {
        return errors::NOT_ENDED;
    }
    if (!auction->winning_bid) {
        return errors::NO_WINNER;
    }
    if (auction->payout_collected) {
        return errors::ALREADY_COLLECTED;
    }

    int32_t result = payouts_.distribute(self_, auction->currency,
                                         auction->winning_bid->amount_x18, auction->seller,
                                         fees_.fee_recipient, fees_.fee_bps);
    if (result != errors::OK) {
        return result;
    }

    auction->payout_collected = true;
    auction->status = AuctionStatus::COMPLETED;

    notify_closed(*auction, caller);
    return errors::OK;
}

int32_t AuctionHouse::cancel_auction(const Address& caller, uint64_t auction_id) {
    std::unique_lock lock(mutex_);

    EnglishAuction* auction = find(auction_id);
    if (!auction) {
        return errors::NOT_FOUND;
    }
    if (auction->seller != caller) {
        return errors::NOT_CREATOR;
    }
    if (auction->status != AuctionStatus::CREATED) {
        return errors::NOT_ACTIVE;
    }
    if (auction->winning_bid) {
        return errors::HAS_BIDS;
    }

    int32_t result = ledger_.transfer(self_, self_, auction->seller, auction->token_id);
    if (result != errors::OK) {
        return result;
    }

    auction->status = AuctionStatus::CANCELLED;

    if (listener_) listener_->on_auction_cancelled(*auction);
    return errors::OK;
}

int32_t AuctionHouse::withdraw_refund(const Address& caller, uint64_t auction_id) {
    std::unique_lock lock(mutex_);

    const EnglishAuction* auction = find(auction_id);
    if (!auction) {
        return errors::NOT_FOUND;
    }

    auto it = pending_refunds_.find({auction_id, caller});
    if (it == pending_refunds_.end()) {
        return errors::NOTHING_TO_WITHDRAW;
    }

    I128 amount = it->second;
    int32_t result = vault_.transfer(self_, caller, auction->currency, amount);
    if (result != errors::OK) {
        return result;  // Stays queued
    }

    pending_refunds_.erase(it);

    if (listener_) {
        RefundEvent event{auction_id, caller, auction->currency, amount, false};
        listener_->on_refund(event);
    }
    return errors::OK;
}

// =============================================================================
// Fees
// =============================================================================

int32_t AuctionHouse::set_platform_fee_recipient(const Address& caller, const Address& recipient) {
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

int32_t AuctionHouse::set_marketplace_fee_bps(const Address& caller, uint32_t fee_bps) {
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

FeeSchedule AuctionHouse::fee_schedule() const {
    std::shared_lock lock(mutex_);
    return fees_;
}

// =============================================================================
// Views
// =============================================================================

std::optional<EnglishAuction> AuctionHouse::get_auction(uint64_t auction_id) const {
    std::shared_lock lock(mutex_);
    const EnglishAuction* auction = find(auction_id);
    if (!auction) return std::nullopt;
    return *auction;
}

uint64_t AuctionHouse::total_auctions() const {
    std::shared_lock lock(mutex_);
    return auctions_.size();
}

int32_t AuctionHouse::get_all_auctions(uint64_t start_id, uint64_t end_id,
                                       std::vector<EnglishAuction>& out) const {
    std::shared_lock lock(mutex_);
    if (start_id > end_id || end_id >= auctions_.size()) {
        return errors::INVALID_RANGE;
    }

    out.assign(auctions_.begin() + start_id, auctions_.begin() + end_id + 1);
    return errors::OK;
}

int32_t AuctionHouse::get_all_valid_auctions(uint64_t start_id, uint64_t end_id,
                                             std::vector<EnglishAuction>& out) const {
    std::shared_lock lock(mutex_);
    if (start_id > end_id || end_id >= auctions_.size()) {
        return errors::INVALID_RANGE;
    }

    uint64_t now = clock_.now();
    out.clear();
    for (uint64_t id = start_id; id <= end_id; ++id) {
        const EnglishAuction& auction = auctions_[id];
        if (auction.status == AuctionStatus::CREATED &&
            now >= auction.start_time && now <= auction.end_time) {
            out.push_back(auction);
        }
    }
    return errors::OK;
}

std::optional<Bid> AuctionHouse::get_winning_bid(uint64_t auction_id) const {
    std::shared_lock lock(mutex_);
    const EnglishAuction* auction = find(auction_id);
    if (!auction) return std::nullopt;
    return auction->winning_bid;
}

bool AuctionHouse::is_auction_expired(uint64_t auction_id) const {
    std::shared_lock lock(mutex_);
    const EnglishAuction* auction = find(auction_id);
    return auction && has_ended(*auction, clock_.now());
}

bool AuctionHouse::is_new_winning_bid(uint64_t auction_id, I128 amount_x18) const {
    std::shared_lock lock(mutex_);
    const EnglishAuction* auction = find(auction_id);
    return auction && outbids(*auction, amount_x18);
}

I128 AuctionHouse::pending_refund(uint64_t auction_id, const Address& bidder) const {
    std::shared_lock lock(mutex_);
    auto it = pending_refunds_.find({auction_id, bidder});
    return (it != pending_refunds_.end()) ? it->second : 0;
}

void AuctionHouse::set_listener(MarketListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

// =============================================================================
// Internal Helpers
// =============================================================================

EnglishAuction* AuctionHouse::find(uint64_t auction_id) {
    if (auction_id >= auctions_.size()) return nullptr;
    return &auctions_[auction_id];
}

const EnglishAuction* AuctionHouse::find(uint64_t auction_id) const {
    if (auction_id >= auctions_.size()) return nullptr;
    return &auctions_[auction_id];
}

bool AuctionHouse::outbids(const EnglishAuction& auction, I128 amount_x18) const {
    if (amount_x18 <= 0 || amount_x18 > MAX_AMOUNT_X18) {
        return false;
    }
    if (!auction.winning_bid) {
        return amount_x18 >= auction.min_bid_x18;
    }

    // amount >= previous * (1 + buffer) exactly, i.e.
    // amount - previous >= ceil(previous * buffer / 10000)
    I128 previous = auction.winning_bid->amount_x18;
    I128 buffer = auction.bid_buffer_bps;
    I128 whole = previous / bps::DENOMINATOR;
    I128 rest = previous % bps::DENOMINATOR;
    if (whole > MAX_AMOUNT_X18 / buffer) {
        return false;  // Required increment exceeds any acceptable bid
    }

    I128 increment = whole * buffer + (rest * buffer + bps::DENOMINATOR - 1) / bps::DENOMINATOR;
    return amount_x18 - previous >= increment;
}

bool AuctionHouse::has_ended(const EnglishAuction& auction, uint64_t now) const {
    return auction.status == AuctionStatus::COMPLETED || now > auction.end_time;
}

void AuctionHouse::refund_previous(const EnglishAuction& auction, const Bid& previous) {
    int32_t result = vault_.transfer(self_, previous.bidder, auction.currency,
                                     previous.amount_x18);

    bool queued = result != errors::OK;
    if (queued) {
        pending_refunds_[{auction.id, previous.bidder}] += previous.amount_x18;
    }

    if (listener_) {
        RefundEvent event{auction.id, previous.bidder, auction.currency,
                          previous.amount_x18, queued};
        listener_->on_refund(event);
    }
}

void AuctionHouse::notify_closed(const EnglishAuction& auction, const Address& closer) {
    if (!listener_) return;

    AuctionClosedEvent event{auction.id, closer, auction.token_id, auction.seller,
                             auction.winning_bid ? auction.winning_bid->bidder : Address{},
                             auction.tokens_collected, auction.payout_collected};
    listener_->on_auction_closed(event, auction);
}

} // namespace cardex
