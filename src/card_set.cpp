// =============================================================================
// card_set.cpp - CardSet Registry Implementation
// =============================================================================

#include "cardex/card_set.hpp"
#include "cardex/events.hpp"

namespace cardex {

CardSetRegistry::CardSetRegistry(SystemState& system, AssetLedger& ledger, Vault& vault,
                                 PayoutLedger& payouts, const Clock& clock, SeedSource& seeds,
                                 const Address& self)
    : system_(system), ledger_(ledger), vault_(vault), payouts_(payouts),
      clock_(clock), seeds_(seeds), self_(self) {}

// =============================================================================
// Admin
// =============================================================================

CreateResult CardSetRegistry::create_card_set(const Address& caller, const std::string& name,
                                              const std::vector<std::string>& card_uris,
                                              const std::vector<uint32_t>& probabilities,
                                              uint64_t supply, I128 price_x18) {
    if (!system_.is_admin(caller)) {
        return {errors::UNAUTHORIZED, 0};
    }
    if (card_uris.size() != probabilities.size()) {
        return {errors::LENGTH_MISMATCH, 0};
    }

    uint64_t total = 0;
    for (auto p : probabilities) total += p;
    if (total != PROBABILITY_TOTAL) {
        return {errors::INVALID_PROBABILITIES, 0};
    }
    if (price_x18 < 0 || price_x18 > MAX_AMOUNT_X18) {
        return {errors::INVALID_PRICE, 0};
    }

    std::unique_lock lock(mutex_);

    CardSet set;
    set.id = sets_.size();
    set.name = name;
    set.card_uris = card_uris;
    set.probabilities = probabilities;
    set.remaining_supply = supply;
    set.price_x18 = price_x18;
    set.burned = false;
    sets_.push_back(std::move(set));

    if (listener_) listener_->on_card_set_created(sets_.back());
    return {errors::OK, sets_.back().id};
}

int32_t CardSetRegistry::burn_card_set(const Address& caller, uint64_t set_id) {
    if (!system_.is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }

    std::unique_lock lock(mutex_);

    if (set_id >= sets_.size() || sets_[set_id].burned) {
        return errors::NOT_FOUND;
    }

    sets_[set_id].burned = true;
    if (listener_) listener_->on_card_set_burned(set_id);
    return errors::OK;
}

int32_t CardSetRegistry::update_secret_salt(const Address& caller) {
    if (!system_.is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }

    std::unique_lock lock(mutex_);
    seeds_.rotate_salt(entropy(caller));
    ++draw_nonce_;

    if (listener_) listener_->on_secret_salt_updated(caller);
    return errors::OK;
}

// =============================================================================
// Minting
// =============================================================================

MintResult CardSetRegistry::mint_from_card_set(const Address& caller, uint64_t set_id,
                                               I128 payment_x18) {
    MintResult result{errors::OK, 0, 0, {}};

    if (system_.is_paused()) {
        result.error_code = errors::PAUSED;
        return result;
    }

    std::unique_lock lock(mutex_);

    if (set_id >= sets_.size() || sets_[set_id].burned) {
        result.error_code = errors::NOT_FOUND;
        return result;
    }

    CardSet& set = sets_[set_id];
    if (set.remaining_supply == 0) {
        result.error_code = errors::SOLD_OUT;
        return result;
    }
    if (payment_x18 != set.price_x18) {
        result.error_code = errors::WRONG_PAYMENT;
        return result;
    }

    auto index = weighted_draw(seeds_.seed(entropy(caller)), set.probabilities);
    if (!index) {
        result.error_code = errors::INVALID_PROBABILITIES;
        return result;
    }

    // Mint revenue goes straight to the admin treasury
    if (payment_x18 > 0) {
        int32_t pulled = vault_.transfer(caller, self_, NATIVE, payment_x18);
        if (pulled != errors::OK) {
            result.error_code = pulled;
            return result;
        }

        int32_t credited = payouts_.credit_from(self_, system_.admin(), NATIVE, payment_x18);
        if (credited != errors::OK) {
            int32_t refunded = vault_.rollback(self_, caller, NATIVE, payment_x18);
            result.error_code = (refunded == errors::OK) ? credited : refunded;
            return result;
        }
    }

    ++draw_nonce_;
    --set.remaining_supply;

    result.card_index = static_cast<uint32_t>(*index);
    result.uri = set.card_uris[*index];
    result.token_id = ledger_.mint(caller, result.uri);

    if (listener_) {
        MintEvent event{set.id, result.token_id, result.card_index, result.uri,
                        caller, set.remaining_supply};
        listener_->on_card_minted(event);
    }
    return result;
}

// =============================================================================
// Views
// =============================================================================

std::optional<CardSet> CardSetRegistry::get_card_set(uint64_t set_id) const {
    std::shared_lock lock(mutex_);
    if (set_id >= sets_.size() || sets_[set_id].burned) return std::nullopt;
    return sets_[set_id];
}

uint64_t CardSetRegistry::card_set_count() const {
    std::shared_lock lock(mutex_);
    return sets_.size();
}

std::vector<CardSet> CardSetRegistry::available_card_sets() const {
    std::shared_lock lock(mutex_);
    std::vector<CardSet> result;
    for (const auto& set : sets_) {
        if (set.available()) result.push_back(set);
    }
    return result;
}

void CardSetRegistry::set_listener(MarketListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

EntropyContext CardSetRegistry::entropy(const Address& caller) const {
    EntropyContext ctx;
    ctx.timestamp = clock_.now();
    ctx.block_number = clock_.block_number();
    ctx.caller = caller;
    ctx.nonce = draw_nonce_;
    return ctx;
}

} // namespace cardex
