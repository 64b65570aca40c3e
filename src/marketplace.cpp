// =============================================================================
// marketplace.cpp - Component wiring
// =============================================================================

#include "cardex/marketplace.hpp"
#include "cardex/events.hpp"
#include <stdexcept>

namespace cardex {

namespace {

std::unique_ptr<SeedSource> default_seeds(const Config& config,
                                          std::unique_ptr<SeedSource> seeds) {
    if (seeds) return seeds;
    return std::make_unique<BlockEntropySeed>(BlockEntropySeed::salt_from_seed(config.salt_seed));
}

FeeSchedule fee_schedule(const Config& config, uint32_t fee_bps) {
    if (fee_bps > bps::MAX_FEE) {
        throw std::invalid_argument("Marketplace: fee above 10000 bps");
    }

    FeeSchedule fees;
    fees.fee_bps = fee_bps;
    fees.fee_recipient = config.effective_fee_recipient();
    return fees;
}

}  // namespace

Marketplace::Marketplace(const Config& config, const Clock& clock,
                         std::unique_ptr<SeedSource> seeds)
    : clock_(clock),
      seeds_(default_seeds(config, std::move(seeds))),
      system_(config.admin),
      payouts_(vault_),
      card_sets_(system_, tokens_, vault_, payouts_, clock_, *seeds_),
      listings_(system_, tokens_, vault_, payouts_, clock_,
                fee_schedule(config, config.listing_fee_bps)),
      auctions_(system_, tokens_, vault_, payouts_, clock_,
                fee_schedule(config, config.auction_fee_bps)),
      dutch_auctions_(system_, tokens_, vault_, payouts_, clock_,
                      fee_schedule(config, config.dutch_fee_bps)) {}

void Marketplace::set_listener(MarketListener* listener) {
    system_.set_listener(listener);
    payouts_.set_listener(listener);
    card_sets_.set_listener(listener);
    listings_.set_listener(listener);
    auctions_.set_listener(listener);
    dutch_auctions_.set_listener(listener);
}

int32_t Marketplace::set_platform_fee_recipient(const Address& caller, const Address& recipient) {
    int32_t result = listings_.set_platform_fee_recipient(caller, recipient);
    if (result != errors::OK) return result;

    result = auctions_.set_platform_fee_recipient(caller, recipient);
    if (result != errors::OK) return result;

    return dutch_auctions_.set_platform_fee_recipient(caller, recipient);
}

} // namespace cardex
