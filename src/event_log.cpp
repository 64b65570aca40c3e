// =============================================================================
// event_log.cpp - JSON-lines event logger
// =============================================================================

#include "cardex/event_log.hpp"
#include "cardex/auction.hpp"
#include "cardex/card_set.hpp"
#include "cardex/dutch_auction.hpp"
#include "cardex/listing.hpp"
#include <nlohmann/json.hpp>

namespace cardex {

using json = nlohmann::json;

namespace {

std::string hex(const Address& addr) { return addresses::to_hex(addr); }
std::string hex(const Currency& c) { return addresses::to_hex(c.addr); }
std::string amount(I128 v) { return to_string(v); }

const char* status_name(ListingStatus status) {
    switch (status) {
        case ListingStatus::ACTIVE: return "ACTIVE";
        case ListingStatus::COMPLETED: return "COMPLETED";
        case ListingStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

const char* status_name(AuctionStatus status) {
    switch (status) {
        case AuctionStatus::CREATED: return "CREATED";
        case AuctionStatus::COMPLETED: return "COMPLETED";
        case AuctionStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

json listing_json(const Listing& listing) {
    return {
        {"listing_id", listing.id},
        {"seller", hex(listing.seller)},
        {"token_id", listing.token_id},
        {"quantity", listing.quantity},
        {"currency", hex(listing.currency)},
        {"price_per_token", amount(listing.price_per_token_x18)},
        {"start_time", listing.start_time},
        {"end_time", listing.end_time},
        {"reserved", listing.reserved},
        {"status", status_name(listing.status)}
    };
}

json auction_json(const EnglishAuction& auction) {
    json body = {
        {"auction_id", auction.id},
        {"seller", hex(auction.seller)},
        {"token_id", auction.token_id},
        {"currency", hex(auction.currency)},
        {"min_bid", amount(auction.min_bid_x18)},
        {"buyout_bid", amount(auction.buyout_bid_x18)},
        {"start_time", auction.start_time},
        {"end_time", auction.end_time},
        {"status", status_name(auction.status)}
    };
    if (auction.winning_bid) {
        body["winning_bidder"] = hex(auction.winning_bid->bidder);
        body["winning_bid"] = amount(auction.winning_bid->amount_x18);
    }
    return body;
}

json dutch_json(const DutchAuction& auction) {
    return {
        {"auction_id", auction.id},
        {"seller", hex(auction.seller)},
        {"token_id", auction.token_id},
        {"start_price", amount(auction.start_price_x18)},
        {"end_price", amount(auction.end_price_x18)},
        {"start_time", auction.start_time},
        {"duration", auction.duration},
        {"decay_exponent", auction.decay_exponent},
        {"currency", hex(auction.currency)},
        {"active", auction.active}
    };
}

}  // namespace

JsonEventLog::JsonEventLog(std::ostream& out)
    : out_(out) {}

uint64_t JsonEventLog::events_written() const {
    std::lock_guard lock(mutex_);
    return seq_;
}

template <typename Json>
void JsonEventLog::write(const char* name, Json&& body) {
    json line = std::forward<Json>(body);

    std::lock_guard lock(mutex_);
    line["event"] = name;
    line["seq"] = seq_++;
    out_ << line.dump() << '\n';
}

// =============================================================================
// Card sets
// =============================================================================

void JsonEventLog::on_card_set_created(const CardSet& set) {
    write("card_set_created", json{
        {"set_id", set.id},
        {"name", set.name},
        {"card_uris", set.card_uris},
        {"probabilities", set.probabilities},
        {"supply", set.remaining_supply},
        {"price", amount(set.price_x18)}
    });
}

void JsonEventLog::on_card_set_burned(uint64_t set_id) {
    write("card_set_burned", json{{"set_id", set_id}});
}

void JsonEventLog::on_card_minted(const MintEvent& event) {
    write("card_minted", json{
        {"set_id", event.set_id},
        {"token_id", event.token_id},
        {"card_index", event.card_index},
        {"uri", event.uri},
        {"owner", hex(event.owner)},
        {"remaining_supply", event.remaining_supply}
    });
}

void JsonEventLog::on_secret_salt_updated(const Address& by) {
    write("secret_salt_updated", json{{"by", hex(by)}});
}

// =============================================================================
// Listings
// =============================================================================

void JsonEventLog::on_listing_created(const Listing& listing) {
    write("listing_created", listing_json(listing));
}

void JsonEventLog::on_listing_updated(const Listing& listing) {
    write("listing_updated", listing_json(listing));
}

void JsonEventLog::on_listing_cancelled(const Listing& listing) {
    write("listing_cancelled", listing_json(listing));
}

void JsonEventLog::on_buyer_approved(uint64_t listing_id, const Address& buyer, bool approved) {
    write("buyer_approved", json{
        {"listing_id", listing_id},
        {"buyer", hex(buyer)},
        {"approved", approved}
    });
}

void JsonEventLog::on_currency_approved(uint64_t listing_id, const Currency& currency,
                                        I128 price_x18) {
    write("currency_approved", json{
        {"listing_id", listing_id},
        {"currency", hex(currency)},
        {"price_per_token", amount(price_x18)}
    });
}

void JsonEventLog::on_sale(const SaleEvent& event) {
    write("sale", json{
        {"listing_id", event.listing_id},
        {"seller", hex(event.seller)},
        {"buyer", hex(event.buyer)},
        {"token_id", event.token_id},
        {"quantity", event.quantity},
        {"currency", hex(event.currency)},
        {"total_price", amount(event.total_price_x18)},
        {"fee", amount(event.fee_x18)},
        {"proceeds", amount(event.proceeds_x18)}
    });
}

// =============================================================================
// English auctions
// =============================================================================

void JsonEventLog::on_auction_created(const EnglishAuction& auction) {
    write("auction_created", auction_json(auction));
}

void JsonEventLog::on_bid(const BidEvent& event, const EnglishAuction& auction) {
    write("bid", json{
        {"auction_id", event.auction_id},
        {"bidder", hex(event.bidder)},
        {"amount", amount(event.amount_x18)},
        {"end_time", event.end_time},
        {"buyout", event.buyout},
        {"status", status_name(auction.status)}
    });
}

void JsonEventLog::on_refund(const RefundEvent& event) {
    write(event.queued ? "refund_queued" : "refund", json{
        {"auction_id", event.auction_id},
        {"bidder", hex(event.bidder)},
        {"currency", hex(event.currency)},
        {"amount", amount(event.amount_x18)}
    });
}

void JsonEventLog::on_auction_closed(const AuctionClosedEvent& event,
                                     const EnglishAuction& auction) {
    write("auction_closed", json{
        {"auction_id", event.auction_id},
        {"closer", hex(event.closer)},
        {"token_id", event.token_id},
        {"seller", hex(event.seller)},
        {"winner", hex(event.winner)},
        {"tokens_collected", event.tokens_collected},
        {"payout_collected", event.payout_collected},
        {"status", status_name(auction.status)}
    });
}

void JsonEventLog::on_auction_cancelled(const EnglishAuction& auction) {
    write("auction_cancelled", auction_json(auction));
}

// =============================================================================
// Dutch auctions
// =============================================================================

void JsonEventLog::on_dutch_auction_created(const DutchAuction& auction) {
    write("dutch_auction_created", dutch_json(auction));
}

void JsonEventLog::on_dutch_sale(const DutchSaleEvent& event) {
    write("dutch_sale", json{
        {"auction_id", event.auction_id},
        {"seller", hex(event.seller)},
        {"buyer", hex(event.buyer)},
        {"token_id", event.token_id},
        {"currency", hex(event.currency)},
        {"price", amount(event.price_x18)},
        {"paid", amount(event.paid_x18)},
        {"fee", amount(event.fee_x18)},
        {"proceeds", amount(event.proceeds_x18)}
    });
}

void JsonEventLog::on_dutch_auction_cancelled(const DutchAuction& auction) {
    write("dutch_auction_cancelled", dutch_json(auction));
}

// =============================================================================
// Funds and admin
// =============================================================================

void JsonEventLog::on_withdrawal(const WithdrawalEvent& event) {
    write("withdrawal", json{
        {"to", hex(event.to)},
        {"currency", hex(event.currency)},
        {"amount", amount(event.amount_x18)}
    });
}

void JsonEventLog::on_paused(const Address& by) {
    write("paused", json{{"by", hex(by)}});
}

void JsonEventLog::on_unpaused(const Address& by) {
    write("unpaused", json{{"by", hex(by)}});
}

} // namespace cardex
