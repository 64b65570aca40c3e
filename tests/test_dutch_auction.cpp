// cardex - Dutch auction tests

#include "test_support.hpp"
#include <cardex/dutch_auction.hpp>

using namespace cardex;
using namespace cardex::test;

namespace {

DutchAuction curve(I128 start, I128 end, uint64_t duration, uint32_t exponent) {
    DutchAuction auction{};
    auction.start_price_x18 = start;
    auction.end_price_x18 = end;
    auction.start_time = 1000;
    auction.duration = duration;
    auction.decay_exponent = exponent;
    auction.currency = NATIVE;
    auction.active = true;
    return auction;
}

struct DutchFixture : Ledgers {
    DutchAuctionHouse house{system, tokens, vault, payouts, clock, fees(250)};
    RecordingListener listener;
    uint64_t token = 0;

    DutchFixture() {
        house.set_listener(&listener);
        token = mint_to(SELLER);
        tokens.set_approval_for_all(SELLER, house.address(), true);
    }

    uint64_t open(I128 start, I128 end, const Currency& currency = NATIVE) {
        CreateResult result = house.create_dutch_auction(SELLER, token, start, end, 3600, 1, currency);
        REQUIRE(result.error_code == errors::OK);
        return result.id;
    }

    I128 price(uint64_t id) const {
        I128 out = 0;
        REQUIRE(house.get_current_price(id, out) == errors::OK);
        return out;
    }
};

} // namespace

TEST_CASE("Dutch price curve", "[dutch]") {
    SECTION("Linear decay") {
        DutchAuction a = curve(eth(1), eth(1, 2), 3600, 1);
        REQUIRE(dutch_price(a, 1000) == eth(1));
        REQUIRE(dutch_price(a, 1000 + 1800) == eth(3, 4));
        REQUIRE(dutch_price(a, 1000 + 3600) == eth(1, 2));
    }

    SECTION("Clamped after the duration") {
        DutchAuction a = curve(eth(1), eth(1, 2), 3600, 1);
        REQUIRE(dutch_price(a, 1000 + 3601) == eth(1, 2));
        REQUIRE(dutch_price(a, 1000 + 100000) == eth(1, 2));
    }

    SECTION("Before the start the price is the start price") {
        DutchAuction a = curve(eth(1), eth(1, 2), 3600, 1);
        REQUIRE(dutch_price(a, 0) == eth(1));
    }

    SECTION("Higher exponents stay near the start longer") {
        DutchAuction quadratic = curve(eth(1), eth(1, 2), 3600, 2);
        REQUIRE(dutch_price(quadratic, 1000 + 1800) == eth(7, 8));

        DutchAuction cubic = curve(eth(1), eth(1, 2), 3600, 3);
        REQUIRE(dutch_price(cubic, 1000 + 1800) == eth(15, 16));
        REQUIRE(dutch_price(cubic, 1000 + 3600) == eth(1, 2));
    }

    SECTION("Monotone non-increasing and bounded") {
        for (uint32_t exponent : {1u, 2u, 5u}) {
            DutchAuction a = curve(eth(3), eth(1, 3), 7200, exponent);
            I128 previous = dutch_price(a, 1000);
            for (uint64_t t = 0; t <= 8000; t += 97) {
                I128 current = dutch_price(a, 1000 + t);
                REQUIRE(current <= previous);
                REQUIRE(current >= a.end_price_x18);
                REQUIRE(current <= a.start_price_x18);
                previous = current;
            }
        }
    }
}

TEST_CASE("Dutch auction creation", "[dutch]") {
    DutchFixture f;

    SECTION("Validation") {
        REQUIRE(f.house.create_dutch_auction(SELLER, f.token, eth(1), 0, 3600, 1, NATIVE).error_code ==
                errors::INVALID_PRICE);
        REQUIRE(f.house.create_dutch_auction(SELLER, f.token, eth(1), eth(1), 3600, 1, NATIVE).error_code ==
                errors::INVALID_PRICE);
        REQUIRE(f.house.create_dutch_auction(SELLER, f.token, eth(1), eth(2), 3600, 1, NATIVE).error_code ==
                errors::INVALID_PRICE);
        REQUIRE(f.house.create_dutch_auction(SELLER, f.token, eth(2), eth(1), 0, 1, NATIVE).error_code ==
                errors::INVALID_PARAMS);
        REQUIRE(f.house.create_dutch_auction(SELLER, f.token, eth(2), eth(1), 3600, 0, NATIVE).error_code ==
                errors::INVALID_PARAMS);
        REQUIRE(f.house.create_dutch_auction(SELLER, f.token, eth(2), eth(1), 3600, 1, Currency{}).error_code ==
                errors::INVALID_CURRENCY);
        REQUIRE(f.house.create_dutch_auction(BUYER, f.token, eth(2), eth(1), 3600, 1, NATIVE).error_code ==
                errors::NOT_OWNER);

        f.tokens.set_approval_for_all(SELLER, f.house.address(), false);
        REQUIRE(f.house.create_dutch_auction(SELLER, f.token, eth(2), eth(1), 3600, 1, NATIVE).error_code ==
                errors::NOT_APPROVED);
        REQUIRE(f.house.total_dutch_auctions() == 0);
    }

    SECTION("Asset moves into escrow and the clock starts") {
        f.clock.advance(42);
        uint64_t id = f.open(eth(1), eth(1, 2));
        auto auction = f.house.get_dutch_auction(id);
        REQUIRE(auction->start_time == f.clock.now());
        REQUIRE(auction->active);
        REQUIRE(f.tokens.owner_of(f.token) == std::optional<Address>(f.house.address()));
        REQUIRE(f.price(id) == eth(1));
    }

    SECTION("Unknown auction") {
        I128 out = 0;
        REQUIRE(f.house.get_current_price(3, out) == errors::NOT_FOUND);
        REQUIRE_FALSE(f.house.get_dutch_auction(3).has_value());
    }
}

TEST_CASE("Buying a native Dutch auction", "[dutch]") {
    DutchFixture f;
    uint64_t id = f.open(eth(1), eth(1, 2));
    f.fund(BUYER, NATIVE, eth(5));

    SECTION("Payment below the current price is refused") {
        REQUIRE(f.house.buy(BUYER, id, eth(9, 10)) == errors::INSUFFICIENT_PAYMENT);
        REQUIRE(f.tokens.owner_of(f.token) == std::optional<Address>(f.house.address()));
        REQUIRE(f.vault.get_balance(BUYER, NATIVE) == eth(5));
    }

    SECTION("Attached value is settled in full") {
        f.clock.advance(1800);
        REQUIRE(f.price(id) == eth(3, 4));

        REQUIRE(f.house.buy(BUYER, id, eth(1)) == errors::OK);
        REQUIRE(f.tokens.owner_of(f.token) == std::optional<Address>(BUYER));
        REQUIRE(f.vault.get_balance(BUYER, NATIVE) == eth(4));
        REQUIRE(f.payouts.balance_of(SELLER, NATIVE) == eth(39, 40));
        REQUIRE(f.payouts.balance_of(FEE_RECIPIENT, NATIVE) == eth(1, 40));
        REQUIRE_FALSE(f.house.get_dutch_auction(id)->active);

        REQUIRE(f.listener.dutch_sales.size() == 1);
        REQUIRE(f.listener.dutch_sales[0].price_x18 == eth(3, 4));
        REQUIRE(f.listener.dutch_sales[0].paid_x18 == eth(1));

        REQUIRE(f.house.buy(BUYER, id, eth(1)) == errors::NOT_ACTIVE);
    }

    SECTION("Buyer must hold the payment") {
        REQUIRE(f.house.buy(BUYER2, id, eth(1)) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.tokens.owner_of(f.token) == std::optional<Address>(f.house.address()));
        REQUIRE(f.house.get_dutch_auction(id)->active);
    }

    SECTION("Pause blocks buying") {
        REQUIRE(f.system.pause(ADMIN) == errors::OK);
        REQUIRE(f.house.buy(BUYER, id, eth(1)) == errors::PAUSED);
    }

    SECTION("Unknown auction") {
        REQUIRE(f.house.buy(BUYER, 8, eth(1)) == errors::NOT_FOUND);
    }
}

TEST_CASE("Buying a token Dutch auction", "[dutch]") {
    DutchFixture f;
    uint64_t id = f.open(eth(100), eth(50), TOKEN);
    f.fund(BUYER, TOKEN, eth(200));
    f.clock.advance(1800);

    REQUIRE(f.house.buy(BUYER, id, eth(80)) == errors::INSUFFICIENT_ALLOWANCE);

    REQUIRE(f.vault.approve(BUYER, f.house.address(), TOKEN, eth(80)) == errors::OK);
    REQUIRE(f.house.buy(BUYER, id, eth(80)) == errors::OK);

    // Only the current price is pulled
    REQUIRE(f.vault.get_balance(BUYER, TOKEN) == eth(125));
    REQUIRE(f.vault.allowance(BUYER, f.house.address(), TOKEN) == eth(5));
    REQUIRE(f.payouts.balance_of(SELLER, TOKEN) == eth(585, 8));
    REQUIRE(f.payouts.balance_of(FEE_RECIPIENT, TOKEN) == eth(15, 8));
    REQUIRE(f.tokens.owner_of(f.token) == std::optional<Address>(BUYER));
}

TEST_CASE("Cancelling a Dutch auction", "[dutch]") {
    DutchFixture f;
    uint64_t id = f.open(eth(1), eth(1, 2));

    REQUIRE(f.house.cancel_dutch_auction(BUYER, id) == errors::NOT_CREATOR);
    REQUIRE(f.house.cancel_dutch_auction(SELLER, id) == errors::OK);
    REQUIRE(f.tokens.owner_of(f.token) == std::optional<Address>(SELLER));
    REQUIRE(f.house.cancel_dutch_auction(SELLER, id) == errors::NOT_ACTIVE);
    REQUIRE(f.house.cancel_dutch_auction(SELLER, 4) == errors::NOT_FOUND);

    f.fund(BUYER, NATIVE, eth(1));
    REQUIRE(f.house.buy(BUYER, id, eth(1)) == errors::NOT_ACTIVE);
    REQUIRE(f.listener.events ==
            std::vector<std::string>{"dutch_auction_created", "dutch_auction_cancelled"});
}

TEST_CASE("Dutch auction fees", "[dutch]") {
    DutchFixture f;
    REQUIRE(f.house.set_marketplace_fee_bps(SELLER, 500) == errors::UNAUTHORIZED);
    REQUIRE(f.house.set_marketplace_fee_bps(ADMIN, 10001) == errors::INVALID_FEE);
    REQUIRE(f.house.set_marketplace_fee_bps(ADMIN, 10000) == errors::OK);
    REQUIRE(f.house.set_platform_fee_recipient(ADMIN, ADMIN) == errors::OK);
    REQUIRE(f.house.fee_schedule().fee_recipient == ADMIN);

    uint64_t id = f.open(eth(1), eth(1, 2));
    f.fund(BUYER, NATIVE, eth(1));
    REQUIRE(f.house.buy(BUYER, id, eth(1)) == errors::OK);
    REQUIRE(f.payouts.balance_of(ADMIN, NATIVE) == eth(1));
    REQUIRE(f.payouts.balance_of(SELLER, NATIVE) == 0);
}
