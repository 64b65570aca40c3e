// cardex tests - shared fixtures

#ifndef CARDEX_TEST_SUPPORT_HPP
#define CARDEX_TEST_SUPPORT_HPP

#include <catch2/catch.hpp>

#include <cardex/clock.hpp>
#include <cardex/events.hpp>
#include <cardex/ledger.hpp>
#include <cardex/payout.hpp>
#include <cardex/random.hpp>
#include <cardex/system_state.hpp>
#include <cardex/vault.hpp>

#include <string>
#include <vector>

// Readable amounts in assertion failures
namespace Catch {
template <>
struct StringMaker<cardex::I128> {
    static std::string convert(cardex::I128 value) { return cardex::to_string(value); }
};
} // namespace Catch

namespace cardex::test {

inline const Address ADMIN = addresses::from_u64(0xAD);
inline const Address SELLER = addresses::from_u64(0x51);
inline const Address BUYER = addresses::from_u64(0xB1);
inline const Address BUYER2 = addresses::from_u64(0xB2);
inline const Address FEE_RECIPIENT = addresses::from_u64(0xFE);
inline const Currency TOKEN{addresses::from_u64(0x70CE)};

inline I128 eth(int64_t n) { return x18::from_int(n); }
inline I128 eth(int64_t num, int64_t den) { return x18::from_ratio(num, den); }

// Seed source returning a preset value
class FixedSeed : public SeedSource {
public:
    explicit FixedSeed(uint64_t value) : value(value) {}

    uint64_t seed(const EntropyContext& ctx) override {
        last_ctx = ctx;
        ++calls;
        return value;
    }

    void rotate_salt(const EntropyContext&) override { ++rotations; }

    uint64_t value;
    int calls = 0;
    int rotations = 0;
    EntropyContext last_ctx{};
};

// Records event names in order
class RecordingListener : public MarketListener {
public:
    std::vector<std::string> events;
    std::vector<SaleEvent> sales;
    std::vector<RefundEvent> refunds;
    std::vector<DutchSaleEvent> dutch_sales;
    std::vector<MintEvent> mints;

    void on_card_set_created(const CardSet&) override { events.push_back("card_set_created"); }
    void on_card_set_burned(uint64_t) override { events.push_back("card_set_burned"); }
    void on_card_minted(const MintEvent& e) override { events.push_back("card_minted"); mints.push_back(e); }
    void on_listing_created(const Listing&) override { events.push_back("listing_created"); }
    void on_listing_updated(const Listing&) override { events.push_back("listing_updated"); }
    void on_listing_cancelled(const Listing&) override { events.push_back("listing_cancelled"); }
    void on_sale(const SaleEvent& e) override { events.push_back("sale"); sales.push_back(e); }
    void on_auction_created(const EnglishAuction&) override { events.push_back("auction_created"); }
    void on_bid(const BidEvent&, const EnglishAuction&) override { events.push_back("bid"); }
    void on_refund(const RefundEvent& e) override { events.push_back("refund"); refunds.push_back(e); }
    void on_auction_closed(const AuctionClosedEvent&, const EnglishAuction&) override { events.push_back("auction_closed"); }
    void on_auction_cancelled(const EnglishAuction&) override { events.push_back("auction_cancelled"); }
    void on_dutch_auction_created(const DutchAuction&) override { events.push_back("dutch_auction_created"); }
    void on_dutch_sale(const DutchSaleEvent& e) override { events.push_back("dutch_sale"); dutch_sales.push_back(e); }
    void on_dutch_auction_cancelled(const DutchAuction&) override { events.push_back("dutch_auction_cancelled"); }
    void on_withdrawal(const WithdrawalEvent&) override { events.push_back("withdrawal"); }
    void on_paused(const Address&) override { events.push_back("paused"); }
    void on_unpaused(const Address&) override { events.push_back("unpaused"); }
};

// Shared ledgers every engine component settles against
struct Ledgers {
    ManualClock clock{1700000000};
    SystemState system{ADMIN};
    TokenLedger tokens;
    Vault vault;
    PayoutLedger payouts{vault};

    FeeSchedule fees(uint32_t fee_bps) const {
        FeeSchedule schedule;
        schedule.fee_bps = fee_bps;
        schedule.fee_recipient = FEE_RECIPIENT;
        return schedule;
    }

    uint64_t mint_to(const Address& owner) {
        return tokens.mint(owner, "ipfs://card");
    }

    void fund(const Address& account, const Currency& currency, I128 amount) {
        REQUIRE(vault.deposit(account, currency, amount) == errors::OK);
    }
};

} // namespace cardex::test

#endif // CARDEX_TEST_SUPPORT_HPP
