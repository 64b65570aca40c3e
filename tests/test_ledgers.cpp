// cardex - Ownership, custody and payout ledger tests

#include "test_support.hpp"

using namespace cardex;
using namespace cardex::test;

TEST_CASE("Token ledger ownership", "[ledger]") {
    TokenLedger tokens;

    uint64_t first = tokens.mint(SELLER, "ipfs://a");
    uint64_t second = tokens.mint(SELLER, "ipfs://b");

    SECTION("Sequential ids from zero") {
        REQUIRE(first == 0);
        REQUIRE(second == 1);
        REQUIRE(tokens.last_minted_token_id() == std::optional<uint64_t>(1));
        REQUIRE(tokens.total_minted() == 2);
        REQUIRE(tokens.balance_of(SELLER) == 2);
        REQUIRE(tokens.token_uri(1) == std::optional<std::string>("ipfs://b"));
    }

    SECTION("Owner transfers") {
        REQUIRE(tokens.transfer(SELLER, SELLER, BUYER, first) == errors::OK);
        REQUIRE(tokens.owner_of(first) == std::optional<Address>(BUYER));
    }

    SECTION("Stranger cannot transfer") {
        REQUIRE(tokens.transfer(BUYER, SELLER, BUYER, first) == errors::NOT_APPROVED_OR_OWNER);
        REQUIRE(tokens.owner_of(first) == std::optional<Address>(SELLER));
    }

    SECTION("Wrong from is rejected") {
        REQUIRE(tokens.transfer(SELLER, BUYER, BUYER2, first) == errors::NOT_APPROVED_OR_OWNER);
    }

    SECTION("Operator transfers") {
        tokens.set_approval_for_all(SELLER, BUYER, true);
        REQUIRE(tokens.is_approved_for_all(SELLER, BUYER));
        REQUIRE(tokens.transfer(BUYER, SELLER, BUYER2, first) == errors::OK);

        tokens.set_approval_for_all(SELLER, BUYER, false);
        REQUIRE(tokens.transfer(BUYER, SELLER, BUYER2, second) == errors::NOT_APPROVED_OR_OWNER);
    }

    SECTION("Single-token approval is cleared by a transfer") {
        REQUIRE(tokens.approve(SELLER, BUYER, first) == errors::OK);
        REQUIRE(tokens.get_approved(first) == std::optional<Address>(BUYER));

        REQUIRE(tokens.transfer(BUYER, SELLER, BUYER2, first) == errors::OK);
        REQUIRE_FALSE(tokens.get_approved(first).has_value());
        REQUIRE(tokens.transfer(BUYER, BUYER2, BUYER, first) == errors::NOT_APPROVED_OR_OWNER);
    }

    SECTION("Approve requires owner or operator") {
        REQUIRE(tokens.approve(BUYER, BUYER, first) == errors::NOT_APPROVED_OR_OWNER);
        REQUIRE(tokens.approve(SELLER, BUYER, 99) == errors::NOT_FOUND);
    }

    SECTION("Transfer edge cases") {
        REQUIRE(tokens.transfer(SELLER, SELLER, addresses::ZERO, first) == errors::INVALID_PARAMS);
        REQUIRE(tokens.transfer(SELLER, SELLER, BUYER, 42) == errors::NOT_FOUND);
    }

    SECTION("Burn") {
        REQUIRE(tokens.burn(BUYER, first) == errors::NOT_APPROVED);
        REQUIRE(tokens.burn(SELLER, first) == errors::OK);
        REQUIRE_FALSE(tokens.owner_of(first).has_value());
        REQUIRE(tokens.burn(SELLER, first) == errors::NOT_FOUND);
    }
}

TEST_CASE("Vault custody", "[vault]") {
    Vault vault;
    REQUIRE(vault.deposit(BUYER, NATIVE, eth(10)) == errors::OK);

    SECTION("Deposit validation") {
        REQUIRE(vault.deposit(BUYER, NATIVE, 0) == errors::INVALID_AMOUNT);
        REQUIRE(vault.deposit(BUYER, Currency{}, eth(1)) == errors::INVALID_CURRENCY);
    }

    SECTION("Balances stop at the amount ceiling") {
        REQUIRE(vault.deposit(SELLER, NATIVE, MAX_AMOUNT_X18) == errors::OK);
        REQUIRE(vault.deposit(SELLER, NATIVE, 1) == errors::INVALID_AMOUNT);
        REQUIRE(vault.deposit(BUYER, NATIVE, MAX_AMOUNT_X18) == errors::INVALID_AMOUNT);
        REQUIRE(vault.get_balance(BUYER, NATIVE) == eth(10));

        REQUIRE(vault.transfer(BUYER, SELLER, NATIVE, eth(1)) == errors::INVALID_AMOUNT);
        REQUIRE(vault.get_balance(BUYER, NATIVE) == eth(10));
        REQUIRE(vault.get_balance(SELLER, NATIVE) == MAX_AMOUNT_X18);
    }

    SECTION("Withdraw") {
        REQUIRE(vault.withdraw(BUYER, NATIVE, eth(4)) == errors::OK);
        REQUIRE(vault.get_balance(BUYER, NATIVE) == eth(6));
        REQUIRE(vault.withdraw(BUYER, NATIVE, eth(7)) == errors::INSUFFICIENT_BALANCE);
    }

    SECTION("Transfer") {
        REQUIRE(vault.transfer(BUYER, SELLER, NATIVE, eth(3)) == errors::OK);
        REQUIRE(vault.get_balance(BUYER, NATIVE) == eth(7));
        REQUIRE(vault.get_balance(SELLER, NATIVE) == eth(3));
        REQUIRE(vault.transfer(BUYER, SELLER, NATIVE, eth(8)) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(vault.transfer(BUYER, SELLER, TOKEN, eth(1)) == errors::INSUFFICIENT_BALANCE);
    }

    SECTION("Rejecting recipients") {
        vault.set_reject_deposits(SELLER, true);
        REQUIRE(vault.rejects_deposits(SELLER));
        REQUIRE(vault.transfer(BUYER, SELLER, NATIVE, eth(1)) == errors::TRANSFER_REJECTED);
        REQUIRE(vault.get_balance(BUYER, NATIVE) == eth(10));

        // Returning funds in the same operation ignores the block
        REQUIRE(vault.rollback(BUYER, SELLER, NATIVE, eth(1)) == errors::OK);
        REQUIRE(vault.get_balance(SELLER, NATIVE) == eth(1));
    }

    SECTION("Allowances") {
        REQUIRE(vault.deposit(BUYER, TOKEN, eth(5)) == errors::OK);
        REQUIRE(vault.approve(BUYER, SELLER, TOKEN, eth(2)) == errors::OK);
        REQUIRE(vault.allowance(BUYER, SELLER, TOKEN) == eth(2));

        REQUIRE(vault.transfer_from(SELLER, BUYER, SELLER, TOKEN, eth(3)) == errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(vault.transfer_from(SELLER, BUYER, SELLER, TOKEN, eth(2)) == errors::OK);
        REQUIRE(vault.allowance(BUYER, SELLER, TOKEN) == 0);
        REQUIRE(vault.get_balance(SELLER, TOKEN) == eth(2));
        REQUIRE(vault.approve(BUYER, SELLER, TOKEN, -1) == errors::INVALID_AMOUNT);
    }

    SECTION("Pull payment") {
        // Native is taken directly
        REQUIRE(vault.pull_payment(BUYER, SELLER, NATIVE, eth(1)) == errors::OK);
        REQUIRE(vault.get_balance(SELLER, NATIVE) == eth(1));

        // Tokens need an allowance to the escrow
        REQUIRE(vault.deposit(BUYER, TOKEN, eth(5)) == errors::OK);
        REQUIRE(vault.pull_payment(BUYER, SELLER, TOKEN, eth(1)) == errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(vault.approve(BUYER, SELLER, TOKEN, eth(1)) == errors::OK);
        REQUIRE(vault.pull_payment(BUYER, SELLER, TOKEN, eth(1)) == errors::OK);
        REQUIRE(vault.get_balance(SELLER, TOKEN) == eth(1));
    }
}

TEST_CASE("Fee split", "[payout]") {
    FeeSplit split = split_fee(eth(1), 250);
    REQUIRE(split.fee_x18 == eth(1, 40));            // 2.5%
    REQUIRE(split.proceeds_x18 == eth(39, 40));

    // Truncates toward the seller
    split = split_fee(3, 5000);
    REQUIRE(split.fee_x18 == 1);
    REQUIRE(split.proceeds_x18 == 2);

    split = split_fee(eth(1), 0);
    REQUIRE(split.fee_x18 == 0);
    REQUIRE(split.proceeds_x18 == eth(1));
}

TEST_CASE("Fee split at the amount ceiling", "[payout]") {
    FeeSplit split = split_fee(MAX_AMOUNT_X18, bps::MAX_FEE);
    REQUIRE(split.fee_x18 == MAX_AMOUNT_X18);
    REQUIRE(split.proceeds_x18 == 0);

    split = split_fee(MAX_AMOUNT_X18, 250);
    REQUIRE(split.fee_x18 == MAX_AMOUNT_X18 / 40);
    REQUIRE(split.fee_x18 + split.proceeds_x18 == MAX_AMOUNT_X18);

    // Totals beyond what total * bps could hold
    I128 total = static_cast<I128>(1) << 125;
    split = split_fee(total, 5000);
    REQUIRE(split.fee_x18 == total / 2);
    REQUIRE(split.proceeds_x18 == total / 2);
}

TEST_CASE("Payout ledger", "[payout]") {
    Ledgers l;
    RecordingListener listener;
    l.payouts.set_listener(&listener);

    const Address escrow = addresses::LISTING_BOOK;
    l.fund(escrow, NATIVE, eth(2));

    SECTION("Distribute credits seller and fee recipient") {
        FeeSplit split{0, 0};
        REQUIRE(l.payouts.distribute(escrow, NATIVE, eth(1), SELLER, FEE_RECIPIENT, 1000, &split) == errors::OK);
        REQUIRE(split.fee_x18 == eth(1, 10));
        REQUIRE(l.payouts.balance_of(SELLER, NATIVE) == eth(9, 10));
        REQUIRE(l.payouts.balance_of(FEE_RECIPIENT, NATIVE) == eth(1, 10));
        REQUIRE(l.payouts.total_fees_collected(NATIVE) == eth(1, 10));
        REQUIRE(l.vault.get_balance(escrow, NATIVE) == eth(1));
        REQUIRE(l.vault.get_balance(addresses::PAYOUTS, NATIVE) == eth(1));
    }

    SECTION("Distribute fails without effect when the source is short") {
        REQUIRE(l.payouts.distribute(escrow, NATIVE, eth(3), SELLER, FEE_RECIPIENT, 1000) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(l.payouts.balance_of(SELLER, NATIVE) == 0);
        REQUIRE(l.payouts.total_fees_collected(NATIVE) == 0);
    }

    SECTION("Withdraw pays the whole balance") {
        REQUIRE(l.payouts.credit_from(escrow, SELLER, NATIVE, eth(2)) == errors::OK);
        REQUIRE(l.payouts.withdraw(SELLER, NATIVE) == errors::OK);
        REQUIRE(l.vault.get_balance(SELLER, NATIVE) == eth(2));
        REQUIRE(l.payouts.balance_of(SELLER, NATIVE) == 0);
        REQUIRE(listener.events == std::vector<std::string>{"withdrawal"});

        REQUIRE(l.payouts.withdraw(SELLER, NATIVE) == errors::NOTHING_TO_WITHDRAW);
    }

    SECTION("Rejected withdrawal keeps the balance") {
        REQUIRE(l.payouts.credit_from(escrow, SELLER, NATIVE, eth(1)) == errors::OK);
        l.vault.set_reject_deposits(SELLER, true);

        REQUIRE(l.payouts.withdraw(SELLER, NATIVE) == errors::TRANSFER_REJECTED);
        REQUIRE(l.payouts.balance_of(SELLER, NATIVE) == eth(1));

        l.vault.set_reject_deposits(SELLER, false);
        REQUIRE(l.payouts.withdraw(SELLER, NATIVE) == errors::OK);
    }

    SECTION("Zero credit is rejected") {
        REQUIRE(l.payouts.credit_from(escrow, SELLER, NATIVE, 0) == errors::INVALID_AMOUNT);
    }
}

TEST_CASE("System state", "[system]") {
    SystemState system(ADMIN);
    RecordingListener listener;
    system.set_listener(&listener);

    REQUIRE(system.is_admin(ADMIN));
    REQUIRE_FALSE(system.is_paused());

    REQUIRE(system.pause(SELLER) == errors::UNAUTHORIZED);
    REQUIRE(system.unpause(ADMIN) == errors::NOT_PAUSED);
    REQUIRE(system.pause(ADMIN) == errors::OK);
    REQUIRE(system.is_paused());
    REQUIRE(system.pause(ADMIN) == errors::PAUSED);
    REQUIRE(system.unpause(ADMIN) == errors::OK);
    REQUIRE(listener.events == std::vector<std::string>{"paused", "unpaused"});

    REQUIRE(system.transfer_admin(SELLER, SELLER) == errors::UNAUTHORIZED);
    REQUIRE(system.transfer_admin(ADMIN, addresses::ZERO) == errors::INVALID_PARAMS);
    REQUIRE(system.transfer_admin(ADMIN, SELLER) == errors::OK);
    REQUIRE(system.admin() == SELLER);
    REQUIRE_FALSE(system.is_admin(ADMIN));
}

TEST_CASE("Address and amount helpers", "[types]") {
    REQUIRE(addresses::to_hex(addresses::from_u64(0xAB)) ==
            "0x00000000000000000000000000000000000000ab");
    REQUIRE(addresses::from_hex("0x00000000000000000000000000000000000000AB") ==
            addresses::from_u64(0xAB));
    REQUIRE_THROWS_AS(addresses::from_hex("0x1234"), std::invalid_argument);
    REQUIRE(NATIVE.is_native());
    REQUIRE_FALSE(Currency{}.is_native());

    REQUIRE(to_string(eth(1)) == "1000000000000000000");
    REQUIRE(to_string(-5) == "-5");
    REQUIRE(parse_amount("1500000000000000000") == eth(3, 2));
    REQUIRE_THROWS_AS(parse_amount("12a"), std::invalid_argument);

    REQUIRE(std::string(errors::name(errors::SOLD_OUT)) == "SOLD_OUT");
    REQUIRE(std::string(errors::name(errors::OK)) == "OK");
}
