#ifndef CARDEX_PAYOUT_HPP
#define CARDEX_PAYOUT_HPP

#include <map>
#include <mutex>
#include <shared_mutex>

#include "types.hpp"
#include "vault.hpp"

namespace cardex {

class MarketListener;

// =============================================================================
// Fee Split
// =============================================================================

struct FeeSplit {
    I128 fee_x18;        // Marketplace fee
    I128 proceeds_x18;   // Remainder for the seller
};

// fee = total * fee_bps / 10000 (truncating); proceeds = total - fee
FeeSplit split_fee(I128 total_x18, uint32_t fee_bps);

// =============================================================================
// PayoutLedger - Withdrawable balances (fees, seller proceeds, mint revenue)
// =============================================================================
//
// Funds credited here sit in the ledger's own vault account until the
// beneficiary withdraws them.

class PayoutLedger {
public:
    PayoutLedger(Vault& vault, const Address& self = addresses::PAYOUTS);
    ~PayoutLedger() = default;

    // Non-copyable
    PayoutLedger(const PayoutLedger&) = delete;
    PayoutLedger& operator=(const PayoutLedger&) = delete;

    const Address& address() const { return self_; }

    // Moves amount from `source` (an escrow account) into the ledger and
    // credits `beneficiary`
    int32_t credit_from(const Address& source, const Address& beneficiary,
                        const Currency& currency, I128 amount_x18);

    // Moves total from `source` and credits fee recipient and seller.
    // Fails without effect if the move fails.
    int32_t distribute(const Address& source, const Currency& currency, I128 total_x18,
                       const Address& seller, const Address& fee_recipient,
                       uint32_t fee_bps, FeeSplit* split = nullptr);

    // Pays out the caller's whole balance in `currency`
    int32_t withdraw(const Address& caller, const Currency& currency);

    I128 balance_of(const Address& account, const Currency& currency) const;
    I128 total_fees_collected(const Currency& currency) const;

    void set_listener(MarketListener* listener);

private:
    Vault& vault_;
    Address self_;

    std::map<Address, std::map<Currency, I128>> balances_;
    std::map<Currency, I128> fees_collected_;
    MarketListener* listener_{nullptr};
    mutable std::shared_mutex mutex_;
};

} // namespace cardex

#endif // CARDEX_PAYOUT_HPP
