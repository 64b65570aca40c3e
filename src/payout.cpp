// =============================================================================
// payout.cpp - Fee/Payout Ledger
// =============================================================================

#include "cardex/payout.hpp"
#include "cardex/events.hpp"

namespace cardex {

FeeSplit split_fee(I128 total_x18, uint32_t fee_bps) {
    FeeSplit split;
    // floor(total * bps / 10000), split so no intermediate exceeds total
    I128 whole = total_x18 / bps::DENOMINATOR;
    I128 rest = total_x18 % bps::DENOMINATOR;
    split.fee_x18 = whole * fee_bps + rest * fee_bps / bps::DENOMINATOR;
    split.proceeds_x18 = total_x18 - split.fee_x18;
    return split;
}

PayoutLedger::PayoutLedger(Vault& vault, const Address& self)
    : vault_(vault), self_(self) {}

int32_t PayoutLedger::credit_from(const Address& source, const Address& beneficiary,
                                  const Currency& currency, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);

    int32_t result = vault_.transfer(source, self_, currency, amount_x18);
    if (result != errors::OK) {
        return result;
    }

    balances_[beneficiary][currency] += amount_x18;
    return errors::OK;
}

int32_t PayoutLedger::distribute(const Address& source, const Currency& currency, I128 total_x18,
                                 const Address& seller, const Address& fee_recipient,
                                 uint32_t fee_bps, FeeSplit* split) {
    if (total_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }

    FeeSplit parts = split_fee(total_x18, fee_bps);

    std::unique_lock lock(mutex_);

    int32_t result = vault_.transfer(source, self_, currency, total_x18);
    if (result != errors::OK) {
        return result;
    }

    if (parts.fee_x18 > 0) {
        balances_[fee_recipient][currency] += parts.fee_x18;
        fees_collected_[currency] += parts.fee_x18;
    }
    if (parts.proceeds_x18 > 0) {
        balances_[seller][currency] += parts.proceeds_x18;
    }

    if (split) *split = parts;
    return errors::OK;
}

int32_t PayoutLedger::withdraw(const Address& caller, const Currency& currency) {
    std::unique_lock lock(mutex_);

    auto account_it = balances_.find(caller);
    if (account_it == balances_.end()) {
        return errors::NOTHING_TO_WITHDRAW;
    }
    auto it = account_it->second.find(currency);
    if (it == account_it->second.end() || it->second <= 0) {
        return errors::NOTHING_TO_WITHDRAW;
    }

    I128 amount = it->second;
    int32_t result = vault_.transfer(self_, caller, currency, amount);
    if (result != errors::OK) {
        return result;  // Balance stays credited
    }

    account_it->second.erase(it);

    if (listener_) {
        WithdrawalEvent event{caller, currency, amount};
        listener_->on_withdrawal(event);
    }
    return errors::OK;
}

I128 PayoutLedger::balance_of(const Address& account, const Currency& currency) const {
    std::shared_lock lock(mutex_);
    auto account_it = balances_.find(account);
    if (account_it == balances_.end()) return 0;
    auto it = account_it->second.find(currency);
    return (it != account_it->second.end()) ? it->second : 0;
}

I128 PayoutLedger::total_fees_collected(const Currency& currency) const {
    std::shared_lock lock(mutex_);
    auto it = fees_collected_.find(currency);
    return (it != fees_collected_.end()) ? it->second : 0;
}

void PayoutLedger::set_listener(MarketListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

} // namespace cardex
