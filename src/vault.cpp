// =============================================================================
// vault.cpp - Fund Custody Implementation
// =============================================================================

#include "cardex/vault.hpp"

namespace cardex {

// =============================================================================
// Constructor
// =============================================================================

Vault::Vault() = default;

// =============================================================================
// Deposit/Withdraw
// =============================================================================

int32_t Vault::deposit(const Address& account, const Currency& currency, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }
    if (currency.is_zero()) {
        return errors::INVALID_CURRENCY;
    }

    std::unique_lock lock(accounts_mutex_);
    VaultAccount& state = get_or_create_account(account);
    I128& balance = state.balances[currency];
    if (amount_x18 > MAX_AMOUNT_X18 - balance) {
        return errors::INVALID_AMOUNT;
    }
    balance += amount_x18;

    return errors::OK;
}

int32_t Vault::withdraw(const Address& account, const Currency& currency, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(accounts_mutex_);

    VaultAccount& state = get_or_create_account(account);
    auto it = state.balances.find(currency);
    if (it == state.balances.end() || it->second < amount_x18) {
        return errors::INSUFFICIENT_BALANCE;
    }

    it->second -= amount_x18;
    return errors::OK;
}

int32_t Vault::transfer(const Address& from, const Address& to,
                        const Currency& currency, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(accounts_mutex_);
    return move_locked(from, to, currency, amount_x18);
}

int32_t Vault::pull_payment(const Address& payer, const Address& escrow,
                            const Currency& currency, I128 amount_x18) {
    if (currency.is_native()) {
        return transfer(payer, escrow, currency, amount_x18);
    }
    return transfer_from(escrow, payer, escrow, currency, amount_x18);
}

int32_t Vault::rollback(const Address& from, const Address& to,
                        const Currency& currency, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(accounts_mutex_);
    return move_locked(from, to, currency, amount_x18, false);
}

I128 Vault::get_balance(const Address& account, const Currency& currency) const {
    std::shared_lock lock(accounts_mutex_);
    const VaultAccount* state = get_account(account);
    if (!state) return 0;

    auto it = state->balances.find(currency);
    return (it != state->balances.end()) ? it->second : 0;
}

// =============================================================================
// Allowances
// =============================================================================

int32_t Vault::approve(const Address& owner, const Address& spender,
                       const Currency& currency, I128 amount_x18) {
    if (amount_x18 < 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(accounts_mutex_);
    VaultAccount& state = get_or_create_account(owner);
    state.allowances[{spender, currency}] = amount_x18;
    return errors::OK;
}

I128 Vault::allowance(const Address& owner, const Address& spender,
                      const Currency& currency) const {
    std::shared_lock lock(accounts_mutex_);
    const VaultAccount* state = get_account(owner);
    if (!state) return 0;

    auto it = state->allowances.find({spender, currency});
    return (it != state->allowances.end()) ? it->second : 0;
}

int32_t Vault::transfer_from(const Address& spender, const Address& from, const Address& to,
                             const Currency& currency, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }

    // Hold the lock across the allowance check and the move
    std::unique_lock lock(accounts_mutex_);

    VaultAccount& owner = get_or_create_account(from);
    auto allowance_it = owner.allowances.find({spender, currency});
    if (allowance_it == owner.allowances.end() || allowance_it->second < amount_x18) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }

    int32_t result = move_locked(from, to, currency, amount_x18);
    if (result != errors::OK) {
        return result;
    }

    // std::map inserts in move_locked keep allowance_it valid
    allowance_it->second -= amount_x18;
    return errors::OK;
}

// =============================================================================
// Receive Blocking
// =============================================================================

void Vault::set_reject_deposits(const Address& account, bool reject) {
    std::unique_lock lock(accounts_mutex_);
    if (reject) {
        rejecting_.insert(account);
    } else {
        rejecting_.erase(account);
    }
}

bool Vault::rejects_deposits(const Address& account) const {
    std::shared_lock lock(accounts_mutex_);
    return rejecting_.count(account) > 0;
}

// =============================================================================
// Internal Helpers
// =============================================================================

VaultAccount& Vault::get_or_create_account(const Address& account) {
    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        it = accounts_.emplace(account, VaultAccount{}).first;
    }
    return it->second;
}

const VaultAccount* Vault::get_account(const Address& account) const {
    auto it = accounts_.find(account);
    return (it != accounts_.end()) ? &it->second : nullptr;
}

int32_t Vault::move_locked(const Address& from, const Address& to,
                           const Currency& currency, I128 amount_x18,
                           bool honor_rejection) {
    if (honor_rejection && rejecting_.count(to) > 0) {
        return errors::TRANSFER_REJECTED;
    }

    VaultAccount& from_state = get_or_create_account(from);
    auto it = from_state.balances.find(currency);
    if (it == from_state.balances.end() || it->second < amount_x18) {
        return errors::INSUFFICIENT_BALANCE;
    }

    VaultAccount& to_state = get_or_create_account(to);
    I128& to_balance = to_state.balances[currency];
    if (from != to && amount_x18 > MAX_AMOUNT_X18 - to_balance) {
        return errors::INVALID_AMOUNT;
    }

    it->second -= amount_x18;
    to_balance += amount_x18;
    return errors::OK;
}

} // namespace cardex
