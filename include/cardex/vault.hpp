#ifndef CARDEX_VAULT_HPP
#define CARDEX_VAULT_HPP

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>

#include "types.hpp"

namespace cardex {

// =============================================================================
// Account State
// =============================================================================

struct VaultAccount {
    std::map<Currency, I128> balances;                     // currency -> balance_x18
    std::map<std::pair<Address, Currency>, I128> allowances;  // (spender, currency) -> allowance_x18
};

// =============================================================================
// Vault - Custody of fungible balances (native token and token currencies)
// =============================================================================
//
// Engine components hold escrowed funds in their own vault account and pull
// buyer funds either directly (native payments, the caller attaches value) or
// through an allowance (token currencies).

class Vault {
public:
    Vault();
    ~Vault() = default;

    // Non-copyable
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // =========================================================================
    // Deposit/Withdraw (Custody)
    // =========================================================================

    int32_t deposit(const Address& account, const Currency& currency, I128 amount_x18);
    int32_t withdraw(const Address& account, const Currency& currency, I128 amount_x18);

    // Push transfer; fails with TRANSFER_REJECTED when `to` refuses deposits
    int32_t transfer(const Address& from, const Address& to,
                     const Currency& currency, I128 amount_x18);

    // Moves a payment into `escrow`. Native funds are taken directly (the
    // value attached to the call), token funds through the payer's allowance
    // to `escrow`.
    int32_t pull_payment(const Address& payer, const Address& escrow,
                         const Currency& currency, I128 amount_x18);

    // Returns funds moved from `to` earlier in the same operation. Receive
    // blocking does not apply.
    int32_t rollback(const Address& from, const Address& to,
                     const Currency& currency, I128 amount_x18);

    I128 get_balance(const Address& account, const Currency& currency) const;

    // =========================================================================
    // Allowances (token currencies)
    // =========================================================================

    int32_t approve(const Address& owner, const Address& spender,
                    const Currency& currency, I128 amount_x18);
    I128 allowance(const Address& owner, const Address& spender,
                   const Currency& currency) const;

    // Spender moves funds out of `from`, consuming allowance
    int32_t transfer_from(const Address& spender, const Address& from, const Address& to,
                          const Currency& currency, I128 amount_x18);

    // =========================================================================
    // Receive Blocking
    // =========================================================================

    // Accounts that reject incoming pushes (e.g. a contract without a
    // receive hook). Pull-based withdrawals are the only way to pay them.
    void set_reject_deposits(const Address& account, bool reject);
    bool rejects_deposits(const Address& account) const;

private:
    std::map<Address, VaultAccount> accounts_;
    std::set<Address> rejecting_;
    mutable std::shared_mutex accounts_mutex_;

    VaultAccount& get_or_create_account(const Address& account);
    const VaultAccount* get_account(const Address& account) const;

    int32_t move_locked(const Address& from, const Address& to,
                        const Currency& currency, I128 amount_x18,
                        bool honor_rejection = true);
};

} // namespace cardex

#endif // CARDEX_VAULT_HPP
