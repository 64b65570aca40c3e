#ifndef CARDEX_LEDGER_HPP
#define CARDEX_LEDGER_HPP

#include <map>
#include <set>
#include <optional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace cardex {

// =============================================================================
// AssetLedger - Ownership ledger the engine settles against
// =============================================================================
//
// Authoritative map from token id to owner. The engine never writes it
// directly; it only goes through transfer/mint/burn.

class AssetLedger {
public:
    virtual ~AssetLedger() = default;

    virtual std::optional<Address> owner_of(uint64_t token_id) const = 0;
    virtual bool is_approved_for_all(const Address& owner, const Address& op) const = 0;

    // Moves token_id from `from` to `to`. `op` must be the owner, an operator
    // of the owner or the token's approved spender.
    virtual int32_t transfer(const Address& op, const Address& from,
                             const Address& to, uint64_t token_id) = 0;

    // Mints a token bound to `uri`, returns its id
    virtual uint64_t mint(const Address& to, const std::string& uri) = 0;

    virtual int32_t burn(const Address& caller, uint64_t token_id) = 0;
};

// =============================================================================
// TokenLedger - In-memory non-fungible token ledger
// =============================================================================

class TokenLedger : public AssetLedger {
public:
    TokenLedger() = default;
    ~TokenLedger() override = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // AssetLedger
    std::optional<Address> owner_of(uint64_t token_id) const override;
    bool is_approved_for_all(const Address& owner, const Address& op) const override;
    int32_t transfer(const Address& op, const Address& from,
                     const Address& to, uint64_t token_id) override;
    uint64_t mint(const Address& to, const std::string& uri) override;
    int32_t burn(const Address& caller, uint64_t token_id) override;

    // Approvals
    void set_approval_for_all(const Address& owner, const Address& op, bool approved);
    int32_t approve(const Address& caller, const Address& spender, uint64_t token_id);
    std::optional<Address> get_approved(uint64_t token_id) const;

    // Metadata
    std::optional<std::string> token_uri(uint64_t token_id) const;
    std::optional<uint64_t> last_minted_token_id() const;
    uint64_t total_minted() const;
    uint64_t balance_of(const Address& owner) const;

private:
    struct TokenState {
        Address owner;
        std::string uri;
        std::optional<Address> approved;
    };

    std::unordered_map<uint64_t, TokenState> tokens_;
    std::map<Address, std::set<Address>> operators_;  // owner -> operators
    uint64_t next_token_id_{0};
    mutable std::shared_mutex mutex_;

    bool is_approved_or_owner(const TokenState& token, const Address& op) const;
};

} // namespace cardex

#endif // CARDEX_LEDGER_HPP
