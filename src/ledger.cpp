// =============================================================================
// ledger.cpp - In-memory token ownership ledger
// =============================================================================

#include "cardex/ledger.hpp"

namespace cardex {

std::optional<Address> TokenLedger::owner_of(uint64_t token_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second.owner;
}

bool TokenLedger::is_approved_for_all(const Address& owner, const Address& op) const {
    std::shared_lock lock(mutex_);
    auto it = operators_.find(owner);
    if (it == operators_.end()) return false;
    return it->second.count(op) > 0;
}

bool TokenLedger::is_approved_or_owner(const TokenState& token, const Address& op) const {
    if (token.owner == op) return true;
    if (token.approved && *token.approved == op) return true;

    auto it = operators_.find(token.owner);
    return it != operators_.end() && it->second.count(op) > 0;
}

int32_t TokenLedger::transfer(const Address& op, const Address& from,
                              const Address& to, uint64_t token_id) {
    if (addresses::is_zero(to)) {
        return errors::INVALID_PARAMS;
    }

    std::unique_lock lock(mutex_);

    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) {
        return errors::NOT_FOUND;
    }

    TokenState& token = it->second;
    if (token.owner != from || !is_approved_or_owner(token, op)) {
        return errors::NOT_APPROVED_OR_OWNER;
    }

    token.owner = to;
    token.approved.reset();  // Single-token approval does not survive a transfer
    return errors::OK;
}

uint64_t TokenLedger::mint(const Address& to, const std::string& uri) {
    std::unique_lock lock(mutex_);

    uint64_t token_id = next_token_id_++;
    tokens_[token_id] = TokenState{to, uri, std::nullopt};
    return token_id;
}

int32_t TokenLedger::burn(const Address& caller, uint64_t token_id) {
    std::unique_lock lock(mutex_);

    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) {
        return errors::NOT_FOUND;
    }
    if (!is_approved_or_owner(it->second, caller)) {
        return errors::NOT_APPROVED;
    }

    tokens_.erase(it);
    return errors::OK;
}

void TokenLedger::set_approval_for_all(const Address& owner, const Address& op, bool approved) {
    std::unique_lock lock(mutex_);
    if (approved) {
        operators_[owner].insert(op);
    } else {
        auto it = operators_.find(owner);
        if (it != operators_.end()) {
            it->second.erase(op);
        }
    }
}

int32_t TokenLedger::approve(const Address& caller, const Address& spender, uint64_t token_id) {
    std::unique_lock lock(mutex_);

    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) {
        return errors::NOT_FOUND;
    }

    // Owner or one of the owner's operators may set the spender
    TokenState& token = it->second;
    auto ops = operators_.find(token.owner);
    bool is_operator = ops != operators_.end() && ops->second.count(caller) > 0;
    if (token.owner != caller && !is_operator) {
        return errors::NOT_APPROVED_OR_OWNER;
    }

    if (addresses::is_zero(spender)) {
        token.approved.reset();
    } else {
        token.approved = spender;
    }
    return errors::OK;
}

std::optional<Address> TokenLedger::get_approved(uint64_t token_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second.approved;
}

std::optional<std::string> TokenLedger::token_uri(uint64_t token_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second.uri;
}

std::optional<uint64_t> TokenLedger::last_minted_token_id() const {
    std::shared_lock lock(mutex_);
    if (next_token_id_ == 0) return std::nullopt;
    return next_token_id_ - 1;
}

uint64_t TokenLedger::total_minted() const {
    std::shared_lock lock(mutex_);
    return next_token_id_;
}

uint64_t TokenLedger::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    uint64_t count = 0;
    for (const auto& [id, token] : tokens_) {
        if (token.owner == owner) ++count;
    }
    return count;
}

} // namespace cardex
