#ifndef CARDEX_SYSTEM_STATE_HPP
#define CARDEX_SYSTEM_STATE_HPP

#include <mutex>
#include <shared_mutex>

#include "types.hpp"

namespace cardex {

class MarketListener;

// =============================================================================
// SystemState - Admin and global pause flag shared by every engine
// =============================================================================

class SystemState {
public:
    explicit SystemState(const Address& admin);

    // Non-copyable
    SystemState(const SystemState&) = delete;
    SystemState& operator=(const SystemState&) = delete;

    bool is_admin(const Address& caller) const;
    Address admin() const;
    bool is_paused() const;

    int32_t pause(const Address& caller);
    int32_t unpause(const Address& caller);
    int32_t transfer_admin(const Address& caller, const Address& new_admin);

    void set_listener(MarketListener* listener);

private:
    Address admin_;
    bool paused_{false};
    MarketListener* listener_{nullptr};
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// Fee Schedule (per sale component)
// =============================================================================

struct FeeSchedule {
    uint32_t fee_bps;        // Marketplace fee in basis points
    Address fee_recipient;   // Platform fee recipient
};

} // namespace cardex

#endif // CARDEX_SYSTEM_STATE_HPP
