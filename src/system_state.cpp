#include "cardex/system_state.hpp"
#include "cardex/events.hpp"

namespace cardex {

SystemState::SystemState(const Address& admin)
    : admin_(admin) {}

bool SystemState::is_admin(const Address& caller) const {
    std::shared_lock lock(mutex_);
    return caller == admin_;
}

Address SystemState::admin() const {
    std::shared_lock lock(mutex_);
    return admin_;
}

bool SystemState::is_paused() const {
    std::shared_lock lock(mutex_);
    return paused_;
}

int32_t SystemState::pause(const Address& caller) {
    std::unique_lock lock(mutex_);
    if (caller != admin_) return errors::UNAUTHORIZED;
    if (paused_) return errors::PAUSED;

    paused_ = true;
    if (listener_) listener_->on_paused(caller);
    return errors::OK;
}

int32_t SystemState::unpause(const Address& caller) {
    std::unique_lock lock(mutex_);
    if (caller != admin_) return errors::UNAUTHORIZED;
    if (!paused_) return errors::NOT_PAUSED;

    paused_ = false;
    if (listener_) listener_->on_unpaused(caller);
    return errors::OK;
}

int32_t SystemState::transfer_admin(const Address& caller, const Address& new_admin) {
    std::unique_lock lock(mutex_);
    if (caller != admin_) return errors::UNAUTHORIZED;
    if (addresses::is_zero(new_admin)) return errors::INVALID_PARAMS;

    admin_ = new_admin;
    return errors::OK;
}

void SystemState::set_listener(MarketListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

} // namespace cardex
