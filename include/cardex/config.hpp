#ifndef CARDEX_CONFIG_HPP
#define CARDEX_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace cardex {

// =============================================================================
// Config - Engine settings, loaded from JSON or built in code
// =============================================================================
//
//   {
//     "admin": "0x...",
//     "fee_recipient": "0x...",            // optional, defaults to admin
//     "fees": {"listing_bps": 250, "auction_bps": 250, "dutch_bps": 250},
//     "salt_seed": "any string"
//   }

class Config {
public:
    Address admin{};
    std::optional<Address> fee_recipient;
    uint32_t listing_fee_bps = 250;
    uint32_t auction_fee_bps = 250;
    uint32_t dutch_fee_bps = 250;
    std::string salt_seed;

    Config() = default;

    // Throws std::runtime_error on unreadable or invalid input
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    std::string to_json() const;

    // Builder methods
    Config& with_admin(const Address& addr) {
        admin = addr;
        return *this;
    }

    Config& with_fee_recipient(const Address& addr) {
        fee_recipient = addr;
        return *this;
    }

    Config& with_fees(uint32_t listing_bps, uint32_t auction_bps, uint32_t dutch_bps) {
        listing_fee_bps = listing_bps;
        auction_fee_bps = auction_bps;
        dutch_fee_bps = dutch_bps;
        return *this;
    }

    Config& with_salt_seed(std::string_view seed) {
        salt_seed = std::string(seed);
        return *this;
    }

    Address effective_fee_recipient() const {
        return fee_recipient ? *fee_recipient : admin;
    }
};

} // namespace cardex

#endif // CARDEX_CONFIG_HPP
