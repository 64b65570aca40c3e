#ifndef CARDEX_TYPES_HPP
#define CARDEX_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <vector>

namespace cardex {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Engine component accounts. Each component escrows assets and funds
// under its own address.
constexpr Address CARD_SETS     = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xCA,0x01};
constexpr Address LISTING_BOOK  = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xCA,0x02};
constexpr Address AUCTION_HOUSE = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xCA,0x03};
constexpr Address DUTCH_HOUSE   = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xCA,0x04};
constexpr Address PAYOUTS       = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xCA,0x05};

// Build an address whose low 8 bytes hold `n` (big-endian)
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// 0x-prefixed lowercase hex
std::string to_hex(const Address& addr);

// Parses 40 hex digits with optional 0x prefix. Throws std::invalid_argument.
Address from_hex(const std::string& hex);

} // namespace addresses

// =============================================================================
// Amounts (X18 = 18 decimal places, smallest currency unit)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18

namespace x18 {

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

// Fraction num/den of one unit, e.g. from_ratio(3, 4) == 0.75e18
inline I128 from_ratio(int64_t num, int64_t den) {
    return static_cast<I128>(num) * X18_ONE / den;
}

inline I128 mul(I128 a, I128 b) {
    return (a * b) / X18_ONE;
}

// a * b / X18_ONE without overflowing when a is large and 0 <= b <= X18_ONE
inline I128 mul_frac(I128 a, I128 b) {
    return (a / X18_ONE) * b + ((a % X18_ONE) * b) / X18_ONE;
}

} // namespace x18

// Decimal rendering of a 128-bit amount
std::string to_string(I128 v);

// Parses an optionally signed decimal integer. Throws std::invalid_argument.
I128 parse_amount(const std::string& s);

// =============================================================================
// Basis Points
// =============================================================================

namespace bps {
constexpr uint32_t DENOMINATOR = 10000;  // 100%
constexpr uint32_t MAX_FEE = 10000;
}

constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);

// Largest amount, price or balance the engine accepts. amount * DENOMINATOR
// stays representable.
constexpr I128 MAX_AMOUNT_X18 = I128_MAX / bps::DENOMINATOR;

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_zero() const { return addresses::is_zero(addr); }
    bool is_native() const;

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// Native token sentinel 0xEeeeeEeeeEeEeeEeEeEeeEEEeeeeEeeeeeeeEEeE.
// The zero address is never a valid currency.
constexpr Address NATIVE_TOKEN_ADDRESS = {
    0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,
    0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,0xEE,0xEE
};
inline const Currency NATIVE{NATIVE_TOKEN_ADDRESS};

inline bool Currency::is_native() const { return addr == NATIVE_TOKEN_ADDRESS; }

// =============================================================================
// Create Result (operations that allocate a sequential id)
// =============================================================================

struct CreateResult {
    int32_t error_code;
    uint64_t id;
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t INVALID_PROBABILITIES = -1;
constexpr int32_t LENGTH_MISMATCH = -2;
constexpr int32_t INVALID_PRICE = -3;
constexpr int32_t INVALID_WINDOW = -4;
constexpr int32_t INVALID_PARAMS = -5;
constexpr int32_t INVALID_CURRENCY = -6;
constexpr int32_t INVALID_QUANTITY = -7;
constexpr int32_t INVALID_FEE = -8;
constexpr int32_t INVALID_RANGE = -9;
constexpr int32_t INVALID_AMOUNT = -10;

// State
constexpr int32_t NOT_FOUND = -20;
constexpr int32_t SOLD_OUT = -21;
constexpr int32_t NOT_ACTIVE = -22;
constexpr int32_t EXPIRED = -23;
constexpr int32_t NOT_STARTED = -24;
constexpr int32_t NOT_ENDED = -25;
constexpr int32_t ALREADY_COLLECTED = -26;
constexpr int32_t NOT_RESERVED = -27;
constexpr int32_t PAUSED = -28;
constexpr int32_t HAS_BIDS = -29;
constexpr int32_t NO_WINNER = -30;
constexpr int32_t NOT_PAUSED = -31;

// Authorization
constexpr int32_t UNAUTHORIZED = -40;
constexpr int32_t NOT_OWNER = -41;
constexpr int32_t NOT_APPROVED = -42;
constexpr int32_t NOT_CREATOR = -43;
constexpr int32_t NOT_APPROVED_BUYER = -44;
constexpr int32_t NOT_WINNER = -45;
constexpr int32_t NOT_APPROVED_OR_OWNER = -46;

// Payment
constexpr int32_t WRONG_PAYMENT = -60;
constexpr int32_t PRICE_MISMATCH = -61;
constexpr int32_t PAYMENT_MISMATCH = -62;
constexpr int32_t INSUFFICIENT_PAYMENT = -63;
constexpr int32_t INSUFFICIENT_BALANCE = -64;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -65;
constexpr int32_t CURRENCY_NOT_ACCEPTED = -66;
constexpr int32_t BID_TOO_LOW = -67;
constexpr int32_t NOTHING_TO_WITHDRAW = -68;
constexpr int32_t TRANSFER_REJECTED = -69;

// Stable identifier for logs, e.g. "SOLD_OUT"
const char* name(int32_t code);
}

} // namespace cardex

#endif // CARDEX_TYPES_HPP
