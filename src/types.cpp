// =============================================================================
// types.cpp - Address, amount and error code helpers
// =============================================================================

#include "cardex/types.hpp"
#include <algorithm>
#include <stdexcept>

namespace cardex {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address from_hex(const std::string& hex) {
    size_t offset = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        offset = 2;
    }
    if (hex.size() - offset != 40) {
        throw std::invalid_argument("address must have 40 hex digits: " + hex);
    }

    Address addr{};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(hex[offset + 2 * i]);
        int lo = hex_value(hex[offset + 2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + hex);
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

std::string to_string(I128 v) {
    if (v == 0) return "0";

    bool negative = v < 0;
    U128 u = negative ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);

    std::string out;
    while (u > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

I128 parse_amount(const std::string& s) {
    if (s.empty()) {
        throw std::invalid_argument("empty amount");
    }

    size_t i = 0;
    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        i = 1;
    }
    if (i == s.size()) {
        throw std::invalid_argument("invalid amount: " + s);
    }

    I128 value = 0;
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') {
            throw std::invalid_argument("invalid amount: " + s);
        }
        value = value * 10 + (s[i] - '0');
    }
    return negative ? -value : value;
}

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_PROBABILITIES: return "INVALID_PROBABILITIES";
        case LENGTH_MISMATCH: return "LENGTH_MISMATCH";
        case INVALID_PRICE: return "INVALID_PRICE";
        case INVALID_WINDOW: return "INVALID_WINDOW";
        case INVALID_PARAMS: return "INVALID_PARAMS";
        case INVALID_CURRENCY: return "INVALID_CURRENCY";
        case INVALID_QUANTITY: return "INVALID_QUANTITY";
        case INVALID_FEE: return "INVALID_FEE";
        case INVALID_RANGE: return "INVALID_RANGE";
        case INVALID_AMOUNT: return "INVALID_AMOUNT";
        case NOT_FOUND: return "NOT_FOUND";
        case SOLD_OUT: return "SOLD_OUT";
        case NOT_ACTIVE: return "NOT_ACTIVE";
        case EXPIRED: return "EXPIRED";
        case NOT_STARTED: return "NOT_STARTED";
        case NOT_ENDED: return "NOT_ENDED";
        case ALREADY_COLLECTED: return "ALREADY_COLLECTED";
        case NOT_RESERVED: return "NOT_RESERVED";
        case PAUSED: return "PAUSED";
        case HAS_BIDS: return "HAS_BIDS";
        case NO_WINNER: return "NO_WINNER";
        case NOT_PAUSED: return "NOT_PAUSED";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        case NOT_OWNER: return "NOT_OWNER";
        case NOT_APPROVED: return "NOT_APPROVED";
        case NOT_CREATOR: return "NOT_CREATOR";
        case NOT_APPROVED_BUYER: return "NOT_APPROVED_BUYER";
        case NOT_WINNER: return "NOT_WINNER";
        case NOT_APPROVED_OR_OWNER: return "NOT_APPROVED_OR_OWNER";
        case WRONG_PAYMENT: return "WRONG_PAYMENT";
        case PRICE_MISMATCH: return "PRICE_MISMATCH";
        case PAYMENT_MISMATCH: return "PAYMENT_MISMATCH";
        case INSUFFICIENT_PAYMENT: return "INSUFFICIENT_PAYMENT";
        case INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case INSUFFICIENT_ALLOWANCE: return "INSUFFICIENT_ALLOWANCE";
        case CURRENCY_NOT_ACCEPTED: return "CURRENCY_NOT_ACCEPTED";
        case BID_TOO_LOW: return "BID_TOO_LOW";
        case NOTHING_TO_WITHDRAW: return "NOTHING_TO_WITHDRAW";
        case TRANSFER_REJECTED: return "TRANSFER_REJECTED";
        default: return "UNKNOWN";
    }
}

} // namespace errors

} // namespace cardex
