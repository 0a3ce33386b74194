// =============================================================================
// types.cpp - Identity/amount text forms and enum names
// =============================================================================

#include "cpamm/types.hpp"
#include "cpamm/errors.hpp"

#include <algorithm>

namespace cpamm {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Address
// =============================================================================

namespace address {

std::string to_hex(const Address& addr) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

Address from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    Address addr{};
    if (text.size() != addr.size() * 2) {
        throw PoolError(ErrorCode::INVALID_PAYLOAD,
                        "address must be 64 hex digits, got " + std::to_string(text.size()));
    }
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw PoolError(ErrorCode::INVALID_PAYLOAD,
                            "invalid hex digit in address: " + std::string(text));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace address

// =============================================================================
// Coins
// =============================================================================

namespace coins {

std::string to_string(Coins value) {
    if (value == 0) return "0";
    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

Coins parse(std::string_view text) {
    if (text.empty()) {
        throw PoolError(ErrorCode::INVALID_PAYLOAD, "empty amount");
    }
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw PoolError(ErrorCode::INVALID_PAYLOAD,
                            "invalid amount: " + std::string(text));
        }
        value = value * 10 + static_cast<U128>(c - '0');
        if (value > MAX_COINS) {
            throw PoolError(ErrorCode::MATH_ERROR,
                            "amount exceeds MAX_COINS: " + std::string(text));
        }
    }
    return value;
}

} // namespace coins

// =============================================================================
// Enum Names
// =============================================================================

const char* to_string(InstructionKind kind) {
    switch (kind) {
        case InstructionKind::TRANSFER: return "transfer";
        case InstructionKind::MINT_LP: return "mint_lp";
        case InstructionKind::REFUND: return "refund";
        case InstructionKind::FEE_PAYOUT: return "fee_payout";
        case InstructionKind::EXCESS: return "excess";
    }
    return "unknown";
}

const char* to_string(PayoutRole role) {
    switch (role) {
        case PayoutRole::NONE: return "none";
        case PayoutRole::PROVIDER: return "provider";
        case PayoutRole::PROTOCOL: return "protocol";
        case PayoutRole::COLLECTOR: return "collector";
        case PayoutRole::REFERRAL: return "referral";
    }
    return "unknown";
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NO_LIQUIDITY: return "NoLiquidity";
        case ErrorCode::ZERO_OUTPUT: return "ZeroOutput";
        case ErrorCode::INVALID_CALLER: return "InvalidCaller";
        case ErrorCode::INSUFFICIENT_GAS: return "InsufficientGas";
        case ErrorCode::FEE_OUT_OF_RANGE: return "FeeOutOfRange";
        case ErrorCode::INVALID_TOKEN: return "InvalidToken";
        case ErrorCode::LOW_AMOUNT: return "LowAmount";
        case ErrorCode::LOW_LIQUIDITY: return "LowLiquidity";
        case ErrorCode::WRONG_K: return "WrongK";
        case ErrorCode::MATH_ERROR: return "MathError";
        case ErrorCode::INVALID_RECIPIENT: return "InvalidRecipient";
        case ErrorCode::POOL_LOCKED: return "PoolLocked";
        case ErrorCode::UNKNOWN_OP: return "UnknownOp";
        case ErrorCode::INVALID_PAYLOAD: return "InvalidPayload";
    }
    return "Unknown";
}

} // namespace cpamm
