#ifndef CPAMM_TYPES_HPP
#define CPAMM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace cpamm {

// =============================================================================
// Identities (opaque 32-byte account hashes, zero = null)
// =============================================================================

using Address = std::array<uint8_t, 32>;

namespace address {

constexpr Address NONE = {};

constexpr bool is_null(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Build a test/well-known identity from a small integer (stored big-endian in
// the last 8 bytes)
constexpr Address from_u64(uint64_t v) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[31 - i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    return addr;
}

// 64 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts 64 hex digits, optionally prefixed by "0x"; throws PoolError(InvalidPayload)
Address from_hex(std::string_view text);

} // namespace address

// =============================================================================
// Coin Amounts (unsigned 128-bit, bounded by MAX_COINS = 2^120 - 1)
// =============================================================================

using U128 = unsigned __int128;
using Coins = U128;

constexpr Coins MAX_COINS = (U128(1) << 120) - 1;

namespace coins {

std::string to_string(Coins value);

// Decimal digits only; throws PoolError(InvalidPayload) on bad text and
// PoolError(MathError) above MAX_COINS
Coins parse(std::string_view text);

} // namespace coins

// =============================================================================
// Fee Constants (basis points)
// =============================================================================

namespace fees {
constexpr uint32_t FEE_DIVIDER = 10000;
constexpr uint32_t MAX_FEE_RATE = 200;                 // 2%
constexpr Coins REQUIRED_MIN_COLLECT_FEES = 1000000;
constexpr uint32_t COLLECTOR_REWARD_DIVIDER = 1000;   // 0.1%
}

// =============================================================================
// Token Sides
// =============================================================================

enum class Side : uint8_t {
    TOKEN0 = 0,
    TOKEN1 = 1
};

constexpr Side other(Side s) {
    return s == Side::TOKEN0 ? Side::TOKEN1 : Side::TOKEN0;
}

inline constexpr const char* to_string(Side s) {
    return s == Side::TOKEN0 ? "token0" : "token1";
}

// =============================================================================
// Outbound Instructions (executed by the dispatch layer after commit)
// =============================================================================

enum class InstructionKind : uint8_t {
    TRANSFER = 0,    // Swap output / withdrawn liquidity
    MINT_LP = 1,     // LP shares to mint for a provider
    REFUND = 2,      // Unused deposit returned
    FEE_PAYOUT = 3,  // Collected or referral fee
    EXCESS = 4       // Unused gas-equivalent returned
};

enum class PayoutRole : uint8_t {
    NONE = 0,
    PROVIDER = 1,
    PROTOCOL = 2,
    COLLECTOR = 3,
    REFERRAL = 4
};

struct Instruction {
    InstructionKind kind;
    Side side;            // Token side (ignored for MINT_LP and EXCESS)
    Address recipient;
    Coins amount;
    PayoutRole role;

    bool operator==(const Instruction& other) const {
        return kind == other.kind && side == other.side &&
               recipient == other.recipient && amount == other.amount &&
               role == other.role;
    }
};

using Instructions = std::vector<Instruction>;

namespace instr {

inline Instruction transfer(Side side, const Address& to, Coins amount) {
    return {InstructionKind::TRANSFER, side, to, amount, PayoutRole::NONE};
}

inline Instruction mint_lp(const Address& to, Coins amount) {
    return {InstructionKind::MINT_LP, Side::TOKEN0, to, amount, PayoutRole::NONE};
}

inline Instruction refund(Side side, const Address& to, Coins amount) {
    return {InstructionKind::REFUND, side, to, amount, PayoutRole::NONE};
}

inline Instruction payout(Side side, const Address& to, Coins amount, PayoutRole role) {
    return {InstructionKind::FEE_PAYOUT, side, to, amount, role};
}

inline Instruction excess(const Address& to, Coins amount) {
    return {InstructionKind::EXCESS, Side::TOKEN0, to, amount, PayoutRole::NONE};
}

} // namespace instr

const char* to_string(InstructionKind kind);
const char* to_string(PayoutRole role);

} // namespace cpamm

#endif // CPAMM_TYPES_HPP
