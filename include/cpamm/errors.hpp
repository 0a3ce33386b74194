#ifndef CPAMM_ERRORS_HPP
#define CPAMM_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cpamm {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,
    NO_LIQUIDITY = -1,
    ZERO_OUTPUT = -2,
    INVALID_CALLER = -3,
    INSUFFICIENT_GAS = -4,
    FEE_OUT_OF_RANGE = -5,
    INVALID_TOKEN = -6,
    LOW_AMOUNT = -7,
    LOW_LIQUIDITY = -8,
    WRONG_K = -9,
    MATH_ERROR = -10,
    INVALID_RECIPIENT = -11,
    POOL_LOCKED = -20,
    UNKNOWN_OP = -30,
    INVALID_PAYLOAD = -31
};

// Stable kind name, e.g. "NoLiquidity"
const char* to_string(ErrorCode code);

// Rejection of a whole operation; nothing was mutated when this is thrown
class PoolError : public std::runtime_error {
public:
    PoolError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    explicit PoolError(ErrorCode code)
        : std::runtime_error(to_string(code)), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace cpamm

#endif // CPAMM_ERRORS_HPP
