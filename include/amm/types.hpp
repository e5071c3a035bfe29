#ifndef AMM_TYPES_HPP
#define AMM_TYPES_HPP

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace amm {

// =============================================================================
// Addresses (EVM-style 20-byte identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Helper to create an address from a small numeric id (last 8 bytes, big endian)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Amounts (unsigned 256-bit, overflow is an error, never wraps)
// =============================================================================

using Amount = boost::multiprecision::checked_uint256_t;

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,
    NOT_CONFIGURED = -1,
    ALREADY_CONFIGURED = -2,
    INVALID_PARAMETERS = -3,
    EXPIRED = -4,
    INVALID_RESERVE = -5,
    INSUFFICIENT_LIQUIDITY = -6,
    SLIPPAGE_EXCEEDED = -7,
    INVALID_RECIPIENT = -8,
    INVALID_EXCHANGE = -9,
    ASSET_TRANSFER_FAILED = -10,
    ARITHMETIC_OVERFLOW = -11,
    REENTRANCY = -30
};

const char* error_name(ErrorCode code);

class ExchangeError : public std::runtime_error {
public:
    ExchangeError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// =============================================================================
// Caller context for operations that may carry native currency
// =============================================================================

struct Call {
    Address sender;
    Amount value;   // native currency attached to the call
};

} // namespace amm

#endif // AMM_TYPES_HPP
