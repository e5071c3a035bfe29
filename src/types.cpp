// =============================================================================
// types.cpp - Address formatting and error names
// =============================================================================

#include "amm/types.hpp"

namespace amm {

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                     return "OK";
        case ErrorCode::NOT_CONFIGURED:         return "NotConfigured";
        case ErrorCode::ALREADY_CONFIGURED:     return "AlreadyConfigured";
        case ErrorCode::INVALID_PARAMETERS:     return "InvalidParameters";
        case ErrorCode::EXPIRED:                return "Expired";
        case ErrorCode::INVALID_RESERVE:        return "InvalidReserve";
        case ErrorCode::INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case ErrorCode::SLIPPAGE_EXCEEDED:      return "SlippageExceeded";
        case ErrorCode::INVALID_RECIPIENT:      return "InvalidRecipient";
        case ErrorCode::INVALID_EXCHANGE:       return "InvalidExchange";
        case ErrorCode::ASSET_TRANSFER_FAILED:  return "AssetTransferFailed";
        case ErrorCode::ARITHMETIC_OVERFLOW:    return "ArithmeticOverflow";
        case ErrorCode::REENTRANCY:             return "Reentrancy";
    }
    return "Unknown";
}

} // namespace amm
