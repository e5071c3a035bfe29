#ifndef AMM_PRICING_HPP
#define AMM_PRICING_HPP

#include <cstdint>

#include "types.hpp"

namespace amm {

// =============================================================================
// Reserve Pricing (constant product x * y = k with a 0.3% input fee)
//
// Outputs round down and required inputs round up, so k never decreases
// from rounding. All arithmetic is checked 256-bit; overflow, underflow and
// division by zero raise ARITHMETIC_OVERFLOW.
// =============================================================================

namespace pricing {

constexpr uint32_t FEE_NUMERATOR = 997;
constexpr uint32_t FEE_DENOMINATOR = 1000;

// Amount received for selling exactly input_amount.
// Throws INVALID_RESERVE unless both reserves are positive.
Amount get_input_price(const Amount& input_amount,
                       const Amount& input_reserve,
                       const Amount& output_reserve);

// Amount that must be sold to receive exactly output_amount.
// Throws INVALID_RESERVE unless both reserves are positive, and
// INSUFFICIENT_LIQUIDITY unless output_reserve > output_amount.
Amount get_output_price(const Amount& output_amount,
                        const Amount& input_reserve,
                        const Amount& output_reserve);

} // namespace pricing

} // namespace amm

#endif // AMM_PRICING_HPP
