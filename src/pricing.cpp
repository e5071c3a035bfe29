// =============================================================================
// pricing.cpp - Constant product pricing with integer rounding
// =============================================================================

#include "amm/pricing.hpp"

#include <stdexcept>

namespace amm {
namespace pricing {

namespace {

void require_reserves(const Amount& input_reserve, const Amount& output_reserve) {
    if (input_reserve == 0 || output_reserve == 0) {
        throw ExchangeError(ErrorCode::INVALID_RESERVE, "pricing: reserves must be positive");
    }
}

[[noreturn]] void overflow(const char* op, const std::exception& e) {
    throw ExchangeError(ErrorCode::ARITHMETIC_OVERFLOW,
                        std::string("pricing: ") + op + ": " + e.what());
}

} // anonymous namespace

Amount get_input_price(const Amount& input_amount,
                       const Amount& input_reserve,
                       const Amount& output_reserve) {
    require_reserves(input_reserve, output_reserve);

    try {
        Amount input_with_fee = input_amount * FEE_NUMERATOR;
        Amount numerator = input_with_fee * output_reserve;
        Amount denominator = input_reserve * FEE_DENOMINATOR + input_with_fee;
        return numerator / denominator;
    } catch (const std::overflow_error& e) {
        overflow("get_input_price", e);
    } catch (const std::range_error& e) {
        overflow("get_input_price", e);
    }
}

Amount get_output_price(const Amount& output_amount,
                        const Amount& input_reserve,
                        const Amount& output_reserve) {
    require_reserves(input_reserve, output_reserve);
    if (output_reserve <= output_amount) {
        throw ExchangeError(ErrorCode::INSUFFICIENT_LIQUIDITY,
                            "pricing: output exceeds available reserve");
    }

    try {
        Amount numerator = input_reserve * output_amount * FEE_DENOMINATOR;
        Amount denominator = (output_reserve - output_amount) * FEE_NUMERATOR;
        return numerator / denominator + 1;
    } catch (const std::overflow_error& e) {
        overflow("get_output_price", e);
    } catch (const std::range_error& e) {
        overflow("get_output_price", e);
    }
}

} // namespace pricing
} // namespace amm
