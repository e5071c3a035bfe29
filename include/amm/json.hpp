#ifndef AMM_JSON_HPP
#define AMM_JSON_HPP

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "event.hpp"

namespace amm {

// =============================================================================
// Scalars
// =============================================================================

// 0x-prefixed, 40 hex digits
Address parse_address(const std::string& hex);

// Decimal string (or a JSON number for small values)
Amount parse_amount(const nlohmann::json& j);
std::string format_amount(const Amount& amount);

// =============================================================================
// Events
// =============================================================================

void to_json(nlohmann::json& j, const TokenPurchase& e);
void to_json(nlohmann::json& j, const EthPurchase& e);
void to_json(nlohmann::json& j, const AddLiquidity& e);
void to_json(nlohmann::json& j, const RemoveLiquidity& e);
void to_json(nlohmann::json& j, const Transfer& e);
void to_json(nlohmann::json& j, const Approval& e);
void to_json(nlohmann::json& j, const NewExchange& e);
void to_json(nlohmann::json& j, const LogEntry& entry);

const char* event_name(const EventData& data);

nlohmann::json events_to_json(const std::vector<LogEntry>& entries);

} // namespace amm

#endif // AMM_JSON_HPP
