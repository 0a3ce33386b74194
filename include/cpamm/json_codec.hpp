#ifndef CPAMM_JSON_CODEC_HPP
#define CPAMM_JSON_CODEC_HPP

#include <nlohmann/json.hpp>

#include "types.hpp"
#include "errors.hpp"

namespace cpamm {
namespace codec {

using json = nlohmann::json;

// Coins travel as decimal strings (they exceed 64 bits); plain unsigned
// numbers are accepted too
Coins coins_from(const json& value, const char* field);
json coins_to(Coins value);

Address address_from(const json& value, const char* field);
Address required_address(const json& obj, const char* field);

// Optional field: null / absent -> NONE
Address optional_address(const json& obj, const char* field);

Coins required_coins(const json& obj, const char* field);
Coins optional_coins(const json& obj, const char* field, Coins fallback);

uint32_t required_u32(const json& obj, const char* field);
uint64_t optional_u64(const json& obj, const char* field, uint64_t fallback);
bool required_bool(const json& obj, const char* field);
bool optional_bool(const json& obj, const char* field, bool fallback);

json to_json(const Instruction& instruction);
json to_json(const Instructions& instructions);

json error_to_json(const PoolError& err);

} // namespace codec
} // namespace cpamm

#endif // CPAMM_JSON_CODEC_HPP
