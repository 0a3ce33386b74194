// =============================================================================
// json_codec.cpp - JSON field decoding shared by config and router
// =============================================================================

#include "cpamm/json_codec.hpp"

namespace cpamm {
namespace codec {

namespace {

[[noreturn]] void bad_field(const char* field, const std::string& why) {
    throw PoolError(ErrorCode::INVALID_PAYLOAD, std::string("field '") + field + "': " + why);
}

const json& require(const json& obj, const char* field) {
    if (!obj.is_object()) {
        bad_field(field, "enclosing value is not an object");
    }
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) {
        bad_field(field, "missing");
    }
    return *it;
}

bool present(const json& obj, const char* field) {
    if (!obj.is_object()) return false;
    auto it = obj.find(field);
    return it != obj.end() && !it->is_null();
}

} // anonymous namespace

Coins coins_from(const json& value, const char* field) {
    if (value.is_string()) {
        return coins::parse(value.get<std::string>());
    }
    if (value.is_number_unsigned()) {
        return static_cast<Coins>(value.get<uint64_t>());
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return static_cast<Coins>(value.get<int64_t>());
    }
    bad_field(field, "expected a non-negative amount");
}

json coins_to(Coins value) {
    return coins::to_string(value);
}

Address address_from(const json& value, const char* field) {
    if (!value.is_string()) {
        bad_field(field, "expected a hex address string");
    }
    return address::from_hex(value.get<std::string>());
}

Address required_address(const json& obj, const char* field) {
    return address_from(require(obj, field), field);
}

Address optional_address(const json& obj, const char* field) {
    if (!present(obj, field)) return address::NONE;
    return address_from(obj.at(field), field);
}

Coins required_coins(const json& obj, const char* field) {
    return coins_from(require(obj, field), field);
}

Coins optional_coins(const json& obj, const char* field, Coins fallback) {
    if (!present(obj, field)) return fallback;
    return coins_from(obj.at(field), field);
}

uint32_t required_u32(const json& obj, const char* field) {
    const json& value = require(obj, field);
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
        bad_field(field, "expected an unsigned 32-bit integer");
    }
    return static_cast<uint32_t>(value.get<int64_t>());
}

uint64_t optional_u64(const json& obj, const char* field, uint64_t fallback) {
    if (!present(obj, field)) return fallback;
    const json& value = obj.at(field);
    if (value.is_number_unsigned()) return value.get<uint64_t>();
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(value.get<int64_t>());
    }
    bad_field(field, "expected an unsigned integer");
}

bool required_bool(const json& obj, const char* field) {
    const json& value = require(obj, field);
    if (!value.is_boolean()) {
        bad_field(field, "expected a boolean");
    }
    return value.get<bool>();
}

bool optional_bool(const json& obj, const char* field, bool fallback) {
    if (!present(obj, field)) return fallback;
    const json& value = obj.at(field);
    if (!value.is_boolean()) {
        bad_field(field, "expected a boolean");
    }
    return value.get<bool>();
}

json to_json(const Instruction& instruction) {
    json j = {
        {"kind", to_string(instruction.kind)},
        {"recipient", address::to_hex(instruction.recipient)},
        {"amount", coins_to(instruction.amount)}
    };
    if (instruction.kind != InstructionKind::MINT_LP &&
        instruction.kind != InstructionKind::EXCESS) {
        j["token"] = to_string(instruction.side);
    }
    if (instruction.role != PayoutRole::NONE) {
        j["role"] = to_string(instruction.role);
    }
    return j;
}

json to_json(const Instructions& instructions) {
    json arr = json::array();
    for (const auto& instruction : instructions) {
        arr.push_back(to_json(instruction));
    }
    return arr;
}

json error_to_json(const PoolError& err) {
    return {
        {"ok", false},
        {"error", to_string(err.code())},
        {"code", static_cast<int32_t>(err.code())},
        {"message", err.what()}
    };
}

} // namespace codec
} // namespace cpamm
