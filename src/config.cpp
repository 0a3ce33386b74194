// =============================================================================
// config.cpp - PoolConfig loading (JSON)
// =============================================================================

#include "cpamm/config.hpp"
#include "cpamm/json_codec.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cpamm {

using codec::json;

PoolConfig PoolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

PoolConfig PoolConfig::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw PoolError(ErrorCode::INVALID_PAYLOAD, std::string("config parse error: ") + e.what());
    }
    if (!root.is_object()) {
        throw PoolError(ErrorCode::INVALID_PAYLOAD, "config root must be an object");
    }

    PoolConfig config;
    config.owner = codec::optional_address(root, "owner");
    config.wallet0 = codec::optional_address(root, "wallet0");
    config.wallet1 = codec::optional_address(root, "wallet1");
    config.provider_fee_address = codec::optional_address(root, "provider_fee_address");
    config.protocol_fee_address = codec::optional_address(root, "protocol_fee_address");

    if (root.contains("fees")) {
        const json& f = root.at("fees");
        config.fees.lp_fee = codec::required_u32(f, "lp_fee");
        config.fees.protocol_fee = codec::required_u32(f, "protocol_fee");
        config.fees.ref_fee = codec::required_u32(f, "ref_fee");
    }

    if (root.contains("authorized")) {
        const json& list = root.at("authorized");
        if (!list.is_array()) {
            throw PoolError(ErrorCode::INVALID_PAYLOAD, "field 'authorized': expected an array");
        }
        for (const auto& entry : list) {
            config.authorized.push_back(codec::address_from(entry, "authorized"));
        }
    }

    config.min_liquidity = codec::optional_coins(root, "min_liquidity", config.min_liquidity);
    config.min_swap_amount = codec::optional_coins(root, "min_swap_amount", config.min_swap_amount);
    config.min_collect_fees = codec::optional_coins(root, "min_collect_fees", config.min_collect_fees);
    config.min_operating_reserve =
        codec::optional_u64(root, "min_operating_reserve", config.min_operating_reserve);

    if (root.contains("log_level")) {
        const json& level = root.at("log_level");
        if (!level.is_string()) {
            throw PoolError(ErrorCode::INVALID_PAYLOAD, "field 'log_level': expected a string");
        }
        config.log_level = level.get<std::string>();
    }

    return config;
}

} // namespace cpamm
