// =============================================================================
// router.cpp - Opcode dispatch and JSON request/response mapping
// =============================================================================

#include "cpamm/router.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/logging.hpp"

namespace cpamm {

using codec::json;

namespace {

json fee_accumulator_to_json(const FeeAccumulator& acc) {
    return {
        {"provider", codec::coins_to(acc.provider)},
        {"protocol", codec::coins_to(acc.protocol)}
    };
}

json ok(json response, const Instructions& instructions) {
    response["ok"] = true;
    response["instructions"] = codec::to_json(instructions);
    return response;
}

} // anonymous namespace

// =============================================================================
// PoolRouter
// =============================================================================

PoolRouter::PoolRouter(PoolController& pool) : pool_(pool) {
    register_user_handlers();
    register_admin_handlers();
    register_getters();
}

json PoolRouter::call(const json& message) {
    try {
        uint32_t op = codec::required_u32(message, "op");

        auto it = handlers_.find(op);
        if (it == handlers_.end()) {
            throw PoolError(ErrorCode::UNKNOWN_OP, "unknown opcode " + std::to_string(op));
        }

        CallContext ctx{};
        ctx.sender = codec::required_address(message, "sender");
        ctx.gas = codec::optional_u64(message, "gas", 0);

        json body = message.contains("body") ? message.at("body") : json::object();
        if (!body.is_object()) {
            throw PoolError(ErrorCode::INVALID_PAYLOAD, "body must be an object");
        }

        return it->second(Message{ctx, body});
    } catch (const PoolError& e) {
        // The controller logs its own rejections; only decode failures are logged here
        if (e.code() == ErrorCode::UNKNOWN_OP || e.code() == ErrorCode::INVALID_PAYLOAD) {
            logging::get()->warn("message rejected: {} ({})", to_string(e.code()), e.what());
        }
        return codec::error_to_json(e);
    }
}

json PoolRouter::get(std::string_view method, const json& args) const {
    try {
        auto it = getters_.find(std::string(method));
        if (it == getters_.end()) {
            throw PoolError(ErrorCode::UNKNOWN_OP, "unknown getter " + std::string(method));
        }
        json response = it->second(args);
        response["ok"] = true;
        return response;
    } catch (const PoolError& e) {
        logging::get()->warn("{} rejected: {} ({})", method, to_string(e.code()), e.what());
        return codec::error_to_json(e);
    }
}

json PoolRouter::pool_data_to_json(const PoolData& data) {
    return {
        {"wallet0", address::to_hex(data.wallet0)},
        {"wallet1", address::to_hex(data.wallet1)},
        {"reserve0", codec::coins_to(data.reserve0)},
        {"reserve1", codec::coins_to(data.reserve1)},
        {"total_supply", codec::coins_to(data.total_supply)},
        {"lp_fee", data.rates.lp_fee},
        {"protocol_fee", data.rates.protocol_fee},
        {"ref_fee", data.rates.ref_fee},
        {"provider_fee_address", address::to_hex(data.provider_fee_address)},
        {"protocol_fee_address", address::to_hex(data.protocol_fee_address)},
        {"collected_token0", fee_accumulator_to_json(data.fees0)},
        {"collected_token1", fee_accumulator_to_json(data.fees1)},
        {"locked", data.locked},
        {"gas_accrued", data.gas_accrued}
    };
}

json PoolRouter::quote_to_json(const SwapQuote& quote) {
    return {
        {"base_out", codec::coins_to(quote.base_out)},
        {"amount_out", codec::coins_to(quote.amount_out)},
        {"provider_fee", codec::coins_to(quote.provider_fee)},
        {"protocol_fee", codec::coins_to(quote.protocol_fee)},
        {"ref_fee", codec::coins_to(quote.ref_fee)}
    };
}

// =============================================================================
// User Operations
// =============================================================================

void PoolRouter::register_user_handlers() {
    // swap(from?, token_wallet, amount_in, min_out?, has_ref?, ref_address?, to?)
    handlers_[ops::SWAP] = [this](const Message& m) -> json {
        SwapRequest req{};
        req.from = codec::optional_address(m.body, "from");
        if (address::is_null(req.from)) req.from = m.ctx.sender;
        req.token_wallet = codec::required_address(m.body, "token_wallet");
        req.amount_in = codec::required_coins(m.body, "amount_in");
        req.min_out = codec::optional_coins(m.body, "min_out", 0);
        req.has_ref = codec::optional_bool(m.body, "has_ref", false);
        req.ref_address = codec::optional_address(m.body, "ref_address");
        req.to = codec::optional_address(m.body, "to");

        SwapResult result = pool_.swap(m.ctx, req);

        json response = quote_to_json(result.quote);
        response["refunded"] = result.refunded;
        return ok(std::move(response), result.instructions);
    };

    // provide_liquidity(from?, amount0, amount1, min_lp_out?)
    handlers_[ops::PROVIDE_LIQUIDITY] = [this](const Message& m) -> json {
        ProvideLiquidityRequest req{};
        req.from = codec::optional_address(m.body, "from");
        if (address::is_null(req.from)) req.from = m.ctx.sender;
        req.amount0 = codec::required_coins(m.body, "amount0");
        req.amount1 = codec::required_coins(m.body, "amount1");
        req.min_lp_out = codec::optional_coins(m.body, "min_lp_out", 0);

        ProvideResult result = pool_.provide_liquidity(m.ctx, req);

        json response = {
            {"refunded", result.refunded},
            {"lp_minted", codec::coins_to(result.deposit.lp_minted)}
        };
        return ok(std::move(response), result.instructions);
    };

    // burn_notification(lp_amount, from?, response?)
    handlers_[ops::BURN_NOTIFICATION] = [this](const Message& m) -> json {
        BurnNotification req{};
        req.lp_amount = codec::required_coins(m.body, "lp_amount");
        req.from = codec::optional_address(m.body, "from");
        if (address::is_null(req.from)) req.from = m.ctx.sender;
        req.response = codec::optional_address(m.body, "response");

        BurnResult result = pool_.burn_notification(m.ctx, req);

        json response = {
            {"amount0", codec::coins_to(result.withdrawn.amount0)},
            {"amount1", codec::coins_to(result.withdrawn.amount1)}
        };
        return ok(std::move(response), result.instructions);
    };

    handlers_[ops::COLLECT_FEES] = [this](const Message& m) -> json {
        CollectResult result = pool_.collect_fees(m.ctx);
        return ok({{"collected", result.collected}}, result.instructions);
    };
}

// =============================================================================
// Administrative Operations
// =============================================================================

void PoolRouter::register_admin_handlers() {
    // set_fees(lp_fee, protocol_fee, ref_fee, protocol_fee_address, provider_fee_address?)
    handlers_[ops::SET_FEES] = [this](const Message& m) -> json {
        SetFeesRequest req{};
        req.rates.lp_fee = codec::required_u32(m.body, "lp_fee");
        req.rates.protocol_fee = codec::required_u32(m.body, "protocol_fee");
        req.rates.ref_fee = codec::required_u32(m.body, "ref_fee");
        req.protocol_fee_address = codec::optional_address(m.body, "protocol_fee_address");
        req.provider_fee_address = codec::optional_address(m.body, "provider_fee_address");

        return ok(json::object(), pool_.set_fees(m.ctx, req));
    };

    handlers_[ops::SET_LOCK_STATUS] = [this](const Message& m) -> json {
        bool locked = codec::required_bool(m.body, "locked");
        Instructions out = pool_.set_lock_status(m.ctx, locked);
        return ok({{"locked", locked}}, out);
    };

    handlers_[ops::RESET_GAS] = [this](const Message& m) -> json {
        return ok(json::object(), pool_.reset_gas(m.ctx));
    };

    handlers_[ops::ADD_AUTHORIZED] = [this](const Message& m) -> json {
        Address addr = codec::required_address(m.body, "address");
        return ok(json::object(), pool_.add_authorized(m.ctx, addr));
    };

    handlers_[ops::REMOVE_AUTHORIZED] = [this](const Message& m) -> json {
        Address addr = codec::required_address(m.body, "address");
        return ok(json::object(), pool_.remove_authorized(m.ctx, addr));
    };
}

// =============================================================================
// Read-only Getters
// =============================================================================

void PoolRouter::register_getters() {
    getters_["get_pool_data"] = [this](const json&) -> json {
        return pool_data_to_json(pool_.get_pool_data());
    };

    getters_["get_reserves"] = [this](const json&) -> json {
        auto reserves = pool_.get_reserves();
        return {
            {"reserve0", codec::coins_to(reserves.first)},
            {"reserve1", codec::coins_to(reserves.second)}
        };
    };

    getters_["get_total_supply"] = [this](const json&) -> json {
        return {{"total_supply", codec::coins_to(pool_.get_total_supply())}};
    };

    getters_["get_expected_outputs"] = [this](const json& args) -> json {
        Coins amount_in = codec::required_coins(args, "amount_in");
        Address token_wallet = codec::required_address(args, "token_wallet");
        return quote_to_json(pool_.get_expected_outputs(amount_in, token_wallet));
    };

    getters_["is_authorized"] = [this](const json& args) -> json {
        Address addr = codec::required_address(args, "address");
        return {{"authorized", pool_.is_authorized(addr)}};
    };

    // Getters with an opcode of their own answer through call() as well
    handlers_[ops::GET_POOL_DATA] = [this](const Message& m) -> json {
        return get("get_pool_data", m.body);
    };

    handlers_[ops::GET_EXPECTED_OUTPUTS] = [this](const Message& m) -> json {
        return get("get_expected_outputs", m.body);
    };
}

} // namespace cpamm
