#ifndef CPAMM_ROUTER_HPP
#define CPAMM_ROUTER_HPP

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "json_codec.hpp"
#include "pool.hpp"

namespace cpamm {

// =============================================================================
// Opcodes
// =============================================================================

namespace ops {
constexpr uint32_t SWAP = 0x25938561;
constexpr uint32_t PROVIDE_LIQUIDITY = 0xfcf9e58f;
constexpr uint32_t BURN_NOTIFICATION = 0x7bdd97de;
constexpr uint32_t COLLECT_FEES = 0x1fcb7d3d;
constexpr uint32_t SET_FEES = 0x355423e5;
constexpr uint32_t RESET_GAS = 0x42a0fb43;
constexpr uint32_t SET_LOCK_STATUS = 0x69;
constexpr uint32_t ADD_AUTHORIZED = 0x6b;
constexpr uint32_t REMOVE_AUTHORIZED = 0x6c;
constexpr uint32_t GET_POOL_DATA = 0x43c034e6;
constexpr uint32_t GET_EXPECTED_OUTPUTS = 0xed4d8b67;
}

// =============================================================================
// PoolRouter - JSON message boundary in front of a PoolController
//
// Message:  { "op": <u32>, "sender": "<hex>", "gas": <u64>, "body": {...} }
// Success:  { "ok": true, "instructions": [...], ... }
// Failure:  { "ok": false, "error": "<Kind>", "code": <int>, "message": "..." }
// =============================================================================

class PoolRouter {
public:
    using json = codec::json;

    explicit PoolRouter(PoolController& pool);

    // Dispatch one message by opcode. PoolError becomes a failure response.
    json call(const json& message);

    // Named read-only getter (get_reserves, get_total_supply, get_pool_data,
    // get_expected_outputs, is_authorized)
    json get(std::string_view method, const json& args = json::object()) const;

    bool has_op(uint32_t op) const { return handlers_.count(op) > 0; }

    static json pool_data_to_json(const PoolData& data);
    static json quote_to_json(const SwapQuote& quote);

private:
    struct Message {
        CallContext ctx;
        const json& body;
    };

    using Handler = std::function<json(const Message&)>;
    using Getter = std::function<json(const json&)>;

    PoolController& pool_;
    std::unordered_map<uint32_t, Handler> handlers_;
    std::unordered_map<std::string, Getter> getters_;

    void register_user_handlers();
    void register_admin_handlers();
    void register_getters();
};

} // namespace cpamm

#endif // CPAMM_ROUTER_HPP
