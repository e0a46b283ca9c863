#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>
#include <eosio/singleton.hpp>

namespace hemat {

using namespace eosio;
using std::string;

/**
 * 外部收益适配器（调用接口）
 *  - 存入：向适配器转账，memo "deposit"
 *  - withdraw：适配器以 memo "recall" 转回
 *  - harvest：适配器以调用方给定的 memo 转回收益，无收益则不转账
 *  - balance / apy：读 deposits 表与 state 单例
 */
class [[eosio::contract("yield.adapter")]] yieldadapter : public contract {
public:
    using contract::contract;

    ACTION withdraw(const name& to, const asset& quantity);
    ACTION harvest(const name& to, const string& memo);

    using withdraw_action   = eosio::action_wrapper<"withdraw"_n, &yieldadapter::withdraw>;
    using harvest_action    = eosio::action_wrapper<"harvest"_n, &yieldadapter::harvest>;
};

// 适配器公开表（只读）
struct adapter_deposit_t {
    name        owner;
    asset       balance;

    uint64_t primary_key() const { return owner.value; }

    EOSLIB_SERIALIZE( adapter_deposit_t, (owner)(balance) )
};
typedef eosio::multi_index<"deposits"_n, adapter_deposit_t> adapter_deposit_tbl;

struct adapter_state_t {
    name        token_contract;
    asset       pending_yield;
    uint32_t    apy_bps         = 0;

    EOSLIB_SERIALIZE( adapter_state_t, (token_contract)(pending_yield)(apy_bps) )
};
typedef eosio::singleton<"state"_n, adapter_state_t> adapter_state_singleton;

inline asset adapter_balance(const name& adapter, const name& owner, const symbol& sym) {
    adapter_deposit_tbl deposits(adapter, adapter.value);
    auto itr = deposits.find(owner.value);
    if (itr == deposits.end()) return asset(0, sym);
    return itr->balance;
}

inline uint32_t adapter_apy(const name& adapter) {
    adapter_state_singleton st(adapter, adapter.value);
    if (!st.exists()) return 0;
    return st.get().apy_bps;
}

static constexpr std::string_view ADAPTER_DEPOSIT_MEMO  = "deposit";
static constexpr std::string_view ADAPTER_RECALL_MEMO   = "recall";

} // namespace hemat
