#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <flon/wasm_db.hpp>
#include <hemat/consts.hpp>

namespace hemat {

using namespace eosio;
using std::string;

#undef TBL
#undef NTBL
#define TBL struct [[eosio::table, eosio::contract("hemat.escrow")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("hemat.escrow")]]

NTBL("global") escrow_global_t {
    name            admin;
    name            registry            = GROUP_CONTRACT;
    name            stake_contract      = STAKE_CONTRACT;
    name            insure_contract     = INSURE_CONTRACT;
    name            yield_adapter;                              // 空则不做收益部署
    name            treasury;                                   // 平台手续费接收账户
    extended_symbol settle_token        = extended_symbol(USDT_SYM, USDT_BANK);
    uint16_t        buffer_ratio_bps    = 1000;                 // 10% 留存
    uint16_t        group_yield_bps     = 8000;                 // 80% 归组，其余归保险
    asset           deployed            = asset(0, USDT_SYM);   // 已存入收益适配器
    asset           total_harvested     = asset(0, USDT_SYM);
    time_point_sec  last_harvest_at;
    uint32_t        last_apy_bps        = 0;                    // 最近一次收割时适配器年化

    EOSLIB_SERIALIZE( escrow_global_t, (admin)(registry)(stake_contract)(insure_contract)(yield_adapter)
                                       (treasury)(settle_token)(buffer_ratio_bps)(group_yield_bps)
                                       (deployed)(total_harvested)(last_harvest_at)(last_apy_bps) )
};
typedef eosio::singleton< "global"_n, escrow_global_t > escrow_global_singleton;

/**
 * scope: self
 */
TBL escrow_grant_t {
    uint64_t            group_id;                   // PK
    uint64_t            cap;
    time_point_sec      opened_at;
    time_point_sec      closed_at;                  // 组结束或取消后不再收割

    escrow_grant_t() {}
    escrow_grant_t(const uint64_t& gid): group_id(gid) {}

    uint64_t primary_key() const { return group_id; }
    bool is_closed() const { return closed_at != time_point_sec(); }

    typedef eosio::multi_index<"grants"_n, escrow_grant_t> idx_t;

    EOSLIB_SERIALIZE( escrow_grant_t, (group_id)(cap)(opened_at)(closed_at) )
};

/**
 * 组托管余额
 * scope: self
 */
TBL balance_t {
    uint64_t            group_id;                   // PK
    asset               principal;
    asset               yield_reserve;
    asset               pending_payouts;
    asset               fees_collected;
    asset               penalties_collected;
    asset               total_deposited;
    asset               total_withdrawn;
    asset               total_yield;
    time_point_sec      updated_at;

    balance_t() {}
    balance_t(const uint64_t& gid): group_id(gid) {}

    uint64_t primary_key() const { return group_id; }

    typedef eosio::multi_index<"balances"_n, balance_t> idx_t;

    EOSLIB_SERIALIZE( balance_t, (group_id)(principal)(yield_reserve)(pending_payouts)(fees_collected)
                                 (penalties_collected)(total_deposited)(total_withdrawn)(total_yield)
                                 (updated_at) )
};

/**
 * 待领取出款
 * scope: group_id
 */
TBL pending_t {
    name                owner;                      // PK
    asset               amount;

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index<"pendings"_n, pending_t> idx_t;

    EOSLIB_SERIALIZE( pending_t, (owner)(amount) )
};

} // namespace hemat
