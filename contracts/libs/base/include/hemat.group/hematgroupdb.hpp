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
using std::vector;

#undef TBL
#undef NTBL
#define TBL struct [[eosio::table, eosio::contract("hemat.group")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("hemat.group")]]

namespace GroupModel {
    static constexpr eosio::name ROTATIONAL     = "rotational"_n;
    static constexpr eosio::name FIXED_SAVINGS  = "fixedsavings"_n;
    static constexpr eosio::name EMERGENCY      = "emergency"_n;
};

namespace GroupStatus {
    static constexpr eosio::name CREATED        = "created"_n;
    static constexpr eosio::name ACTIVE         = "active"_n;
    static constexpr eosio::name PAUSED         = "paused"_n;
    static constexpr eosio::name COMPLETED      = "completed"_n;
    static constexpr eosio::name CANCELLED      = "cancelled"_n;
};

namespace ContribStatus {
    static constexpr eosio::name PAID           = "paid"_n;
    static constexpr eosio::name DEFAULTED      = "defaulted"_n;
    static constexpr eosio::name COVERED        = "covered"_n;
};

NTBL("global") group_global_t {
    name            admin;
    name            escrow_contract     = ESCROW_CONTRACT;
    name            stake_contract      = STAKE_CONTRACT;
    name            insure_contract     = INSURE_CONTRACT;
    extended_symbol settle_token        = extended_symbol(USDT_SYM, USDT_BANK);
    uint16_t        min_group_size      = MIN_GROUP_SIZE;
    uint16_t        max_group_size      = 50;
    asset           min_contribution    = asset(1'0000, USDT_SYM);          // 1 USDT
    asset           max_contribution    = asset(100000'0000, USDT_SYM);     // 100k USDT
    uint16_t        max_groups_per_creator = 10;                            // open groups only
    uint64_t        last_group_id       = 0;

    EOSLIB_SERIALIZE( group_global_t, (admin)(escrow_contract)(stake_contract)(insure_contract)
                                      (settle_token)(min_group_size)(max_group_size)
                                      (min_contribution)(max_contribution)(max_groups_per_creator)
                                      (last_group_id) )
};
typedef eosio::singleton< "global"_n, group_global_t > group_global_singleton;

/**
 * 组配置，创建后不可修改
 */
struct group_conf_s {
    name        model;                              // rotational | fixedsavings | emergency
    asset       contribution;                       // 每期缴款
    uint32_t    cycle_interval              = 0;    // 秒
    uint16_t    group_size                  = 0;
    uint32_t    lock_duration               = 0;    // 秒，仅储蓄/应急组
    uint32_t    grace_period                = 0;    // 秒
    asset       stake_required;                     // 入组质押，可为 0
    bool        insurance_enabled           = false;
    uint16_t    insurance_bps               = 0;
    uint16_t    platform_fee_bps            = 0;
    uint16_t    early_withdraw_penalty_bps  = 0;

    EOSLIB_SERIALIZE( group_conf_s, (model)(contribution)(cycle_interval)(group_size)(lock_duration)
                                    (grace_period)(stake_required)(insurance_enabled)(insurance_bps)
                                    (platform_fee_bps)(early_withdraw_penalty_bps) )
};

/**
 * 互助组
 * scope: self
 */
TBL group_t {
    uint64_t            id;                         // PK
    name                creator;
    group_conf_s        conf;
    name                status                  = GroupStatus::CREATED;
    vector<name>        members;                    // 出款顺序
    uint64_t            cap                     = 0;    // 账本授权句柄
    uint32_t            current_cycle           = 0;
    time_point_sec      cycle_start_time;
    asset               cycle_collected;            // 本期已进入托管的金额
    uint16_t            next_payout_index       = 0;
    time_point_sec      maturity_time;
    time_point_sec      activated_at;
    time_point_sec      paused_at;
    bool                guard                   = false;
    bool                order_set               = false;
    time_point_sec      matured_at;                 // 首次到期提取时的快照时间
    asset               matured_yield;              // 快照：可分配收益
    asset               matured_total;              // 快照：未提前退出成员的缴款总额
    asset               matured_paid;               // 已分配收益
    time_point_sec      created_at;
    time_point_sec      updated_at;

    group_t() {}
    group_t(const uint64_t& gid): id(gid) {}

    uint64_t primary_key() const { return id; }
    uint64_t by_creator() const { return creator.value; }

    bool is_terminal() const {
        return status == GroupStatus::COMPLETED || status == GroupStatus::CANCELLED;
    }

    typedef eosio::multi_index<"groups"_n, group_t,
        indexed_by<"creatoridx"_n, const_mem_fun<group_t, uint64_t, &group_t::by_creator> >
    > idx_t;

    EOSLIB_SERIALIZE( group_t, (id)(creator)(conf)(status)(members)(cap)(current_cycle)(cycle_start_time)
                               (cycle_collected)(next_payout_index)(maturity_time)(activated_at)(paused_at)
                               (guard)(order_set)(matured_at)(matured_yield)(matured_total)(matured_paid)
                               (created_at)(updated_at) )
};

/**
 * 组成员，退出后保留记录
 * scope: group_id
 */
TBL member_t {
    name                owner;                      // PK
    asset               stake_amount;
    asset               total_contributed;          // 已进入托管的金额（含罚没/保险补足）
    asset               total_received;             // 已领取本金与轮转出款
    asset               yield_received;
    uint32_t            trust_score             = 0;
    time_point_sec      joined_at;
    bool                is_active               = true;
    bool                has_withdrawn           = false;
    bool                has_received_payout     = false;
    uint32_t            paid_count              = 0;
    uint32_t            default_count           = 0;

    member_t() {}
    member_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    bool in_play() const { return is_active && !has_withdrawn; }

    typedef eosio::multi_index<"members"_n, member_t> idx_t;

    EOSLIB_SERIALIZE( member_t, (owner)(stake_amount)(total_contributed)(total_received)(yield_received)
                                (trust_score)(joined_at)(is_active)(has_withdrawn)(has_received_payout)
                                (paid_count)(default_count) )
};

/**
 * 缴款记录，(cycle, member) 唯一
 * scope: group_id
 */
TBL contribution_t {
    uint64_t            id;                         // PK
    uint32_t            cycle;
    name                member;
    asset               amount;
    name                status;                     // paid | defaulted | covered
    time_point_sec      created_at;

    uint64_t primary_key() const { return id; }
    uint128_t by_cycle_member() const { return (uint128_t)cycle << 64 | member.value; }

    static uint128_t make_key(const uint32_t& cycle, const name& member) {
        return (uint128_t)cycle << 64 | member.value;
    }

    typedef eosio::multi_index<"contribs"_n, contribution_t,
        indexed_by<"cyclemember"_n, const_mem_fun<contribution_t, uint128_t, &contribution_t::by_cycle_member> >
    > idx_t;

    EOSLIB_SERIALIZE( contribution_t, (id)(cycle)(member)(amount)(status)(created_at) )
};

/**
 * 轮转出款记录
 * scope: group_id
 */
TBL payout_t {
    uint32_t            cycle;                      // PK
    name                recipient;
    asset               gross;
    asset               fee;
    asset               amount;                     // gross - fee，待领取
    bool                executed                = false;
    time_point_sec      created_at;
    time_point_sec      executed_at;

    payout_t() {}
    payout_t(const uint32_t& c): cycle(c) {}

    uint64_t primary_key() const { return cycle; }

    typedef eosio::multi_index<"payouts"_n, payout_t> idx_t;

    EOSLIB_SERIALIZE( payout_t, (cycle)(recipient)(gross)(fee)(amount)(executed)(created_at)(executed_at) )
};

} // namespace hemat
