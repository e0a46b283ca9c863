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
#define TBL struct [[eosio::table, eosio::contract("hemat.stake")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("hemat.stake")]]

namespace StakeAction {
    static constexpr eosio::name DEPOSIT        = "deposit"_n;
    static constexpr eosio::name SLASH          = "slash"_n;
    static constexpr eosio::name REFUND         = "refund"_n;
};

NTBL("global") stake_global_t {
    name            admin;
    name            registry            = GROUP_CONTRACT;
    name            escrow_contract     = ESCROW_CONTRACT;
    extended_symbol settle_token        = extended_symbol(USDT_SYM, USDT_BANK);
    uint16_t        stake_penalty_bps   = 2000;     // 20%
    uint16_t        blacklist_threshold = 3;
    uint32_t        initial_trust       = 100;
    uint32_t        trust_reward_step   = 10;
    uint32_t        trust_slash_step    = 50;
    uint32_t        max_trust           = 1000;

    EOSLIB_SERIALIZE( stake_global_t, (admin)(registry)(escrow_contract)(settle_token)
                                      (stake_penalty_bps)(blacklist_threshold)(initial_trust)
                                      (trust_reward_step)(trust_slash_step)(max_trust) )
};
typedef eosio::singleton< "global"_n, stake_global_t > stake_global_singleton;

/**
 * scope: self
 */
TBL stake_grant_t {
    uint64_t            group_id;                   // PK
    uint64_t            cap;
    time_point_sec      opened_at;

    stake_grant_t() {}
    stake_grant_t(const uint64_t& gid): group_id(gid) {}

    uint64_t primary_key() const { return group_id; }

    typedef eosio::multi_index<"grants"_n, stake_grant_t> idx_t;

    EOSLIB_SERIALIZE( stake_grant_t, (group_id)(cap)(opened_at) )
};

/**
 * 组内质押
 * scope: group_id
 */
TBL stake_t {
    name                owner;                      // PK
    asset               amount;                     // 当前质押
    asset               cum_staked;
    asset               slashed;
    uint32_t            default_count       = 0;
    time_point_sec      created_at;
    time_point_sec      updated_at;

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index<"stakes"_n, stake_t> idx_t;

    EOSLIB_SERIALIZE( stake_t, (owner)(amount)(cum_staked)(slashed)(default_count)(created_at)(updated_at) )
};

/**
 * 全平台信誉
 * scope: self
 */
TBL reputation_t {
    name                owner;                      // PK
    uint32_t            trust_score         = 0;
    uint32_t            default_count       = 0;
    uint32_t            success_count       = 0;
    bool                blacklisted         = false;
    time_point_sec      updated_at;

    reputation_t() {}
    reputation_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index<"reputations"_n, reputation_t> idx_t;

    EOSLIB_SERIALIZE( reputation_t, (owner)(trust_score)(default_count)(success_count)(blacklisted)(updated_at) )
};

/**
 * 质押流水
 * scope: group_id
 */
TBL stake_log_t {
    uint64_t            id;                         // PK
    name                owner;
    name                action;                     // deposit | slash | refund
    asset               quantity;
    uint32_t            trust_after         = 0;
    time_point_sec      created_at;

    uint64_t primary_key() const { return id; }

    typedef eosio::multi_index<"stakelogs"_n, stake_log_t> idx_t;

    EOSLIB_SERIALIZE( stake_log_t, (id)(owner)(action)(quantity)(trust_after)(created_at) )
};

// 罚没 = min(质押 × 罚没比例, 欠缴, 质押)
inline asset calc_slash_amount(const asset& stake, const asset& missed, const uint16_t& penalty_bps) {
    auto penalty = calc_bps(stake, penalty_bps);
    if (penalty.amount > missed.amount) penalty.amount = missed.amount;
    if (penalty.amount > stake.amount)  penalty.amount = stake.amount;
    if (penalty.amount < 0)             penalty.amount = 0;
    return penalty;
}

inline uint32_t trust_after_reward(const stake_global_t& conf, const uint32_t& trust) {
    return std::min<uint32_t>(trust + conf.trust_reward_step, conf.max_trust);
}

inline uint32_t trust_after_slash(const stake_global_t& conf, const uint32_t& trust) {
    return trust > conf.trust_slash_step ? trust - conf.trust_slash_step : 0;
}

} // namespace hemat
