#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <flon/wasm_db.hpp>
#include <hemat/consts.hpp>

#include <set>

namespace hemat {

using namespace eosio;
using std::string;
using std::vector;

#undef TBL
#undef NTBL
#define TBL struct [[eosio::table, eosio::contract("hemat.insure")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("hemat.insure")]]

namespace ClaimStatus {
    static constexpr eosio::name SUBMITTED      = "submitted"_n;
    static constexpr eosio::name APPROVED       = "approved"_n;
    static constexpr eosio::name REJECTED       = "rejected"_n;
    static constexpr eosio::name PAID           = "paid"_n;
};

NTBL("global") insure_global_t {
    name                admin;
    name                registry                = GROUP_CONTRACT;
    name                escrow_contract         = ESCROW_CONTRACT;
    extended_symbol     settle_token            = extended_symbol(USDT_SYM, USDT_BANK);
    std::set<name>      approvers;
    uint16_t            min_reserve_ratio_bps   = 1000;                     // 10% 进入储备金
    uint16_t            approval_threshold      = 2;
    asset               claim_cap               = asset(1000'0000, USDT_SYM);
    asset               emergency_cap           = asset(500'0000, USDT_SYM);
    uint32_t            claim_cooldown          = 7 * DAY_SECONDS;
    uint64_t            last_claim_id           = 0;

    EOSLIB_SERIALIZE( insure_global_t, (admin)(registry)(escrow_contract)(settle_token)(approvers)
                                       (min_reserve_ratio_bps)(approval_threshold)(claim_cap)
                                       (emergency_cap)(claim_cooldown)(last_claim_id) )
};
typedef eosio::singleton< "global"_n, insure_global_t > insure_global_singleton;

/**
 * scope: self
 */
TBL insure_grant_t {
    uint64_t            group_id;                   // PK
    uint64_t            cap;
    time_point_sec      opened_at;

    insure_grant_t() {}
    insure_grant_t(const uint64_t& gid): group_id(gid) {}

    uint64_t primary_key() const { return group_id; }

    typedef eosio::multi_index<"grants"_n, insure_grant_t> idx_t;

    EOSLIB_SERIALIZE( insure_grant_t, (group_id)(cap)(opened_at) )
};

/**
 * 组保险池
 * scope: self
 */
TBL pool_t {
    uint64_t            group_id;                   // PK
    asset               balance;                    // 可理赔
    asset               reserve_fund;               // 储备金，仅管理员应急提取
    asset               total_premiums;
    asset               total_claims_paid;
    asset               total_covered;              // 违约补足
    uint64_t            total_claims_denied = 0;
    bool                emergency_mode      = false;
    time_point_sec      updated_at;

    pool_t() {}
    pool_t(const uint64_t& gid): group_id(gid) {}

    uint64_t primary_key() const { return group_id; }

    typedef eosio::multi_index<"pools"_n, pool_t> idx_t;

    EOSLIB_SERIALIZE( pool_t, (group_id)(balance)(reserve_fund)(total_premiums)(total_claims_paid)
                              (total_covered)(total_claims_denied)(emergency_mode)(updated_at) )
};

/**
 * 理赔
 * scope: self
 */
TBL claim_t {
    uint64_t            id;                         // PK
    uint64_t            group_id;
    name                claimant;
    asset               requested;
    asset               amount;                     // 审批后可下调
    string              evidence;
    name                status              = ClaimStatus::SUBMITTED;
    vector<name>        approvals;
    string              reject_reason;
    time_point_sec      submitted_at;
    time_point_sec      processed_at;

    claim_t() {}
    claim_t(const uint64_t& i): id(i) {}

    uint64_t primary_key() const { return id; }
    uint64_t by_group() const { return group_id; }
    uint64_t by_claimant() const { return claimant.value; }

    typedef eosio::multi_index<"claims"_n, claim_t,
        indexed_by<"groupidx"_n,    const_mem_fun<claim_t, uint64_t, &claim_t::by_group> >,
        indexed_by<"claimantidx"_n, const_mem_fun<claim_t, uint64_t, &claim_t::by_claimant> >
    > idx_t;

    EOSLIB_SERIALIZE( claim_t, (id)(group_id)(claimant)(requested)(amount)(evidence)(status)
                               (approvals)(reject_reason)(submitted_at)(processed_at) )
};

/**
 * 理赔冷却
 * scope: group_id
 */
TBL claimant_t {
    name                owner;                      // PK
    time_point_sec      last_claim_at;
    uint32_t            claim_count         = 0;
    asset               total_claimed;

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index<"claimants"_n, claimant_t> idx_t;

    EOSLIB_SERIALIZE( claimant_t, (owner)(last_claim_at)(claim_count)(total_claimed) )
};

} // namespace hemat
