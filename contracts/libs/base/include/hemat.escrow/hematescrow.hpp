#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>

#include "hematescrowdb.hpp"

namespace hemat {

using namespace eosio;

/**
 * 合约：hemat.escrow（调用接口）
 */
class [[eosio::contract("hemat.escrow")]] hematescrow : public contract {
public:
    using contract::contract;

    ACTION opengroup(const uint64_t& group_id, const uint64_t& cap);
    ACTION withdraw(const uint64_t& group_id, const uint64_t& cap, const name& to,
                    const asset& quantity, const string& memo);
    ACTION payyield(const uint64_t& group_id, const uint64_t& cap, const name& to, const asset& quantity);
    ACTION penalize(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& quantity);
    ACTION commitpay(const uint64_t& group_id, const uint64_t& cap, const uint32_t& cycle,
                     const name& recipient, const asset& gross, const asset& fee);
    ACTION release(const uint64_t& group_id, const uint64_t& cap, const name& recipient, const asset& quantity);
    ACTION harvest(const uint64_t& group_id);
    ACTION closegroup(const uint64_t& group_id, const uint64_t& cap);

    using opengroup_action  = eosio::action_wrapper<"opengroup"_n, &hematescrow::opengroup>;
    using withdraw_action   = eosio::action_wrapper<"withdraw"_n, &hematescrow::withdraw>;
    using payyield_action   = eosio::action_wrapper<"payyield"_n, &hematescrow::payyield>;
    using penalize_action   = eosio::action_wrapper<"penalize"_n, &hematescrow::penalize>;
    using commitpay_action  = eosio::action_wrapper<"commitpay"_n, &hematescrow::commitpay>;
    using release_action    = eosio::action_wrapper<"release"_n, &hematescrow::release>;
    using harvest_action    = eosio::action_wrapper<"harvest"_n, &hematescrow::harvest>;
    using closegroup_action = eosio::action_wrapper<"closegroup"_n, &hematescrow::closegroup>;
};

} // namespace hemat
