#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>

#include "hematstakedb.hpp"

namespace hemat {

using namespace eosio;

/**
 * 合约：hemat.stake（调用接口）
 * 仅 hemat.group 持有组授权句柄，可调用以下组内操作
 */
class [[eosio::contract("hemat.stake")]] hematstake : public contract {
public:
    using contract::contract;

    ACTION opengroup(const uint64_t& group_id, const uint64_t& cap);
    ACTION enroll(const uint64_t& group_id, const uint64_t& cap, const name& member);
    ACTION refund(const uint64_t& group_id, const uint64_t& cap, const name& member);
    ACTION releaseall(const uint64_t& group_id, const uint64_t& cap);
    ACTION slash(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& missed);
    ACTION reward(const uint64_t& group_id, const uint64_t& cap, const name& member);

    using opengroup_action  = eosio::action_wrapper<"opengroup"_n, &hematstake::opengroup>;
    using enroll_action     = eosio::action_wrapper<"enroll"_n, &hematstake::enroll>;
    using refund_action     = eosio::action_wrapper<"refund"_n, &hematstake::refund>;
    using releaseall_action = eosio::action_wrapper<"releaseall"_n, &hematstake::releaseall>;
    using slash_action      = eosio::action_wrapper<"slash"_n, &hematstake::slash>;
    using reward_action     = eosio::action_wrapper<"reward"_n, &hematstake::reward>;
};

} // namespace hemat
