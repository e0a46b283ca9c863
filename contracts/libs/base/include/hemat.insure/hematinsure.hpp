#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>

#include "hematinsuredb.hpp"

namespace hemat {

using namespace eosio;

/**
 * 合约：hemat.insure（调用接口）
 */
class [[eosio::contract("hemat.insure")]] hematinsure : public contract {
public:
    using contract::contract;

    ACTION opengroup(const uint64_t& group_id, const uint64_t& cap, const bool& emergency);
    ACTION cover(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& quantity);

    using opengroup_action  = eosio::action_wrapper<"opengroup"_n, &hematinsure::opengroup>;
    using cover_action      = eosio::action_wrapper<"cover"_n, &hematinsure::cover>;
};

} // namespace hemat
