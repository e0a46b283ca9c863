#pragma once
#include <eosio/asset.hpp>
#include <eosio/name.hpp>

namespace hemat {

static constexpr eosio::name active_perm            {"active"_n};

static constexpr eosio::name USDT_BANK              {"flon.mtoken"_n};
static constexpr eosio::symbol USDT_SYM             = eosio::symbol("USDT", 4);

static constexpr eosio::name GROUP_CONTRACT         = "hemat.group"_n;
static constexpr eosio::name ESCROW_CONTRACT        = "hemat.escrow"_n;
static constexpr eosio::name STAKE_CONTRACT         = "hemat.stake"_n;
static constexpr eosio::name INSURE_CONTRACT        = "hemat.insure"_n;

static constexpr uint64_t RATIO_BOOST           = 10000;            // 1 bp = 0.01%
static constexpr uint64_t DAY_SECONDS           = 24 * 3600;
static constexpr uint32_t MAX_EVIDENCE_SIZE     = 256;
static constexpr uint16_t MIN_GROUP_SIZE        = 3;

inline eosio::asset calc_bps(const eosio::asset& quantity, const uint64_t& bps) {
    return eosio::asset((int64_t)((__int128)quantity.amount * bps / RATIO_BOOST), quantity.symbol);
}

}
