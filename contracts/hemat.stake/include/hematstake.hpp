#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <hemat.stake/hematstakedb.hpp>
#include <hemat/errors.hpp>
#include <contract_version.hpp>

namespace hemat {

using namespace eosio;
using namespace std;
using namespace flon;
using namespace wasm::db;

DEFINE_VERSION_CONTRACT_CLASS("hemat.stake", hematstake)

/**
 * 合约：hemat.stake
 * 功能：入组质押与全平台信誉
 * 说明：
 *   - hemat.group 转入质押（memo "stake:<group_id>:<member>"）
 *   - 违约时按比例罚没，罚没金额转入 hemat.escrow
 *   - 按期缴款提高信誉，违约降低信誉，累计违约达到阈值后拉黑
 */
class [[eosio::contract("hemat.stake")]] hematstake : public contract {
public:
    using contract::contract;

    hematstake(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _global(get_self(), get_self().value),
      _db(get_self())
    {
        _gstate = _global.exists() ? _global.get() : stake_global_t{};
    }

    ~hematstake() {
        _global.set(_gstate, get_self());
    }

    ACTION init(const name& admin, const name& registry, const name& escrow_contract,
                const extended_symbol& settle_token);

    /**
     * 调整罚没与信誉参数（管理员）
     */
    ACTION setconfig(const uint16_t& stake_penalty_bps, const uint16_t& blacklist_threshold,
                     const uint32_t& trust_reward_step, const uint32_t& trust_slash_step);

    /**
     * 登记组授权句柄，仅 registry 可调用
     */
    ACTION opengroup(const uint64_t& group_id, const uint64_t& cap);

    /**
     * 零质押成员入组
     */
    ACTION enroll(const uint64_t& group_id, const uint64_t& cap, const name& member);

    /**
     * 退还成员全部剩余质押
     */
    ACTION refund(const uint64_t& group_id, const uint64_t& cap, const name& member);

    /**
     * 退还组内全部质押（组完成或取消）
     */
    ACTION releaseall(const uint64_t& group_id, const uint64_t& cap);

    /**
     * 违约罚没
     * @param missed 欠缴金额，罚没不超过该值
     */
    ACTION slash(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& missed);

    ACTION reward(const uint64_t& group_id, const uint64_t& cap, const name& member);

    /**
     * 解除黑名单，违约计数与信誉分不变
     */
    ACTION whitelist(const name& member);

    [[eosio::on_notify("*::transfer")]]
    void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo);

private:
    void _check_grant(const uint64_t& group_id, const uint64_t& cap);
    void _on_stake(const uint64_t& group_id, const name& member, const asset& quantity);
    reputation_t _touch_reputation(const name& member);
    void _log(const uint64_t& group_id, const name& owner, const name& action,
              const asset& quantity, const uint32_t& trust_after);

private:
    stake_global_singleton  _global;
    stake_global_t          _gstate;
    dbc                     _db;
};

} // namespace hemat
