#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <map>
#include <vector>

#include <hemat.group/hematgroupdb.hpp>
#include <hemat.escrow/hematescrow.hpp>
#include <hemat.stake/hematstake.hpp>
#include <hemat.insure/hematinsure.hpp>
#include <hemat/errors.hpp>
#include <contract_version.hpp>

namespace hemat {

using namespace eosio;
using namespace std;
using namespace flon;
using namespace wasm::db;

DEFINE_VERSION_CONTRACT_CLASS("hemat.group", hematgroup)

/**
 * 合约：hemat.group
 * 功能：互助储蓄组生命周期
 * 说明：
 *   - creategroup 分配组 ID 与授权句柄，并在托管、质押、保险合约开户
 *   - 入组：转账质押（memo "join:<group_id>"），零质押组调用 join
 *   - 缴款：转账（memo "contribute:<group_id>"），保费转入保险，其余转入托管
 *   - 轮转组每期集齐后出款给当期接收人；储蓄组到期后按缴款比例提取本金与收益
 *   - 每个变更入口持有组锁，最后以 releaseguard 释放，期间的重入调用整体失败
 */
class [[eosio::contract("hemat.group")]] hematgroup : public contract {
public:
    using contract::contract;

    hematgroup(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _global(get_self(), get_self().value),
      _db(get_self())
    {
        _gstate = _global.exists() ? _global.get() : group_global_t{};
    }

    ~hematgroup() {
        _global.set(_gstate, get_self());
    }

    /**
     * 初始化
     * @param admin 管理员账户
     * @param settle_token 结算币种，如 4,USDT@flon.mtoken
     */
    ACTION init(const name& admin, const name& escrow_contract, const name& stake_contract,
                const name& insure_contract, const extended_symbol& settle_token);

    /**
     * 平台限制（管理员）
     */
    ACTION setconfig(const uint16_t& min_group_size, const uint16_t& max_group_size,
                     const asset& min_contribution, const asset& max_contribution,
                     const uint16_t& max_groups_per_creator);

    /**
     * 创建互助组（配置创建后不可修改）
     */
    ACTION creategroup(const name& creator, const group_conf_s& conf);

    /**
     * 零质押组入组；需质押的组通过转账入组
     */
    ACTION join(const name& member, const uint64_t& group_id);

    /**
     * 激活前退出，退还质押
     */
    ACTION leave(const name& member, const uint64_t& group_id);

    /**
     * 创建者在激活前调整出款顺序，仅一次
     * @param order 排在最前的成员，其余成员保持入组顺序
     */
    ACTION setorder(const name& creator, const uint64_t& group_id, const vector<name>& order);

    /**
     * 缴款窗口结束后追缴：罚没质押，不足部分由保险补足
     */
    ACTION enforce(const name& caller, const uint64_t& group_id, const name& member);

    /**
     * 领取轮转出款
     */
    ACTION claimpayout(const name& member, const uint64_t& group_id, const uint32_t& cycle);

    /**
     * 到期提取本金与收益（储蓄组、应急组）
     */
    ACTION withdraw(const name& member, const uint64_t& group_id);

    /**
     * 到期前提前退出（储蓄组），扣除罚金
     */
    ACTION earlywd(const name& member, const uint64_t& group_id);

    ACTION pause(const name& actor, const uint64_t& group_id);
    ACTION resume(const name& actor, const uint64_t& group_id);

    /**
     * 取消互助组：按净缴款比例退还本金，释放全部质押
     */
    ACTION cancel(const name& creator, const uint64_t& group_id);

    ACTION releaseguard(const uint64_t& group_id);

    [[eosio::on_notify("*::transfer")]]
    void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo);

    using releaseguard_action = eosio::action_wrapper<"releaseguard"_n, &hematgroup::releaseguard>;

private:
    group_t _get_group(const uint64_t& group_id);
    member_t _get_member(const uint64_t& group_id, const name& owner);
    void _save_member(const uint64_t& group_id, const member_t& member);

    void _lock(group_t& group);
    void _unlock(const group_t& group);

    void _validate_conf(const group_conf_s& conf);
    uint64_t _mint_cap(const uint64_t& group_id, const name& creator);

    void _join(const name& member, group_t& group, const asset& stake);
    void _activate(group_t& group);
    void _contribute(const name& member, group_t& group, const asset& quantity);

    bool _has_record(const group_t& group, const name& member);
    bool _cycle_settled(const group_t& group);
    void _settle_cycle(group_t& group);
    void _advance_cycle(group_t& group);
    void _complete(group_t& group);
    void _close_escrow(const group_t& group);
    void _distribute_reserve(const group_t& group);
    asset _net_contribution(const group_t& group) const;

    uint32_t _window_end(const group_t& group) const;
    uint32_t _trust_of(const name& member, const stake_global_t& conf);
    stake_global_t _stake_conf();
    balance_t _escrow_balance(const uint64_t& group_id);

private:
    group_global_singleton  _global;
    group_global_t          _gstate;
    dbc                     _db;
};

} // namespace hemat
