#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <hemat.escrow/hematescrowdb.hpp>
#include <hemat/errors.hpp>
#include <contract_version.hpp>

namespace hemat {

using namespace eosio;
using namespace std;
using namespace flon;
using namespace wasm::db;

DEFINE_VERSION_CONTRACT_CLASS("hemat.escrow", hematescrow)

/**
 * @contract hematescrow
 * @brief 互助组资金托管
 *
 * 功能说明：
 *  - 按组记账：本金、收益储备、待领取出款、手续费、罚金
 *  - 每次本金入账后保留 buffer_ratio_bps 流动性，其余存入收益适配器
 *  - 出款时流动性不足则先从适配器赎回差额
 *  - 收益收割按 group_yield_bps 分配给组，其余转入保险池
 */
class [[eosio::contract("hemat.escrow")]] hematescrow : public contract {
public:
    using contract::contract;

    hematescrow(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _db(get_self()),
      _global(get_self(), get_self().value)
    {
        _gstate = _global.exists() ? _global.get() : escrow_global_t{};
    }

    ~hematescrow() {
        _global.set(_gstate, get_self());
    }

    /**
     * memo 格式：
     *  - deposit:<group_id>:<member>   来自 hemat.group
     *  - slash:<group_id>:<member>     来自 hemat.stake
     *  - cover:<group_id>:<member>     来自 hemat.insure
     *  - harvest:<group_id>            来自收益适配器
     *  - recall                        来自收益适配器
     */
    [[eosio::on_notify("*::transfer")]]
    void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo);

    ACTION init(const name& admin, const name& registry, const name& stake_contract, const name& insure_contract,
                const name& yield_adapter, const name& treasury, const extended_symbol& settle_token);

    ACTION setconfig(const uint16_t& buffer_ratio_bps, const uint16_t& group_yield_bps, const name& treasury);

    /**
     * 更换收益适配器，仅在无已部署资金时允许
     */
    ACTION setadapter(const name& adapter);

    ACTION opengroup(const uint64_t& group_id, const uint64_t& cap);

    /**
     * 本金出款（到期提取、提前退出、取消退款）
     */
    ACTION withdraw(const uint64_t& group_id, const uint64_t& cap, const name& to,
                    const asset& quantity, const string& memo);

    ACTION payyield(const uint64_t& group_id, const uint64_t& cap, const name& to, const asset& quantity);

    /**
     * 提前退出罚金，转入保险池
     */
    ACTION penalize(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& quantity);

    /**
     * 轮转出款入账：本金转入待领取，手续费转入 treasury
     */
    ACTION commitpay(const uint64_t& group_id, const uint64_t& cap, const uint32_t& cycle,
                     const name& recipient, const asset& gross, const asset& fee);

    ACTION release(const uint64_t& group_id, const uint64_t& cap, const name& recipient, const asset& quantity);

    /**
     * 收割收益，任何人可调用
     * 适配器当前全部待收益计入所指定的组，已关闭的组不可收割
     */
    ACTION harvest(const uint64_t& group_id);

    /**
     * 组结束或取消时由 registry 关闭，关闭后待领取出款仍可释放
     */
    ACTION closegroup(const uint64_t& group_id, const uint64_t& cap);

private:
    void _check_grant(const uint64_t& group_id, const uint64_t& cap);
    balance_t _get_group_balance(const uint64_t& group_id);
    asset _get_balance(const name& token_contract, const name& owner, const symbol& sym);

    void _on_deposit(const uint64_t& group_id, const asset& quantity);
    void _on_harvest(const uint64_t& group_id, const asset& quantity);
    void _on_recall(const asset& quantity);

    void _sweep();
    void _pay_out(const name& to, const asset& quantity, const string& memo);

private:
    dbc                     _db;
    escrow_global_singleton _global;
    escrow_global_t         _gstate;
};

} // namespace hemat
