#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <hemat.insure/hematinsuredb.hpp>
#include <hemat.group/hematgroupdb.hpp>
#include <hemat/errors.hpp>
#include <contract_version.hpp>

namespace hemat {

using namespace eosio;
using namespace std;
using namespace flon;
using namespace wasm::db;

DEFINE_VERSION_CONTRACT_CLASS("hemat.insure", hematinsure)

/**
 * @contract hematinsure
 * @brief 互助组保险池
 *
 * 功能说明：
 *  - 接收保费（hemat.group 缴款分成、提前退出罚金、赞助充值）与收益分成
 *  - 保费按 min_reserve_ratio_bps 进入不可理赔的储备金
 *  - 理赔：成员提交 -> 审批人多签 -> 执行支付；可被驳回
 *  - 违约补足：由 hemat.group 凭组授权句柄调用，资金转入托管
 */
class [[eosio::contract("hemat.insure")]] hematinsure : public contract {
public:
    using contract::contract;

    hematinsure(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _db(get_self()),
      _global(get_self(), get_self().value)
    {
        _gstate = _global.exists() ? _global.get() : insure_global_t{};
    }

    ~hematinsure() {
        _global.set(_gstate, get_self());
    }

    [[eosio::on_notify("*::transfer")]]
    void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo);

    ACTION init(const name& admin, const name& registry, const name& escrow_contract,
                const extended_symbol& settle_token);

    /**
     * @notice 调整保险池参数（管理员）
     * @param min_reserve_ratio_bps 保费进入储备金比例
     * @param approval_threshold 理赔生效所需审批数
     * @param claim_cap 单笔理赔上限
     * @param emergency_cap 应急组单笔理赔上限
     * @param claim_cooldown 同组同一成员两次理赔最小间隔（秒）
     */
    ACTION setconfig(const uint16_t& min_reserve_ratio_bps, const uint16_t& approval_threshold,
                     const asset& claim_cap, const asset& emergency_cap, const uint32_t& claim_cooldown);

    ACTION addapprover(const name& approver);
    ACTION delapprover(const name& approver);

    ACTION opengroup(const uint64_t& group_id, const uint64_t& cap, const bool& emergency);

    /**
     * @notice 成员提交理赔
     * @param evidence 证明材料（链下存储地址等）
     */
    ACTION submitclaim(const name& claimant, const uint64_t& group_id, const asset& amount, const string& evidence);

    /**
     * @notice 审批理赔，每个审批人一票
     * @param payout 非零且低于申请金额时下调理赔金额
     */
    ACTION approveclaim(const name& approver, const uint64_t& claim_id, const asset& payout);

    ACTION rejectclaim(const name& processor, const uint64_t& claim_id, const string& reason);

    /**
     * @notice 执行理赔支付，池余额不足时失败，可在充值后重试
     */
    ACTION payclaim(const name& executor, const uint64_t& claim_id);

    /**
     * @notice 违约补足：从组保险余额转入托管
     */
    ACTION cover(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& quantity);

    /**
     * @notice 管理员从储备金应急提取
     */
    ACTION emergencywd(const uint64_t& group_id, const name& to, const asset& quantity);

private:
    void _check_grant(const uint64_t& group_id, const uint64_t& cap);
    void _on_premium(const uint64_t& group_id, const asset& quantity);
    bool _is_approver(const name& account) const;

private:
    dbc                     _db;
    insure_global_singleton _global;
    insure_global_t         _gstate;
};

} // namespace hemat
