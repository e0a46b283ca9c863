#include "hematescrow.hpp"

#include <flon/flon.token.hpp>
#include <flon/utils.hpp>
#include <yield.adapter/yieldadapter.hpp>

using namespace hemat;
using namespace eosio;
using namespace flon;

asset hematescrow::_get_balance(const name& token_contract, const name& owner, const symbol& sym) {
    eosio::multi_index<"accounts"_n, flon::token::account> account_tbl(token_contract, owner.value);
    auto itr = account_tbl.find(sym.code().raw());
    return itr == account_tbl.end() ? asset(0, sym) : itr->balance;
}

void hematescrow::init(const name& admin, const name& registry, const name& stake_contract, const name& insure_contract,
                       const name& yield_adapter, const name& treasury, const extended_symbol& settle_token) {
    require_auth(get_self());
    CHECKC(is_account(admin), err::ACCOUNT_INVALID, "invalid admin");
    CHECKC(is_account(registry), err::ACCOUNT_INVALID, "invalid registry");
    CHECKC(is_account(stake_contract), err::ACCOUNT_INVALID, "invalid stake contract");
    CHECKC(is_account(insure_contract), err::ACCOUNT_INVALID, "invalid insure contract");
    CHECKC(is_account(treasury), err::ACCOUNT_INVALID, "invalid treasury");
    CHECKC(yield_adapter == name() || is_account(yield_adapter), err::ACCOUNT_INVALID, "invalid yield adapter");
    CHECKC(_gstate.deployed.amount == 0, err::INVALID_STATUS, "funds still deployed");

    const auto& sym             = settle_token.get_symbol();
    _gstate.admin               = admin;
    _gstate.registry            = registry;
    _gstate.stake_contract      = stake_contract;
    _gstate.insure_contract     = insure_contract;
    _gstate.yield_adapter       = yield_adapter;
    _gstate.treasury            = treasury;
    _gstate.settle_token        = settle_token;
    _gstate.deployed            = asset(0, sym);
    _gstate.total_harvested     = asset(_gstate.total_harvested.amount, sym);
}

void hematescrow::setconfig(const uint16_t& buffer_ratio_bps, const uint16_t& group_yield_bps, const name& treasury) {
    require_auth(_gstate.admin);
    CHECKC(buffer_ratio_bps <= RATIO_BOOST, err::PARAM_ERROR, "buffer ratio exceeds 100%");
    CHECKC(group_yield_bps <= RATIO_BOOST, err::PARAM_ERROR, "group yield share exceeds 100%");
    CHECKC(is_account(treasury), err::ACCOUNT_INVALID, "invalid treasury");

    _gstate.buffer_ratio_bps    = buffer_ratio_bps;
    _gstate.group_yield_bps     = group_yield_bps;
    _gstate.treasury            = treasury;
}

void hematescrow::setadapter(const name& adapter) {
    require_auth(_gstate.admin);
    CHECKC(adapter == name() || is_account(adapter), err::ACCOUNT_INVALID, "invalid yield adapter");
    CHECKC(_gstate.deployed.amount == 0, err::INVALID_STATUS, "funds still deployed in current adapter");
    _gstate.yield_adapter = adapter;
}

void hematescrow::opengroup(const uint64_t& group_id, const uint64_t& cap) {
    require_auth(_gstate.registry);

    escrow_grant_t grant(group_id);
    CHECKC(!_db.get(grant), err::RECORD_EXISTS, "group already opened: " + std::to_string(group_id));

    const auto now  = time_point_sec(current_time_point());
    grant.cap       = cap;
    grant.opened_at = now;
    _db.set(grant, get_self());

    const asset zero(0, _gstate.settle_token.get_symbol());
    balance_t bal(group_id);
    bal.principal = bal.yield_reserve = bal.pending_payouts = zero;
    bal.fees_collected = bal.penalties_collected = zero;
    bal.total_deposited = bal.total_withdrawn = bal.total_yield = zero;
    bal.updated_at = now;
    _db.set(bal, get_self());
}

void hematescrow::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    if (from == get_self() || to != get_self()) return;
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "invalid transfer amount");
    CHECKC(get_first_receiver() == _gstate.settle_token.get_contract(), err::CONTRACT_MISMATCH, "token contract mismatch");
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");

    if (memo == ADAPTER_RECALL_MEMO) {
        CHECKC(from == _gstate.yield_adapter, err::NO_AUTH, "recall must come from yield adapter");
        return _on_recall(quantity);
    }

    auto parts = split(memo, ":");
    CHECKC(parts.size() == 2 || parts.size() == 3, err::INVALID_FORMAT, "memo must be <type>:<group_id>[:<member>]");

    const string action     = parts[0];
    const uint64_t group_id = std::stoull(parts[1]);

    if (action == "harvest") {
        CHECKC(from == _gstate.yield_adapter, err::NO_AUTH, "harvest must come from yield adapter");
        return _on_harvest(group_id, quantity);
    }

    CHECKC(parts.size() == 3, err::INVALID_FORMAT, "memo must be <type>:<group_id>:<member>");
    if (action == "deposit") {
        CHECKC(from == _gstate.registry, err::NO_AUTH, "deposit must come from registry");
        return _on_deposit(group_id, quantity);
    }
    if (action == "slash") {
        CHECKC(from == _gstate.stake_contract, err::NO_AUTH, "slash must come from stake contract");
        return _on_deposit(group_id, quantity);
    }
    if (action == "cover") {
        CHECKC(from == _gstate.insure_contract, err::NO_AUTH, "cover must come from insure contract");
        return _on_deposit(group_id, quantity);
    }

    CHECKC(false, err::INVALID_FORMAT, "unsupported memo action: " + action);
}

void hematescrow::withdraw(const uint64_t& group_id, const uint64_t& cap, const name& to,
                           const asset& quantity, const string& memo) {
    _check_grant(group_id, cap);
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "withdraw amount must be positive");

    auto bal = _get_group_balance(group_id);
    CHECKC(bal.principal >= quantity, err::QUANTITY_INSUFFICIENT, "insufficient principal");

    bal.principal       -= quantity;
    bal.total_withdrawn += quantity;
    bal.updated_at       = time_point_sec(current_time_point());
    _db.set(bal, get_self());

    _pay_out(to, quantity, memo);
}

void hematescrow::payyield(const uint64_t& group_id, const uint64_t& cap, const name& to, const asset& quantity) {
    _check_grant(group_id, cap);
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "yield amount must be positive");

    auto bal = _get_group_balance(group_id);
    CHECKC(bal.yield_reserve >= quantity, err::QUANTITY_INSUFFICIENT, "insufficient yield reserve");

    bal.yield_reserve   -= quantity;
    bal.updated_at       = time_point_sec(current_time_point());
    _db.set(bal, get_self());

    _pay_out(to, quantity, "yield:" + std::to_string(group_id));
}

void hematescrow::penalize(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& quantity) {
    _check_grant(group_id, cap);
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "penalty must be positive");

    auto bal = _get_group_balance(group_id);
    CHECKC(bal.principal >= quantity, err::QUANTITY_INSUFFICIENT, "insufficient principal");

    bal.principal           -= quantity;
    bal.penalties_collected += quantity;
    bal.updated_at           = time_point_sec(current_time_point());
    _db.set(bal, get_self());

    _pay_out(_gstate.insure_contract, quantity, "premium:" + std::to_string(group_id) + ":" + member.to_string());
}

void hematescrow::commitpay(const uint64_t& group_id, const uint64_t& cap, const uint32_t& cycle,
                            const name& recipient, const asset& gross, const asset& fee) {
    _check_grant(group_id, cap);
    CHECKC(gross.symbol == _gstate.settle_token.get_symbol() && fee.symbol == gross.symbol,
           err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(gross.amount > 0, err::NOT_POSITIVE, "payout must be positive");
    CHECKC(fee.amount >= 0 && fee <= gross, err::PARAM_ERROR, "invalid fee");

    auto bal = _get_group_balance(group_id);
    CHECKC(bal.principal >= gross, err::QUANTITY_INSUFFICIENT, "insufficient principal");

    const asset net = gross - fee;
    bal.principal       -= gross;
    bal.pending_payouts += net;
    bal.fees_collected  += fee;
    bal.updated_at       = time_point_sec(current_time_point());
    _db.set(bal, get_self());

    pending_t::idx_t pendings(get_self(), group_id);
    auto itr = pendings.find(recipient.value);
    if (itr == pendings.end()) {
        pendings.emplace(get_self(), [&](auto& p) {
            p.owner  = recipient;
            p.amount = net;
        });
    } else {
        pendings.modify(itr, same_payer, [&](auto& p) {
            p.amount += net;
        });
    }

    if (fee.amount > 0)
        _pay_out(_gstate.treasury, fee, "fee:" + std::to_string(group_id) + ":" + std::to_string(cycle));
}

void hematescrow::release(const uint64_t& group_id, const uint64_t& cap, const name& recipient, const asset& quantity) {
    _check_grant(group_id, cap);
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "release amount must be positive");

    pending_t::idx_t pendings(get_self(), group_id);
    auto itr = pendings.find(recipient.value);
    CHECKC(itr != pendings.end(), err::RECORD_NOT_FOUND, "no pending payout for " + recipient.to_string());
    CHECKC(itr->amount >= quantity, err::QUANTITY_INSUFFICIENT, "insufficient pending payout");

    if (itr->amount == quantity) {
        pendings.erase(itr);
    } else {
        pendings.modify(itr, same_payer, [&](auto& p) {
            p.amount -= quantity;
        });
    }

    auto bal = _get_group_balance(group_id);
    bal.pending_payouts -= quantity;
    bal.total_withdrawn += quantity;
    bal.updated_at       = time_point_sec(current_time_point());
    _db.set(bal, get_self());

    _pay_out(recipient, quantity, "payout:" + std::to_string(group_id));
}

void hematescrow::harvest(const uint64_t& group_id) {
    escrow_grant_t grant(group_id);
    CHECKC(_db.get(grant), err::RECORD_NOT_FOUND, "group not opened: " + std::to_string(group_id));
    CHECKC(!grant.is_closed(), err::INVALID_STATUS, "group closed: " + std::to_string(group_id));
    CHECKC(_gstate.yield_adapter != name(), err::INVALID_STATUS, "no yield adapter configured");

    _gstate.last_harvest_at = time_point_sec(current_time_point());
    _gstate.last_apy_bps    = adapter_apy(_gstate.yield_adapter);

    // 适配器以 memo "harvest:<group_id>" 转回收益，无收益则无转账
    yieldadapter::harvest_action{
        _gstate.yield_adapter,
        { permission_level{ get_self(), active_perm } }
    }.send(get_self(), "harvest:" + std::to_string(group_id));
}

void hematescrow::closegroup(const uint64_t& group_id, const uint64_t& cap) {
    _check_grant(group_id, cap);

    escrow_grant_t grant(group_id);
    _db.get(grant);
    CHECKC(!grant.is_closed(), err::INVALID_STATUS, "group closed: " + std::to_string(group_id));
    grant.closed_at = time_point_sec(current_time_point());
    _db.set(grant, get_self());
}

// ==============================
// 内部逻辑实现
// ==============================

void hematescrow::_check_grant(const uint64_t& group_id, const uint64_t& cap) {
    require_auth(_gstate.registry);

    escrow_grant_t grant(group_id);
    CHECKC(_db.get(grant), err::RECORD_NOT_FOUND, "group not opened: " + std::to_string(group_id));
    CHECKC(grant.cap == cap, err::NO_AUTH, "capability mismatch");
}

balance_t hematescrow::_get_group_balance(const uint64_t& group_id) {
    balance_t bal(group_id);
    CHECKC(_db.get(bal), err::RECORD_NOT_FOUND, "balance not found: " + std::to_string(group_id));
    return bal;
}

void hematescrow::_on_deposit(const uint64_t& group_id, const asset& quantity) {
    auto bal = _get_group_balance(group_id);
    bal.principal       += quantity;
    bal.total_deposited += quantity;
    bal.updated_at       = time_point_sec(current_time_point());
    _db.set(bal, get_self());

    _sweep();
}

// 收益分配：group_yield_bps 归组，其余归保险池
void hematescrow::_on_harvest(const uint64_t& group_id, const asset& quantity) {
    auto bal = _get_group_balance(group_id);

    const asset group_share  = calc_bps(quantity, _gstate.group_yield_bps);
    const asset insure_share = quantity - group_share;

    bal.yield_reserve   += group_share;
    bal.total_yield     += group_share;
    bal.updated_at       = time_point_sec(current_time_point());
    _db.set(bal, get_self());

    _gstate.total_harvested += quantity;

    if (insure_share.amount > 0)
        TRANSFER(_gstate.settle_token.get_contract(), _gstate.insure_contract, insure_share,
                 "yield:" + std::to_string(group_id));
}

void hematescrow::_on_recall(const asset& quantity) {
    _gstate.deployed.amount = std::max<int64_t>(0, _gstate.deployed.amount - quantity.amount);
}

// 保留 buffer_ratio_bps 流动性，其余存入收益适配器
void hematescrow::_sweep() {
    if (_gstate.yield_adapter == name()) return;

    const auto& bank  = _gstate.settle_token.get_contract();
    const asset on_hand = _get_balance(bank, get_self(), _gstate.settle_token.get_symbol());
    const asset buffer  = calc_bps(on_hand + _gstate.deployed, _gstate.buffer_ratio_bps);
    const asset idle    = on_hand - buffer;
    if (idle.amount <= 0) return;

    _gstate.deployed += idle;
    TRANSFER(bank, _gstate.yield_adapter, idle, string(ADAPTER_DEPOSIT_MEMO));
}

// 流动性不足时先从适配器赎回差额，赎回的 inline 转账先于出款执行
void hematescrow::_pay_out(const name& to, const asset& quantity, const string& memo) {
    const auto& bank  = _gstate.settle_token.get_contract();
    const asset on_hand = _get_balance(bank, get_self(), quantity.symbol);

    if (on_hand < quantity) {
        const asset shortfall = quantity - on_hand;
        CHECKC(_gstate.yield_adapter != name() && _gstate.deployed >= shortfall,
               err::QUANTITY_INSUFFICIENT, "insufficient liquidity");
        CHECKC(adapter_balance(_gstate.yield_adapter, get_self(), quantity.symbol) >= shortfall,
               err::QUANTITY_INSUFFICIENT, "adapter balance insufficient");

        yieldadapter::withdraw_action{
            _gstate.yield_adapter,
            { permission_level{ get_self(), active_perm } }
        }.send(get_self(), shortfall);
    }

    TRANSFER(bank, to, quantity, memo);
}
