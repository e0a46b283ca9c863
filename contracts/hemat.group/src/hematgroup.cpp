#include "hematgroup.hpp"

#include <eosio/crypto.hpp>
#include <flon/flon.token.hpp>
#include <flon/utils.hpp>

#include <algorithm>

namespace hemat {

void hematgroup::init(const name& admin, const name& escrow_contract, const name& stake_contract,
                      const name& insure_contract, const extended_symbol& settle_token) {
    require_auth(get_self());
    CHECKC(is_account(admin), err::ACCOUNT_INVALID, "invalid admin");
    CHECKC(is_account(escrow_contract), err::ACCOUNT_INVALID, "invalid escrow contract");
    CHECKC(is_account(stake_contract), err::ACCOUNT_INVALID, "invalid stake contract");
    CHECKC(is_account(insure_contract), err::ACCOUNT_INVALID, "invalid insure contract");

    const auto& sym             = settle_token.get_symbol();
    _gstate.admin               = admin;
    _gstate.escrow_contract     = escrow_contract;
    _gstate.stake_contract      = stake_contract;
    _gstate.insure_contract     = insure_contract;
    _gstate.settle_token        = settle_token;
    _gstate.min_contribution    = asset(_gstate.min_contribution.amount, sym);
    _gstate.max_contribution    = asset(_gstate.max_contribution.amount, sym);
}

void hematgroup::setconfig(const uint16_t& min_group_size, const uint16_t& max_group_size,
                           const asset& min_contribution, const asset& max_contribution,
                           const uint16_t& max_groups_per_creator) {
    require_auth(_gstate.admin);
    const auto& sym = _gstate.settle_token.get_symbol();
    CHECKC(min_group_size >= MIN_GROUP_SIZE, err::PARAM_ERROR, "min group size must be at least 3");
    CHECKC(max_group_size >= min_group_size, err::PARAM_ERROR, "max group size below min group size");
    CHECKC(min_contribution.symbol == sym && max_contribution.symbol == sym, err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(min_contribution.amount > 0, err::NOT_POSITIVE, "min contribution must be positive");
    CHECKC(max_contribution >= min_contribution, err::PARAM_ERROR, "max contribution below min contribution");
    CHECKC(max_groups_per_creator > 0, err::PARAM_ERROR, "max groups per creator must be positive");

    _gstate.min_group_size          = min_group_size;
    _gstate.max_group_size          = max_group_size;
    _gstate.min_contribution        = min_contribution;
    _gstate.max_contribution        = max_contribution;
    _gstate.max_groups_per_creator  = max_groups_per_creator;
}

void hematgroup::creategroup(const name& creator, const group_conf_s& conf) {
    require_auth(creator);
    _validate_conf(conf);

    // === 1. 创建者未结束的组数量 ===
    group_t::idx_t groups(get_self(), get_self().value);
    auto creator_idx = groups.get_index<"creatoridx"_n>();
    uint16_t open_groups = 0;
    for (auto itr = creator_idx.lower_bound(creator.value);
         itr != creator_idx.end() && itr->creator == creator; ++itr) {
        if (!itr->is_terminal()) open_groups++;
    }
    CHECKC(open_groups < _gstate.max_groups_per_creator, err::CAP_EXCEEDED, "too many open groups for creator");

    // === 2. 新建组 ===
    const auto now  = time_point_sec(current_time_point());
    const auto& sym = _gstate.settle_token.get_symbol();

    group_t group(++_gstate.last_group_id);
    group.creator           = creator;
    group.conf              = conf;
    group.status            = GroupStatus::CREATED;
    group.cap               = _mint_cap(group.id, creator);
    group.cycle_collected   = asset(0, sym);
    group.matured_yield     = asset(0, sym);
    group.matured_total     = asset(0, sym);
    group.matured_paid      = asset(0, sym);
    group.created_at        = now;
    group.updated_at        = now;
    _db.set(group, get_self());

    // === 3. 各账本开户 ===
    hematstake::opengroup_action{
        _gstate.stake_contract,
        { permission_level{ get_self(), active_perm } }
    }.send(group.id, group.cap);

    hematescrow::opengroup_action{
        _gstate.escrow_contract,
        { permission_level{ get_self(), active_perm } }
    }.send(group.id, group.cap);

    hematinsure::opengroup_action{
        _gstate.insure_contract,
        { permission_level{ get_self(), active_perm } }
    }.send(group.id, group.cap, conf.model == GroupModel::EMERGENCY);
}

void hematgroup::join(const name& member, const uint64_t& group_id) {
    require_auth(member);

    auto group = _get_group(group_id);
    _lock(group);
    CHECKC(group.conf.stake_required.amount == 0, err::PARAM_ERROR,
           "stake required, join by transfer with memo join:" + std::to_string(group_id));

    _join(member, group, asset(0, group.conf.contribution.symbol));
    _unlock(group);
}

void hematgroup::leave(const name& member, const uint64_t& group_id) {
    require_auth(member);

    auto group = _get_group(group_id);
    _lock(group);
    CHECKC(group.status == GroupStatus::CREATED, err::INVALID_STATUS, "can only leave before activation");

    auto itr = std::find(group.members.begin(), group.members.end(), member);
    CHECKC(itr != group.members.end(), err::RECORD_NOT_FOUND, "not a member: " + member.to_string());
    group.members.erase(itr);

    auto m = _get_member(group_id, member);
    const asset stake = m.stake_amount;
    m.is_active             = false;
    m.stake_amount.amount   = 0;
    _save_member(group_id, m);

    if (stake.amount > 0) {
        hematstake::refund_action{
            _gstate.stake_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group_id, group.cap, member);
    }

    _unlock(group);
}

void hematgroup::setorder(const name& creator, const uint64_t& group_id, const vector<name>& order) {
    require_auth(creator);

    auto group = _get_group(group_id);
    CHECKC(creator == group.creator, err::NO_AUTH, "only creator can set payout order");
    _lock(group);
    CHECKC(group.status == GroupStatus::CREATED, err::INVALID_STATUS, "payout order is fixed after activation");
    CHECKC(group.conf.model == GroupModel::ROTATIONAL, err::PARAM_ERROR, "payout order only applies to rotational groups");
    CHECKC(!group.order_set, err::RECORD_EXISTS, "payout order already set");
    CHECKC(!order.empty() && order.size() <= group.members.size(), err::PARAM_ERROR, "invalid order size");

    vector<name> reordered;
    for (const auto& m : order) {
        CHECKC(std::find(group.members.begin(), group.members.end(), m) != group.members.end(),
               err::RECORD_NOT_FOUND, "not a member: " + m.to_string());
        CHECKC(std::find(reordered.begin(), reordered.end(), m) == reordered.end(),
               err::PARAM_ERROR, "duplicate member: " + m.to_string());
        reordered.push_back(m);
    }
    for (const auto& m : group.members) {
        if (std::find(reordered.begin(), reordered.end(), m) == reordered.end())
            reordered.push_back(m);
    }

    group.members   = reordered;
    group.order_set = true;
    _unlock(group);
}

// 入组质押 / 缴款
void hematgroup::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    if (from == get_self() || to != get_self()) return;
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "invalid transfer amount");
    CHECKC(get_first_receiver() == _gstate.settle_token.get_contract(), err::CONTRACT_MISMATCH, "token contract mismatch");
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");

    // memo: join:<group_id> | contribute:<group_id>
    auto parts = split(memo, ":");
    CHECKC(parts.size() == 2, err::INVALID_FORMAT, "memo must be <type>:<group_id>");

    const string action     = parts[0];
    const uint64_t group_id = std::stoull(parts[1]);

    auto group = _get_group(group_id);
    _lock(group);

    if (action == "join") {
        _join(from, group, quantity);
    } else if (action == "contribute") {
        _contribute(from, group, quantity);
    } else {
        CHECKC(false, err::INVALID_FORMAT, "unsupported memo action: " + action);
    }

    _unlock(group);
}

void hematgroup::enforce(const name& caller, const uint64_t& group_id, const name& member) {
    require_auth(caller);

    auto group = _get_group(group_id);
    _lock(group);
    CHECKC(group.status == GroupStatus::ACTIVE, err::INVALID_STATUS, "group not active");

    const uint32_t now = current_time_point().sec_since_epoch();
    CHECKC(now > _window_end(group), err::NOT_EXPIRED, "contribution window still open");
    if (group.conf.model != GroupModel::ROTATIONAL) {
        CHECKC(group.cycle_start_time.sec_since_epoch() + group.conf.cycle_interval <= group.maturity_time.sec_since_epoch(),
               err::INVALID_STATUS, "no contribution due after maturity");
    }

    auto m = _get_member(group_id, member);
    CHECKC(!_has_record(group, member), err::RECORD_EXISTS, "contribution already recorded");

    // === 1. 罚没质押（与 hemat.stake 同一公式），欠缴额按扣除保费后的净额计 ===
    const auto sconf        = _stake_conf();
    const asset missed      = _net_contribution(group);
    asset stake(0, missed.symbol);
    stake_t::idx_t stakes(_gstate.stake_contract, group_id);
    auto sitr = stakes.find(member.value);
    if (sitr != stakes.end()) stake = sitr->amount;

    const asset slashed = calc_slash_amount(stake, missed, sconf.stake_penalty_bps);
    hematstake::slash_action{
        _gstate.stake_contract,
        { permission_level{ get_self(), active_perm } }
    }.send(group_id, group.cap, member, missed);

    // === 2. 保险补足 ===
    const asset shortfall = missed - slashed;
    bool covered = false;
    if (group.conf.insurance_enabled && shortfall.amount > 0) {
        pool_t::idx_t pools(_gstate.insure_contract, _gstate.insure_contract.value);
        auto pitr = pools.find(group_id);
        if (pitr != pools.end() && pitr->balance >= shortfall) {
            hematinsure::cover_action{
                _gstate.insure_contract,
                { permission_level{ get_self(), active_perm } }
            }.send(group_id, group.cap, member, shortfall);
            covered = true;
        }
    }

    const asset escrowed = covered ? missed : slashed;
    contribution_t::idx_t contribs(get_self(), group_id);
    contribs.emplace(get_self(), [&](auto& c) {
        c.id            = contribs.available_primary_key();
        c.cycle         = group.current_cycle;
        c.member        = member;
        c.amount        = escrowed;
        c.status        = covered ? ContribStatus::COVERED : ContribStatus::DEFAULTED;
        c.created_at    = time_point_sec(now);
    });

    m.total_contributed += escrowed;
    m.stake_amount      -= slashed;
    m.default_count     += 1;
    m.trust_score        = trust_after_slash(sconf, _trust_of(member, sconf));
    _save_member(group_id, m);

    group.cycle_collected += escrowed;
    if (_cycle_settled(group)) _settle_cycle(group);

    _unlock(group);
}

void hematgroup::claimpayout(const name& member, const uint64_t& group_id, const uint32_t& cycle) {
    require_auth(member);

    auto group = _get_group(group_id);
    _lock(group);

    payout_t::idx_t payouts(get_self(), group_id);
    auto itr = payouts.find(cycle);
    CHECKC(itr != payouts.end(), err::RECORD_NOT_FOUND, "payout not found for cycle " + std::to_string(cycle));
    CHECKC(itr->recipient == member, err::NO_AUTH, "not the payout recipient");
    CHECKC(!itr->executed, err::RECORD_EXISTS, "payout already claimed");

    const asset amount = itr->amount;
    payouts.modify(itr, same_payer, [&](auto& p) {
        p.executed      = true;
        p.executed_at   = time_point_sec(current_time_point());
    });

    member_t::idx_t members(get_self(), group_id);
    auto mitr = members.find(member.value);
    CHECKC(mitr != members.end(), err::RECORD_NOT_FOUND, "member not found: " + member.to_string());
    members.modify(mitr, same_payer, [&](auto& m) {
        m.total_received += amount;
    });

    hematescrow::release_action{
        _gstate.escrow_contract,
        { permission_level{ get_self(), active_perm } }
    }.send(group_id, group.cap, member, amount);

    _unlock(group);
}

void hematgroup::withdraw(const name& member, const uint64_t& group_id) {
    require_auth(member);

    auto group = _get_group(group_id);
    _lock(group);
    CHECKC(group.conf.model != GroupModel::ROTATIONAL, err::PARAM_ERROR, "rotational groups pay out by cycle");
    CHECKC(group.status == GroupStatus::ACTIVE, err::INVALID_STATUS, "group not active");

    const auto now = time_point_sec(current_time_point());
    CHECKC(now >= group.maturity_time, err::NOT_EXPIRED, "group not matured");

    auto m = _get_member(group_id, member);
    const auto bal = _escrow_balance(group_id);

    // === 1. 首次到期提取：快照收益与缴款总额 ===
    member_t::idx_t members(get_self(), group_id);
    if (group.matured_at == time_point_sec()) {
        asset total(0, m.total_contributed.symbol);
        for (const auto& owner : group.members) {
            auto itr = members.find(owner.value);
            if (itr != members.end() && itr->in_play()) total += itr->total_contributed;
        }
        group.matured_at    = now;
        group.matured_yield = bal.yield_reserve;
        group.matured_total = total;
    }

    uint16_t remaining = 0;
    for (const auto& owner : group.members) {
        auto itr = members.find(owner.value);
        if (itr != members.end() && itr->in_play()) remaining++;
    }

    // === 2. 收益份额，最后一人取剩余 ===
    asset slice(0, bal.yield_reserve.symbol);
    if (remaining == 1) {
        slice = bal.yield_reserve;
    } else if (group.matured_total.amount > 0) {
        slice.amount = (int64_t)((__int128)group.matured_yield.amount * m.total_contributed.amount / group.matured_total.amount);
    }

    const asset principal = m.total_contributed - m.total_received;
    if (principal.amount > 0) {
        hematescrow::withdraw_action{
            _gstate.escrow_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group_id, group.cap, member, principal, "matured:" + std::to_string(group_id));
    }
    if (slice.amount > 0) {
        hematescrow::payyield_action{
            _gstate.escrow_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group_id, group.cap, member, slice);
    }
    if (m.stake_amount.amount > 0) {
        hematstake::refund_action{
            _gstate.stake_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group_id, group.cap, member);
    }

    m.has_withdrawn         = true;
    m.total_received       += principal;
    m.yield_received       += slice;
    m.stake_amount.amount   = 0;
    _save_member(group_id, m);

    group.matured_paid += slice;
    if (remaining == 1) _complete(group);

    _unlock(group);
}

void hematgroup::earlywd(const name& member, const uint64_t& group_id) {
    require_auth(member);

    auto group = _get_group(group_id);
    _lock(group);
    CHECKC(group.conf.model == GroupModel::FIXED_SAVINGS, err::PARAM_ERROR, "early withdrawal only for fixed savings groups");
    CHECKC(group.status == GroupStatus::ACTIVE, err::INVALID_STATUS, "group not active");
    CHECKC(time_point_sec(current_time_point()) < group.maturity_time, err::EXPIRED, "group matured, use withdraw");

    auto m = _get_member(group_id, member);
    const asset principal   = m.total_contributed - m.total_received;
    const asset penalty     = calc_bps(principal, group.conf.early_withdraw_penalty_bps);
    const asset payout      = principal - penalty;

    if (payout.amount > 0) {
        hematescrow::withdraw_action{
            _gstate.escrow_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group_id, group.cap, member, payout, "early:" + std::to_string(group_id));
    }
    if (penalty.amount > 0) {
        hematescrow::penalize_action{
            _gstate.escrow_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group_id, group.cap, member, penalty);
    }
    if (m.stake_amount.amount > 0) {
        hematstake::refund_action{
            _gstate.stake_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group_id, group.cap, member);
    }

    m.is_active             = false;
    m.has_withdrawn         = true;
    m.total_received       += payout;
    m.stake_amount.amount   = 0;
    _save_member(group_id, m);

    // 剩余成员继续；全部退出则结束
    bool any_left = false;
    member_t::idx_t members(get_self(), group_id);
    for (const auto& owner : group.members) {
        auto itr = members.find(owner.value);
        if (itr != members.end() && itr->in_play()) { any_left = true; break; }
    }

    if (!any_left) {
        _complete(group);
    } else if (_cycle_settled(group)) {
        _settle_cycle(group);
    }

    _unlock(group);
}

void hematgroup::pause(const name& actor, const uint64_t& group_id) {
    require_auth(actor);

    auto group = _get_group(group_id);
    CHECKC(actor == _gstate.admin || actor == group.creator, err::NO_AUTH, "only admin or creator can pause");
    _lock(group);
    CHECKC(group.status == GroupStatus::ACTIVE, err::INVALID_STATUS, "group not active");

    group.status    = GroupStatus::PAUSED;
    group.paused_at = time_point_sec(current_time_point());
    _unlock(group);
}

void hematgroup::resume(const name& actor, const uint64_t& group_id) {
    require_auth(actor);

    auto group = _get_group(group_id);
    CHECKC(actor == _gstate.admin || actor == group.creator, err::NO_AUTH, "only admin or creator can resume");
    _lock(group);
    CHECKC(group.status == GroupStatus::PAUSED, err::INVALID_STATUS, "group not paused");

    // 暂停期间不计入锁定期，当期缴款窗口自恢复时重新开始
    const auto now = time_point_sec(current_time_point());
    if (group.conf.model != GroupModel::ROTATIONAL)
        group.maturity_time = time_point_sec(group.maturity_time.sec_since_epoch()
                                             + (now.sec_since_epoch() - group.paused_at.sec_since_epoch()));
    group.status            = GroupStatus::ACTIVE;
    group.cycle_start_time  = now;
    _unlock(group);
}

void hematgroup::cancel(const name& creator, const uint64_t& group_id) {
    require_auth(creator);

    auto group = _get_group(group_id);
    CHECKC(creator == group.creator, err::NO_AUTH, "only creator can cancel");
    _lock(group);
    CHECKC(!group.is_terminal(), err::INVALID_STATUS, "group already finalized");

    // === 1. 按净缴款比例退还剩余本金，最后一人取余数 ===
    // 净缴款扣除未领取的轮转出款，待领取部分取消后仍可领取
    const auto bal  = _escrow_balance(group_id);
    const auto& sym = bal.principal.symbol;
    member_t::idx_t members(get_self(), group_id);

    std::map<name, int64_t> unclaimed;
    payout_t::idx_t payouts(get_self(), group_id);
    for (auto pitr = payouts.begin(); pitr != payouts.end(); pitr++) {
        if (!pitr->executed) unclaimed[pitr->recipient] += pitr->amount.amount;
    }
    auto net_of = [&](const member_t& m) {
        asset net = m.total_contributed - m.total_received;
        auto uitr = unclaimed.find(m.owner);
        if (uitr != unclaimed.end()) net.amount -= uitr->second;
        return net;
    };

    asset total_net(0, sym);
    uint16_t eligible = 0;
    for (const auto& owner : group.members) {
        auto itr = members.find(owner.value);
        if (itr == members.end() || !itr->in_play()) continue;
        const asset net = net_of(*itr);
        if (net.amount <= 0) continue;
        eligible++;
        total_net += net;
    }

    const bool refund   = bal.principal.amount > 0 && total_net.amount > 0;
    int64_t distributed = 0;
    uint16_t seen       = 0;
    for (const auto& owner : group.members) {
        auto itr = members.find(owner.value);
        if (itr == members.end()) continue;

        asset share(0, sym);
        const asset net = net_of(*itr);
        if (refund && itr->in_play() && net.amount > 0) {
            seen++;
            share.amount = (seen < eligible)
                ? (int64_t)((__int128)bal.principal.amount * net.amount / total_net.amount)
                : (bal.principal.amount - distributed);
            distributed += share.amount;
        }

        if (share.amount > 0) {
            hematescrow::withdraw_action{
                _gstate.escrow_contract,
                { permission_level{ get_self(), active_perm } }
            }.send(group_id, group.cap, owner, share, "cancel:" + std::to_string(group_id));
        }

        members.modify(itr, same_payer, [&](auto& m) {
            m.total_received       += share;
            m.stake_amount.amount   = 0;
        });
    }

    // === 2. 分配收益储备，释放全部质押，关闭托管 ===
    _distribute_reserve(group);
    hematstake::releaseall_action{
        _gstate.stake_contract,
        { permission_level{ get_self(), active_perm } }
    }.send(group_id, group.cap);
    _close_escrow(group);

    group.status = GroupStatus::CANCELLED;
    _unlock(group);
}

void hematgroup::releaseguard(const uint64_t& group_id) {
    require_auth(get_self());

    auto group = _get_group(group_id);
    group.guard = false;
    _db.set(group, get_self());
}

// ==============================
// 内部逻辑实现
// ==============================

group_t hematgroup::_get_group(const uint64_t& group_id) {
    group_t group(group_id);
    CHECKC(_db.get(group), err::RECORD_NOT_FOUND, "group not found: " + std::to_string(group_id));
    return group;
}

member_t hematgroup::_get_member(const uint64_t& group_id, const name& owner) {
    member_t::idx_t members(get_self(), group_id);
    auto itr = members.find(owner.value);
    CHECKC(itr != members.end(), err::RECORD_NOT_FOUND, "member not found: " + owner.to_string());
    CHECKC(itr->in_play(), err::INVALID_STATUS, "member not active: " + owner.to_string());
    return *itr;
}

void hematgroup::_save_member(const uint64_t& group_id, const member_t& member) {
    member_t::idx_t members(get_self(), group_id);
    auto itr = members.find(member.owner.value);
    if (itr == members.end()) {
        members.emplace(get_self(), [&](auto& m) { m = member; });
    } else {
        members.modify(itr, same_payer, [&](auto& m) { m = member; });
    }
}

// 组锁：释放动作必须是本次调用发出的最后一个 inline action
void hematgroup::_lock(group_t& group) {
    CHECKC(!group.guard, err::GUARD_LOCKED, "reentrant call");
    group.guard = true;
    _db.set(group, get_self());
}

void hematgroup::_unlock(const group_t& group) {
    auto g = group;
    g.updated_at = time_point_sec(current_time_point());
    _db.set(g, get_self());

    releaseguard_action{
        get_self(),
        { permission_level{ get_self(), active_perm } }
    }.send(group.id);
}

void hematgroup::_validate_conf(const group_conf_s& conf) {
    const auto& sym = _gstate.settle_token.get_symbol();
    CHECKC(conf.model == GroupModel::ROTATIONAL || conf.model == GroupModel::FIXED_SAVINGS ||
           conf.model == GroupModel::EMERGENCY, err::PARAM_ERROR, "invalid group model: " + conf.model.to_string());

    CHECKC(conf.contribution.symbol == sym, err::SYMBOL_MISMATCH, "contribution symbol mismatch");
    CHECKC(conf.contribution.amount > 0, err::NOT_POSITIVE, "contribution must be positive");
    CHECKC(conf.contribution >= _gstate.min_contribution && conf.contribution <= _gstate.max_contribution,
           err::PARAM_ERROR, "contribution out of range");
    CHECKC(conf.stake_required.symbol == sym, err::SYMBOL_MISMATCH, "stake symbol mismatch");
    CHECKC(conf.stake_required.amount >= 0, err::NOT_POSITIVE, "stake must not be negative");

    CHECKC(conf.cycle_interval > 0, err::PARAM_ERROR, "cycle interval must be positive");
    CHECKC(conf.group_size >= std::max(_gstate.min_group_size, MIN_GROUP_SIZE) && conf.group_size <= _gstate.max_group_size,
           err::PARAM_ERROR, "group size out of range");
    if (conf.model != GroupModel::ROTATIONAL)
        CHECKC(conf.lock_duration >= conf.cycle_interval, err::PARAM_ERROR, "lock duration shorter than one cycle");

    CHECKC(conf.insurance_bps <= RATIO_BOOST && conf.platform_fee_bps <= RATIO_BOOST &&
           conf.early_withdraw_penalty_bps <= RATIO_BOOST, err::PARAM_ERROR, "bps exceeds 100%");
    CHECKC(conf.insurance_enabled || conf.insurance_bps == 0, err::PARAM_ERROR, "insurance premium set but insurance disabled");
}

// 组授权句柄：sha256(group_id, creator, 创建时间) 前 8 字节
uint64_t hematgroup::_mint_cap(const uint64_t& group_id, const name& creator) {
    const uint64_t seed[3] = { group_id, creator.value, current_time_point().sec_since_epoch() };
    const auto hash  = sha256(reinterpret_cast<const char*>(seed), sizeof(seed));
    const auto bytes = hash.extract_as_byte_array();

    uint64_t cap = 0;
    for (int i = 0; i < 8; i++) cap = (cap << 8) | bytes[i];
    return cap;
}

void hematgroup::_join(const name& member, group_t& group, const asset& stake) {
    CHECKC(group.status == GroupStatus::CREATED, err::INVALID_STATUS, "group not open for joining");
    CHECKC(stake == group.conf.stake_required, err::PARAM_ERROR, "stake must equal " + group.conf.stake_required.to_string());
    CHECKC(group.members.size() < group.conf.group_size, err::GROUP_FULL, "group is full");
    CHECKC(std::find(group.members.begin(), group.members.end(), member) == group.members.end(),
           err::RECORD_EXISTS, "already a member: " + member.to_string());

    // === 全平台黑名单与信誉快照 ===
    const auto sconf = _stake_conf();
    reputation_t::idx_t reps(_gstate.stake_contract, _gstate.stake_contract.value);
    auto ritr = reps.find(member.value);
    CHECKC(ritr == reps.end() || !ritr->blacklisted, err::BLACKLISTED, "member is blacklisted: " + member.to_string());

    if (stake.amount > 0) {
        TRANSFER(_gstate.settle_token.get_contract(), _gstate.stake_contract, stake,
                 "stake:" + std::to_string(group.id) + ":" + member.to_string());
    } else {
        hematstake::enroll_action{
            _gstate.stake_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group.id, group.cap, member);
    }

    const auto now  = time_point_sec(current_time_point());
    const auto& sym = group.conf.contribution.symbol;
    member_t::idx_t members(get_self(), group.id);
    auto mitr = members.find(member.value);

    member_t m(member);
    if (mitr != members.end()) {
        m = *mitr;                              // 退出后重新入组，保留历史
    } else {
        m.total_contributed = asset(0, sym);
        m.total_received    = asset(0, sym);
        m.yield_received    = asset(0, sym);
    }
    m.stake_amount  = stake;
    m.trust_score   = _trust_of(member, sconf);
    m.joined_at     = now;
    m.is_active     = true;
    _save_member(group.id, m);

    group.members.push_back(member);
    if (group.members.size() == group.conf.group_size) _activate(group);
}

void hematgroup::_activate(group_t& group) {
    const auto now = time_point_sec(current_time_point());
    group.status            = GroupStatus::ACTIVE;
    group.activated_at      = now;
    group.current_cycle     = 1;
    group.cycle_start_time  = now;
    group.cycle_collected   = asset(0, group.conf.contribution.symbol);
    group.next_payout_index = 0;
    if (group.conf.model != GroupModel::ROTATIONAL)
        group.maturity_time = time_point_sec(now.sec_since_epoch() + group.conf.lock_duration);
}

void hematgroup::_contribute(const name& member, group_t& group, const asset& quantity) {
    CHECKC(group.status == GroupStatus::ACTIVE, err::INVALID_STATUS, "group not active");
    auto m = _get_member(group.id, member);
    CHECKC(quantity == group.conf.contribution, err::PARAM_ERROR, "contribution must equal " + group.conf.contribution.to_string());

    const uint32_t now = current_time_point().sec_since_epoch();
    CHECKC(now <= _window_end(group), err::EXPIRED, "contribution window closed");
    if (group.conf.model != GroupModel::ROTATIONAL)
        CHECKC(now < group.maturity_time.sec_since_epoch(), err::EXPIRED, "group has matured");
    CHECKC(!_has_record(group, member), err::RECORD_EXISTS, "already contributed this cycle");

    // === 1. 保费转入保险，其余转入托管 ===
    const auto& bank    = _gstate.settle_token.get_contract();
    const string suffix = std::to_string(group.id) + ":" + member.to_string();
    const asset net     = _net_contribution(group);
    const asset premium = quantity - net;

    if (premium.amount > 0)
        TRANSFER(bank, _gstate.insure_contract, premium, "premium:" + suffix);
    if (net.amount > 0)
        TRANSFER(bank, _gstate.escrow_contract, net, "deposit:" + suffix);

    // === 2. 记录缴款 ===
    contribution_t::idx_t contribs(get_self(), group.id);
    contribs.emplace(get_self(), [&](auto& c) {
        c.id            = contribs.available_primary_key();
        c.cycle         = group.current_cycle;
        c.member        = member;
        c.amount        = net;
        c.status        = ContribStatus::PAID;
        c.created_at    = time_point_sec(now);
    });

    const auto sconf = _stake_conf();
    m.total_contributed += net;
    m.paid_count        += 1;
    m.trust_score        = trust_after_reward(sconf, _trust_of(member, sconf));
    _save_member(group.id, m);

    hematstake::reward_action{
        _gstate.stake_contract,
        { permission_level{ get_self(), active_perm } }
    }.send(group.id, group.cap, member);

    group.cycle_collected += net;
    if (_cycle_settled(group)) _settle_cycle(group);
}

bool hematgroup::_has_record(const group_t& group, const name& member) {
    contribution_t::idx_t contribs(get_self(), group.id);
    auto idx = contribs.get_index<"cyclemember"_n>();
    return idx.find(contribution_t::make_key(group.current_cycle, member)) != idx.end();
}

// 当期所有在组成员均有缴款记录（缴款、违约或补足）
bool hematgroup::_cycle_settled(const group_t& group) {
    member_t::idx_t members(get_self(), group.id);
    bool any = false;
    for (const auto& owner : group.members) {
        auto itr = members.find(owner.value);
        if (itr == members.end() || !itr->in_play()) continue;
        any = true;
        if (!_has_record(group, owner)) return false;
    }
    return any;
}

void hematgroup::_settle_cycle(group_t& group) {
    if (group.conf.model == GroupModel::ROTATIONAL) {
        CHECKC(group.next_payout_index < group.members.size(), err::INVALID_STATUS, "payout order exhausted");

        const name recipient    = group.members[group.next_payout_index];
        const asset gross       = group.cycle_collected;
        const asset fee         = calc_bps(gross, group.conf.platform_fee_bps);
        const asset amount      = gross - fee;
        const auto now          = time_point_sec(current_time_point());

        if (gross.amount > 0) {
            hematescrow::commitpay_action{
                _gstate.escrow_contract,
                { permission_level{ get_self(), active_perm } }
            }.send(group.id, group.cap, group.current_cycle, recipient, gross, fee);
        }

        payout_t::idx_t payouts(get_self(), group.id);
        payouts.emplace(get_self(), [&](auto& p) {
            p.cycle         = group.current_cycle;
            p.recipient     = recipient;
            p.gross         = gross;
            p.fee           = fee;
            p.amount        = amount;
            p.executed      = amount.amount == 0;
            p.created_at    = now;
            if (p.executed) p.executed_at = now;
        });

        member_t::idx_t members(get_self(), group.id);
        auto mitr = members.find(recipient.value);
        CHECKC(mitr != members.end(), err::RECORD_NOT_FOUND, "recipient not found: " + recipient.to_string());
        members.modify(mitr, same_payer, [&](auto& m) {
            m.has_received_payout = true;
        });

        group.next_payout_index++;
        if (group.next_payout_index >= group.members.size())
            return _complete(group);
    }

    _advance_cycle(group);
}

void hematgroup::_advance_cycle(group_t& group) {
    group.current_cycle    += 1;
    group.cycle_start_time  = time_point_sec(current_time_point());
    group.cycle_collected   = asset(0, group.conf.contribution.symbol);
}

// 到期提取已结清收益储备；其余结束路径（轮转完成、全员提前退出）在此分配
void hematgroup::_complete(group_t& group) {
    group.status = GroupStatus::COMPLETED;
    if (group.matured_at == time_point_sec())
        _distribute_reserve(group);

    if (group.conf.model == GroupModel::ROTATIONAL) {
        hematstake::releaseall_action{
            _gstate.stake_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group.id, group.cap);
    }
    _close_escrow(group);
}

void hematgroup::_close_escrow(const group_t& group) {
    hematescrow::closegroup_action{
        _gstate.escrow_contract,
        { permission_level{ get_self(), active_perm } }
    }.send(group.id, group.cap);
}

// 按缴款比例分配收益储备，最后一人取余数
// 仅在组成员参与分配；全员已退出时所有成员按缴款参与
void hematgroup::_distribute_reserve(const group_t& group) {
    const auto bal = _escrow_balance(group.id);
    if (bal.yield_reserve.amount <= 0) return;

    member_t::idx_t members(get_self(), group.id);
    bool any_in_play = false;
    for (const auto& owner : group.members) {
        auto itr = members.find(owner.value);
        if (itr != members.end() && itr->in_play()) { any_in_play = true; break; }
    }

    std::vector<name> eligible;
    asset total(0, bal.yield_reserve.symbol);
    for (const auto& owner : group.members) {
        auto itr = members.find(owner.value);
        if (itr == members.end() || itr->total_contributed.amount <= 0) continue;
        if (any_in_play && !itr->in_play()) continue;
        eligible.push_back(owner);
        total += itr->total_contributed;
    }
    if (eligible.empty()) return;

    int64_t distributed = 0;
    for (size_t i = 0; i < eligible.size(); i++) {
        auto itr = members.find(eligible[i].value);

        const int64_t share_amt = (i + 1 < eligible.size())
            ? (int64_t)((__int128)bal.yield_reserve.amount * itr->total_contributed.amount / total.amount)
            : (bal.yield_reserve.amount - distributed);
        if (share_amt <= 0) continue;

        distributed += share_amt;
        const asset share(share_amt, bal.yield_reserve.symbol);
        members.modify(itr, same_payer, [&](auto& m) {
            m.yield_received += share;
        });

        hematescrow::payyield_action{
            _gstate.escrow_contract,
            { permission_level{ get_self(), active_perm } }
        }.send(group.id, group.cap, itr->owner, share);
    }
}

// 每期缴款扣除保费后进入托管的金额
asset hematgroup::_net_contribution(const group_t& group) const {
    const asset& contribution = group.conf.contribution;
    if (!group.conf.insurance_enabled) return contribution;
    return contribution - calc_bps(contribution, group.conf.insurance_bps);
}

uint32_t hematgroup::_window_end(const group_t& group) const {
    return group.cycle_start_time.sec_since_epoch() + group.conf.cycle_interval + group.conf.grace_period;
}

uint32_t hematgroup::_trust_of(const name& member, const stake_global_t& conf) {
    reputation_t::idx_t reps(_gstate.stake_contract, _gstate.stake_contract.value);
    auto itr = reps.find(member.value);
    return itr == reps.end() ? conf.initial_trust : itr->trust_score;
}

stake_global_t hematgroup::_stake_conf() {
    stake_global_singleton stake_global(_gstate.stake_contract, _gstate.stake_contract.value);
    return stake_global.get_or_default(stake_global_t{});
}

balance_t hematgroup::_escrow_balance(const uint64_t& group_id) {
    balance_t::idx_t balances(_gstate.escrow_contract, _gstate.escrow_contract.value);
    auto itr = balances.find(group_id);
    CHECKC(itr != balances.end(), err::RECORD_NOT_FOUND, "escrow balance not found: " + std::to_string(group_id));
    return *itr;
}

} // namespace hemat
