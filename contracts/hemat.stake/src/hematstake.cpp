#include "hematstake.hpp"

#include <flon/flon.token.hpp>
#include <flon/utils.hpp>

namespace hemat {

void hematstake::init(const name& admin, const name& registry, const name& escrow_contract,
                      const extended_symbol& settle_token) {
    require_auth(get_self());
    CHECKC(is_account(admin), err::ACCOUNT_INVALID, "invalid admin");
    CHECKC(is_account(registry), err::ACCOUNT_INVALID, "invalid registry");
    CHECKC(is_account(escrow_contract), err::ACCOUNT_INVALID, "invalid escrow contract");

    _gstate.admin           = admin;
    _gstate.registry        = registry;
    _gstate.escrow_contract = escrow_contract;
    _gstate.settle_token    = settle_token;
}

void hematstake::setconfig(const uint16_t& stake_penalty_bps, const uint16_t& blacklist_threshold,
                           const uint32_t& trust_reward_step, const uint32_t& trust_slash_step) {
    require_auth(_gstate.admin);
    CHECKC(stake_penalty_bps <= RATIO_BOOST, err::PARAM_ERROR, "stake penalty exceeds 100%");
    CHECKC(blacklist_threshold > 0, err::PARAM_ERROR, "blacklist threshold must be positive");
    CHECKC(trust_reward_step <= _gstate.max_trust && trust_slash_step <= _gstate.max_trust,
           err::PARAM_ERROR, "trust step exceeds max trust");

    _gstate.stake_penalty_bps   = stake_penalty_bps;
    _gstate.blacklist_threshold = blacklist_threshold;
    _gstate.trust_reward_step   = trust_reward_step;
    _gstate.trust_slash_step    = trust_slash_step;
}

void hematstake::opengroup(const uint64_t& group_id, const uint64_t& cap) {
    require_auth(_gstate.registry);

    stake_grant_t grant(group_id);
    CHECKC(!_db.get(grant), err::RECORD_EXISTS, "group already opened: " + std::to_string(group_id));

    grant.cap       = cap;
    grant.opened_at = time_point_sec(current_time_point());
    _db.set(grant, get_self());
}

void hematstake::enroll(const uint64_t& group_id, const uint64_t& cap, const name& member) {
    _check_grant(group_id, cap);
    _on_stake(group_id, member, asset(0, _gstate.settle_token.get_symbol()));
}

// --- 质押转入 ---
void hematstake::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    if (from == get_self() || to != get_self()) return;
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "must transfer positive amount");
    CHECKC(get_first_receiver() == _gstate.settle_token.get_contract(), err::CONTRACT_MISMATCH, "token contract mismatch");
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(from == _gstate.registry, err::NO_AUTH, "stake must come from registry");

    auto parts = split(memo, ":");
    CHECKC(parts.size() == 3 && parts[0] == "stake", err::INVALID_FORMAT, "invalid memo format, expect stake:<group_id>:<member>");

    const uint64_t group_id = std::stoull(parts[1]);
    const name member       = name(parts[2]);

    stake_grant_t grant(group_id);
    CHECKC(_db.get(grant), err::RECORD_NOT_FOUND, "group not opened: " + std::to_string(group_id));

    _on_stake(group_id, member, quantity);
}

void hematstake::refund(const uint64_t& group_id, const uint64_t& cap, const name& member) {
    _check_grant(group_id, cap);

    stake_t::idx_t stakes(get_self(), group_id);
    auto itr = stakes.find(member.value);
    CHECKC(itr != stakes.end(), err::RECORD_NOT_FOUND, "stake not found: " + member.to_string());
    if (itr->amount.amount == 0) return;

    const asset quantity = itr->amount;
    stakes.modify(itr, same_payer, [&](auto& s) {
        s.amount.amount = 0;
        s.updated_at    = time_point_sec(current_time_point());
    });

    auto rep = _touch_reputation(member);
    _log(group_id, member, StakeAction::REFUND, quantity, rep.trust_score);

    TRANSFER(_gstate.settle_token.get_contract(), member, quantity, "stake refund: " + std::to_string(group_id));
}

void hematstake::releaseall(const uint64_t& group_id, const uint64_t& cap) {
    _check_grant(group_id, cap);

    const auto now = time_point_sec(current_time_point());
    stake_t::idx_t stakes(get_self(), group_id);
    for (auto itr = stakes.begin(); itr != stakes.end(); ++itr) {
        if (itr->amount.amount <= 0) continue;

        const name owner     = itr->owner;
        const asset quantity = itr->amount;
        stakes.modify(itr, same_payer, [&](auto& s) {
            s.amount.amount = 0;
            s.updated_at    = now;
        });

        _log(group_id, owner, StakeAction::REFUND, quantity, _touch_reputation(owner).trust_score);
        TRANSFER(_gstate.settle_token.get_contract(), owner, quantity, "stake release: " + std::to_string(group_id));
    }
}

void hematstake::slash(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& missed) {
    _check_grant(group_id, cap);
    CHECKC(missed.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(missed.amount >= 0, err::NOT_POSITIVE, "missed amount must not be negative");

    stake_t::idx_t stakes(get_self(), group_id);
    auto itr = stakes.find(member.value);
    CHECKC(itr != stakes.end(), err::RECORD_NOT_FOUND, "stake not found: " + member.to_string());

    const auto now     = time_point_sec(current_time_point());
    const asset penalty = calc_slash_amount(itr->amount, missed, _gstate.stake_penalty_bps);

    stakes.modify(itr, same_payer, [&](auto& s) {
        s.amount        -= penalty;
        s.slashed       += penalty;
        s.default_count += 1;
        s.updated_at     = now;
    });

    // === 信誉：违约计数、扣分、拉黑 ===
    auto rep = _touch_reputation(member);
    rep.default_count  += 1;
    rep.trust_score     = trust_after_slash(_gstate, rep.trust_score);
    if (rep.default_count >= _gstate.blacklist_threshold)
        rep.blacklisted = true;
    rep.updated_at      = now;
    _db.set(rep, get_self());

    _log(group_id, member, StakeAction::SLASH, penalty, rep.trust_score);

    if (penalty.amount > 0)
        TRANSFER(_gstate.settle_token.get_contract(), _gstate.escrow_contract, penalty,
                 "slash:" + std::to_string(group_id) + ":" + member.to_string());
}

void hematstake::reward(const uint64_t& group_id, const uint64_t& cap, const name& member) {
    _check_grant(group_id, cap);

    auto rep = _touch_reputation(member);
    rep.trust_score     = trust_after_reward(_gstate, rep.trust_score);
    rep.success_count  += 1;
    rep.updated_at      = time_point_sec(current_time_point());
    _db.set(rep, get_self());
}

void hematstake::whitelist(const name& member) {
    require_auth(_gstate.admin);

    reputation_t rep(member);
    CHECKC(_db.get(rep), err::RECORD_NOT_FOUND, "reputation not found: " + member.to_string());
    CHECKC(rep.blacklisted, err::INVALID_STATUS, "member not blacklisted");

    rep.blacklisted = false;
    rep.updated_at  = time_point_sec(current_time_point());
    _db.set(rep, get_self());
}

// ==============================
// 内部逻辑实现
// ==============================

void hematstake::_check_grant(const uint64_t& group_id, const uint64_t& cap) {
    require_auth(_gstate.registry);

    stake_grant_t grant(group_id);
    CHECKC(_db.get(grant), err::RECORD_NOT_FOUND, "group not opened: " + std::to_string(group_id));
    CHECKC(grant.cap == cap, err::NO_AUTH, "capability mismatch");
}

void hematstake::_on_stake(const uint64_t& group_id, const name& member, const asset& quantity) {
    auto rep = _touch_reputation(member);
    CHECKC(!rep.blacklisted, err::BLACKLISTED, "member is blacklisted: " + member.to_string());

    const auto now = time_point_sec(current_time_point());
    stake_t::idx_t stakes(get_self(), group_id);
    auto itr = stakes.find(member.value);

    if (itr == stakes.end()) {
        stakes.emplace(get_self(), [&](auto& s) {
            s.owner         = member;
            s.amount        = quantity;
            s.cum_staked    = quantity;
            s.slashed       = asset(0, quantity.symbol);
            s.created_at    = now;
            s.updated_at    = now;
        });
    } else {
        // 退出后重新入组
        stakes.modify(itr, same_payer, [&](auto& s) {
            s.amount       += quantity;
            s.cum_staked   += quantity;
            s.updated_at    = now;
        });
    }

    if (quantity.amount > 0)
        _log(group_id, member, StakeAction::DEPOSIT, quantity, rep.trust_score);
}

reputation_t hematstake::_touch_reputation(const name& member) {
    reputation_t rep(member);
    if (!_db.get(rep)) {
        rep.trust_score = _gstate.initial_trust;
        rep.updated_at  = time_point_sec(current_time_point());
        _db.set(rep, get_self());
    }
    return rep;
}

void hematstake::_log(const uint64_t& group_id, const name& owner, const name& action,
                      const asset& quantity, const uint32_t& trust_after) {
    stake_log_t::idx_t logs(get_self(), group_id);
    logs.emplace(get_self(), [&](auto& l) {
        l.id            = logs.available_primary_key();
        l.owner         = owner;
        l.action        = action;
        l.quantity      = quantity;
        l.trust_after   = trust_after;
        l.created_at    = time_point_sec(current_time_point());
    });
}

} // namespace hemat
