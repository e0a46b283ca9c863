#include "hematinsure.hpp"

#include <flon/flon.token.hpp>
#include <flon/utils.hpp>

#include <algorithm>

using namespace hemat;
using namespace eosio;
using namespace flon;

void hematinsure::init(const name& admin, const name& registry, const name& escrow_contract,
                       const extended_symbol& settle_token) {
    require_auth(get_self());
    CHECKC(is_account(admin), err::ACCOUNT_INVALID, "invalid admin");
    CHECKC(is_account(registry), err::ACCOUNT_INVALID, "invalid registry");
    CHECKC(is_account(escrow_contract), err::ACCOUNT_INVALID, "invalid escrow contract");

    _gstate.admin           = admin;
    _gstate.registry        = registry;
    _gstate.escrow_contract = escrow_contract;
    _gstate.settle_token    = settle_token;
    _gstate.claim_cap       = asset(_gstate.claim_cap.amount, settle_token.get_symbol());
    _gstate.emergency_cap   = asset(_gstate.emergency_cap.amount, settle_token.get_symbol());
}

void hematinsure::setconfig(const uint16_t& min_reserve_ratio_bps, const uint16_t& approval_threshold,
                            const asset& claim_cap, const asset& emergency_cap, const uint32_t& claim_cooldown) {
    require_auth(_gstate.admin);
    const auto& sym = _gstate.settle_token.get_symbol();
    CHECKC(min_reserve_ratio_bps <= RATIO_BOOST, err::PARAM_ERROR, "reserve ratio exceeds 100%");
    CHECKC(approval_threshold > 0, err::PARAM_ERROR, "approval threshold must be positive");
    CHECKC(claim_cap.symbol == sym && emergency_cap.symbol == sym, err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(claim_cap.amount > 0 && emergency_cap.amount > 0, err::NOT_POSITIVE, "caps must be positive");

    _gstate.min_reserve_ratio_bps   = min_reserve_ratio_bps;
    _gstate.approval_threshold      = approval_threshold;
    _gstate.claim_cap               = claim_cap;
    _gstate.emergency_cap           = emergency_cap;
    _gstate.claim_cooldown          = claim_cooldown;
}

void hematinsure::addapprover(const name& approver) {
    require_auth(_gstate.admin);
    CHECKC(is_account(approver), err::ACCOUNT_INVALID, "invalid approver");
    CHECKC(_gstate.approvers.count(approver) == 0, err::RECORD_EXISTS, "approver already added");
    _gstate.approvers.insert(approver);
}

void hematinsure::delapprover(const name& approver) {
    require_auth(_gstate.admin);
    CHECKC(_gstate.approvers.erase(approver) > 0, err::RECORD_NOT_FOUND, "approver not found");
}

void hematinsure::opengroup(const uint64_t& group_id, const uint64_t& cap, const bool& emergency) {
    require_auth(_gstate.registry);

    insure_grant_t grant(group_id);
    CHECKC(!_db.get(grant), err::RECORD_EXISTS, "group already opened: " + std::to_string(group_id));

    const auto now  = time_point_sec(current_time_point());
    const auto& sym = _gstate.settle_token.get_symbol();
    grant.cap       = cap;
    grant.opened_at = now;
    _db.set(grant, get_self());

    pool_t pool(group_id);
    pool.balance            = asset(0, sym);
    pool.reserve_fund       = asset(0, sym);
    pool.total_premiums     = asset(0, sym);
    pool.total_claims_paid  = asset(0, sym);
    pool.total_covered      = asset(0, sym);
    pool.emergency_mode     = emergency;
    pool.updated_at         = now;
    _db.set(pool, get_self());
}

// 保费 / 收益分成
void hematinsure::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    if (from == get_self() || to != get_self()) return;
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "invalid transfer amount");
    CHECKC(get_first_receiver() == _gstate.settle_token.get_contract(), err::CONTRACT_MISMATCH, "token contract mismatch");
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");

    // memo: premium:<group_id>[:<member>] | yield:<group_id>
    auto parts = split(memo, ":");
    CHECKC(parts.size() == 2 || parts.size() == 3, err::INVALID_FORMAT, "memo must be <type>:<group_id>[:<member>]");

    const string action     = parts[0];
    const uint64_t group_id = std::stoull(parts[1]);

    if (action == "premium") return _on_premium(group_id, quantity);
    if (action == "yield") {
        CHECKC(from == _gstate.escrow_contract, err::NO_AUTH, "yield share must come from escrow");
        return _on_premium(group_id, quantity);
    }

    CHECKC(false, err::INVALID_FORMAT, "unsupported memo action: " + action);
}

void hematinsure::submitclaim(const name& claimant, const uint64_t& group_id, const asset& amount, const string& evidence) {
    require_auth(claimant);
    CHECKC(amount.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(amount.amount > 0, err::NOT_POSITIVE, "claim amount must be positive");
    CHECKC(evidence.size() <= MAX_EVIDENCE_SIZE, err::PARAM_ERROR, "evidence too long");

    pool_t pool(group_id);
    CHECKC(_db.get(pool), err::RECORD_NOT_FOUND, "pool not found: " + std::to_string(group_id));

    // === 1. 成员资格（读取 hemat.group） ===
    member_t::idx_t members(_gstate.registry, group_id);
    auto mitr = members.find(claimant.value);
    CHECKC(mitr != members.end() && mitr->in_play(), err::NO_AUTH, "not an active member: " + claimant.to_string());

    // === 2. 额度 ===
    CHECKC(amount <= _gstate.claim_cap, err::CAP_EXCEEDED, "claim exceeds cap");
    if (pool.emergency_mode)
        CHECKC(amount <= _gstate.emergency_cap, err::CAP_EXCEEDED, "claim exceeds emergency cap");

    // === 3. 冷却 ===
    const auto now = time_point_sec(current_time_point());
    claimant_t::idx_t claimants(get_self(), group_id);
    auto citr = claimants.find(claimant.value);
    if (citr != claimants.end()) {
        CHECKC(now.sec_since_epoch() >= citr->last_claim_at.sec_since_epoch() + _gstate.claim_cooldown,
               err::COOLDOWN_ACTIVE, "claim cooldown active");
        claimants.modify(citr, same_payer, [&](auto& c) {
            c.last_claim_at  = now;
            c.claim_count   += 1;
            c.total_claimed += amount;
        });
    } else {
        claimants.emplace(get_self(), [&](auto& c) {
            c.owner         = claimant;
            c.last_claim_at = now;
            c.claim_count   = 1;
            c.total_claimed = amount;
        });
    }

    claim_t claim(++_gstate.last_claim_id);
    claim.group_id      = group_id;
    claim.claimant      = claimant;
    claim.requested     = amount;
    claim.amount        = amount;
    claim.evidence      = evidence;
    claim.submitted_at  = now;
    _db.set(claim, get_self());
}

void hematinsure::approveclaim(const name& approver, const uint64_t& claim_id, const asset& payout) {
    require_auth(approver);
    CHECKC(_is_approver(approver), err::NO_AUTH, "not an approver: " + approver.to_string());

    claim_t claim(claim_id);
    CHECKC(_db.get(claim), err::RECORD_NOT_FOUND, "claim not found: " + std::to_string(claim_id));
    CHECKC(claim.status == ClaimStatus::SUBMITTED, err::INVALID_STATUS, "claim not pending approval");
    CHECKC(std::find(claim.approvals.begin(), claim.approvals.end(), approver) == claim.approvals.end(),
           err::RECORD_EXISTS, "already approved by " + approver.to_string());

    if (payout.amount > 0) {
        CHECKC(payout.symbol == claim.amount.symbol, err::SYMBOL_MISMATCH, "symbol mismatch");
        CHECKC(payout <= claim.amount, err::PARAM_ERROR, "payout exceeds claim amount");
        claim.amount = payout;
    }

    claim.approvals.push_back(approver);
    if (claim.approvals.size() >= _gstate.approval_threshold) {
        claim.status        = ClaimStatus::APPROVED;
        claim.processed_at  = time_point_sec(current_time_point());
    }
    _db.set(claim, get_self());
}

void hematinsure::rejectclaim(const name& processor, const uint64_t& claim_id, const string& reason) {
    require_auth(processor);
    CHECKC(processor == _gstate.admin || _is_approver(processor), err::NO_AUTH, "not an approver or admin");
    CHECKC(reason.size() <= MAX_EVIDENCE_SIZE, err::PARAM_ERROR, "reason too long");

    claim_t claim(claim_id);
    CHECKC(_db.get(claim), err::RECORD_NOT_FOUND, "claim not found: " + std::to_string(claim_id));
    CHECKC(claim.status == ClaimStatus::SUBMITTED || claim.status == ClaimStatus::APPROVED,
           err::INVALID_STATUS, "claim already finalized");

    claim.status        = ClaimStatus::REJECTED;
    claim.reject_reason = reason;
    claim.processed_at  = time_point_sec(current_time_point());
    _db.set(claim, get_self());

    pool_t pool(claim.group_id);
    CHECKC(_db.get(pool), err::RECORD_NOT_FOUND, "pool not found: " + std::to_string(claim.group_id));
    pool.total_claims_denied += 1;
    pool.updated_at           = claim.processed_at;
    _db.set(pool, get_self());
}

void hematinsure::payclaim(const name& executor, const uint64_t& claim_id) {
    require_auth(executor);

    claim_t claim(claim_id);
    CHECKC(_db.get(claim), err::RECORD_NOT_FOUND, "claim not found: " + std::to_string(claim_id));
    CHECKC(executor == claim.claimant || executor == _gstate.admin || _is_approver(executor),
           err::NO_AUTH, "missing required auth");
    CHECKC(claim.status == ClaimStatus::APPROVED, err::INVALID_STATUS, "claim not approved");

    pool_t pool(claim.group_id);
    CHECKC(_db.get(pool), err::RECORD_NOT_FOUND, "pool not found: " + std::to_string(claim.group_id));
    CHECKC(pool.balance >= claim.amount, err::QUANTITY_INSUFFICIENT, "insufficient pool balance");

    const auto now = time_point_sec(current_time_point());
    pool.balance            -= claim.amount;
    pool.total_claims_paid  += claim.amount;
    pool.updated_at          = now;
    _db.set(pool, get_self());

    claim.status        = ClaimStatus::PAID;
    claim.processed_at  = now;
    _db.set(claim, get_self());

    TRANSFER(_gstate.settle_token.get_contract(), claim.claimant, claim.amount, "claim:" + std::to_string(claim_id));
}

void hematinsure::cover(const uint64_t& group_id, const uint64_t& cap, const name& member, const asset& quantity) {
    _check_grant(group_id, cap);
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "cover amount must be positive");

    pool_t pool(group_id);
    CHECKC(_db.get(pool), err::RECORD_NOT_FOUND, "pool not found: " + std::to_string(group_id));
    CHECKC(pool.balance >= quantity, err::QUANTITY_INSUFFICIENT, "insufficient pool balance");

    pool.balance        -= quantity;
    pool.total_covered  += quantity;
    pool.updated_at      = time_point_sec(current_time_point());
    _db.set(pool, get_self());

    TRANSFER(_gstate.settle_token.get_contract(), _gstate.escrow_contract, quantity,
             "cover:" + std::to_string(group_id) + ":" + member.to_string());
}

void hematinsure::emergencywd(const uint64_t& group_id, const name& to, const asset& quantity) {
    require_auth(_gstate.admin);
    CHECKC(is_account(to), err::ACCOUNT_INVALID, "invalid account: " + to.to_string());
    CHECKC(quantity.symbol == _gstate.settle_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "withdraw amount must be positive");

    pool_t pool(group_id);
    CHECKC(_db.get(pool), err::RECORD_NOT_FOUND, "pool not found: " + std::to_string(group_id));
    CHECKC(pool.reserve_fund >= quantity, err::QUANTITY_INSUFFICIENT, "insufficient reserve fund");

    pool.reserve_fund   -= quantity;
    pool.updated_at      = time_point_sec(current_time_point());
    _db.set(pool, get_self());

    TRANSFER(_gstate.settle_token.get_contract(), to, quantity, "emergency:" + std::to_string(group_id));
}

void hematinsure::_check_grant(const uint64_t& group_id, const uint64_t& cap) {
    require_auth(_gstate.registry);

    insure_grant_t grant(group_id);
    CHECKC(_db.get(grant), err::RECORD_NOT_FOUND, "group not opened: " + std::to_string(group_id));
    CHECKC(grant.cap == cap, err::NO_AUTH, "capability mismatch");
}

// 储备金先行划出，余下可理赔
void hematinsure::_on_premium(const uint64_t& group_id, const asset& quantity) {
    pool_t pool(group_id);
    CHECKC(_db.get(pool), err::RECORD_NOT_FOUND, "pool not found: " + std::to_string(group_id));

    const asset reserve = calc_bps(quantity, _gstate.min_reserve_ratio_bps);
    pool.reserve_fund       += reserve;
    pool.balance            += quantity - reserve;
    pool.total_premiums     += quantity;
    pool.updated_at          = time_point_sec(current_time_point());
    _db.set(pool, get_self());
}

bool hematinsure::_is_approver(const name& account) const {
    return _gstate.approvers.count(account) > 0;
}
