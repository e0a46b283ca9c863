#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>

using namespace eosio;
using std::string;

/**
 * 测试用收益适配器
 *  - 存入：转账 memo "deposit"
 *  - withdraw：按 memo "recall" 转回
 *  - harvest：转出 accrue 累积的收益，无收益不转账
 *  - setattack：收到存入后立即向目标组缴款，用于验证组锁
 */
class [[eosio::contract("mock.yield")]] mockyield : public contract {
public:
    using contract::contract;

    struct [[eosio::table]] deposit_t {
        name     owner;
        asset    balance;

        uint64_t primary_key() const { return owner.value; }
    };
    typedef eosio::multi_index<"deposits"_n, deposit_t> deposits;

    struct [[eosio::table("state")]] state_t {
        name     token_contract;
        asset    pending_yield;
        uint32_t apy_bps       = 0;
        name     attack_target;
        uint64_t attack_group  = 0;
    };
    typedef eosio::singleton<"state"_n, state_t> state_singleton;

    [[eosio::action]]
    void init(const name& token_contract, const symbol& sym) {
        require_auth(get_self());
        state_singleton st(get_self(), get_self().value);
        auto s = st.get_or_default();
        s.token_contract = token_contract;
        s.pending_yield  = asset(0, sym);
        st.set(s, get_self());
    }

    [[eosio::action]]
    void accrue(const asset& quantity) {
        require_auth(get_self());
        state_singleton st(get_self(), get_self().value);
        auto s = st.get();
        s.pending_yield += quantity;
        st.set(s, get_self());
    }

    [[eosio::action]]
    void setapy(const uint32_t& apy_bps) {
        require_auth(get_self());
        state_singleton st(get_self(), get_self().value);
        auto s = st.get();
        s.apy_bps = apy_bps;
        st.set(s, get_self());
    }

    [[eosio::action]]
    void setattack(const name& target, const uint64_t& group_id) {
        require_auth(get_self());
        state_singleton st(get_self(), get_self().value);
        auto s = st.get();
        s.attack_target = target;
        s.attack_group  = group_id;
        st.set(s, get_self());
    }

    [[eosio::action]]
    void withdraw(const name& to, const asset& quantity) {
        require_auth(to);
        deposits dep(get_self(), get_self().value);
        const auto& d = dep.get(to.value, "no deposit");
        check(d.balance >= quantity, "insufficient deposit");
        dep.modify(d, same_payer, [&](auto& r) {
            r.balance -= quantity;
        });
        send_transfer(to, quantity, "recall");
    }

    [[eosio::action]]
    void harvest(const name& to, const string& memo) {
        require_auth(to);
        state_singleton st(get_self(), get_self().value);
        auto s = st.get();
        if (s.pending_yield.amount <= 0) return;

        const asset yield = s.pending_yield;
        s.pending_yield.amount = 0;
        st.set(s, get_self());
        send_transfer(to, yield, memo);
    }

    [[eosio::on_notify("*::transfer")]]
    void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
        if (from == get_self() || to != get_self()) return;
        if (memo != "deposit") return;

        deposits dep(get_self(), get_self().value);
        auto itr = dep.find(from.value);
        if (itr == dep.end()) {
            dep.emplace(get_self(), [&](auto& r) {
                r.owner   = from;
                r.balance = quantity;
            });
        } else {
            dep.modify(itr, same_payer, [&](auto& r) {
                r.balance += quantity;
            });
        }

        state_singleton st(get_self(), get_self().value);
        const auto s = st.get();
        if (s.attack_target != name())
            send_transfer(s.attack_target, quantity, "contribute:" + std::to_string(s.attack_group));
    }

private:
    void send_transfer(const name& to, const asset& quantity, const string& memo) {
        state_singleton st(get_self(), get_self().value);
        action(permission_level{ get_self(), "active"_n }, st.get().token_contract, "transfer"_n,
               std::make_tuple(get_self(), to, quantity, memo)).send();
    }
};
