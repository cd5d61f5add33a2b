/** RewardToken implementation file
 *  Description: RewardToken is the token contract holding the assets paid out by the reward pool.
 *  Any symbol may be created, balances live in the "accounts" table scoped by owner.
 *  @file reward.token.cpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#include <reward.token/reward.token.hpp>

namespace rewardpool {

    void token::create(const name &issuer, const asset &maximum_supply) {
        require_auth(_self);

        const auto sym = maximum_supply.symbol;
        check(is_account(issuer), "issuer account does not exist");
        check(sym.is_valid(), "invalid symbol name");
        check(maximum_supply.is_valid(), "invalid supply");
        check(maximum_supply.amount > 0, "max-supply must be positive");

        stats statstable(_self, sym.code().raw());
        check(statstable.find(sym.code().raw()) == statstable.end(), "token with symbol already exists");

        statstable.emplace(get_self(), [&](auto &s) {
            s.supply.symbol = maximum_supply.symbol;
            s.max_supply = maximum_supply;
            s.issuer = issuer;
        });
    }

    void token::issue(const name &to, const asset &quantity, const string &memo) {
        const auto sym = quantity.symbol;
        check(sym.is_valid(), "invalid symbol name");
        check(memo.size() <= MAXMEMOLEN, "memo has more than 256 bytes");

        stats statstable(_self, sym.code().raw());
        auto existing = statstable.find(sym.code().raw());
        check(existing != statstable.end(), "token with symbol does not exist, create token before issue");
        const auto &st = *existing;

        require_auth(st.issuer);
        check(quantity.is_valid(), "invalid quantity");
        check(quantity.amount > 0, "must issue positive quantity");

        check(quantity.symbol == st.supply.symbol, "symbol precision mismatch");
        check(quantity.amount <= st.max_supply.amount - st.supply.amount, "quantity exceeds available supply");

        statstable.modify(st, same_payer, [&](auto &s) {
            s.supply += quantity;
        });

        add_balance(st.issuer, quantity, st.issuer);

        //sent inline so the recipient is notified of a transfer, the pool credits its vaults on transfers.
        if (to != st.issuer) {
            action(permission_level{st.issuer, ACTIVEPERMISSION},
                   get_self(), "transfer"_n,
                   std::make_tuple(st.issuer, to, quantity, memo)
            ).send();
        }
    }

    void token::transfer(const name &from,
                         const name &to,
                         const asset &quantity,
                         const string &memo) {
        check(from != to, "cannot transfer to self");
        require_auth(from);
        check(is_account(to), "to account does not exist");
        auto sym = quantity.symbol.code();
        stats statstable(_self, sym.raw());
        const auto &st = statstable.get(sym.raw(), "token with symbol does not exist");

        require_recipient(from);
        require_recipient(to);

        check(quantity.is_valid(), "invalid quantity");
        check(quantity.amount > 0, "must transfer positive quantity");
        check(quantity.symbol == st.supply.symbol, "symbol precision mismatch");
        check(memo.size() <= MAXMEMOLEN, "memo has more than 256 bytes");

        auto payer = has_auth(to) ? to : from;

        sub_balance(from, quantity);
        add_balance(to, quantity, payer);
    }

    //creates a zero balance row so the owner can be paid without supplying RAM.
    void token::open(const name &owner, const symbol &symbol, const name &ram_payer) {
        require_auth(ram_payer);
        check(is_account(owner), "owner account does not exist");

        const auto sym_code_raw = symbol.code().raw();
        stats statstable(_self, sym_code_raw);
        const auto &st = statstable.get(sym_code_raw, "symbol does not exist");
        check(st.supply.symbol == symbol, "symbol precision mismatch");

        accounts acnts(_self, owner.value);
        if (acnts.find(sym_code_raw) == acnts.end()) {
            acnts.emplace(ram_payer, [&](auto &a) {
                a.balance = asset{0, symbol};
            });
        }
    }

    void token::sub_balance(const name &owner, const asset &value) {
        accounts from_acnts(_self, owner.value);
        const auto acnts_iter = from_acnts.find(value.symbol.code().raw());

        reward_assert(acnts_iter != from_acnts.end(), "quantity", value.to_string(),
                      "Insufficient funds", ErrorInsufficientBalance);
        reward_assert(acnts_iter->balance.amount >= value.amount, "quantity", value.to_string(),
                      "Insufficient funds", ErrorInsufficientBalance);

        from_acnts.modify(acnts_iter, same_payer, [&](auto &a) {
            a.balance -= value;
        });
    }

    void token::add_balance(const name &owner, const asset &value, const name &ram_payer) {
        accounts to_acnts(_self, owner.value);
        auto to = to_acnts.find(value.symbol.code().raw());
        if (to == to_acnts.end()) {
            to_acnts.emplace(ram_payer, [&](auto &a) {
                a.balance = value;
            });
        } else {
            to_acnts.modify(to, same_payer, [&](auto &a) {
                a.balance += value;
            });
        }
    }
} /// namespace rewardpool

EOSIO_DISPATCH( rewardpool::token, (create)(issue)(transfer)(open))
