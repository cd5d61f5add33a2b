/** RewardToken header file
 *  Description: RewardToken is the token contract holding the assets paid out by the reward pool.
 *  @file reward.token.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <reward.common/reward.common.hpp>
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <string>

namespace rewardpool {

    using namespace eosio;
    using std::string;

    class [[eosio::contract("reward.token")]] token : public contract {
    public:
        using contract::contract;

        [[eosio::action]]
        void create(const name &issuer, const asset &maximum_supply);

        [[eosio::action]]
        void issue(const name &to, const asset &quantity, const string &memo);

        [[eosio::action]]
        void transfer(const name &from,
                      const name &to,
                      const asset &quantity,
                      const string &memo);

        [[eosio::action]]
        void open(const name &owner, const symbol &symbol, const name &ram_payer);

        //true when owner holds a balance row for exactly this asset on its contract.
        static bool is_asset_account(const extended_symbol &asset_id, const name &owner) {
            accounts accountstable(asset_id.get_contract(), owner.value);
            const auto acnts_iter = accountstable.find(asset_id.get_symbol().code().raw());
            return acnts_iter != accountstable.end() && acnts_iter->balance.symbol == asset_id.get_symbol();
        }

    private:
        struct [[eosio::table]] account {
            asset balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }
        };

        struct [[eosio::table]] currency_stats {
            asset supply;
            asset max_supply;
            name issuer;

            uint64_t primary_key() const { return supply.symbol.code().raw(); }
        };

        typedef eosio::multi_index<"accounts"_n, account> accounts;
        typedef eosio::multi_index<"stat"_n, currency_stats> stats;

        void sub_balance(const name &owner, const asset &value);

        void add_balance(const name &owner, const asset &value, const name &ram_payer);

    public:

        struct transfer_args {
            name from;
            name to;
            asset quantity;
            string memo;

            EOSLIB_SERIALIZE(transfer_args, (from)(to)(quantity)(memo))
        };
    };
}
