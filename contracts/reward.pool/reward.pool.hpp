/** RewardPool header file
 *  Description: tables of the reward pool contract. Every row carries the derived address it lives at,
 *  rows are located through the "byaddress" index and never by caller supplied primary keys.
 *  @file reward.pool.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#ifndef REWARDPOOL_CONTRACTS_REWARD_POOL_H
#define REWARDPOOL_CONTRACTS_REWARD_POOL_H

#include <reward.common/reward.common.hpp>
#include <reward.common/derivation.hpp>
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/singleton.hpp>
#include <string>

namespace rewardpool {
    using namespace eosio;
    using std::string;

    //pool config is the single configuration record governing fees and pause state.
    struct [[eosio::table("poolconfig"), eosio::contract("reward.pool")]] pool_config {
        pool_config(){}
        checksum256 address;           //derived address of this record, fixed at initialization.
        bool initialized = false;      //guards re-initialization.
        name authority;                //the only account allowed to record tasks and administer the pool.
        name treasury;                 //receives the platform fee of every withdrawal.
        uint8_t fee_percentage = 0;    //platform fee, 0 to 100.
        uint64_t total_distributed = 0;    //sum of all farmer payouts, smallest asset units.
        uint64_t total_fees_collected = 0; //sum of all treasury payouts, smallest asset units.
        bool paused = false;           //blocks task recording and withdrawals while set.

        EOSLIB_SERIALIZE(pool_config, (address)(initialized)(authority)(treasury)(fee_percentage)
                (total_distributed)(total_fees_collected)(paused)
        )
    };

    typedef eosio::singleton<"poolconfig"_n, pool_config> pool_config_singleton;

    //farmer ledger accumulates earnings and withdrawals of one farmer. created on the first recorded task.
    struct [[eosio::table, eosio::contract("reward.pool")]] farmer_ledger {
        uint64_t id = 0;                //primary key
        checksum256 address;            //derived from the farmer name, secondary key
        name farmer;                    //owner of this ledger
        uint64_t withdrawal_nonce = 0;  //expected nonce of the next withdrawal, incremented once per withdrawal.
        uint64_t total_earned = 0;
        uint64_t total_withdrawn = 0;
        uint64_t last_withdrawal_clock = 0; //block time in seconds of the last withdrawal.

        uint64_t primary_key() const { return id; }
        checksum256 by_address() const { return address; }

        EOSLIB_SERIALIZE(farmer_ledger, (id)(address)(farmer)(withdrawal_nonce)(total_earned)
                (total_withdrawn)(last_withdrawal_clock)
        )
    };

    typedef eosio::multi_index<"farmers"_n, farmer_ledger,
            indexed_by<"byaddress"_n, const_mem_fun<farmer_ledger, checksum256, &farmer_ledger::by_address>>
    > farmer_ledgers_table;

    //task record is one completed task. immutable once recorded except for the claimed flag.
    struct [[eosio::table, eosio::contract("reward.pool")]] task_record {
        uint64_t id = 0;
        checksum256 address;          //derived from the task id
        string task_id;
        name farmer;
        string pool_id;
        uint64_t reward_amount = 0;   //smallest units of asset_id
        extended_symbol asset_id;
        bool claimed = false;
        uint64_t completion_clock = 0;

        uint64_t primary_key() const { return id; }
        checksum256 by_address() const { return address; }
        uint64_t by_farmer() const { return farmer.value; }

        EOSLIB_SERIALIZE(task_record, (id)(address)(task_id)(farmer)(pool_id)(reward_amount)(asset_id)
                (claimed)(completion_clock)
        )
    };

    typedef eosio::multi_index<"tasks"_n, task_record,
            indexed_by<"byaddress"_n, const_mem_fun<task_record, checksum256, &task_record::by_address>>,
            indexed_by<"byfarmer"_n, const_mem_fun<task_record, uint64_t, &task_record::by_farmer>>
    > task_records_table;

    //reward vault tracks the pool's holdings of one asset, credited by deposits and debited by withdrawals.
    struct [[eosio::table, eosio::contract("reward.pool")]] reward_vault {
        uint64_t id = 0;
        checksum256 address;          //derived from the asset id
        extended_symbol asset_id;
        uint64_t balance = 0;
        uint64_t total_deposited = 0;

        uint64_t primary_key() const { return id; }
        checksum256 by_address() const { return address; }

        EOSLIB_SERIALIZE(reward_vault, (id)(address)(asset_id)(balance)(total_deposited))
    };

    typedef eosio::multi_index<"vaults"_n, reward_vault,
            indexed_by<"byaddress"_n, const_mem_fun<reward_vault, checksum256, &reward_vault::by_address>>
    > reward_vaults_table;
}

#endif //REWARDPOOL_CONTRACTS_REWARD_POOL_H
