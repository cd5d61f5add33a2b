/** RewardPool implementation file
 *  Description: RewardPool records completed tasks for farmers and pays accrued rewards out in batches.
 *  The platform authority records tasks, farmers withdraw them with a per farmer nonce, each payout is
 *  split between the farmer and the treasury by the configured fee percentage.
 *  @file reward.pool.cpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */
#include <eosiolib/eosio.hpp>
#include "reward.pool.hpp"
#include <reward.token/reward.token.hpp>
#include <algorithm>
#include <vector>

namespace rewardpool {

class [[eosio::contract("reward.pool")]] RewardPool : public eosio::contract {

private:
        pool_config_singleton     poolconfig;
        pool_config               gpool;
        farmer_ledgers_table      farmers;
        task_records_table        tasks;
        reward_vaults_table       vaults;

        //pending total of one asset, used by the pending rewards query.
        struct pending_reward {
            extended_symbol asset_id;
            uint64_t amount = 0;
            uint64_t task_count = 0;
        };

        void assert_pool_address(const checksum256 &pool_address) {
            verify_address(pool_address, pool_config_address(_self), "pool_address");
        }

        void assert_initialized(const checksum256 &pool_address) {
            reward_assert(gpool.initialized, "pool_address", checksum_to_hex(pool_address),
                          "Reward pool is not initialized", ErrorNotInitialized);
        }

        void assert_authority(const name &authority) {
            reward_assert(gpool.authority == authority, "authority", authority.to_string(),
                          "Caller is not the pool authority", ErrorUnauthorized);
        }

        void assert_not_paused() {
            reward_assert(!gpool.paused, "paused", "true", "Reward pool is paused", ErrorPaused);
        }

        void send_payout(const extended_symbol &asset_id, const name &to, const uint64_t &amount,
                         const string &memo) {
            if (amount == 0) {
                return;
            }
            action(permission_level{get_self(), ACTIVEPERMISSION},
                   asset_id.get_contract(), "transfer"_n,
                   make_tuple(get_self(), to, asset((int64_t) amount, asset_id.get_symbol()), memo)
            ).send();
        }

public:
        using contract::contract;

        RewardPool(name s, name code, datastream<const char *> ds) :
                contract(s, code, ds),
                poolconfig(_self, _self.value),
                farmers(_self, _self.value),
                tasks(_self, _self.value),
                vaults(_self, _self.value) {
            gpool = poolconfig.exists() ? poolconfig.get() : pool_config{};
        }

        ~RewardPool() {
            if (gpool.initialized) {
                poolconfig.set(gpool, _self);
            }
        }

    /***********
     * This action creates the pool configuration. It can run exactly once.
     * @param authority this is the account that will administer the pool and record tasks.
     * @param fee_percentage this is the platform fee taken from every withdrawal, 0 to 100.
     * @param treasury this is the account receiving the platform fee.
     * @param pool_address this is the derived address of the pool configuration.
     */
    [[eosio::action]]
    void initpool(const name &authority, const uint8_t &fee_percentage, const name &treasury,
                  const checksum256 &pool_address) {
        reward_assert(fee_percentage <= MAXFEEPERCENTAGE, "fee_percentage", to_string(fee_percentage),
                      "Fee percentage must be between 0 and 100", ErrorInvalidFeePercentage);
        reward_assert(has_auth(authority), "authority", authority.to_string(),
                      "Missing required authority", ErrorMissingAuthorization);

        const derived_address pool_derived = pool_config_address(_self);
        verify_address(pool_address, pool_derived, "pool_address");
        reward_assert(!gpool.initialized, "pool_address", checksum_to_hex(pool_address),
                      "Reward pool is already initialized", ErrorAlreadyInitialized);
        reward_assert(is_account(treasury), "treasury", treasury.to_string(),
                      "Treasury account does not exist", ErrorInvalidArgument);
        reward_assert(treasury != _self, "treasury", treasury.to_string(),
                      "Treasury cannot be the pool account", ErrorInvalidArgument);

        gpool.address = pool_derived.address;
        gpool.initialized = true;
        gpool.authority = authority;
        gpool.treasury = treasury;
        gpool.fee_percentage = fee_percentage;
        gpool.total_distributed = 0;
        gpool.total_fees_collected = 0;
        gpool.paused = false;

        print("Reward pool initialized by ", authority, " with ", (uint32_t) fee_percentage,
              "% platform fee, treasury ", treasury, "\n");
    }

    /***********
     * This action records one completed task and accrues its reward to the farmer ledger.
     * @param authority this is the pool authority, it pays for the new rows.
     * @param farmer this is the account that completed the task.
     * @param task_id this is the unique id of the task, 1 to 60 bytes.
     * @param pool_id this is the pool the task was completed in, at most 60 bytes.
     * @param reward_amount this is the reward in the smallest units of asset_id, zero is permitted.
     * @param asset_id this is the asset the reward is paid in.
     * @param pool_address this is the derived address of the pool configuration.
     * @param ledger_address this is the derived address of the farmer ledger.
     * @param task_address this is the derived address of the task record.
     */
    [[eosio::action]]
    void recordtask(const name &authority, const name &farmer, const string &task_id, const string &pool_id,
                    const uint64_t &reward_amount, const extended_symbol &asset_id,
                    const checksum256 &pool_address, const checksum256 &ledger_address,
                    const checksum256 &task_address) {
        reward_assert(has_auth(authority), "authority", authority.to_string(),
                      "Missing required authority", ErrorMissingAuthorization);
        assert_initialized(pool_address);
        assert_pool_address(pool_address);
        assert_authority(authority);
        assert_not_paused();

        reward_assert(validateTaskIdFormat(task_id), "task_id", task_id,
                      "Task id must be 1 to 60 bytes", ErrorInvalidArgument);
        reward_assert(validatePoolIdFormat(pool_id), "pool_id", pool_id,
                      "Pool id must be at most 60 bytes", ErrorInvalidArgument);
        reward_assert(asset_id.get_symbol().is_valid(), "asset_id", extended_symbol_to_string(asset_id),
                      "Invalid asset symbol", ErrorInvalidArgument);
        reward_assert(is_account(asset_id.get_contract()), "asset_id", extended_symbol_to_string(asset_id),
                      "Asset contract does not exist", ErrorInvalidArgument);
        reward_assert(is_account(farmer), "farmer", farmer.to_string(),
                      "Farmer account does not exist", ErrorInvalidFarmerAddress);

        const derived_address ledger_derived = farmer_ledger_address(_self, farmer);
        verify_address(ledger_address, ledger_derived, "ledger_address");
        const derived_address task_derived = task_record_address(_self, task_id);
        verify_address(task_address, task_derived, "task_address");

        auto ledgersbyaddress = farmers.get_index<"byaddress"_n>();
        auto ledger_iter = ledgersbyaddress.find(ledger_derived.address);
        if (ledger_iter != ledgersbyaddress.end()) {
            reward_assert(ledger_iter->farmer == farmer, "farmer", farmer.to_string(),
                          "Farmer ledger belongs to another account", ErrorInvalidFarmerAddress);
        }

        auto tasksbyaddress = tasks.get_index<"byaddress"_n>();
        reward_assert(tasksbyaddress.find(task_derived.address) == tasksbyaddress.end(), "task_id", task_id,
                      "Task has already been recorded", ErrorDuplicateTask);

        const uint64_t earned_before = ledger_iter == ledgersbyaddress.end() ? 0 : ledger_iter->total_earned;
        const uint64_t total_earned = checked_add(earned_before, reward_amount, "total_earned");
        const uint32_t present_time = now();

        if (ledger_iter == ledgersbyaddress.end()) {
            const uint64_t id = farmers.available_primary_key();
            farmers.emplace(authority, [&](struct farmer_ledger &l) {
                l.id = id;
                l.address = ledger_derived.address;
                l.farmer = farmer;
                l.total_earned = total_earned;
            });
        } else {
            ledgersbyaddress.modify(ledger_iter, same_payer, [&](struct farmer_ledger &l) {
                l.total_earned = total_earned;
            });
        }

        const uint64_t task_key = tasks.available_primary_key();
        tasks.emplace(authority, [&](struct task_record &t) {
            t.id = task_key;
            t.address = task_derived.address;
            t.task_id = task_id;
            t.farmer = farmer;
            t.pool_id = pool_id;
            t.reward_amount = reward_amount;
            t.asset_id = asset_id;
            t.claimed = false;
            t.completion_clock = present_time;
        });

        print("Task ", task_id, " recorded for farmer ", farmer, ", reward ", reward_amount, " ",
              extended_symbol_to_string(asset_id), "\n");
    }

    /***********
     * This action pays out a batch of unclaimed tasks of the calling farmer. All tasks must share one asset.
     * The total is split into the farmer share and the platform fee, both paid from the asset's vault.
     * @param farmer this is the farmer withdrawing, it must sign the transaction.
     * @param task_ids this is the batch of task ids to claim, at least one.
     * @param expected_nonce this must equal the withdrawal nonce stored in the farmer ledger.
     * @param pool_address this is the derived address of the pool configuration.
     * @param ledger_address this is the derived address of the farmer ledger.
     * @param vault_address this is the derived address of the vault of the batch asset.
     */
    [[eosio::action]]
    void withdraw(const name &farmer, const vector<string> &task_ids, const uint64_t &expected_nonce,
                  const checksum256 &pool_address, const checksum256 &ledger_address,
                  const checksum256 &vault_address) {
        reward_assert(has_auth(farmer), "farmer", farmer.to_string(),
                      "Missing required authority", ErrorMissingAuthorization);
        assert_initialized(pool_address);
        assert_pool_address(pool_address);
        assert_not_paused();
        reward_assert(!task_ids.empty(), "task_ids", "[]",
                      "At least one task id is required", ErrorInvalidArgument);

        const derived_address ledger_derived = farmer_ledger_address(_self, farmer);
        auto ledgersbyaddress = farmers.get_index<"byaddress"_n>();
        auto ledger_iter = ledgersbyaddress.find(ledger_derived.address);
        reward_assert(ledger_iter != ledgersbyaddress.end(), "farmer", farmer.to_string(),
                      "Farmer ledger is not initialized", ErrorNotInitialized);
        verify_address(ledger_address, ledger_derived, "ledger_address");
        reward_assert(ledger_iter->farmer == farmer, "farmer", farmer.to_string(),
                      "Farmer ledger belongs to another account", ErrorInvalidFarmerAddress);
        reward_assert(ledger_iter->withdrawal_nonce == expected_nonce, "expected_nonce",
                      to_string(expected_nonce), "Invalid nonce", ErrorInvalidNonce);

        //validate the whole batch before any record is touched.
        vector<uint64_t> staged;
        staged.reserve(task_ids.size());
        extended_symbol batch_asset;
        uint64_t total = 0;

        auto tasksbyaddress = tasks.get_index<"byaddress"_n>();
        for (const auto &task_id : task_ids) {
            auto task_iter = tasksbyaddress.find(task_record_address(_self, task_id).address);
            reward_assert(task_iter != tasksbyaddress.end(), "task_id", task_id,
                          "Task not found", ErrorTaskNotFound);
            reward_assert(task_iter->farmer == farmer, "task_id", task_id,
                          "Task belongs to another farmer", ErrorInvalidFarmerAddress);
            reward_assert(!task_iter->claimed &&
                          std::find(staged.begin(), staged.end(), task_iter->id) == staged.end(),
                          "task_id", task_id, "Task has already been claimed", ErrorTaskAlreadyClaimed);
            if (staged.empty()) {
                batch_asset = task_iter->asset_id;
            } else {
                reward_assert(task_iter->asset_id == batch_asset, "task_id", task_id,
                              "All tasks in a batch must share one asset", ErrorInconsistentAsset);
            }
            total = checked_add(total, task_iter->reward_amount, "total");
            staged.push_back(task_iter->id);
        }

        reward_assert(total > 0, "task_ids", to_string(task_ids.size()),
                      "Withdrawal total must be positive", ErrorInvalidArgument);

        const derived_address vault_derived = reward_vault_address(_self, batch_asset);
        verify_address(vault_address, vault_derived, "vault_address");

        const uint64_t fee = compute_platform_fee(total, gpool.fee_percentage);
        const uint64_t farmer_amount = total - fee;

        auto vaultsbyaddress = vaults.get_index<"byaddress"_n>();
        auto vault_iter = vaultsbyaddress.find(vault_derived.address);
        const uint64_t vault_balance = vault_iter == vaultsbyaddress.end() ? 0 : vault_iter->balance;
        reward_assert(vault_balance >= total, "vault_address", to_string(vault_balance),
                      "Insufficient vault balance", ErrorInsufficientBalance);
        reward_assert(vault_iter->asset_id == batch_asset, "vault_address", extended_symbol_to_string(vault_iter->asset_id),
                      "Vault holds a different asset", ErrorInvalidAssetAccount);
        reward_assert(token::is_asset_account(batch_asset, farmer), "farmer", farmer.to_string(),
                      "Farmer has no account for the batch asset", ErrorInvalidAssetAccount);
        reward_assert(token::is_asset_account(batch_asset, gpool.treasury), "treasury", gpool.treasury.to_string(),
                      "Treasury has no account for the batch asset", ErrorInvalidAssetAccount);

        const uint64_t new_nonce = checked_add(ledger_iter->withdrawal_nonce, 1, "withdrawal_nonce");
        const uint64_t new_withdrawn = checked_add(ledger_iter->total_withdrawn, total, "total_withdrawn");
        eosio_assert(new_withdrawn <= ledger_iter->total_earned,
                     "withdraw, total withdrawn exceeds total earned for farmer.");
        const uint64_t new_distributed = checked_add(gpool.total_distributed, farmer_amount, "total_distributed");
        const uint64_t new_fees = checked_add(gpool.total_fees_collected, fee, "total_fees_collected");
        const uint32_t present_time = now();

        for (const uint64_t id : staged) {
            const auto &task = tasks.get(id, "withdraw, staged task lookup error.");
            tasks.modify(task, same_payer, [&](struct task_record &t) {
                t.claimed = true;
            });
        }

        vaultsbyaddress.modify(vault_iter, same_payer, [&](struct reward_vault &v) {
            v.balance -= total;
        });

        ledgersbyaddress.modify(ledger_iter, same_payer, [&](struct farmer_ledger &l) {
            l.withdrawal_nonce = new_nonce;
            l.total_withdrawn = new_withdrawn;
            l.last_withdrawal_clock = present_time;
        });

        gpool.total_distributed = new_distributed;
        gpool.total_fees_collected = new_fees;

        send_payout(batch_asset, farmer, farmer_amount, FARMERPAYOUTMEMO);
        send_payout(batch_asset, gpool.treasury, fee, TREASURYPAYOUTMEMO);

        print("Withdrawal of ", (uint64_t) task_ids.size(), " tasks by ", farmer, ": total ", total, ", farmer ",
              farmer_amount, ", fee ", fee, " ", extended_symbol_to_string(batch_asset), ", next nonce ",
              new_nonce, "\n");
    }

    [[eosio::action]]
    void setpaused(const name &authority, const bool &is_paused, const checksum256 &pool_address) {
        reward_assert(has_auth(authority), "authority", authority.to_string(),
                      "Missing required authority", ErrorMissingAuthorization);
        assert_initialized(pool_address);
        assert_pool_address(pool_address);
        assert_authority(authority);

        gpool.paused = is_paused;

        print("Reward pool ", is_paused ? "paused" : "resumed", " by ", authority, "\n");
    }

    [[eosio::action]]
    void updatefee(const name &authority, const uint8_t &new_fee_percentage, const checksum256 &pool_address) {
        reward_assert(has_auth(authority), "authority", authority.to_string(),
                      "Missing required authority", ErrorMissingAuthorization);
        assert_initialized(pool_address);
        assert_pool_address(pool_address);
        assert_authority(authority);
        reward_assert(new_fee_percentage <= MAXFEEPERCENTAGE, "new_fee_percentage", to_string(new_fee_percentage),
                      "Fee percentage must be between 0 and 100", ErrorInvalidFeePercentage);

        const uint8_t old_fee_percentage = gpool.fee_percentage;
        gpool.fee_percentage = new_fee_percentage;

        print("Platform fee updated from ", (uint32_t) old_fee_percentage, "% to ",
              (uint32_t) new_fee_percentage, "%\n");
    }

    //prints the unclaimed rewards of farmer grouped by asset, along with the ledger counters.
    [[eosio::action]]
    void pendingrwds(const name &farmer) {
        vector<pending_reward> pending;

        auto tasksbyfarmer = tasks.get_index<"byfarmer"_n>();
        for (auto task_iter = tasksbyfarmer.lower_bound(farmer.value);
             task_iter != tasksbyfarmer.end() && task_iter->farmer == farmer; task_iter++) {
            if (task_iter->claimed) {
                continue;
            }
            auto entry = std::find_if(pending.begin(), pending.end(), [&](const pending_reward &p) {
                return p.asset_id == task_iter->asset_id;
            });
            if (entry == pending.end()) {
                pending_reward p;
                p.asset_id = task_iter->asset_id;
                pending.push_back(p);
                entry = pending.end() - 1;
            }
            entry->amount = checked_add(entry->amount, task_iter->reward_amount, "amount");
            entry->task_count++;
        }

        uint64_t next_nonce = 0;
        uint64_t total_earned = 0;
        uint64_t total_withdrawn = 0;
        auto ledgersbyaddress = farmers.get_index<"byaddress"_n>();
        auto ledger_iter = ledgersbyaddress.find(farmer_ledger_address(_self, farmer).address);
        if (ledger_iter != ledgersbyaddress.end()) {
            eosio_assert(ledger_iter->farmer == farmer, "pendingrwds, farmer ledger lookup error.");
            next_nonce = ledger_iter->withdrawal_nonce;
            total_earned = ledger_iter->total_earned;
            total_withdrawn = ledger_iter->total_withdrawn;
        }

        string response_string = string("{\"farmer\":\"") + farmer.to_string() +
                                 string("\",\"next_nonce\":") + to_string(next_nonce) +
                                 string(",\"total_earned\":") + to_string(total_earned) +
                                 string(",\"total_withdrawn\":") + to_string(total_withdrawn) +
                                 string(",\"pending\":[");
        for (size_t i = 0; i < pending.size(); i++) {
            if (i > 0) {
                response_string += ",";
            }
            response_string += string("{\"asset\":\"") + extended_symbol_to_string(pending[i].asset_id) +
                               string("\",\"amount\":") + to_string(pending[i].amount) +
                               string(",\"tasks\":") + to_string(pending[i].task_count) + string("}");
        }
        response_string += "]}";

        print(response_string);
    }

    /***********
     * credits the vault of the incoming asset. transfers sent by the pool itself are ignored.
     * only the pool authority can open the vault of a new asset, any account can top up an existing vault.
     */
    void deposit(const name &from, const name &to, const asset &quantity, const string &memo,
                 const name &token_contract) {
        if (from == _self || to != _self) {
            return;
        }
        reward_assert(gpool.initialized, "to", to.to_string(),
                      "Reward pool is not initialized", ErrorNotInitialized);
        reward_assert(quantity.is_valid() && quantity.amount > 0, "quantity", quantity.to_string(),
                      "Deposit quantity must be positive", ErrorInvalidArgument);

        const extended_symbol asset_id(quantity.symbol, token_contract);
        const derived_address vault_derived = reward_vault_address(_self, asset_id);
        const uint64_t amount = (uint64_t) quantity.amount;

        auto vaultsbyaddress = vaults.get_index<"byaddress"_n>();
        auto vault_iter = vaultsbyaddress.find(vault_derived.address);
        uint64_t new_balance = amount;
        if (vault_iter == vaultsbyaddress.end()) {
            reward_assert(from == gpool.authority, "quantity", extended_symbol_to_string(asset_id),
                          "No vault for asset, only the pool authority can open one", ErrorInvalidArgument);
            const uint64_t id = vaults.available_primary_key();
            vaults.emplace(_self, [&](struct reward_vault &v) {
                v.id = id;
                v.address = vault_derived.address;
                v.asset_id = asset_id;
                v.balance = amount;
                v.total_deposited = amount;
            });
        } else {
            eosio_assert(vault_iter->asset_id == asset_id, "deposit, vault lookup error.");
            new_balance = checked_add(vault_iter->balance, amount, "balance");
            const uint64_t new_total = checked_add(vault_iter->total_deposited, amount, "total_deposited");
            vaultsbyaddress.modify(vault_iter, same_payer, [&](struct reward_vault &v) {
                v.balance = new_balance;
                v.total_deposited = new_total;
            });
        }

        print("Vault ", extended_symbol_to_string(asset_id), " credited ", quantity, " from ", from,
              ", balance ", new_balance, ", memo ", memo, "\n");
    }
};
}

extern "C" {
    void apply(uint64_t receiver, uint64_t code, uint64_t action) {
        if (code == receiver) {
            switch (action) {
                EOSIO_DISPATCH_HELPER(rewardpool::RewardPool,
                        (initpool)(recordtask)(withdraw)(setpaused)(updatefee)(pendingrwds))
            }
        } else if (action == eosio::name("transfer").value) {
            rewardpool::RewardPool pool(eosio::name(receiver), eosio::name(code),
                                        eosio::datastream<const char *>(nullptr, 0));
            const auto t = eosio::unpack_action_data<rewardpool::token::transfer_args>();
            pool.deposit(t.from, t.to, t.quantity, t.memo, eosio::name(code));
        }
    }
}
