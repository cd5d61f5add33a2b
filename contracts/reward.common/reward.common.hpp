/** Reward common definitions file
 *  Description: constants and helpers shared by the reward pool and reward token contracts.
 *  @file reward.common.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/symbol.hpp>
#include <string>
#include "rewarderror.hpp"
#include "reward.accounts.hpp"

namespace rewardpool {

    using namespace eosio;
    using std::string;
    using std::to_string;

    static constexpr uint8_t MAXFEEPERCENTAGE = 100;
    static constexpr size_t MAXTASKIDLEN = 60;
    static constexpr size_t MAXPOOLIDLEN = 60;
    static constexpr size_t MAXMEMOLEN = 256;

    //derivation tags, one per logical entity.
    static const char *const REWARDPOOLTAG = "reward_pool";
    static const char *const FARMERTAG = "farmer";
    static const char *const TASKTAG = "task";
    static const char *const REWARDVAULTTAG = "reward_vault";

    static const string FARMERPAYOUTMEMO = "Reward withdrawal";
    static const string TREASURYPAYOUTMEMO = "Platform fee";

    inline bool validateTaskIdFormat(const string &task_id) {
        return !task_id.empty() && task_id.size() <= MAXTASKIDLEN;
    }

    inline bool validatePoolIdFormat(const string &pool_id) {
        return pool_id.size() <= MAXPOOLIDLEN;
    }

    inline uint64_t checked_add(const uint64_t a, const uint64_t b, const char *fieldname) {
        reward_assert(b <= UINT64_MAX - a, fieldname, to_string(a) + " + " + to_string(b),
                      "Arithmetic overflow", ErrorOverflow);
        return a + b;
    }

    //floor(total * fee_percentage / 100), the product is taken in 128 bits.
    inline uint64_t compute_platform_fee(const uint64_t total, const uint8_t fee_percentage) {
        const uint128_t scaled = (uint128_t) total * (uint128_t) fee_percentage;
        return (uint64_t)(scaled / (uint128_t) 100);
    }

    //"4,RWD@reward.token"
    inline string extended_symbol_to_string(const extended_symbol &asset_id) {
        const symbol sym = asset_id.get_symbol();
        return to_string(sym.precision()) + "," + sym.code().to_string() + "@" +
               asset_id.get_contract().to_string();
    }
}
