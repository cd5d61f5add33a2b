/** Reward accounts definitions file
 *  Description: well-known permission names used by the reward contracts.
 *  @file reward.accounts.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <eosiolib/eosio.hpp>

namespace rewardpool {

    static const eosio::name ACTIVEPERMISSION = eosio::name("active");

}
