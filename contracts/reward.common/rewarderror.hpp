/** Reward error definitions file
 *  Description: error codes and assertion helpers shared by the reward contracts.
 *  @file rewarderror.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/system.hpp>
#include <string>

namespace rewardpool {

    using std::string;

    static constexpr uint64_t ident = 0x7277000000000000;

    //validation errors
    static constexpr auto ErrorInvalidFeePercentage = ident | 100;
    static constexpr auto ErrorInvalidArgument = ident | 101;
    static constexpr auto ErrorInconsistentAsset = ident | 102;

    //authorization errors
    static constexpr auto ErrorMissingAuthorization = ident | 200;
    static constexpr auto ErrorUnauthorized = ident | 201;
    static constexpr auto ErrorInvalidFarmerAddress = ident | 202;

    //state errors
    static constexpr auto ErrorNotInitialized = ident | 300;
    static constexpr auto ErrorPaused = ident | 301;
    static constexpr auto ErrorTaskAlreadyClaimed = ident | 302;
    static constexpr auto ErrorTaskNotFound = ident | 303;
    static constexpr auto ErrorDuplicateTask = ident | 304;
    static constexpr auto ErrorAlreadyInitialized = ident | 305;

    //resource errors
    static constexpr auto ErrorInsufficientBalance = ident | 400;
    static constexpr auto ErrorInvalidAssetAccount = ident | 401;

    //address errors
    static constexpr auto ErrorAddressMismatch = ident | 500;

    //arithmetic errors
    static constexpr auto ErrorOverflow = ident | 600;
    static constexpr auto ErrorInvalidNonce = ident | 601;

    inline const char *error_name(const uint64_t code) {
        switch (code) {
            case ErrorInvalidFeePercentage: return "InvalidFeePercentage";
            case ErrorInvalidArgument: return "InvalidArgument";
            case ErrorInconsistentAsset: return "InconsistentAsset";
            case ErrorMissingAuthorization: return "MissingAuthorization";
            case ErrorUnauthorized: return "Unauthorized";
            case ErrorInvalidFarmerAddress: return "InvalidFarmerAddress";
            case ErrorNotInitialized: return "NotInitialized";
            case ErrorPaused: return "Paused";
            case ErrorTaskAlreadyClaimed: return "TaskAlreadyClaimed";
            case ErrorTaskNotFound: return "TaskNotFound";
            case ErrorDuplicateTask: return "DuplicateTask";
            case ErrorAlreadyInitialized: return "AlreadyInitialized";
            case ErrorInsufficientBalance: return "InsufficientBalance";
            case ErrorInvalidAssetAccount: return "InvalidAssetAccount";
            case ErrorAddressMismatch: return "AddressMismatch";
            case ErrorOverflow: return "Overflow";
            case ErrorInvalidNonce: return "InvalidNonce";
            default: return "Unknown";
        }
    }

    //the hundreds digit of the low word selects the category.
    inline const char *error_type(const uint64_t code) {
        switch ((code & ~ident) / 100) {
            case 1: return "validation_error";
            case 2: return "authorization_error";
            case 3: return "state_error";
            case 4: return "resource_error";
            case 5: return "address_error";
            case 6: return "arithmetic_error";
            default: return "unknown_error";
        }
    }

    /***
     * aborts the running action when test is false. the abort message is a json object naming the
     * error category, the error code, and the offending field so clients can report it.
     * @param test the condition that must hold
     * @param fieldname the action parameter or record field that failed
     * @param fieldvalue the printable value of that field
     * @param message human readable reason
     * @param code one of the Error constants above
     */
    inline void reward_assert(const bool test, const char *fieldname, const string &fieldvalue,
                              const char *message, const uint64_t code) {
        if (!test) {
            const string json = string("{\"type\": \"") + error_type(code) +
                                string("\",\"code\": \"") + error_name(code) +
                                string("\",\"fields\": [{\"name\": \"") + fieldname +
                                string("\",\"value\": \"") + fieldvalue +
                                string("\",\"error\": \"") + message + string("\"}]}");
            eosio::check(false, json);
        }
    }
}
