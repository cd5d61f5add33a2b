/** Reward address derivation file
 *  Description: deterministic record addresses. Every record the pool owns lives at an address
 *  computed from the program account, a tag and seed bytes. Callers hand these addresses in and
 *  each action re-derives them before touching a record.
 *  @file derivation.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/crypto.h>
#include <eosiolib/fixed_bytes.hpp>
#include <eosiolib/asset.hpp>
#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <vector>
#include "reward.common.hpp"

namespace rewardpool {

    using namespace eosio;
    using std::string;
    using std::vector;

    struct derived_address {
        checksum256 address;
        uint8_t bump = 0;
    };

    //seed bytes are concatenated without separators, the tag fixes their layout.
    class seed_buffer {
    public:
        seed_buffer &append(const name &n) {
            return append_le64(n.value);
        }

        seed_buffer &append(const string &s) {
            return append_bytes(s.data(), s.size());
        }

        seed_buffer &append(const extended_symbol &asset_id) {
            append(asset_id.get_contract());
            return append_le64(asset_id.get_symbol().raw());
        }

        const vector<char> &bytes() const { return data; }

    private:
        seed_buffer &append_le64(const uint64_t value) {
            char bytes[sizeof(value)];
            memcpy(bytes, &value, sizeof(value));
            return append_bytes(bytes, sizeof(bytes));
        }

        seed_buffer &append_bytes(const char *p, const size_t len) {
            data.insert(data.end(), p, p + len);
            return *this;
        }

        vector<char> data;
    };

    /***
     * address = sha256(le64(program) || tag || seeds || bump). the bump counts down from 255 and the
     * first digest whose leading 8 bytes are not all zero is taken, the zero slot is reserved.
     * @param program the account that owns the derived records
     * @param tag the entity tag
     * @param seeds the entity seed bytes
     * @return the address and the bump that produced it
     */
    inline derived_address derive_address(const name &program, const char *tag, const seed_buffer &seeds) {
        vector<char> preimage;
        const uint64_t program_value = program.value;
        char program_bytes[sizeof(program_value)];
        memcpy(program_bytes, &program_value, sizeof(program_value));
        preimage.insert(preimage.end(), program_bytes, program_bytes + sizeof(program_bytes));
        preimage.insert(preimage.end(), tag, tag + strlen(tag));
        preimage.insert(preimage.end(), seeds.bytes().begin(), seeds.bytes().end());
        preimage.push_back(0);

        for (int bump = 255; bump >= 0; bump--) {
            preimage.back() = (char) bump;
            capi_checksum256 digest;
            ::sha256(preimage.data(), preimage.size(), &digest);

            uint64_t leading = 0;
            memcpy(&leading, digest.hash, sizeof(leading));
            if (leading != 0) {
                std::array<uint8_t, 32> raw;
                std::copy(std::begin(digest.hash), std::end(digest.hash), raw.begin());
                derived_address result;
                result.address = checksum256(raw);
                result.bump = (uint8_t) bump;
                return result;
            }
        }
        eosio_assert(false, "derive_address, no usable bump for seeds.");
        return derived_address{};
    }

    inline derived_address pool_config_address(const name &program) {
        return derive_address(program, REWARDPOOLTAG, seed_buffer());
    }

    inline derived_address farmer_ledger_address(const name &program, const name &farmer) {
        seed_buffer seeds;
        seeds.append(farmer);
        return derive_address(program, FARMERTAG, seeds);
    }

    inline derived_address task_record_address(const name &program, const string &task_id) {
        seed_buffer seeds;
        seeds.append(task_id);
        return derive_address(program, TASKTAG, seeds);
    }

    inline derived_address reward_vault_address(const name &program, const extended_symbol &asset_id) {
        seed_buffer seeds;
        seeds.append(asset_id);
        return derive_address(program, REWARDVAULTTAG, seeds);
    }

    inline string checksum_to_hex(const checksum256 &value) {
        static const char hexdigits[] = "0123456789abcdef";
        const auto bytes = value.extract_as_byte_array();
        string hex;
        hex.reserve(bytes.size() * 2);
        for (const uint8_t b : bytes) {
            hex += hexdigits[b >> 4];
            hex += hexdigits[b & 0x0f];
        }
        return hex;
    }

    inline void verify_address(const checksum256 &supplied, const derived_address &expected, const char *fieldname) {
        reward_assert(supplied == expected.address, fieldname, checksum_to_hex(supplied),
                      "Address does not match its derivation", ErrorAddressMismatch);
    }
}
