#pragma once

#include <eosio/eosio.hpp>
#include <string>

namespace hemat {

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }

enum class err: uint8_t {
   INVALID_FORMAT         = 0,
   QUANTITY_INSUFFICIENT  = 3,
   NOT_POSITIVE           = 4,
   SYMBOL_MISMATCH        = 5,
   EXPIRED                = 6,
   RECORD_NOT_FOUND       = 8,
   RECORD_EXISTS          = 9,
   NOT_EXPIRED            = 10,
   ACCOUNT_INVALID        = 11,
   NO_AUTH                = 16,
   INVALID_STATUS         = 31,
   CONTRACT_MISMATCH      = 32,
   PARAM_ERROR            = 33,
   GUARD_LOCKED           = 34,
   COOLDOWN_ACTIVE        = 35,
   CAP_EXCEEDED           = 36,
   BLACKLISTED            = 37,
   GROUP_FULL             = 38
};

}
