#pragma once

#include <eosio/action.hpp>
#include <eosio/asset.hpp>

#include <string>
#include <tuple>

#define TRANSFER(bank, to, quantity, memo) \
    { action(permission_level{ get_self(), active_perm }, bank, "transfer"_n, \
             std::make_tuple( get_self(), to, quantity, std::string(memo) )).send(); }
