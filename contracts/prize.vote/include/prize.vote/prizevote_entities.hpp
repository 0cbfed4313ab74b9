#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <string>

#include "ledger.hpp"

namespace prizevote {

using namespace std;
using namespace eosio;

static constexpr eosio::name active_perm{"active"_n};
static constexpr eosio::name SYS_BANK{"eosio.token"_n};
static constexpr symbol   SYS_SYMBOL            = symbol(symbol_code("MGP"), 4);
static constexpr uint64_t PRIZEVOTE_SCOPE       = 1000;

#define CONTRACT_TBL [[eosio::table, eosio::contract("prize.vote")]]

/**
 * Round scalars only; candidates and voters have their own tables so the
 * singleton stays the same size however many accounts vote.
 */
struct [[eosio::table("global"), eosio::contract("prize.vote")]] global_t {
    name                    admin;
    uint8_t                 phase = IDLE;
    time_point_sec          started_at;
    asset                   balance = asset(0, SYS_SYMBOL);
    name                    winner;
    uint64_t                vote_count = 0;
    uint64_t                candidate_count = 0;

    global_t() {}

    round_state<name> to_round() const {
        round_state<name> round(admin);
        round.phase             = phase;
        round.started_at        = started_at.sec_since_epoch();
        round.balance           = balance.amount;
        round.winner            = winner;
        round.vote_count        = vote_count;
        round.candidate_count   = candidate_count;
        return round;
    }

    void from_round(const round_state<name>& round) {
        admin                   = round.admin;
        phase                   = round.phase;
        started_at              = time_point_sec(round.started_at);
        balance                 = asset(round.balance, SYS_SYMBOL);
        winner                  = round.winner;
        vote_count              = round.vote_count;
        candidate_count         = round.candidate_count;
    }

    EOSLIB_SERIALIZE( global_t, (admin)(phase)(started_at)(balance)(winner)
                                (vote_count)(candidate_count) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

struct CONTRACT_TBL candidate_t {
    name            owner;
    uint64_t        seq = 0;            //registration order, from 0
    uint64_t        tally = 0;          //1 = registered, +1 per vote

    candidate_t() {}
    candidate_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }
    uint64_t scope() const { return PRIZEVOTE_SCOPE; }
    uint64_t by_seq() const { return seq; }

    typedef eosio::multi_index<"candidates"_n, candidate_t,
        indexed_by<"seq"_n, const_mem_fun<candidate_t, uint64_t, &candidate_t::by_seq> >
    > table_t;

    EOSLIB_SERIALIZE( candidate_t, (owner)(seq)(tally) )
};

struct CONTRACT_TBL voter_t {
    name            owner;
    time_point_sec  voted_at;

    voter_t() {}
    voter_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }
    uint64_t scope() const { return PRIZEVOTE_SCOPE; }

    typedef eosio::multi_index<"voters"_n, voter_t> table_t;

    EOSLIB_SERIALIZE( voter_t, (owner)(voted_at) )
};

}
