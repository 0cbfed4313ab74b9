#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/action.hpp>
#include <string>

#include "ledger.hpp"
#include "memo.hpp"
#include "prizevote_entities.hpp"
#include "table_store.hpp"
#include "utils.hpp"

namespace prizevote {

using eosio::asset;
using eosio::check;
using eosio::datastream;
using eosio::name;
using eosio::symbol;
using eosio::symbol_code;

using std::string;

static constexpr bool DEBUG = true;

#define WASM_FUNCTION_PRINT_LENGTH 50

#define PRIZE_LOG( debug, exception, ... ) {  \
if ( debug ) {                               \
   std::string str = std::string(__FILE__); \
   str += std::string(":");                 \
   str += std::to_string(__LINE__);         \
   str += std::string(":[");                \
   str += std::string(__FUNCTION__);        \
   str += std::string("]");                 \
   while(str.size() <= WASM_FUNCTION_PRINT_LENGTH) str += std::string(" ");\
   eosio::print(str);                                                             \
   eosio::print( __VA_ARGS__ ); }}

/**
 * Paid plurality vote with a prize escrow.
 *
 * Admin registers candidates and starts the round; anyone votes once by
 * transferring exactly VOTE_FEE with memo "vote:$candidate"; after three
 * days anyone closes the round, which pays 90% of the pool to the winner;
 * the admin withdraws what remains.
 */
class [[eosio::contract("prize.vote")]] prize_vote: public eosio::contract {
  private:
    global_singleton    _global;
    global_t            _gstate;
    round_state<name>   _round;
    table_store         _store;

  public:
    using contract::contract;
    prize_vote(eosio::name receiver, eosio::name code, datastream<const char*> ds):
        contract(receiver, code, ds), _global(get_self(), get_self().value),
        _store(get_self(), _round)
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
        _round = _gstate.to_round();
    }

    ~prize_vote() {
        _gstate.from_round( _round );
        _global.set( _gstate, get_self() );
    }

    [[eosio::action]]
    void init(const name& admin);  //only code maintainer can init

    [[eosio::action]]
    void addcandidate(const name& issuer, const name& candidate);

    [[eosio::action]]
    void startvoting(const name& issuer);

    [[eosio::action]]
    void closevoting(const name& issuer); //anyone can invoke once the round is over

    [[eosio::action]]
    void withdraw(const name& issuer, const name& to);

    /// vote by paying: memo "vote:$candidate"
    [[eosio::on_notify("eosio.token::transfer")]]
    void ontransfer(name from, name to, asset quantity, string memo);

    using init_action           = action_wrapper<name("init"),          &prize_vote::init           >;
    using addcandidate_action   = action_wrapper<name("addcandidate"),  &prize_vote::addcandidate   >;
    using startvoting_action    = action_wrapper<name("startvoting"),   &prize_vote::startvoting    >;
    using closevoting_action    = action_wrapper<name("closevoting"),   &prize_vote::closevoting    >;
    using withdraw_action       = action_wrapper<name("withdraw"),      &prize_vote::withdraw       >;

  private:
    typedef ledger<name, table_store> round_ledger;

    uint32_t now() const { return eosio::current_time_point().sec_since_epoch(); }

    void _check_inited() {
        check( _round.admin != name(), "not initialized" );
    }

    void _vote(const name& voter, const name& candidate, const asset& quantity);
    void _payout(const payout_t<name>& payout, const string& memo);
};

}
