#pragma once

#include <eosio/eosio.hpp>
#include <eosio/system.hpp>

#include "prizevote_entities.hpp"
#include "wasm_db.hpp"

namespace prizevote {

using namespace wasm::db;

/**
 * Ledger store over the candidates and voters tables. Each call touches a
 * single row, so an action costs the same at the first vote and the last.
 */
class table_store {
  private:
    dbc                         _dbc;
    const round_state<name>&    _round;

  public:
    table_store(const name& code, const round_state<name>& round):
        _dbc(code), _round(round) {}

    uint64_t tally_of(const name& candidate) {
        candidate_t row(candidate);
        return _dbc.get(row) ? row.tally : 0;
    }

    void add_candidate(const name& candidate) {
        candidate_t row(candidate);
        row.seq = _round.candidate_count;
        row.tally = REGISTERED_TALLY;
        _dbc.set(row);
    }

    uint64_t add_vote(const name& candidate) {
        candidate_t row(candidate);
        check( _dbc.get(row), "Err: candidate[" + candidate.to_string() + "] not found" );
        row.tally++;
        _dbc.set(row);
        return row.tally;
    }

    bool has_voted(const name& voter) {
        voter_t row(voter);
        return _dbc.get(row);
    }

    void add_voter(const name& voter) {
        voter_t row(voter);
        row.voted_at = time_point_sec(current_time_point());
        _dbc.set(row);
    }
};

}
