#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace prizevote {

static constexpr int64_t  VOTE_FEE_AMOUNT       = 100;                  //0.0100 in precision 4
static constexpr uint32_t ROUND_DURATION_SEC    = 3 * 24 * 3600;        //3 days
static constexpr uint64_t REGISTERED_TALLY      = 1;                    //0 means not registered

enum phase_t: uint8_t {
    IDLE        = 0,
    STARTED     = 1,
    CLOSED      = 2
};

enum err_t: uint8_t {
    ERR_NONE                    = 0,
    ERR_UNAUTHORIZED,
    ERR_NOT_IDLE,
    ERR_NOT_STARTED,
    ERR_DUPLICATE_CANDIDATE,
    ERR_NO_CANDIDATES,
    ERR_ROUND_ENDED,
    ERR_ROUND_NOT_ENDED,
    ERR_ROUND_NOT_CLOSED,
    ERR_ALREADY_VOTED,
    ERR_WRONG_FEE,
    ERR_UNKNOWN_CANDIDATE
};

inline const char* err_msg(err_t err) {
    switch (err) {
        case ERR_NONE:                  return "";
        case ERR_UNAUTHORIZED:          return "Caller is not an owner";
        case ERR_NOT_IDLE:              return "Voting isn't in 'idle' state";
        case ERR_NOT_STARTED:           return "Voting isn't in 'started' state";
        case ERR_DUPLICATE_CANDIDATE:   return "Candidate has already added";
        case ERR_NO_CANDIDATES:         return "Can't start without candidates";
        case ERR_ROUND_ENDED:           return "Voting has been ended";
        case ERR_ROUND_NOT_ENDED:       return "Voting hasn't been ended";
        case ERR_ROUND_NOT_CLOSED:      return "Profit hasn't been paid";
        case ERR_ALREADY_VOTED:         return "Transaction allowed only once";
        case ERR_WRONG_FEE:             return "Should be 0.0100 MGP";
        case ERR_UNKNOWN_CANDIDATE:     return "Candidate hasn't been proposed";
    }
    return "unknown error";
}

inline bool is_phase_error(err_t err) {
    return err == ERR_NOT_IDLE || err == ERR_NOT_STARTED;
}

/**
 * winner gets 90% of the pool: integer division first, so the odd units
 * stay with the commission
 */
inline int64_t winner_share(int64_t balance) {
    return balance / 10 * 9;
}

/**
 * Scalars of the round. Per-account data (tallies, voters) lives in a
 * store so the chain can keep it in tables instead of one growing blob.
 */
template<typename Account>
struct round_state {
    Account                         admin;
    uint8_t                         phase = IDLE;
    uint32_t                        started_at = 0;     //seconds since epoch
    int64_t                         balance = 0;
    Account                         winner{};
    uint64_t                        vote_count = 0;
    uint64_t                        candidate_count = 0;

    round_state() {}
    explicit round_state(const Account& a): admin(a) {}
};

template<typename Account>
struct payout_t {
    Account to{};
    int64_t amount = 0;
};

/**
 * In-memory store. The contract supplies a multi_index backed store with
 * the same members: tally_of, add_candidate, add_vote, has_voted, add_voter.
 */
template<typename Account>
struct memory_store {
    std::vector<Account>            candidates;         //in registration order
    std::map<Account, uint64_t>     tallies;            //1 = registered, +1 per vote
    std::set<Account>               voters;

    uint64_t tally_of(const Account& candidate) const {
        auto itr = tallies.find(candidate);
        return itr == tallies.end() ? 0 : itr->second;
    }

    void add_candidate(const Account& candidate) {
        tallies[candidate] = REGISTERED_TALLY;
        candidates.push_back(candidate);
    }

    uint64_t add_vote(const Account& candidate) {
        return ++tallies[candidate];
    }

    bool has_voted(const Account& voter) const {
        return voters.find(voter) != voters.end();
    }

    void add_voter(const Account& voter) {
        voters.insert(voter);
    }
};

/**
 * Single-round plurality vote with a fixed entry fee.
 *
 * Operates in place on a round_state and a store owned by the caller. Each
 * operation validates everything first and only then mutates, so a
 * returned error means nothing was written. Value transfers are not
 * performed here: close() and withdraw() hand back the payout to execute.
 */
template<typename Account, typename Store = memory_store<Account>>
class ledger {
  private:
    round_state<Account>&   _state;
    Store&                  _store;
    int64_t                 _vote_fee;
    uint32_t                _round_duration;

  public:
    ledger(round_state<Account>& state, Store& store,
           int64_t vote_fee = VOTE_FEE_AMOUNT,
           uint32_t round_duration = ROUND_DURATION_SEC):
        _state(state), _store(store), _vote_fee(vote_fee), _round_duration(round_duration) {}

    /// admin-only operations check this before anything else
    err_t authorize(const Account& issuer) const {
        return issuer == _state.admin ? ERR_NONE : ERR_UNAUTHORIZED;
    }

    err_t add_candidate(const Account& issuer, const Account& candidate) {
        if (authorize(issuer) != ERR_NONE)  return ERR_UNAUTHORIZED;
        if (_state.phase != IDLE)           return ERR_NOT_IDLE;
        if (tally_of(candidate) != 0)       return ERR_DUPLICATE_CANDIDATE;

        _store.add_candidate(candidate);
        _state.candidate_count++;
        return ERR_NONE;
    }

    err_t start(const Account& issuer, uint32_t now) {
        if (authorize(issuer) != ERR_NONE)  return ERR_UNAUTHORIZED;
        if (_state.phase != IDLE)           return ERR_NOT_IDLE;
        if (_state.candidate_count == 0)    return ERR_NO_CANDIDATES;

        _state.started_at = now;
        _state.phase = STARTED;
        return ERR_NONE;
    }

    err_t vote(const Account& voter, const Account& candidate, int64_t paid, uint32_t now) {
        if (_state.phase != STARTED)        return ERR_NOT_STARTED;
        if (ended(now))                     return ERR_ROUND_ENDED;
        if (has_voted(voter))               return ERR_ALREADY_VOTED;
        if (paid != _vote_fee)              return ERR_WRONG_FEE;
        if (tally_of(candidate) == 0)       return ERR_UNKNOWN_CANDIDATE;

        auto tally = _store.add_vote(candidate);
        if (tally > tally_of(_state.winner))
            _state.winner = candidate;

        _state.vote_count++;
        _state.balance += paid;
        _store.add_voter(voter);
        return ERR_NONE;
    }

    /// anyone may close once the deadline has strictly passed
    err_t close(uint32_t now, payout_t<Account>& prize) {
        if (_state.phase != STARTED)        return ERR_NOT_STARTED;
        if (!ended(now))                    return ERR_ROUND_NOT_ENDED;

        _state.phase = CLOSED;
        prize = payout_t<Account>{};
        if (has_winner()) {
            prize.to = _state.winner;
            prize.amount = winner_share(_state.balance);
            _state.balance -= prize.amount;
        }
        return ERR_NONE;
    }

    err_t withdraw(const Account& issuer, const Account& to, payout_t<Account>& commission) {
        if (authorize(issuer) != ERR_NONE)  return ERR_UNAUTHORIZED;
        if (_state.phase != CLOSED)         return ERR_ROUND_NOT_CLOSED;

        commission.to = to;
        commission.amount = _state.balance;
        _state.balance = 0;
        return ERR_NONE;
    }

    uint64_t tally_of(const Account& candidate) const { return _store.tally_of(candidate); }

    bool has_voted(const Account& voter) const { return _store.has_voted(voter); }

    bool has_winner() const { return _state.vote_count > 0; }

    uint64_t deadline() const { return uint64_t(_state.started_at) + _round_duration; }

    bool ended(uint32_t now) const { return deadline() < now; }

    const Account& admin() const                    { return _state.admin; }
    phase_t phase() const                           { return phase_t(_state.phase); }
    int64_t balance() const                         { return _state.balance; }
    uint32_t started_at() const                     { return _state.started_at; }
    const Account& winner() const                   { return _state.winner; }
    uint64_t vote_count() const                     { return _state.vote_count; }
    uint64_t candidate_count() const                { return _state.candidate_count; }
};

}
