#include <prize.vote/prizevote.hpp>

using namespace eosio;
using namespace std;
using std::string;

//account: prize.vote
namespace prizevote {

using namespace std;
using namespace eosio;

/*************** Begin of Helper functions ***************************************/

void prize_vote::_vote(const name& voter, const name& candidate, const asset& quantity) {
	round_ledger round(_round, _store);
	auto rc = round.vote( voter, candidate, quantity.amount, now() );
	check( rc == ERR_NONE, err_msg(rc) );

	PRIZE_LOG( DEBUG, false, voter, " -> ", candidate, ": ", round.tally_of(candidate), " votes, leader: ", round.winner(), "\n" )
}

void prize_vote::_payout(const payout_t<name>& payout, const string& memo) {
	if (payout.amount <= 0) return;	//token contract refuses zero transfers

	asset quantity(payout.amount, SYS_SYMBOL);
	TRANSFER( SYS_BANK, payout.to, quantity, memo )

	PRIZE_LOG( DEBUG, false, memo, ": ", quantity, " -> ", payout.to, "\n" )
}

/*************** Begin of eosio.token transfer trigger function ******************/
void prize_vote::ontransfer(name from, name to, asset quantity, string memo) {
	if (to != _self) return;

	_check_inited();

	check( quantity.symbol.is_valid(), "Invalid quantity symbol name" );
	check( quantity.is_valid(), "Invalid quantity");
	check( quantity.symbol == SYS_SYMBOL, "Token Symbol not allowed" );
	check( quantity.amount > 0, "ontransfer quanity must be positive" );

	string param;
	check( parse_vote_memo(memo, param), "memo must be vote:$candidate" );

	_vote( from, name(param), quantity );
}

/*************** Begin of ACTION functions ***************************************/

void prize_vote::init(const name& admin) {
	require_auth( _self );

	check( _round.admin == name(), "already initialized" );
	check( is_account(admin), admin.to_string() + " not a valid account" );

	_round = round_state<name>(admin);

	PRIZE_LOG( DEBUG, false, "admin: ", admin, "\n" )
}

void prize_vote::addcandidate(const name& issuer, const name& candidate) {
	require_auth( issuer );
	_check_inited();

	round_ledger round(_round, _store);
	auto rc = round.authorize( issuer );
	check( rc == ERR_NONE, err_msg(rc) );
	check( is_account(candidate), candidate.to_string() + " not a valid account" );

	rc = round.add_candidate( issuer, candidate );
	check( rc == ERR_NONE, err_msg(rc) );
}

void prize_vote::startvoting(const name& issuer) {
	require_auth( issuer );
	_check_inited();

	round_ledger round(_round, _store);
	auto rc = round.start( issuer, now() );
	check( rc == ERR_NONE, err_msg(rc) );

	PRIZE_LOG( DEBUG, false, "started_at: ", round.started_at(), ", candidates: ", round.candidate_count(), "\n" )
}

void prize_vote::closevoting(const name& issuer) {
	require_auth( issuer );
	_check_inited();

	round_ledger round(_round, _store);
	payout_t<name> prize;
	auto rc = round.close( now(), prize );
	check( rc == ERR_NONE, err_msg(rc) );

	PRIZE_LOG( DEBUG, false, "closed by ", issuer, ", votes: ", round.vote_count(), "\n" )

	_payout( prize, "prize" );
}

void prize_vote::withdraw(const name& issuer, const name& to) {
	require_auth( issuer );
	_check_inited();

	round_ledger round(_round, _store);
	auto rc = round.authorize( issuer );
	check( rc == ERR_NONE, err_msg(rc) );
	check( is_account(to), to.to_string() + " not a valid account" );

	payout_t<name> commission;
	rc = round.withdraw( issuer, to, commission );
	check( rc == ERR_NONE, err_msg(rc) );

	_payout( commission, "commission" );
}

}  //end of namespace:: prizevote
