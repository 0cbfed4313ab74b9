// prize.vote - Prize and Commission Accounting Tests

#include <gtest/gtest.h>
#include <prize.vote/ledger.hpp>

#include <string>
#include <vector>

namespace prizevote {
namespace {

using Account = std::string;

static constexpr uint32_t T0 = 1650000000;
static constexpr uint32_t AFTER_DEADLINE = T0 + ROUND_DURATION_SEC + 1;

class PayoutTest : public ::testing::Test {
protected:
    round_state<Account> state_{"owner"};
    memory_store<Account> store_;
    ledger<Account> ledger_{state_, store_};

    void SetUp() override {
        for (const char* c : {"a", "b", "c"}) {
            ASSERT_EQ(ledger_.add_candidate("owner", c), ERR_NONE);
        }
        ASSERT_EQ(ledger_.start("owner", T0), ERR_NONE);
    }

    void Vote(const Account& voter, const Account& candidate) {
        ASSERT_EQ(ledger_.vote(voter, candidate, VOTE_FEE_AMOUNT, T0 + 3600), ERR_NONE);
    }
};

// ============================================================================
// Winner Share
// ============================================================================

TEST(WinnerShareTest, TruncatesBeforeMultiplying) {
    EXPECT_EQ(winner_share(0), 0);
    EXPECT_EQ(winner_share(9), 0);
    EXPECT_EQ(winner_share(10), 9);
    EXPECT_EQ(winner_share(19), 9);
    EXPECT_EQ(winner_share(100), 90);
    EXPECT_EQ(winner_share(300), 270);
    EXPECT_EQ(winner_share(1005), 900);
}

// ============================================================================
// Close Payouts
// ============================================================================

TEST_F(PayoutTest, ThreeVotersSplitTwoCandidates) {
    Vote("v1", "a");
    Vote("v2", "b");
    Vote("v3", "b");
    ASSERT_EQ(ledger_.balance(), 3 * VOTE_FEE_AMOUNT);

    payout_t<Account> prize;
    ASSERT_EQ(ledger_.close(AFTER_DEADLINE, prize), ERR_NONE);
    EXPECT_EQ(prize.to, "b");
    EXPECT_EQ(prize.amount, 270);           // 0.0270 of the 0.0300 pool
    EXPECT_EQ(ledger_.balance(), 30);

    payout_t<Account> commission;
    ASSERT_EQ(ledger_.withdraw("owner", "owner", commission), ERR_NONE);
    EXPECT_EQ(commission.amount, 30);
    EXPECT_EQ(prize.amount + commission.amount, 3 * VOTE_FEE_AMOUNT);
}

TEST_F(PayoutTest, SingleVoter) {
    Vote("v1", "a");

    payout_t<Account> prize;
    ASSERT_EQ(ledger_.close(AFTER_DEADLINE, prize), ERR_NONE);
    EXPECT_EQ(prize.to, "a");
    EXPECT_EQ(prize.amount, winner_share(VOTE_FEE_AMOUNT));

    payout_t<Account> commission;
    ASSERT_EQ(ledger_.withdraw("owner", "treasury", commission), ERR_NONE);
    EXPECT_EQ(commission.to, "treasury");
    EXPECT_EQ(commission.amount, VOTE_FEE_AMOUNT - winner_share(VOTE_FEE_AMOUNT));
    EXPECT_EQ(ledger_.balance(), 0);
}

TEST_F(PayoutTest, TieGoesToFirstToReach) {
    Vote("v1", "c");
    Vote("v2", "a");
    Vote("v3", "a");
    Vote("v4", "c");

    payout_t<Account> prize;
    ASSERT_EQ(ledger_.close(AFTER_DEADLINE, prize), ERR_NONE);
    EXPECT_EQ(prize.to, "a");
}

TEST_F(PayoutTest, AnyoneMayClose) {
    Vote("v1", "a");
    payout_t<Account> prize;
    // close takes no caller: the round is public once over
    ASSERT_EQ(ledger_.close(AFTER_DEADLINE, prize), ERR_NONE);
    EXPECT_EQ(ledger_.phase(), CLOSED);
}

TEST_F(PayoutTest, NoVotesLeavesEverythingForCommission) {
    payout_t<Account> prize;
    ASSERT_EQ(ledger_.close(AFTER_DEADLINE, prize), ERR_NONE);
    EXPECT_EQ(prize.amount, 0);
    EXPECT_FALSE(ledger_.has_winner());

    payout_t<Account> commission;
    ASSERT_EQ(ledger_.withdraw("owner", "owner", commission), ERR_NONE);
    EXPECT_EQ(commission.amount, 0);
}

TEST_F(PayoutTest, ManyVotersKeepResidue) {
    // 13 votes = 1300 units, prize 1170, commission 130
    const std::vector<Account> picks = {"a", "b", "c", "a", "b", "a", "c",
                                        "a", "b", "a", "c", "b", "a"};
    for (size_t i = 0; i < picks.size(); ++i) {
        Vote("voter" + std::to_string(i), picks[i]);
    }

    payout_t<Account> prize;
    ASSERT_EQ(ledger_.close(AFTER_DEADLINE, prize), ERR_NONE);
    EXPECT_EQ(prize.to, "a");
    EXPECT_EQ(prize.amount, 1170);
    EXPECT_EQ(ledger_.balance(), 130);
}

TEST_F(PayoutTest, FailedCloseKeepsBalance) {
    Vote("v1", "a");
    payout_t<Account> prize;
    EXPECT_EQ(ledger_.close(T0 + ROUND_DURATION_SEC, prize), ERR_ROUND_NOT_ENDED);
    EXPECT_EQ(ledger_.balance(), VOTE_FEE_AMOUNT);
    EXPECT_EQ(ledger_.phase(), STARTED);
}

// ============================================================================
// Custom Parameters
// ============================================================================

TEST(CustomLedgerTest, FeeAndDurationAreParameters) {
    round_state<uint64_t> state(1);
    memory_store<uint64_t> store;
    ledger<uint64_t> custom(state, store, 5000, 60);

    ASSERT_EQ(custom.add_candidate(1, 42), ERR_NONE);
    ASSERT_EQ(custom.start(1, 1000), ERR_NONE);
    EXPECT_EQ(custom.vote(7, 42, VOTE_FEE_AMOUNT, 1010), ERR_WRONG_FEE);
    EXPECT_EQ(custom.vote(7, 42, 5000, 1010), ERR_NONE);
    EXPECT_EQ(custom.vote(8, 42, 5000, 1061), ERR_ROUND_ENDED);

    payout_t<uint64_t> prize;
    ASSERT_EQ(custom.close(1061, prize), ERR_NONE);
    EXPECT_EQ(prize.to, 42u);
    EXPECT_EQ(prize.amount, 4500);
}

}  // namespace
}  // namespace prizevote
