#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace ctf;
using namespace ctf::ledger;
using namespace ctf::test;

class LeaderboardTest : public ::testing::Test {
protected:
    void SetUp() override {
        e = make_engine(clock.source());
        add_challenge(*e, 1, 100, false, "flag{a}");
        add_challenge(*e, 2, 200, false, "flag{b}");
        add_challenge(*e, 3, 100, true, "flag{c}");
        for (id_type user_id = 1; user_id <= 6; ++user_id) add_user(*e, user_id);
    }

    void solve(id_type user_id, id_type challenge_id) {
        static const char *flags[] = {"", "flag{a}", "flag{b}", "flag{c}"};
        clock.advance(chrono::seconds(1));
        ASSERT_EQ(e->submit_flag(user_id, challenge_id, flags[challenge_id], {}).status, submit_status::ACCEPTED);
    }

    manual_clock clock;
    unique_ptr<engine> e;
};

TEST_F(LeaderboardTest, OwnScoreSumsAwardedPoints) {
    solve(1, 1);
    solve(1, 3);
    solve(2, 3);
    EXPECT_EQ(e->board().own_score(1), 200);
    EXPECT_EQ(e->board().own_score(2), 95);
    EXPECT_EQ(e->board().own_score(3), 0);
}

TEST_F(LeaderboardTest, IndividualOrdering) {
    solve(1, 1);  // user 1: 100 at t1
    solve(2, 1);  // user 2: 100 at t2
    solve(3, 2);  // user 3: 200 at t3
    solve(4, 1);  // user 4: 100 at t4

    auto board = e->get_individual_leaderboard(0);
    ASSERT_EQ(board.size(), 4u);
    EXPECT_EQ(board[0].id, 3);
    EXPECT_EQ(board[0].score, 200);
    // 分数相同，先达到该分数者排名靠前
    EXPECT_EQ(board[1].id, 1);
    EXPECT_EQ(board[2].id, 2);
    EXPECT_EQ(board[3].id, 4);
    for (size_t i = 0; i < board.size(); ++i)
        EXPECT_EQ(board[i].position, i + 1);
    EXPECT_EQ(board[0].name, "user-3");
}

TEST_F(LeaderboardTest, IndividualTieBrokenById) {
    // 时间戳相同、分数相同时按用户 id 排序
    clock.advance(chrono::seconds(10));
    e->submit_flag(5, 1, "flag{a}", {});
    e->submit_flag(2, 2, "flag{b}", {});
    e->submit_flag(2, 1, "flag{a}", {});
    e->submit_flag(5, 2, "flag{b}", {});

    auto board = e->get_individual_leaderboard(0);
    ASSERT_EQ(board.size(), 2u);
    EXPECT_EQ(board[0].id, 2);
    EXPECT_EQ(board[1].id, 5);
    EXPECT_EQ(board[0].score, board[1].score);
}

TEST_F(LeaderboardTest, UsersWithoutSolvesAreNotListed) {
    e->submit_flag(1, 1, "wrong", {});
    solve(2, 1);
    auto board = e->get_individual_leaderboard(0);
    ASSERT_EQ(board.size(), 1u);
    EXPECT_EQ(board[0].id, 2);
    EXPECT_TRUE(e->get_team_leaderboard(0).empty());
}

TEST_F(LeaderboardTest, LimitTruncates) {
    solve(1, 2);
    solve(2, 1);
    solve(3, 3);
    auto board = e->get_individual_leaderboard(2);
    ASSERT_EQ(board.size(), 2u);
    EXPECT_EQ(board[0].id, 1);
    EXPECT_EQ(board[1].id, 2);
}

TEST_F(LeaderboardTest, TeamStandingCountsCurrentMembers) {
    add_team(*e, 10, 1);
    ASSERT_EQ(e->roster().join(2, 10), roster_status::OK);
    solve(1, 1);
    solve(2, 1);
    solve(2, 2);
    solve(3, 3);  // 不在队伍中

    auto standing = e->board().get_team_standing(10);
    ASSERT_TRUE(standing);
    // 两名成员都解出了题目 1，分数重复计入，解题数不重复计入
    EXPECT_EQ(standing->score, 100 + 100 + 200);
    EXPECT_EQ(standing->solved_count, 2u);
    EXPECT_EQ(standing->member_ids, (vector<id_type>{1, 2}));

    size_t individual_sum = e->board().get_user_standing(1)->solved_count + e->board().get_user_standing(2)->solved_count;
    EXPECT_LE(standing->solved_count, individual_sum);
    EXPECT_FALSE(e->board().get_team_standing(99));
}

TEST_F(LeaderboardTest, DisplayScoreOfTeamedUserIsTeamScore) {
    add_team(*e, 10, 1);
    ASSERT_EQ(e->roster().join(2, 10), roster_status::OK);
    solve(1, 1);
    solve(2, 2);
    solve(3, 1);

    EXPECT_EQ(e->board().individual_display_score(1), 300);
    EXPECT_EQ(e->board().individual_display_score(2), 300);
    EXPECT_EQ(e->board().individual_display_score(3), 100);
    EXPECT_EQ(e->board().individual_display_score(99), 0);

    auto standing = e->board().get_user_standing(1);
    ASSERT_TRUE(standing);
    EXPECT_EQ(standing->own_score, 100);
    EXPECT_EQ(standing->display_score, 300);

    EXPECT_EQ(e->board().score_of(solo_player{2}), 200);
    EXPECT_EQ(e->board().score_of(team_player{2, 10}), 300);

    // 个人排行榜使用自己的分数
    auto board = e->get_individual_leaderboard(0);
    ASSERT_EQ(board.size(), 3u);
    EXPECT_EQ(board[0].id, 2);
    EXPECT_EQ(board[0].score, 200);
}

TEST_F(LeaderboardTest, TeamLeaderboard) {
    add_team(*e, 10, 1);
    add_team(*e, 20, 3);
    ASSERT_EQ(e->roster().join(2, 10), roster_status::OK);
    ASSERT_EQ(e->roster().join(4, 20), roster_status::OK);
    solve(1, 1);
    solve(3, 2);
    solve(2, 2);
    solve(5, 2);  // 个人参赛，不计入任何队伍

    auto board = e->get_team_leaderboard(0);
    ASSERT_EQ(board.size(), 2u);
    EXPECT_EQ(board[0].id, 10);
    EXPECT_EQ(board[0].score, 300);
    EXPECT_EQ(board[0].solved_count, 2u);
    EXPECT_EQ(board[0].name, "team-10");
    EXPECT_EQ(board[1].id, 20);
    EXPECT_EQ(board[1].score, 200);
}

TEST_F(LeaderboardTest, TeamTieBrokenByLastSolve) {
    add_team(*e, 10, 1);
    add_team(*e, 20, 3);
    add_team(*e, 30, 5);
    solve(3, 1);  // 队伍 20：100 分，最后解题 t1
    solve(1, 1);  // 队伍 10：100 分，最后解题 t2
    solve(5, 2);  // 队伍 30：200 分

    auto board = e->get_team_leaderboard(0);
    ASSERT_EQ(board.size(), 3u);
    EXPECT_EQ(board[0].id, 30);
    // 分数相同，先达到该分数的队伍排名靠前，即使 id 更大
    EXPECT_EQ(board[1].id, 20);
    EXPECT_EQ(board[2].id, 10);
    EXPECT_EQ(board[1].score, board[2].score);
    EXPECT_LT(board[1].last_solve, board[2].last_solve);
    EXPECT_EQ(board[2].position, 3u);
}

// 队伍关系不记录历史：转队后原来的解题记录计入新队伍
TEST_F(LeaderboardTest, TransferMovesTeamCredit) {
    add_team(*e, 10, 1);
    add_team(*e, 20, 3);
    ASSERT_EQ(e->roster().join(2, 10), roster_status::OK);
    solve(2, 2);
    EXPECT_EQ(e->board().get_team_standing(10)->score, 200);
    EXPECT_EQ(e->board().get_team_standing(20)->score, 0);

    ASSERT_EQ(e->roster().transfer(2, 20), roster_status::OK);
    EXPECT_EQ(e->board().get_team_standing(10)->score, 0);
    EXPECT_EQ(e->board().get_team_standing(20)->score, 200);
    EXPECT_EQ(e->board().individual_display_score(2), 200);
}

TEST_F(LeaderboardTest, ChallengeStats) {
    e->submit_flag(1, 3, "wrong", {});
    e->submit_flag(1, 3, "wrong again", {});
    solve(1, 3);

    auto stats = e->get_challenge_solve_stats(3);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->solve_count, 1u);
    EXPECT_EQ(stats->attempt_count, 3u);
    EXPECT_DOUBLE_EQ(stats->solve_rate_percent, 33.33);
    EXPECT_EQ(stats->dynamic_points_now, 95);

    auto empty = e->get_challenge_solve_stats(2);
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->attempt_count, 0u);
    EXPECT_DOUBLE_EQ(empty->solve_rate_percent, 0);
    EXPECT_EQ(empty->dynamic_points_now, 200);

    EXPECT_FALSE(e->get_challenge_solve_stats(99));
}

TEST_F(LeaderboardTest, SolvedChallengesAndRecentSolves) {
    solve(1, 2);
    solve(2, 1);
    solve(1, 1);

    auto solved = e->board().solved_challenges(1);
    ASSERT_EQ(solved.size(), 2u);
    EXPECT_EQ(solved[0].challenge_id, 2);
    EXPECT_EQ(solved[1].challenge_id, 1);

    auto recent = e->board().recent_solves(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].user_id, 1);
    EXPECT_EQ(recent[0].challenge_id, 1);
    EXPECT_EQ(recent[1].user_id, 2);
}
