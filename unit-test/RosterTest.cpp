#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace ctf;
using namespace ctf::test;

class RosterTest : public ::testing::Test {
protected:
    void SetUp() override {
        e = make_engine();
        for (id_type user_id = 1; user_id <= 8; ++user_id) add_user(*e, user_id);
    }

    team make_team(id_type id, id_type captain_id, int max_members = 4, const string &name = "team") {
        team t;
        t.id = id;
        t.name = name;
        t.captain_id = captain_id;
        t.max_members = max_members;
        return t;
    }

    optional<id_type> team_of(id_type user_id) {
        return e->store().get_user(user_id)->team_id;
    }

    unique_ptr<engine> e;
};

TEST_F(RosterTest, CreateTeamValidation) {
    EXPECT_EQ(e->roster().create_team(make_team(1, 1, 4, "a")), roster_status::INVALID_TEAM);
    EXPECT_EQ(e->roster().create_team(make_team(1, 1, 4, "  a  ")), roster_status::INVALID_TEAM);
    EXPECT_EQ(e->roster().create_team(make_team(1, 1, 0)), roster_status::INVALID_TEAM);
    EXPECT_EQ(e->roster().create_team(make_team(1, 1, 11)), roster_status::INVALID_TEAM);
    EXPECT_EQ(e->roster().create_team(make_team(1, 99)), roster_status::USER_NOT_FOUND);

    ASSERT_EQ(e->roster().create_team(make_team(1, 1)), roster_status::OK);
    EXPECT_EQ(team_of(1), 1);
    EXPECT_EQ(e->roster().create_team(make_team(1, 2)), roster_status::INVALID_TEAM);
    EXPECT_EQ(e->roster().create_team(make_team(2, 1)), roster_status::ALREADY_IN_TEAM);
}

TEST_F(RosterTest, JoinChecks) {
    ASSERT_EQ(e->roster().create_team(make_team(1, 1, 2)), roster_status::OK);
    EXPECT_EQ(e->roster().join(99, 1), roster_status::USER_NOT_FOUND);
    EXPECT_EQ(e->roster().join(2, 99), roster_status::TEAM_NOT_FOUND);
    EXPECT_EQ(e->roster().join(1, 1), roster_status::ALREADY_IN_TEAM);
    EXPECT_EQ(e->roster().join(2, 1), roster_status::OK);
    EXPECT_EQ(e->roster().join(3, 1), roster_status::TEAM_FULL);
    EXPECT_EQ(team_of(2), 1);
    EXPECT_FALSE(team_of(3));
}

TEST_F(RosterTest, CaptainMustTransferBeforeLeaving) {
    ASSERT_EQ(e->roster().create_team(make_team(1, 1)), roster_status::OK);
    ASSERT_EQ(e->roster().join(2, 1), roster_status::OK);

    EXPECT_EQ(e->roster().leave(1), roster_status::CAPTAIN_MUST_TRANSFER);
    EXPECT_EQ(e->roster().transfer_captain(1, 2, 2), roster_status::NOT_CAPTAIN);
    EXPECT_EQ(e->roster().transfer_captain(1, 1, 3), roster_status::NOT_A_MEMBER);
    EXPECT_EQ(e->roster().transfer_captain(1, 1, 2), roster_status::OK);
    EXPECT_EQ(e->store().get_team(1)->captain_id, 2);

    EXPECT_EQ(e->roster().leave(1), roster_status::OK);
    EXPECT_FALSE(team_of(1));
    EXPECT_TRUE(e->store().get_team(1)->is_active);
}

TEST_F(RosterTest, LastMemberLeavingDeactivatesTeam) {
    ASSERT_EQ(e->roster().create_team(make_team(1, 1)), roster_status::OK);
    EXPECT_EQ(e->roster().leave(3), roster_status::NOT_A_MEMBER);
    EXPECT_EQ(e->roster().leave(1), roster_status::OK);
    EXPECT_FALSE(e->store().get_team(1)->is_active);
    EXPECT_EQ(e->roster().join(2, 1), roster_status::TEAM_INACTIVE);
}

TEST_F(RosterTest, Disband) {
    ASSERT_EQ(e->roster().create_team(make_team(1, 1)), roster_status::OK);
    ASSERT_EQ(e->roster().join(2, 1), roster_status::OK);
    ASSERT_EQ(e->roster().join(3, 1), roster_status::OK);

    EXPECT_EQ(e->roster().disband(1, 2), roster_status::NOT_CAPTAIN);
    EXPECT_EQ(e->roster().disband(99, 1), roster_status::TEAM_NOT_FOUND);
    EXPECT_EQ(e->roster().disband(1, 1), roster_status::OK);
    for (id_type user_id : {1, 2, 3}) EXPECT_FALSE(team_of(user_id));
    EXPECT_FALSE(e->store().get_team(1)->is_active);
    EXPECT_TRUE(e->store().team_member_ids(1).empty());
    EXPECT_EQ(e->roster().disband(1, 1), roster_status::TEAM_INACTIVE);
}

TEST_F(RosterTest, Transfer) {
    ASSERT_EQ(e->roster().create_team(make_team(1, 1)), roster_status::OK);
    ASSERT_EQ(e->roster().create_team(make_team(2, 3, 2)), roster_status::OK);
    ASSERT_EQ(e->roster().join(2, 1), roster_status::OK);

    EXPECT_EQ(e->roster().transfer(4, 2), roster_status::NOT_A_MEMBER);
    EXPECT_EQ(e->roster().transfer(2, 1), roster_status::ALREADY_IN_TEAM);
    EXPECT_EQ(e->roster().transfer(1, 2), roster_status::CAPTAIN_MUST_TRANSFER);
    EXPECT_EQ(e->roster().transfer(2, 2), roster_status::OK);
    EXPECT_EQ(team_of(2), 2);

    // 目标队伍已满
    ASSERT_EQ(e->roster().join(4, 1), roster_status::OK);
    EXPECT_EQ(e->roster().transfer(4, 2), roster_status::TEAM_FULL);
    EXPECT_EQ(team_of(4), 1);
}

TEST_F(RosterTest, SoleCaptainTransferDeactivatesOldTeam) {
    ASSERT_EQ(e->roster().create_team(make_team(1, 1)), roster_status::OK);
    ASSERT_EQ(e->roster().create_team(make_team(2, 2)), roster_status::OK);
    EXPECT_EQ(e->roster().transfer(1, 2), roster_status::OK);
    EXPECT_FALSE(e->store().get_team(1)->is_active);
    EXPECT_EQ(e->store().team_member_ids(2), (vector<id_type>{1, 2}));
}

TEST_F(RosterTest, ConcurrentJoinsRespectCapacity) {
    ASSERT_EQ(e->roster().create_team(make_team(1, 1, 4)), roster_status::OK);
    for (id_type user_id = 9; user_id <= 40; ++user_id) add_user(*e, user_id);

    atomic<bool> go{false};
    atomic<int> joined{0}, full{0};
    vector<thread> threads;
    for (id_type user_id = 9; user_id <= 40; ++user_id) {
        threads.emplace_back([&, user_id] {
            while (!go) this_thread::yield();
            roster_status status = e->roster().join(user_id, 1);
            if (status == roster_status::OK) ++joined;
            else if (status == roster_status::TEAM_FULL) ++full;
        });
    }
    go = true;
    for (auto &th : threads) th.join();

    EXPECT_EQ(joined.load(), 3);
    EXPECT_EQ(full.load(), 29);
    EXPECT_EQ(e->store().team_member_ids(1).size(), 4u);
}

/**
 * @brief 在读取成员关系之后停顿一下，放大并发成员变更之间的竞争窗口
 */
struct slow_roster_store : public store::memory_store {
    struct transaction : public forwarding_transaction {
        using forwarding_transaction::forwarding_transaction;

        size_t count_members(id_type team_id) override {
            this_thread::sleep_for(chrono::milliseconds(2));
            return inner->count_members(team_id);
        }

        vector<id_type> member_ids(id_type team_id) override {
            auto result = inner->member_ids(team_id);
            this_thread::sleep_for(chrono::milliseconds(2));
            return result;
        }
    };

    unique_ptr<store::ledger_transaction> begin_roster(const store::roster_scope &scope) override {
        return make_unique<transaction>(memory_store::begin_roster(scope));
    }
};

static unique_ptr<engine> make_slow_engine() {
    auto e = make_unique<engine>(make_unique<slow_roster_store>(), test_configuration());
    for (id_type user_id = 1; user_id <= 4; ++user_id) add_user(*e, user_id);
    return e;
}

static void run_together(function<void()> a, function<void()> b) {
    atomic<bool> go{false};
    thread first([&] {
        while (!go) this_thread::yield();
        a();
    });
    thread second([&] {
        while (!go) this_thread::yield();
        b();
    });
    go = true;
    first.join();
    second.join();
}

TEST(RosterRaceTest, ConcurrentJoinsIntoTwoTeamsAdmitOne) {
    for (int round = 0; round < 20; ++round) {
        auto e = make_slow_engine();
        add_team(*e, 10, 1);
        add_team(*e, 20, 2);

        roster_status first, second;
        run_together([&] { first = e->roster().join(3, 10); },
                     [&] { second = e->roster().join(3, 20); });

        ASSERT_EQ((first == roster_status::OK) + (second == roster_status::OK), 1) << "round " << round;
        EXPECT_EQ(first == roster_status::OK ? second : first, roster_status::ALREADY_IN_TEAM);
        EXPECT_EQ(e->store().get_user(3)->team_id, first == roster_status::OK ? 10 : 20);
        EXPECT_EQ(e->store().team_member_ids(10).size() + e->store().team_member_ids(20).size(), 3u);
    }
}

TEST(RosterRaceTest, DisbandKeepsMemberWhoTransferredAway) {
    for (int round = 0; round < 20; ++round) {
        auto e = make_slow_engine();
        add_team(*e, 10, 1);
        add_team(*e, 20, 2);
        ASSERT_EQ(e->roster().join(3, 10), roster_status::OK);

        roster_status disbanded, transferred;
        run_together([&] { disbanded = e->roster().disband(10, 1); },
                     [&] { transferred = e->roster().transfer(3, 20); });

        EXPECT_EQ(disbanded, roster_status::OK);
        if (transferred == roster_status::OK) {
            EXPECT_EQ(e->store().get_user(3)->team_id, 20) << "round " << round;
            EXPECT_EQ(e->store().team_member_ids(20), (vector<id_type>{2, 3}));
        } else {
            EXPECT_EQ(transferred, roster_status::NOT_A_MEMBER);
            EXPECT_FALSE(e->store().get_user(3)->team_id);
        }
        EXPECT_TRUE(e->store().team_member_ids(10).empty());
    }
}

TEST(RosterRaceTest, InactiveTeamNeverKeepsMembers) {
    for (int round = 0; round < 20; ++round) {
        auto e = make_slow_engine();
        add_team(*e, 10, 1);
        add_team(*e, 20, 2);

        roster_status transferred, joined;
        run_together([&] { transferred = e->roster().transfer(1, 20); },
                     [&] { joined = e->roster().join(3, 10); });

        if (transferred == roster_status::OK) {
            EXPECT_EQ(joined, roster_status::TEAM_INACTIVE) << "round " << round;
        } else {
            EXPECT_EQ(transferred, roster_status::CAPTAIN_MUST_TRANSFER) << "round " << round;
            EXPECT_EQ(joined, roster_status::OK);
        }
        auto t = e->store().get_team(10);
        EXPECT_EQ(t->is_active, !e->store().team_member_ids(10).empty());
    }
}

TEST_F(RosterTest, RegisterUserKeepsMembership) {
    ASSERT_EQ(e->roster().create_team(make_team(1, 1)), roster_status::OK);
    user renamed{1, "alice", nullopt};
    e->roster().register_user(renamed);
    auto u = e->store().get_user(1);
    EXPECT_EQ(u->name, "alice");
    EXPECT_EQ(u->team_id, 1);

    EXPECT_THROW(e->roster().register_user(user{2, "  ", nullopt}), validation_error);
}
