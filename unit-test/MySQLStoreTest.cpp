#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "store/mysql_store.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace ctf;
using namespace ctf::test;

/**
 * 需要一个可写的 MySQL 数据库，连接信息从环境变量 CTF_TEST_MYSQL 读取，比如
 * CTF_TEST_MYSQL='{"host":"127.0.0.1","user":"root","password":"","database":"ctf_test"}'
 * 测试会清空数据库中的账本表。运行时加上 --gtest_also_run_disabled_tests
 */
class MySQLStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        string settings = get_env("CTF_TEST_MYSQL", "");
        if (settings.empty()) GTEST_SKIP() << "CTF_TEST_MYSQL is not set";
        config.storage = "mysql";
        config.database = nlohmann::json::parse(settings).get<database_config>();
        config.cache.enabled = false;

        auto backend = make_unique<store::mysql_store>(config.database);
        backend->truncate_all();
        e = make_unique<engine>(move(backend), config);
    }

    configuration config;
    unique_ptr<engine> e;
};

TEST_F(MySQLStoreTest, DISABLED_SubmissionFlow) {
    add_challenge(*e, 1, 100, true, "flag{sql}", 3);
    add_user(*e, 1);
    add_user(*e, 2);

    EXPECT_EQ(e->submit_flag(1, 1, "wrong", {}).status, submit_status::WRONG_FLAG);
    auto first = e->submit_flag(1, 1, "flag{sql}", {"127.0.0.1", "gtest"});
    EXPECT_EQ(first.status, submit_status::ACCEPTED);
    EXPECT_TRUE(first.is_first_blood);
    EXPECT_EQ(first.points_awarded, 100);
    auto second = e->submit_flag(2, 1, "flag{sql}", {});
    EXPECT_EQ(second.points_awarded, 95);
    EXPECT_EQ(second.rank, 2u);
    EXPECT_EQ(e->submit_flag(1, 1, "flag{sql}", {}).status, submit_status::ALREADY_SOLVED);

    auto solves = e->resolver().solves(1);
    ASSERT_EQ(solves.size(), 2u);
    EXPECT_EQ(solves[0].user_id, 1);
    EXPECT_EQ(solves[0].meta.ip_address, "127.0.0.1");
    EXPECT_EQ(e->get_challenge_solve_stats(1)->attempt_count, 3u);
}

TEST_F(MySQLStoreTest, DISABLED_DuplicateCorrectRowIsAConflict) {
    add_challenge(*e, 1, 100, false, "flag{sql}");
    add_user(*e, 1);

    submission row;
    row.user_id = 1;
    row.challenge_id = 1;
    row.submitted_flag = "flag{sql}";
    row.is_correct = true;
    row.points_awarded = 100;
    {
        auto txn = e->store().begin_submission(1);
        txn->insert_submission(row);
        txn->commit();
    }
    auto txn = e->store().begin_submission(1);
    EXPECT_THROW(txn->insert_submission(row), concurrency_conflict);
}

TEST_F(MySQLStoreTest, DISABLED_UncommittedTransactionLeavesNoRow) {
    add_challenge(*e, 1, 100, false, "flag{sql}");
    add_user(*e, 1);
    {
        submission row;
        row.user_id = 1;
        row.challenge_id = 1;
        row.submitted_flag = "nope";
        auto txn = e->store().begin_submission(1);
        txn->insert_submission(row);
    }
    EXPECT_TRUE(e->list_submissions({}).empty());
}

TEST_F(MySQLStoreTest, DISABLED_Roster) {
    add_user(*e, 1);
    add_user(*e, 2);
    add_team(*e, 10, 1, 2);
    EXPECT_EQ(e->roster().join(2, 10), roster_status::OK);
    EXPECT_EQ(e->store().team_member_ids(10), (vector<id_type>{1, 2}));
    EXPECT_EQ(e->roster().disband(10, 1), roster_status::OK);
    EXPECT_TRUE(e->store().team_member_ids(10).empty());
    EXPECT_FALSE(e->store().get_team(10)->is_active);
}
