#pragma once

#include "config.hpp"
#include "store/ledger_store.hpp"
#include "store/mysql_conn.hpp"

namespace ctf::store {

/**
 * @brief 基于 MySQL (InnoDB) 的存储后端
 *
 * 串行化方式：
 * 1. 提交事务开启时对题目行执行 SELECT ... FOR UPDATE，同一题目的提交事务互斥；
 * 2. submissions 表上有 (user_id, challenge_id, solved_marker) 唯一键，
 *    solved_marker 对正确提交为 1，错误提交为 NULL，
 *    因此同一用户在同一题目上最多只有一条正确提交；
 * 3. 队伍成员变更事务按 id 升序对涉及的队伍行、再对涉及的用户行执行 SELECT ... FOR UPDATE。
 *
 * 事务隔离级别为 READ COMMITTED，加锁之后的读操作能看到之前已提交的所有提交。
 */
struct mysql_store : public ledger_store {
    /**
     * @brief 建立连接池并创建缺失的表
     * @throws storage_error 如果无法连接数据库
     */
    explicit mysql_store(const database_config &config);

    std::unique_ptr<ledger_transaction> begin_submission(id_type challenge_id) override;
    std::unique_ptr<ledger_transaction> begin_roster(const roster_scope &scope) override;

    std::optional<challenge> get_challenge(id_type challenge_id) override;
    std::vector<challenge> list_challenges() override;
    void save_challenge(const challenge &c) override;
    bool set_challenge_active(id_type challenge_id, bool active) override;

    std::optional<user> get_user(id_type user_id) override;
    std::vector<user> list_users() override;
    void save_user(const user &u) override;

    std::optional<team> get_team(id_type team_id) override;
    std::vector<team> list_teams() override;
    void save_team(const team &t) override;

    std::vector<id_type> team_member_ids(id_type team_id) override;
    std::vector<submission> query_submissions(const submission_filter &filter) override;

    /**
     * @brief 清空所有账本表
     */
    void truncate_all();

private:
    void create_schema();

    mysql_pool pool;
};

}  // namespace ctf::store
