#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "model/challenge.hpp"
#include "model/submission.hpp"
#include "model/team.hpp"

/**
 * 这个头文件包含账本存储后端的接口
 * 包含：
 * 1. ledger_transaction 类（表示一个串行化的写事务）
 * 2. ledger_store 类（表示一个存储后端，提供读接口和开启事务的入口）
 */
namespace ctf::store {

/**
 * @brief 表示一个写事务
 * 事务在创建时就已经获得了串行化点（题目或者队伍的锁），在 commit 或
 * rollback 之前一直持有。事务内的读操作看到的是已提交的数据，写操作在
 * commit 时才对其他读者可见。
 *
 * 如果事务对象在 commit 之前被析构，则视为 rollback，不会留下任何部分写入。
 */
struct ledger_transaction {
    virtual ~ledger_transaction();

    virtual std::optional<challenge> find_challenge(id_type challenge_id) = 0;

    virtual std::optional<user> find_user(id_type user_id) = 0;

    virtual std::optional<team> find_team(id_type team_id) = 0;

    /**
     * @brief 用户在题目上已有的提交次数（包括错误的提交）
     */
    virtual std::size_t count_attempts(id_type user_id, id_type challenge_id) = 0;

    /**
     * @brief 用户是否已经有该题目的正确提交
     */
    virtual bool has_solved(id_type user_id, id_type challenge_id) = 0;

    /**
     * @brief 题目已经写入账本的正确提交数
     */
    virtual std::size_t count_solves(id_type challenge_id) = 0;

    /**
     * @brief 插入一条提交记录
     * @param submit 要插入的记录，id 和 created_at 会被忽略
     * @return 存储后端分配了 id 和 created_at 之后的记录
     * @throws concurrency_conflict 如果违反了 (用户, 题目) 只能有一条正确提交的约束
     */
    virtual submission insert_submission(const submission &submit) = 0;

    /**
     * @brief 队伍当前的成员数
     */
    virtual std::size_t count_members(id_type team_id) = 0;

    /**
     * @brief 队伍当前的成员 id，按 id 升序
     */
    virtual std::vector<id_type> member_ids(id_type team_id) = 0;

    /**
     * @brief 修改用户当前所在的队伍，std::nullopt 表示离开队伍
     */
    virtual void set_user_team(id_type user_id, std::optional<id_type> team_id) = 0;

    virtual void update_team(const team &t) = 0;

    /**
     * @brief 提交事务
     * @throws storage_error 如果持久化失败，此时事务已回滚
     */
    virtual void commit() = 0;

    virtual void rollback() = 0;
};

/**
 * @brief 队伍成员变更事务需要锁定的用户和队伍
 * 事务读取并修改的每一个用户和队伍都必须列在这里：
 * 加入需要锁定用户和目标队伍，转队还需要锁定原队伍。
 */
struct roster_scope {
    std::vector<id_type> users;
    std::vector<id_type> teams;
};

/**
 * @brief 账本存储后端
 * 实现必须是线程安全的：多个线程可以同时读，也可以同时持有不同题目的事务
 */
struct ledger_store {
    virtual ~ledger_store();

    /**
     * @brief 开启一个提交事务，以题目为串行化点
     * 同一道题目的提交事务互斥执行，从而保证"统计已有解题数 -> 计算分数 -> 插入"
     * 这一过程不会与其他提交交错
     */
    virtual std::unique_ptr<ledger_transaction> begin_submission(id_type challenge_id) = 0;

    /**
     * @brief 开启一个队伍成员变更事务，以 scope 中所有的用户和队伍为串行化点
     * 加锁顺序固定为先按 id 升序锁队伍，再按 id 升序锁用户，
     * 因此同时锁定多个队伍的事务之间不会死锁。
     * 队伍的成员集合只会在持有该队伍的锁时改变。
     */
    virtual std::unique_ptr<ledger_transaction> begin_roster(const roster_scope &scope) = 0;

    virtual std::optional<challenge> get_challenge(id_type challenge_id) = 0;

    virtual std::vector<challenge> list_challenges() = 0;

    /**
     * @brief 新建或者覆盖一道题目
     */
    virtual void save_challenge(const challenge &c) = 0;

    /**
     * @brief 上线或者下线一道题目，与该题目的提交事务互斥，不修改题目的其他字段
     * @return 题目不存在时返回 false
     */
    virtual bool set_challenge_active(id_type challenge_id, bool active) = 0;

    virtual std::optional<user> get_user(id_type user_id) = 0;

    virtual std::vector<user> list_users() = 0;

    /**
     * @brief 新建或者覆盖一个用户
     */
    virtual void save_user(const user &u) = 0;

    virtual std::optional<team> get_team(id_type team_id) = 0;

    virtual std::vector<team> list_teams() = 0;

    /**
     * @brief 新建或者覆盖一个队伍
     */
    virtual void save_team(const team &t) = 0;

    /**
     * @brief 队伍当前的成员 id，按 id 升序
     */
    virtual std::vector<id_type> team_member_ids(id_type team_id) = 0;

    /**
     * @brief 按条件查询提交记录
     */
    virtual std::vector<submission> query_submissions(const submission_filter &filter) = 0;
};

}  // namespace ctf::store
