#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include "store/ledger_store.hpp"

namespace ctf::store {

struct memory_transaction;

/**
 * @brief 进程内的存储后端
 * 数据由一把读写锁保护；事务的串行化点是按键（题目、队伍、用户）分配的互斥锁，
 * 事务创建时加锁，提交或回滚时释放。
 * 同一道题目的提交事务互斥，不同题目的提交事务可以并行执行。
 */
struct memory_store : public ledger_store {
    using clock_type = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param clock 提交时间的来源，测试时可以注入固定的时间来制造时间戳相同的提交
     */
    explicit memory_store(clock_type clock = [] { return std::chrono::system_clock::now(); });

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

private:
    friend struct memory_transaction;

    /**
     * @brief 获取 key 对应的串行化锁，锁对象一旦创建就不会被释放
     */
    std::mutex &serial_mutex(const std::string &key);

    std::size_t count_members_nolock(id_type team_id) const;

    clock_type clock;

    std::mutex serial_mutexes_lock;
    std::map<std::string, std::unique_ptr<std::mutex>> serial_mutexes;

    mutable std::shared_mutex data_mutex;

    std::map<id_type, challenge> challenges;
    std::map<id_type, user> users;
    std::map<id_type, team> teams;

    /**
     * @brief 所有提交，按插入顺序
     */
    std::vector<submission> submissions;

    /**
     * @brief (用户, 题目) -> 提交次数
     */
    std::map<std::pair<id_type, id_type>, std::size_t> attempts;

    /**
     * @brief 已解出的 (用户, 题目)
     */
    std::set<std::pair<id_type, id_type>> solved;

    /**
     * @brief 题目 -> 正确提交数
     */
    std::map<id_type, std::size_t> solve_counts;

    /**
     * @brief 题目 -> 最近一次提交的时间，用于保证同一题目下提交时间不倒退
     */
    std::map<id_type, std::chrono::system_clock::time_point> latest_created;

    std::atomic<id_type> next_submission_id{1};
};

}  // namespace ctf::store
