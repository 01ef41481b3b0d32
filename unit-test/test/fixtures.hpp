#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "engine.hpp"
#include "store/memory_store.hpp"

/**
 * 测试用的数据构造函数
 * 用法：
 * 1. auto e = make_engine();
 * 2. add_challenge(*e, ...); add_user(*e, ...);
 * 3. e->submit_flag(...)
 */
namespace ctf::test {

/**
 * @brief 关闭缓存的默认配置，测试中的读操作总是看到最新的账本
 */
configuration test_configuration();

std::unique_ptr<engine> make_engine(const configuration &config = test_configuration());

/**
 * @brief 使用可控时钟的 memory_store 构造 engine
 */
std::unique_ptr<engine> make_engine(store::memory_store::clock_type clock, const configuration &config = test_configuration());

challenge make_challenge(id_type id, int points, bool is_dynamic, const std::string &flag, int max_attempts = 0);

void add_challenge(engine &e, id_type id, int points, bool is_dynamic, const std::string &flag, int max_attempts = 0);

void add_user(engine &e, id_type id, const std::string &name = "");

/**
 * @brief 新建队伍，captain 必须已经存在
 */
void add_team(engine &e, id_type id, id_type captain_id, int max_members = 4, const std::string &name = "");

/**
 * @brief 把所有操作转发给另一个事务，测试中继承它来注入故障或者延迟
 */
struct forwarding_transaction : public store::ledger_transaction {
    explicit forwarding_transaction(std::unique_ptr<store::ledger_transaction> inner) : inner(std::move(inner)) {}

    std::optional<challenge> find_challenge(id_type id) override { return inner->find_challenge(id); }
    std::optional<user> find_user(id_type id) override { return inner->find_user(id); }
    std::optional<team> find_team(id_type id) override { return inner->find_team(id); }
    std::size_t count_attempts(id_type u, id_type c) override { return inner->count_attempts(u, c); }
    bool has_solved(id_type u, id_type c) override { return inner->has_solved(u, c); }
    std::size_t count_solves(id_type c) override { return inner->count_solves(c); }
    submission insert_submission(const submission &s) override { return inner->insert_submission(s); }
    std::size_t count_members(id_type t) override { return inner->count_members(t); }
    std::vector<id_type> member_ids(id_type t) override { return inner->member_ids(t); }
    void set_user_team(id_type u, std::optional<id_type> t) override { inner->set_user_team(u, t); }
    void update_team(const team &t) override { inner->update_team(t); }
    void commit() override { inner->commit(); }
    void rollback() override { inner->rollback(); }

    std::unique_ptr<store::ledger_transaction> inner;
};

/**
 * @brief 可以手动拨动的时钟
 */
struct manual_clock {
    std::chrono::system_clock::time_point now = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

    void advance(std::chrono::system_clock::duration d) { now += d; }

    store::memory_store::clock_type source() {
        return [this] { return now; };
    }
};

}  // namespace ctf::test
