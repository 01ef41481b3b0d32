#pragma once

#include <mysql/mysql.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "config.hpp"

namespace ctf::store {

/**
 * @brief 查询结果的一行，NULL 列为 std::nullopt
 */
using mysql_row = std::vector<std::optional<std::string>>;

/**
 * @brief 表示一个 MySQL 连接
 * 连接不是线程安全的，同一时刻只能被一个线程使用，并发访问通过 mysql_pool 分配连接
 *
 * SQL 语句中的 ? 会按顺序被替换为转义后的参数，支持整数、bool、字符串、
 * std::optional（空值为 NULL）
 */
struct mysql_conn {
    mysql_conn();
    ~mysql_conn();

    mysql_conn(const mysql_conn &) = delete;
    mysql_conn &operator=(const mysql_conn &) = delete;

    /**
     * @brief 建立连接，如果已经连接则先断开
     * @throws storage_error 如果无法连接到数据库服务器
     */
    void connect(const database_config &config);

    bool ping();

    /**
     * @brief 执行查询并取回所有行
     * @throws concurrency_conflict 死锁、锁等待超时、唯一键冲突
     * @throws storage_error 其他数据库错误
     */
    template <typename... Args>
    std::vector<mysql_row> query(std::string_view sql, const Args &... args) {
        return query_raw(bind(sql, {literal(args)...}));
    }

    /**
     * @brief 执行不返回结果集的语句
     * @return 受影响的行数
     */
    template <typename... Args>
    std::uint64_t execute(std::string_view sql, const Args &... args) {
        return execute_raw(bind(sql, {literal(args)...}));
    }

    std::uint64_t last_insert_id();

private:
    std::vector<mysql_row> query_raw(const std::string &sql);
    std::uint64_t execute_raw(const std::string &sql);

    std::string bind(std::string_view sql, const std::vector<std::string> &params) const;

    std::string escape(const std::string &value) const;

    std::string literal(const std::string &value) const { return escape(value); }
    std::string literal(const char *value) const { return escape(value); }
    std::string literal(bool value) const { return value ? "1" : "0"; }

    template <typename T>
    std::enable_if_t<std::is_integral_v<T>, std::string> literal(T value) const {
        return std::to_string(value);
    }

    template <typename T>
    std::string literal(const std::optional<T> &value) const {
        return value ? literal(*value) : std::string("NULL");
    }

    /**
     * @brief 根据当前连接的错误码抛出异常
     */
    [[noreturn]] void raise(const std::string &sql);

    MYSQL *con = nullptr;
    database_config config;
};

/**
 * @brief MySQL 连接池
 * 连接数固定为 database_config::pool_size，取不到连接时阻塞等待
 */
struct mysql_pool {
    /**
     * @brief 借出的连接，析构时归还连接池
     */
    struct lease {
        lease(mysql_pool &pool, std::unique_ptr<mysql_conn> conn);
        lease(lease &&) = default;
        ~lease();

        mysql_conn &operator*() { return *conn; }
        mysql_conn *operator->() { return conn.get(); }

    private:
        mysql_pool *pool;
        std::unique_ptr<mysql_conn> conn;
    };

    explicit mysql_pool(const database_config &config);

    /**
     * @brief 借出一个连接，连接失效时会尝试重连
     * @throws storage_error 如果重连失败
     */
    lease acquire();

private:
    database_config config;
    concurrent_queue<std::unique_ptr<mysql_conn>> idle;
};

}  // namespace ctf::store
