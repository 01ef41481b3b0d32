#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace ctf {

struct ctf_exception : std::exception {
    ctf_exception();
    explicit ctf_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const ctf_exception &ex);

    template <typename T>
    ctf_exception operator<<(const T &t) const {
        return ctf_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示持久化层不可用，比如数据库连接断开、执行 SQL 失败
 * 抛出该异常时账本保证没有被修改，调用方可以稍后重试
 */
struct storage_error : public ctf_exception {
    storage_error();
    explicit storage_error(const std::string &message);
};

/**
 * @brief 表示事务串行化失败
 * 比如 MySQL 的死锁、锁等待超时，或者违反了 (用户, 题目, 已解出) 的唯一约束。
 * 账本会在内部重试若干次，重试次数用尽后才会把该异常抛给调用方
 */
struct concurrency_conflict : public ctf_exception {
    concurrency_conflict();
    explicit concurrency_conflict(const std::string &message);
};

/**
 * @brief 表示管理端传入的数据不合法，比如负的题目分值
 */
struct validation_error : public ctf_exception {
    validation_error();
    explicit validation_error(const std::string &message);
};

}  // namespace ctf
