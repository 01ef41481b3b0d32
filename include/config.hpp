#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace ctf {

/**
 * @brief 动态计分的参数
 * 动态分值 = max(最低分, 基础分 - decay_factor * 已有解题数)
 * 最低分 = max(min_points_floor, 基础分 / min_points_divisor)
 */
struct scoring_config {
    /**
     * @brief 每多一个解题者，题目分值减少的分数
     */
    int decay_factor = 5;

    /**
     * @brief 动态分值的绝对下限
     */
    int min_points_floor = 10;

    /**
     * @brief 基础分除以该数得到动态分值的相对下限（整数除法）
     */
    int min_points_divisor = 4;
};

void from_json(const nlohmann::json &j, scoring_config &config);

/**
 * @brief 提交账本的参数
 */
struct ledger_config {
    /**
     * @brief 提交的 flag 最大长度，超过该长度的提交将被直接拒绝而不写入账本
     * @defaultValue 255，与提交表 submitted_flag 字段的宽度一致
     */
    std::size_t max_flag_length = 255;

    /**
     * @brief 遇到事务冲突时，一次提交最多执行多少次
     */
    int submit_retries = 3;
};

void from_json(const nlohmann::json &j, ledger_config &config);

/**
 * @brief 排行榜读缓存的参数
 */
struct cache_config {
    bool enabled = true;

    /**
     * @brief 缓存项的存活时间，单位为毫秒
     */
    int ttl_ms = 5000;
};

void from_json(const nlohmann::json &j, cache_config &config);

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database_config {
    std::string host;
    std::string user;
    std::string password;
    std::string database;
    unsigned port = 3306;

    /**
     * @brief 连接池大小，每个并发事务独占一个连接
     */
    std::size_t pool_size = 4;
};

void from_json(const nlohmann::json &j, database_config &db);

/**
 * @brief 整个账本服务的配置
 * 配置文件为 JSON 对象，各字段与本结构体的成员同名
 */
struct configuration {
    /**
     * @brief 存储后端，可选 memory, mysql
     */
    std::string storage = "memory";

    database_config database;
    scoring_config scoring;
    ledger_config ledger;
    cache_config cache;

    /**
     * @brief 启动时导入的题目、用户、队伍数据，为空表示不导入
     */
    std::filesystem::path seed;
};

void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 从 JSON 配置文件读取配置
 * @throws std::runtime_error 如果文件不存在
 * @throws nlohmann::json::exception 如果配置文件格式错误
 */
configuration load_configuration(const std::filesystem::path &path);

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后请求处理器会在错误响应中附带异常的诊断信息
 */
extern bool DEBUG;

}  // namespace ctf
