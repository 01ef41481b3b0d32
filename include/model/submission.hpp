#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "model/challenge.hpp"

namespace ctf {

/**
 * @brief 提交者的网络信息
 */
struct client_meta {
    /**
     * @brief 提交者 IP 地址，支持 IPv6
     */
    std::string ip_address;

    std::string user_agent;
};

/**
 * @brief 账本中的一条提交记录
 * 记录一经写入就不会被修改，points_awarded 是提交那一刻的得分，
 * 即使题目的动态分值之后发生了变化也不会被重新计算
 */
struct submission {
    /**
     * @brief 提交 id，由存储后端按插入顺序分配
     */
    id_type id = 0;

    id_type user_id = 0;

    id_type challenge_id = 0;

    /**
     * @brief 选手提交的原始文本
     */
    std::string submitted_flag;

    bool is_correct = false;

    /**
     * @brief 本次提交获得的分数，错误的提交为 0
     */
    int points_awarded = 0;

    /**
     * @brief 插入时间，由存储后端在题目的串行化区间内分配，
     * 同一道题目下不会出现时间倒退
     */
    std::chrono::system_clock::time_point created_at;

    client_meta meta;
};

void to_json(nlohmann::json &j, const submission &s);

/**
 * @brief 提交记录的查询条件
 * 所有条件取交集，未设置的条件不过滤
 */
struct submission_filter {
    std::optional<id_type> user_id;

    std::optional<id_type> challenge_id;

    /**
     * @brief 按队伍过滤时使用用户当前所在的队伍，而不是提交时所在的队伍
     */
    std::optional<id_type> team_id;

    bool correct_only = false;

    /**
     * @brief 为真时按 (created_at, id) 升序返回，否则降序（最新的在前）
     */
    bool ascending = false;

    /**
     * @brief 最多返回多少条，0 表示不限制
     */
    std::size_t limit = 0;
};

void from_json(const nlohmann::json &j, submission_filter &filter);

/**
 * @brief 按 (created_at, id) 比较两条提交的先后
 * 解题顺序、一血、排名都使用这个全序
 */
bool solved_before(const submission &a, const submission &b);

/**
 * @brief 一次 flag 提交的返回结果
 */
struct submission_result {
    submit_status status = submit_status::VALIDATION_ERROR;

    bool correct = false;

    int points_awarded = 0;

    bool is_first_blood = false;

    /**
     * @brief 解题名次，从 1 开始，未解出时为 0
     */
    std::size_t rank = 0;

    /**
     * @brief 本次提交之前该题已有的正确提交数，动态计分使用该值
     */
    std::size_t prior_solves = 0;

    /**
     * @brief 写入账本的提交 id，没有写入时为空
     */
    std::optional<id_type> submission_id;

    /**
     * @brief 给调用方展示的信息
     */
    std::string message;
};

void to_json(nlohmann::json &j, const submission_result &r);

}  // namespace ctf
