#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace ctf {

using id_type = std::int64_t;

/**
 * @brief 一道题目的元数据
 * 题目由管理端创建和修改。有提交记录的题目只会被下线（is_active = false），
 * 不会被删除，这样历史提交的分数仍然有效
 */
struct challenge {
    id_type id = 0;

    std::string name;

    /**
     * @brief 题目分类名，比如 web, pwn, crypto
     * 只用于展示
     */
    std::string category;

    /**
     * @brief 题目的基础分值，必须 >= 0
     * 对于静态计分的题目，这就是每个解题者获得的分数；
     * 对于动态计分的题目，这是第一个解题者获得的分数
     */
    int points = 100;

    /**
     * @brief 是否动态计分
     */
    bool is_dynamic = false;

    /**
     * @brief 题目是否上线，下线的题目不再接受提交
     */
    bool is_active = true;

    /**
     * @brief 每个用户在本题上的最大提交次数，0 表示不限制
     */
    int max_attempts = 0;

    /**
     * @brief 正确的 flag
     * 比较时双方都先去掉首尾空白再转换为小写
     */
    std::string flag;
};

/**
 * @brief 输出题目信息，不包含 flag
 */
void to_json(nlohmann::json &j, const challenge &c);

/**
 * @brief 从管理端数据读取题目，包含 flag
 */
void from_json(const nlohmann::json &j, challenge &c);

}  // namespace ctf
