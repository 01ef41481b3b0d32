#pragma once

#include <cstddef>
#include "config.hpp"
#include "model/challenge.hpp"
#include "model/submission.hpp"

namespace ctf::ledger {

/**
 * @brief 计分规则
 *
 * 静态计分：每个解题者获得题目的基础分。
 * 动态计分：第 k+1 个解题者（之前已有 k 个解题者）获得
 *     max(最低分, 基础分 - decay_factor * k)
 * 其中最低分 = max(min_points_floor, 基础分 / min_points_divisor)。
 *
 * 注意区分两种读数：
 * 1. awarded_points_at_submission：提交记录中冻结的得分，计入总分；
 * 2. current_dynamic_value：题目当前的动态分值，只用于展示，
 *    不会回溯修改已有提交的得分。
 */
struct scoring_engine {
    explicit scoring_engine(const scoring_config &config = {});

    /**
     * @brief 动态分值的下限
     * 对于基础分很低的题目，下限可能高于基础分（比如基础分 5 的题目获得 10 分）
     */
    int min_points(int base) const;

    /**
     * @brief 之前已有 prior_solves 个解题者时，动态计分题目的得分
     */
    int dynamic_points(int base, std::size_t prior_solves) const;

    /**
     * @brief 之前已有 prior_solves 个解题者时，解出题目获得的分数
     */
    int points_for_solve(const challenge &c, std::size_t prior_solves) const;

    /**
     * @brief 题目当前的分值，即下一个解题者将获得的分数
     * @param total_solves 题目当前的总解题数
     */
    int current_dynamic_value(const challenge &c, std::size_t total_solves) const;

    /**
     * @brief 提交记录写入时冻结的得分
     */
    static int awarded_points_at_submission(const submission &s);

    const scoring_config &config() const;

private:
    scoring_config conf;
};

}  // namespace ctf::ledger
