#pragma once

#include <optional>
#include <vector>
#include "model/submission.hpp"
#include "store/ledger_store.hpp"

namespace ctf::ledger {

/**
 * @brief 解题名次和一血的查询
 * 同一道题的正确提交按 (created_at, id) 升序排列，
 * 第一个为一血，名次 = 1 + 排在它之前的正确提交数。
 * 存储后端保证同一道题目内 created_at 不会倒退，因此查询得到的顺序
 * 与计分时使用的已有解题数一致。
 */
struct solve_resolver {
    explicit solve_resolver(store::ledger_store &store);

    /**
     * @brief 题目的正确提交，按解题顺序排列
     * @param limit 最多返回多少条，0 表示不限制
     */
    std::vector<submission> solves(id_type challenge_id, std::size_t limit = 0);

    std::optional<submission> first_blood(id_type challenge_id);

    bool is_first_blood(const submission &s);

    /**
     * @brief 正确提交的名次，从 1 开始；错误的提交返回 0
     */
    std::size_t rank(const submission &s);

private:
    store::ledger_store &store;
};

}  // namespace ctf::ledger
