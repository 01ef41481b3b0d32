#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "ledger/scoring.hpp"
#include "model/submission.hpp"
#include "model/team.hpp"
#include "store/ledger_store.hpp"

namespace ctf::ledger {

/**
 * @brief 排行榜中的一行
 */
struct leaderboard_entry {
    /**
     * @brief 名次，从 1 开始
     */
    std::size_t position = 0;

    /**
     * @brief 用户 id 或者队伍 id
     */
    id_type id = 0;

    std::string name;

    int score = 0;

    std::size_t solved_count = 0;

    /**
     * @brief 最后一次解题的时间，分数相同时先达到该分数者排名靠前
     */
    std::chrono::system_clock::time_point last_solve;
};

void to_json(nlohmann::json &j, const leaderboard_entry &e);

/**
 * @brief 队伍的总分和解题数
 * 成员取队伍当前的成员
 */
struct team_standing {
    team info;

    std::vector<id_type> member_ids;

    /**
     * @brief 当前成员的正确提交得分之和
     * 不同成员解出同一道题时分数重复计入
     */
    int score = 0;

    /**
     * @brief 当前成员解出的不同题目数
     */
    std::size_t solved_count = 0;
};

void to_json(nlohmann::json &j, const team_standing &s);

/**
 * @brief 单个用户的得分情况
 */
struct user_standing {
    user info;

    /**
     * @brief 用户自己的正确提交得分之和
     */
    int own_score = 0;

    /**
     * @brief 展示给用户的分数，组队用户为队伍分数，个人参赛用户为自己的分数
     */
    int display_score = 0;

    std::size_t solved_count = 0;
};

void to_json(nlohmann::json &j, const user_standing &s);

/**
 * @brief 题目的解题统计
 */
struct challenge_stats {
    id_type challenge_id = 0;

    std::size_t solve_count = 0;

    /**
     * @brief 所有提交次数，包括错误的提交
     */
    std::size_t attempt_count = 0;

    /**
     * @brief 解题数 / 提交次数 * 100，保留两位小数，没有提交时为 0
     */
    double solve_rate_percent = 0;

    /**
     * @brief 题目当前的分值
     */
    int dynamic_points_now = 0;
};

void to_json(nlohmann::json &j, const challenge_stats &s);

/**
 * @brief 个人参赛的用户
 */
struct solo_player {
    id_type user_id;
};

/**
 * @brief 在某个队伍中的用户
 */
struct team_player {
    id_type user_id;
    id_type team_id;
};

/**
 * @brief 计算展示分数的主体
 */
using score_subject = std::variant<solo_player, team_player>;

score_subject subject_of(const user &u);

/**
 * @brief 排行榜和统计
 * 所有分数都由提交记录中冻结的得分求和得到，不会使用题目当前的分值
 */
struct leaderboard {
    leaderboard(store::ledger_store &store, const scoring_engine &scoring);

    /**
     * @brief 用户自己的正确提交得分之和
     */
    int own_score(id_type user_id);

    std::optional<team_standing> get_team_standing(id_type team_id);

    /**
     * @brief 用户的展示分数
     * 组队用户展示队伍分数，个人参赛用户展示自己的分数；用户不存在时为 0
     */
    int individual_display_score(id_type user_id);

    int score_of(const score_subject &subject);

    std::optional<user_standing> get_user_standing(id_type user_id);

    /**
     * @brief 个人排行榜
     * 按分数降序，分数相同按最后解题时间升序，再按用户 id 升序。
     * 没有解出任何题目的用户不上榜
     * @param limit 最多返回多少行，0 表示不限制
     */
    std::vector<leaderboard_entry> individual(std::size_t limit = 0);

    /**
     * @brief 队伍排行榜
     * 正确提交计入提交者当前所在的队伍，排序规则与个人排行榜相同
     */
    std::vector<leaderboard_entry> teams(std::size_t limit = 0);

    std::optional<challenge_stats> stats(id_type challenge_id);

    /**
     * @brief 用户的正确提交，按解题顺序排列
     */
    std::vector<submission> solved_challenges(id_type user_id);

    /**
     * @brief 最近的正确提交，最新的在前
     */
    std::vector<submission> recent_solves(std::size_t limit);

private:
    std::vector<submission> correct_submissions(const submission_filter &base = {});

    store::ledger_store &store;
    const scoring_engine &scoring;
};

}  // namespace ctf::ledger
