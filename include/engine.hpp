#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "ledger/challenge_catalog.hpp"
#include "ledger/leaderboard.hpp"
#include "ledger/read_cache.hpp"
#include "ledger/scoring.hpp"
#include "ledger/solve_resolver.hpp"
#include "ledger/submission_ledger.hpp"
#include "ledger/team_roster.hpp"
#include "store/ledger_store.hpp"

namespace ctf {

/**
 * @brief 计分板对外提供的接口
 * 选手端和展示端只通过这个接口访问账本
 */
struct scoreboard_api {
    virtual ~scoreboard_api();

    /**
     * @brief 提交 flag
     * @throws concurrency_conflict 如果重试次数用尽，调用方可以稍后重试
     * @throws storage_error 如果存储后端不可用，调用方可以稍后重试
     */
    virtual submission_result submit_flag(id_type user_id, id_type challenge_id, const std::string &flag, const client_meta &meta) = 0;

    virtual std::vector<submission> list_submissions(const submission_filter &filter) = 0;

    /**
     * @return 题目的解题统计，题目不存在时为空
     */
    virtual std::optional<ledger::challenge_stats> get_challenge_solve_stats(id_type challenge_id) = 0;

    virtual std::vector<ledger::leaderboard_entry> get_individual_leaderboard(std::size_t limit) = 0;

    virtual std::vector<ledger::leaderboard_entry> get_team_leaderboard(std::size_t limit) = 0;
};

/**
 * @brief 账本服务的组装
 * 持有存储后端和所有组件。账本、题目、队伍的每次写入都会让排行榜缓存失效
 */
struct engine : public scoreboard_api {
    engine(std::unique_ptr<store::ledger_store> store, const configuration &config);

    submission_result submit_flag(id_type user_id, id_type challenge_id, const std::string &flag, const client_meta &meta) override;

    std::vector<submission> list_submissions(const submission_filter &filter) override;

    std::optional<ledger::challenge_stats> get_challenge_solve_stats(id_type challenge_id) override;

    std::vector<ledger::leaderboard_entry> get_individual_leaderboard(std::size_t limit) override;

    std::vector<ledger::leaderboard_entry> get_team_leaderboard(std::size_t limit) override;

    /**
     * @brief 导入题目、用户和队伍
     * 格式为 {"challenges": [...], "users": [...], "teams": [...]}，
     * 队伍可以带 "members" 数组，成员按顺序加入队伍
     * @throws validation_error 如果数据不合法
     */
    void seed(const nlohmann::json &data);

    /**
     * @brief 让所有读缓存失效
     */
    void invalidate_caches();

    store::ledger_store &store();
    const ledger::scoring_engine &scoring() const;
    ledger::challenge_catalog &catalog();
    ledger::submission_ledger &submissions();
    ledger::solve_resolver &resolver();
    ledger::leaderboard &board();
    ledger::team_roster &roster();

private:
    std::unique_ptr<store::ledger_store> backend;
    ledger::scoring_engine scoring_rules;
    ledger::challenge_catalog challenge_catalog;
    ledger::submission_ledger submission_ledger;
    ledger::solve_resolver solve_resolver;
    ledger::leaderboard scoreboard;
    ledger::team_roster team_roster;

    ledger::read_cache<std::vector<ledger::leaderboard_entry>> leaderboard_cache;
    ledger::read_cache<std::optional<ledger::challenge_stats>> stats_cache;
};

}  // namespace ctf
