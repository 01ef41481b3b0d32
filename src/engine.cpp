#include "engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace ctf {
using namespace std;
using namespace nlohmann;

scoreboard_api::~scoreboard_api() = default;

engine::engine(unique_ptr<store::ledger_store> store, const configuration &config)
    : backend(move(store)),
      scoring_rules(config.scoring),
      challenge_catalog(*backend),
      submission_ledger(*backend, scoring_rules, config.ledger),
      solve_resolver(*backend),
      scoreboard(*backend, scoring_rules),
      team_roster(*backend),
      leaderboard_cache(chrono::milliseconds(config.cache.ttl_ms), config.cache.enabled),
      stats_cache(chrono::milliseconds(config.cache.ttl_ms), config.cache.enabled) {
    submission_ledger.on_recorded([this](const submission &) { invalidate_caches(); });
    challenge_catalog.on_changed([this](id_type) { invalidate_caches(); });
    team_roster.on_changed([this] { invalidate_caches(); });
}

submission_result engine::submit_flag(id_type user_id, id_type challenge_id, const string &flag, const client_meta &meta) {
    return submission_ledger.submit(user_id, challenge_id, flag, meta);
}

vector<submission> engine::list_submissions(const submission_filter &filter) {
    return backend->query_submissions(filter);
}

optional<ledger::challenge_stats> engine::get_challenge_solve_stats(id_type challenge_id) {
    return stats_cache.get_or_load(fmt::format("stats:{}", challenge_id), [&] {
        return scoreboard.stats(challenge_id);
    });
}

vector<ledger::leaderboard_entry> engine::get_individual_leaderboard(size_t limit) {
    return leaderboard_cache.get_or_load(fmt::format("users:{}", limit), [&] {
        return scoreboard.individual(limit);
    });
}

vector<ledger::leaderboard_entry> engine::get_team_leaderboard(size_t limit) {
    return leaderboard_cache.get_or_load(fmt::format("teams:{}", limit), [&] {
        return scoreboard.teams(limit);
    });
}

void engine::invalidate_caches() {
    leaderboard_cache.invalidate();
    stats_cache.invalidate();
}

void engine::seed(const json &data) {
    size_t challenges = 0, users = 0, teams = 0;
    if (data.count("challenges")) {
        for (auto &item : data.at("challenges")) {
            challenge_catalog.save(item.get<challenge>());
            ++challenges;
        }
    }
    if (data.count("users")) {
        for (auto &item : data.at("users")) {
            team_roster.register_user(item.get<user>());
            ++users;
        }
    }
    if (data.count("teams")) {
        for (auto &item : data.at("teams")) {
            team t = item.get<team>();
            roster_status status = team_roster.create_team(t);
            if (status != roster_status::OK)
                throw validation_error(fmt::format("team {}: {}", t.id, get_display_message(status)));
            if (item.count("members")) {
                for (auto &member : item.at("members")) {
                    id_type user_id = member.get<id_type>();
                    if (user_id == t.captain_id) continue;
                    status = team_roster.join(user_id, t.id);
                    if (status != roster_status::OK)
                        throw validation_error(fmt::format("team {}: user {}: {}", t.id, user_id, get_display_message(status)));
                }
            }
            ++teams;
        }
    }
    LOG(INFO) << fmt::format("Seeded {} challenges, {} users, {} teams", challenges, users, teams);
}

store::ledger_store &engine::store() {
    return *backend;
}

const ledger::scoring_engine &engine::scoring() const {
    return scoring_rules;
}

ledger::challenge_catalog &engine::catalog() {
    return challenge_catalog;
}

ledger::submission_ledger &engine::submissions() {
    return submission_ledger;
}

ledger::solve_resolver &engine::resolver() {
    return solve_resolver;
}

ledger::leaderboard &engine::board() {
    return scoreboard;
}

ledger::team_roster &engine::roster() {
    return team_roster;
}

}  // namespace ctf
