#include "ledger/leaderboard.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>
#include "common/utils.hpp"

namespace ctf::ledger {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const leaderboard_entry &e) {
    j = {{"position", e.position},
         {"id", e.id},
         {"name", e.name},
         {"score", e.score},
         {"solved_count", e.solved_count},
         {"last_solve", to_epoch_millis(e.last_solve)}};
}

void to_json(json &j, const team_standing &s) {
    j = {{"team", s.info},
         {"member_ids", s.member_ids},
         {"score", s.score},
         {"solved_count", s.solved_count}};
}

void to_json(json &j, const user_standing &s) {
    j = {{"user", s.info},
         {"own_score", s.own_score},
         {"display_score", s.display_score},
         {"solved_count", s.solved_count}};
}

void to_json(json &j, const challenge_stats &s) {
    j = {{"challenge_id", s.challenge_id},
         {"solve_count", s.solve_count},
         {"attempt_count", s.attempt_count},
         {"solve_rate_percent", s.solve_rate_percent},
         {"dynamic_points_now", s.dynamic_points_now}};
}

score_subject subject_of(const user &u) {
    if (u.team_id) return team_player{u.id, *u.team_id};
    return solo_player{u.id};
}

/**
 * @brief 排行榜一行的累加器
 */
struct aggregate {
    int score = 0;
    set<id_type> challenges;
    chrono::system_clock::time_point last_solve;

    void add(const submission &s) {
        score += scoring_engine::awarded_points_at_submission(s);
        challenges.insert(s.challenge_id);
        last_solve = max(last_solve, s.created_at);
    }
};

static vector<leaderboard_entry> rank_entries(const map<id_type, aggregate> &groups, const unordered_map<id_type, string> &names, size_t limit) {
    vector<leaderboard_entry> entries;
    for (auto &[id, agg] : groups) {
        leaderboard_entry entry;
        entry.id = id;
        auto name = names.find(id);
        if (name != names.end()) entry.name = name->second;
        entry.score = agg.score;
        entry.solved_count = agg.challenges.size();
        entry.last_solve = agg.last_solve;
        entries.push_back(move(entry));
    }
    sort(entries.begin(), entries.end(), [](const leaderboard_entry &a, const leaderboard_entry &b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.last_solve != b.last_solve) return a.last_solve < b.last_solve;
        return a.id < b.id;
    });
    if (limit > 0 && entries.size() > limit)
        entries.resize(limit);
    for (size_t i = 0; i < entries.size(); ++i)
        entries[i].position = i + 1;
    return entries;
}

leaderboard::leaderboard(store::ledger_store &store, const scoring_engine &scoring)
    : store(store), scoring(scoring) {}

vector<submission> leaderboard::correct_submissions(const submission_filter &base) {
    submission_filter filter = base;
    filter.correct_only = true;
    filter.ascending = true;
    return store.query_submissions(filter);
}

int leaderboard::own_score(id_type user_id) {
    submission_filter filter;
    filter.user_id = user_id;
    int score = 0;
    for (auto &s : correct_submissions(filter))
        score += scoring_engine::awarded_points_at_submission(s);
    return score;
}

optional<team_standing> leaderboard::get_team_standing(id_type team_id) {
    auto t = store.get_team(team_id);
    if (!t) return nullopt;

    team_standing standing;
    standing.info = *t;
    standing.member_ids = store.team_member_ids(team_id);

    submission_filter filter;
    filter.team_id = team_id;
    aggregate agg;
    for (auto &s : correct_submissions(filter)) agg.add(s);
    standing.score = agg.score;
    standing.solved_count = agg.challenges.size();
    return standing;
}

int leaderboard::score_of(const score_subject &subject) {
    return visit(overloaded{
                     [this](const solo_player &p) { return own_score(p.user_id); },
                     [this](const team_player &p) {
                         auto standing = get_team_standing(p.team_id);
                         return standing ? standing->score : own_score(p.user_id);
                     }},
                 subject);
}

int leaderboard::individual_display_score(id_type user_id) {
    auto u = store.get_user(user_id);
    if (!u) return 0;
    return score_of(subject_of(*u));
}

optional<user_standing> leaderboard::get_user_standing(id_type user_id) {
    auto u = store.get_user(user_id);
    if (!u) return nullopt;

    user_standing standing;
    standing.info = *u;
    submission_filter filter;
    filter.user_id = user_id;
    aggregate agg;
    for (auto &s : correct_submissions(filter)) agg.add(s);
    standing.own_score = agg.score;
    standing.solved_count = agg.challenges.size();
    standing.display_score = score_of(subject_of(*u));
    return standing;
}

vector<leaderboard_entry> leaderboard::individual(size_t limit) {
    map<id_type, aggregate> groups;
    for (auto &s : correct_submissions())
        groups[s.user_id].add(s);

    unordered_map<id_type, string> names;
    for (auto &u : store.list_users()) names[u.id] = u.name;
    return rank_entries(groups, names, limit);
}

vector<leaderboard_entry> leaderboard::teams(size_t limit) {
    unordered_map<id_type, id_type> team_of;
    for (auto &u : store.list_users())
        if (u.team_id) team_of[u.id] = *u.team_id;

    map<id_type, aggregate> groups;
    for (auto &s : correct_submissions()) {
        auto it = team_of.find(s.user_id);
        if (it == team_of.end()) continue;
        groups[it->second].add(s);
    }

    unordered_map<id_type, string> names;
    for (auto &t : store.list_teams()) names[t.id] = t.name;
    return rank_entries(groups, names, limit);
}

optional<challenge_stats> leaderboard::stats(id_type challenge_id) {
    auto c = store.get_challenge(challenge_id);
    if (!c) return nullopt;

    submission_filter filter;
    filter.challenge_id = challenge_id;
    challenge_stats result;
    result.challenge_id = challenge_id;
    for (auto &s : store.query_submissions(filter)) {
        ++result.attempt_count;
        if (s.is_correct) ++result.solve_count;
    }
    if (result.attempt_count > 0)
        result.solve_rate_percent = round(10000.0 * result.solve_count / result.attempt_count) / 100.0;
    result.dynamic_points_now = scoring.current_dynamic_value(*c, result.solve_count);
    return result;
}

vector<submission> leaderboard::solved_challenges(id_type user_id) {
    submission_filter filter;
    filter.user_id = user_id;
    return correct_submissions(filter);
}

vector<submission> leaderboard::recent_solves(size_t limit) {
    submission_filter filter;
    filter.correct_only = true;
    filter.ascending = false;
    filter.limit = limit;
    return store.query_submissions(filter);
}

}  // namespace ctf::ledger
