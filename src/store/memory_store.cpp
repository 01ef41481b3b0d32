#include "store/memory_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace ctf::store {
using namespace std;

/**
 * @brief memory_store 的事务
 * 写操作先缓存在事务内，commit 时在写锁下一次性应用，rollback 时直接丢弃
 */
struct memory_transaction : public ledger_transaction {
    memory_transaction(memory_store &store, vector<unique_lock<mutex>> serial)
        : store(store), serial(move(serial)) {}

    ~memory_transaction() override {
        if (!finished) rollback();
    }

    optional<challenge> find_challenge(id_type challenge_id) override {
        shared_lock lock(store.data_mutex);
        auto it = store.challenges.find(challenge_id);
        if (it == store.challenges.end()) return nullopt;
        return it->second;
    }

    optional<user> find_user(id_type user_id) override {
        shared_lock lock(store.data_mutex);
        auto it = store.users.find(user_id);
        if (it == store.users.end()) return nullopt;
        return it->second;
    }

    optional<team> find_team(id_type team_id) override {
        shared_lock lock(store.data_mutex);
        auto it = store.teams.find(team_id);
        if (it == store.teams.end()) return nullopt;
        return it->second;
    }

    size_t count_attempts(id_type user_id, id_type challenge_id) override {
        shared_lock lock(store.data_mutex);
        auto it = store.attempts.find({user_id, challenge_id});
        return it == store.attempts.end() ? 0 : it->second;
    }

    bool has_solved(id_type user_id, id_type challenge_id) override {
        shared_lock lock(store.data_mutex);
        return store.solved.count({user_id, challenge_id}) > 0;
    }

    size_t count_solves(id_type challenge_id) override {
        shared_lock lock(store.data_mutex);
        auto it = store.solve_counts.find(challenge_id);
        return it == store.solve_counts.end() ? 0 : it->second;
    }

    submission insert_submission(const submission &submit) override {
        submission row = submit;
        {
            shared_lock lock(store.data_mutex);
            if (row.is_correct && store.solved.count({row.user_id, row.challenge_id}))
                throw concurrency_conflict(fmt::format("user {} already has a correct submission for challenge {}", row.user_id, row.challenge_id));

            row.created_at = store.clock();
            auto latest = store.latest_created.find(row.challenge_id);
            if (latest != store.latest_created.end() && latest->second > row.created_at)
                row.created_at = latest->second;
        }
        for (auto &p : pending_submissions)
            if (p.is_correct && row.is_correct && p.user_id == row.user_id && p.challenge_id == row.challenge_id)
                throw concurrency_conflict("duplicate correct submission in one transaction");
        row.id = store.next_submission_id++;
        pending_submissions.push_back(row);
        return row;
    }

    size_t count_members(id_type team_id) override {
        shared_lock lock(store.data_mutex);
        return store.count_members_nolock(team_id);
    }

    vector<id_type> member_ids(id_type team_id) override {
        return store.team_member_ids(team_id);
    }

    void set_user_team(id_type user_id, optional<id_type> team_id) override {
        pending_memberships.emplace_back(user_id, team_id);
    }

    void update_team(const team &t) override {
        pending_teams.push_back(t);
    }

    void commit() override {
        if (finished) throw storage_error("transaction already finished");
        {
            unique_lock lock(store.data_mutex);
            for (auto &row : pending_submissions) {
                ++store.attempts[{row.user_id, row.challenge_id}];
                if (row.is_correct) {
                    store.solved.insert({row.user_id, row.challenge_id});
                    ++store.solve_counts[row.challenge_id];
                }
                auto &latest = store.latest_created[row.challenge_id];
                latest = max(latest, row.created_at);
                store.submissions.push_back(move(row));
            }
            for (auto &[user_id, team_id] : pending_memberships) {
                auto it = store.users.find(user_id);
                if (it != store.users.end()) it->second.team_id = team_id;
            }
            for (auto &t : pending_teams)
                store.teams[t.id] = t;
        }
        finish();
    }

    void rollback() override {
        if (finished) return;
        finish();
    }

private:
    void finish() {
        pending_submissions.clear();
        pending_memberships.clear();
        pending_teams.clear();
        finished = true;
        serial.clear();
    }

    memory_store &store;
    vector<unique_lock<mutex>> serial;
    bool finished = false;

    vector<submission> pending_submissions;
    vector<pair<id_type, optional<id_type>>> pending_memberships;
    vector<team> pending_teams;
};

memory_store::memory_store(clock_type clock)
    : clock(move(clock)) {}

mutex &memory_store::serial_mutex(const string &key) {
    scoped_lock guard(serial_mutexes_lock);
    auto &ptr = serial_mutexes[key];
    if (!ptr) ptr = make_unique<mutex>();
    return *ptr;
}

unique_ptr<ledger_transaction> memory_store::begin_submission(id_type challenge_id) {
    vector<unique_lock<mutex>> serial;
    serial.emplace_back(serial_mutex(fmt::format("challenge:{}", challenge_id)));
    return make_unique<memory_transaction>(*this, move(serial));
}

unique_ptr<ledger_transaction> memory_store::begin_roster(const roster_scope &scope) {
    set<id_type> team_ids(scope.teams.begin(), scope.teams.end());
    set<id_type> user_ids(scope.users.begin(), scope.users.end());

    vector<unique_lock<mutex>> serial;
    for (id_type team_id : team_ids)
        serial.emplace_back(serial_mutex(fmt::format("team:{}", team_id)));
    for (id_type user_id : user_ids)
        serial.emplace_back(serial_mutex(fmt::format("user:{}", user_id)));
    return make_unique<memory_transaction>(*this, move(serial));
}

optional<challenge> memory_store::get_challenge(id_type challenge_id) {
    shared_lock lock(data_mutex);
    auto it = challenges.find(challenge_id);
    if (it == challenges.end()) return nullopt;
    return it->second;
}

vector<challenge> memory_store::list_challenges() {
    shared_lock lock(data_mutex);
    vector<challenge> result;
    for (auto &[id, c] : challenges) result.push_back(c);
    return result;
}

void memory_store::save_challenge(const challenge &c) {
    // 与该题目的提交事务互斥，避免提交在题目下线的同时被计分
    scoped_lock serial(serial_mutex(fmt::format("challenge:{}", c.id)));
    unique_lock lock(data_mutex);
    challenges[c.id] = c;
}

bool memory_store::set_challenge_active(id_type challenge_id, bool active) {
    scoped_lock serial(serial_mutex(fmt::format("challenge:{}", challenge_id)));
    unique_lock lock(data_mutex);
    auto it = challenges.find(challenge_id);
    if (it == challenges.end()) return false;
    it->second.is_active = active;
    return true;
}

optional<user> memory_store::get_user(id_type user_id) {
    shared_lock lock(data_mutex);
    auto it = users.find(user_id);
    if (it == users.end()) return nullopt;
    return it->second;
}

vector<user> memory_store::list_users() {
    shared_lock lock(data_mutex);
    vector<user> result;
    for (auto &[id, u] : users) result.push_back(u);
    return result;
}

void memory_store::save_user(const user &u) {
    unique_lock lock(data_mutex);
    users[u.id] = u;
}

optional<team> memory_store::get_team(id_type team_id) {
    shared_lock lock(data_mutex);
    auto it = teams.find(team_id);
    if (it == teams.end()) return nullopt;
    return it->second;
}

vector<team> memory_store::list_teams() {
    shared_lock lock(data_mutex);
    vector<team> result;
    for (auto &[id, t] : teams) result.push_back(t);
    return result;
}

void memory_store::save_team(const team &t) {
    scoped_lock serial(serial_mutex(fmt::format("team:{}", t.id)));
    unique_lock lock(data_mutex);
    teams[t.id] = t;
}

size_t memory_store::count_members_nolock(id_type team_id) const {
    return count_if(users.begin(), users.end(), [team_id](auto &entry) {
        return entry.second.team_id == team_id;
    });
}

vector<id_type> memory_store::team_member_ids(id_type team_id) {
    shared_lock lock(data_mutex);
    vector<id_type> result;
    for (auto &[id, u] : users)
        if (u.team_id == team_id) result.push_back(id);
    return result;
}

vector<submission> memory_store::query_submissions(const submission_filter &filter) {
    shared_lock lock(data_mutex);
    vector<submission> result;
    for (auto &row : submissions) {
        if (filter.user_id && row.user_id != *filter.user_id) continue;
        if (filter.challenge_id && row.challenge_id != *filter.challenge_id) continue;
        if (filter.correct_only && !row.is_correct) continue;
        if (filter.team_id) {
            auto it = users.find(row.user_id);
            if (it == users.end() || it->second.team_id != filter.team_id) continue;
        }
        result.push_back(row);
    }
    lock.unlock();

    if (filter.ascending)
        sort(result.begin(), result.end(), solved_before);
    else
        sort(result.begin(), result.end(), [](const submission &a, const submission &b) { return solved_before(b, a); });
    if (filter.limit > 0 && result.size() > filter.limit)
        result.resize(filter.limit);
    return result;
}

}  // namespace ctf::store
