#include "store/mysql_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <set>
#include "common/exceptions.hpp"

namespace ctf::store {
using namespace std;
using namespace std::chrono;

static const char *CHALLENGE_COLUMNS = "id, name, category, points, is_dynamic, is_active, max_attempts, flag";
static const char *SUBMISSION_COLUMNS = "s.id, s.user_id, s.challenge_id, s.submitted_flag, s.is_correct, s.points_awarded, s.created_at, s.ip_address, s.user_agent";

template <typename T>
static T column(const mysql_row &row, size_t index) {
    if (!row.at(index)) throw storage_error(fmt::format("MySQL: unexpected NULL in column {}", index));
    return boost::lexical_cast<T>(*row[index]);
}

template <>
string column<string>(const mysql_row &row, size_t index) {
    return row.at(index).value_or("");
}

static challenge to_challenge(const mysql_row &row) {
    challenge c;
    c.id = column<id_type>(row, 0);
    c.name = column<string>(row, 1);
    c.category = column<string>(row, 2);
    c.points = column<int>(row, 3);
    c.is_dynamic = column<int>(row, 4) != 0;
    c.is_active = column<int>(row, 5) != 0;
    c.max_attempts = column<int>(row, 6);
    c.flag = column<string>(row, 7);
    return c;
}

static user to_user(const mysql_row &row) {
    user u;
    u.id = column<id_type>(row, 0);
    u.name = column<string>(row, 1);
    if (row.at(2)) u.team_id = column<id_type>(row, 2);
    return u;
}

static team to_team(const mysql_row &row) {
    team t;
    t.id = column<id_type>(row, 0);
    t.name = column<string>(row, 1);
    t.max_members = column<int>(row, 2);
    t.captain_id = column<id_type>(row, 3);
    t.is_active = column<int>(row, 4) != 0;
    return t;
}

static int64_t to_micros(system_clock::time_point tp) {
    return duration_cast<microseconds>(tp.time_since_epoch()).count();
}

static submission to_submission(const mysql_row &row) {
    submission s;
    s.id = column<id_type>(row, 0);
    s.user_id = column<id_type>(row, 1);
    s.challenge_id = column<id_type>(row, 2);
    s.submitted_flag = column<string>(row, 3);
    s.is_correct = column<int>(row, 4) != 0;
    s.points_awarded = column<int>(row, 5);
    s.created_at = system_clock::time_point(duration_cast<system_clock::duration>(microseconds(column<int64_t>(row, 6))));
    s.meta.ip_address = column<string>(row, 7);
    s.meta.user_agent = column<string>(row, 8);
    return s;
}

/**
 * @brief mysql_store 的事务，独占一个连接直到提交或回滚
 */
struct mysql_transaction : public ledger_transaction {
    explicit mysql_transaction(mysql_pool::lease &&conn)
        : conn(move(conn)) {
        this->conn->execute("SET TRANSACTION ISOLATION LEVEL READ COMMITTED");
        this->conn->execute("START TRANSACTION");
    }

    ~mysql_transaction() override {
        if (!finished) {
            try {
                rollback();
            } catch (ctf_exception &ex) {
                LOG(WARNING) << "MySQL: rollback failed, connection will be re-established: " << ex.what();
            }
        }
    }

    /**
     * @brief 对题目行、队伍行或者用户行加排他锁，作为事务的串行化点
     */
    void lock_row(const char *table, id_type id) {
        conn->query(fmt::format("SELECT id FROM {} WHERE id=? FOR UPDATE", table), id);
    }

    optional<challenge> find_challenge(id_type challenge_id) override {
        auto rows = conn->query(fmt::format("SELECT {} FROM challenges WHERE id=?", CHALLENGE_COLUMNS), challenge_id);
        if (rows.empty()) return nullopt;
        return to_challenge(rows.front());
    }

    optional<user> find_user(id_type user_id) override {
        auto rows = conn->query("SELECT id, name, team_id FROM users WHERE id=?", user_id);
        if (rows.empty()) return nullopt;
        return to_user(rows.front());
    }

    optional<team> find_team(id_type team_id) override {
        auto rows = conn->query("SELECT id, name, max_members, captain_id, is_active FROM teams WHERE id=?", team_id);
        if (rows.empty()) return nullopt;
        return to_team(rows.front());
    }

    size_t count_attempts(id_type user_id, id_type challenge_id) override {
        auto rows = conn->query("SELECT COUNT(*) FROM submissions WHERE user_id=? AND challenge_id=?", user_id, challenge_id);
        return column<size_t>(rows.at(0), 0);
    }

    bool has_solved(id_type user_id, id_type challenge_id) override {
        auto rows = conn->query("SELECT COUNT(*) FROM submissions WHERE user_id=? AND challenge_id=? AND is_correct=1", user_id, challenge_id);
        return column<size_t>(rows.at(0), 0) > 0;
    }

    size_t count_solves(id_type challenge_id) override {
        auto rows = conn->query("SELECT COUNT(*) FROM submissions WHERE challenge_id=? AND is_correct=1", challenge_id);
        return column<size_t>(rows.at(0), 0);
    }

    submission insert_submission(const submission &submit) override {
        submission row = submit;
        auto latest = conn->query("SELECT COALESCE(MAX(created_at), 0) FROM submissions WHERE challenge_id=?", submit.challenge_id);
        int64_t created = max(to_micros(system_clock::now()), column<int64_t>(latest.at(0), 0));
        optional<int> solved_marker;
        if (row.is_correct) solved_marker = 1;
        conn->execute("INSERT INTO submissions (user_id, challenge_id, submitted_flag, is_correct, points_awarded, solved_marker, created_at, ip_address, user_agent) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
                      row.user_id, row.challenge_id, row.submitted_flag, row.is_correct, row.points_awarded,
                      solved_marker, created, row.meta.ip_address, row.meta.user_agent);
        row.id = static_cast<id_type>(conn->last_insert_id());
        row.created_at = system_clock::time_point(duration_cast<system_clock::duration>(microseconds(created)));
        return row;
    }

    size_t count_members(id_type team_id) override {
        auto rows = conn->query("SELECT COUNT(*) FROM users WHERE team_id=?", team_id);
        return column<size_t>(rows.at(0), 0);
    }

    vector<id_type> member_ids(id_type team_id) override {
        vector<id_type> result;
        for (auto &row : conn->query("SELECT id FROM users WHERE team_id=? ORDER BY id", team_id))
            result.push_back(column<id_type>(row, 0));
        return result;
    }

    void set_user_team(id_type user_id, optional<id_type> team_id) override {
        conn->execute("UPDATE users SET team_id=? WHERE id=?", team_id, user_id);
    }

    void update_team(const team &t) override {
        conn->execute("UPDATE teams SET name=?, max_members=?, captain_id=?, is_active=? WHERE id=?",
                      t.name, t.max_members, t.captain_id, t.is_active, t.id);
    }

    void commit() override {
        if (finished) throw storage_error("transaction already finished");
        finished = true;
        conn->execute("COMMIT");
    }

    void rollback() override {
        if (finished) return;
        finished = true;
        conn->execute("ROLLBACK");
    }

private:
    mysql_pool::lease conn;
    bool finished = false;
};

mysql_store::mysql_store(const database_config &config)
    : pool(config) {
    create_schema();
}

void mysql_store::create_schema() {
    auto conn = pool.acquire();
    conn->execute(
        "CREATE TABLE IF NOT EXISTS challenges ("
        "id BIGINT PRIMARY KEY, "
        "name VARCHAR(100) NOT NULL, "
        "category VARCHAR(50) NOT NULL DEFAULT '', "
        "points INT NOT NULL, "
        "is_dynamic TINYINT(1) NOT NULL DEFAULT 0, "
        "is_active TINYINT(1) NOT NULL DEFAULT 1, "
        "max_attempts INT NOT NULL DEFAULT 0, "
        "flag VARCHAR(255) NOT NULL"
        ") ENGINE=InnoDB");
    conn->execute(
        "CREATE TABLE IF NOT EXISTS teams ("
        "id BIGINT PRIMARY KEY, "
        "name VARCHAR(100) NOT NULL, "
        "max_members INT NOT NULL DEFAULT 4, "
        "captain_id BIGINT NOT NULL, "
        "is_active TINYINT(1) NOT NULL DEFAULT 1"
        ") ENGINE=InnoDB");
    conn->execute(
        "CREATE TABLE IF NOT EXISTS users ("
        "id BIGINT PRIMARY KEY, "
        "name VARCHAR(80) NOT NULL, "
        "team_id BIGINT NULL, "
        "KEY idx_users_team (team_id)"
        ") ENGINE=InnoDB");
    conn->execute(
        "CREATE TABLE IF NOT EXISTS submissions ("
        "id BIGINT AUTO_INCREMENT PRIMARY KEY, "
        "user_id BIGINT NOT NULL, "
        "challenge_id BIGINT NOT NULL, "
        "submitted_flag VARCHAR(255) NOT NULL, "
        "is_correct TINYINT(1) NOT NULL, "
        "points_awarded INT NOT NULL, "
        "solved_marker TINYINT NULL, "
        "created_at BIGINT NOT NULL, "
        "ip_address VARCHAR(45) NOT NULL DEFAULT '', "
        "user_agent TEXT, "
        "UNIQUE KEY uniq_solve (user_id, challenge_id, solved_marker), "
        "KEY idx_challenge_order (challenge_id, is_correct, created_at, id)"
        ") ENGINE=InnoDB");
}

void mysql_store::truncate_all() {
    auto conn = pool.acquire();
    for (const char *table : {"submissions", "users", "teams", "challenges"})
        conn->execute(fmt::format("TRUNCATE TABLE {}", table));
    LOG(WARNING) << "MySQL: all ledger tables truncated";
}

unique_ptr<ledger_transaction> mysql_store::begin_submission(id_type challenge_id) {
    auto txn = make_unique<mysql_transaction>(pool.acquire());
    txn->lock_row("challenges", challenge_id);
    return txn;
}

unique_ptr<ledger_transaction> mysql_store::begin_roster(const roster_scope &scope) {
    set<id_type> team_ids(scope.teams.begin(), scope.teams.end());
    set<id_type> user_ids(scope.users.begin(), scope.users.end());

    auto txn = make_unique<mysql_transaction>(pool.acquire());
    for (id_type team_id : team_ids)
        txn->lock_row("teams", team_id);
    for (id_type user_id : user_ids)
        txn->lock_row("users", user_id);
    return txn;
}

optional<challenge> mysql_store::get_challenge(id_type challenge_id) {
    auto conn = pool.acquire();
    auto rows = conn->query(fmt::format("SELECT {} FROM challenges WHERE id=?", CHALLENGE_COLUMNS), challenge_id);
    if (rows.empty()) return nullopt;
    return to_challenge(rows.front());
}

vector<challenge> mysql_store::list_challenges() {
    auto conn = pool.acquire();
    vector<challenge> result;
    for (auto &row : conn->query(fmt::format("SELECT {} FROM challenges ORDER BY id", CHALLENGE_COLUMNS)))
        result.push_back(to_challenge(row));
    return result;
}

void mysql_store::save_challenge(const challenge &c) {
    auto conn = pool.acquire();
    conn->execute("INSERT INTO challenges (id, name, category, points, is_dynamic, is_active, max_attempts, flag) VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                  "ON DUPLICATE KEY UPDATE name=VALUES(name), category=VALUES(category), points=VALUES(points), is_dynamic=VALUES(is_dynamic), "
                  "is_active=VALUES(is_active), max_attempts=VALUES(max_attempts), flag=VALUES(flag)",
                  c.id, c.name, c.category, c.points, c.is_dynamic, c.is_active, c.max_attempts, c.flag);
}

bool mysql_store::set_challenge_active(id_type challenge_id, bool active) {
    auto conn = pool.acquire();
    if (conn->execute("UPDATE challenges SET is_active=? WHERE id=?", active, challenge_id) > 0)
        return true;
    // 值没有变化时受影响行数为 0
    return !conn->query("SELECT id FROM challenges WHERE id=?", challenge_id).empty();
}

optional<user> mysql_store::get_user(id_type user_id) {
    auto conn = pool.acquire();
    auto rows = conn->query("SELECT id, name, team_id FROM users WHERE id=?", user_id);
    if (rows.empty()) return nullopt;
    return to_user(rows.front());
}

vector<user> mysql_store::list_users() {
    auto conn = pool.acquire();
    vector<user> result;
    for (auto &row : conn->query("SELECT id, name, team_id FROM users ORDER BY id"))
        result.push_back(to_user(row));
    return result;
}

void mysql_store::save_user(const user &u) {
    auto conn = pool.acquire();
    conn->execute("INSERT INTO users (id, name, team_id) VALUES (?, ?, ?) "
                  "ON DUPLICATE KEY UPDATE name=VALUES(name), team_id=VALUES(team_id)",
                  u.id, u.name, u.team_id);
}

optional<team> mysql_store::get_team(id_type team_id) {
    auto conn = pool.acquire();
    auto rows = conn->query("SELECT id, name, max_members, captain_id, is_active FROM teams WHERE id=?", team_id);
    if (rows.empty()) return nullopt;
    return to_team(rows.front());
}

vector<team> mysql_store::list_teams() {
    auto conn = pool.acquire();
    vector<team> result;
    for (auto &row : conn->query("SELECT id, name, max_members, captain_id, is_active FROM teams ORDER BY id"))
        result.push_back(to_team(row));
    return result;
}

void mysql_store::save_team(const team &t) {
    auto conn = pool.acquire();
    conn->execute("INSERT INTO teams (id, name, max_members, captain_id, is_active) VALUES (?, ?, ?, ?, ?) "
                  "ON DUPLICATE KEY UPDATE name=VALUES(name), max_members=VALUES(max_members), captain_id=VALUES(captain_id), is_active=VALUES(is_active)",
                  t.id, t.name, t.max_members, t.captain_id, t.is_active);
}

vector<id_type> mysql_store::team_member_ids(id_type team_id) {
    auto conn = pool.acquire();
    vector<id_type> result;
    for (auto &row : conn->query("SELECT id FROM users WHERE team_id=? ORDER BY id", team_id))
        result.push_back(column<id_type>(row, 0));
    return result;
}

vector<submission> mysql_store::query_submissions(const submission_filter &filter) {
    auto conn = pool.acquire();
    string sql = fmt::format("SELECT {} FROM submissions s", SUBMISSION_COLUMNS);
    if (filter.team_id)
        sql += " JOIN users u ON u.id = s.user_id";
    sql += " WHERE 1=1";
    if (filter.user_id) sql += fmt::format(" AND s.user_id={}", *filter.user_id);
    if (filter.challenge_id) sql += fmt::format(" AND s.challenge_id={}", *filter.challenge_id);
    if (filter.team_id) sql += fmt::format(" AND u.team_id={}", *filter.team_id);
    if (filter.correct_only) sql += " AND s.is_correct=1";
    sql += filter.ascending ? " ORDER BY s.created_at ASC, s.id ASC" : " ORDER BY s.created_at DESC, s.id DESC";
    if (filter.limit > 0) sql += fmt::format(" LIMIT {}", filter.limit);

    vector<submission> result;
    for (auto &row : conn->query(sql))
        result.push_back(to_submission(row));
    return result;
}

}  // namespace ctf::store
