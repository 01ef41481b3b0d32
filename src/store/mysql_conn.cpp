#include "store/mysql_conn.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <mysql/mysqld_error.h>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"

namespace ctf::store {
using namespace std;

mysql_conn::mysql_conn() {}

mysql_conn::~mysql_conn() {
    if (con != nullptr) {
        mysql_close(con);
        con = nullptr;
    }
}

void mysql_conn::connect(const database_config &config) {
    this->config = config;
    if (con != nullptr) {
        mysql_close(con);
    }

    con = mysql_init(nullptr);
    if (con == nullptr) {
        throw storage_error("mysql init failed");
    }

    mysql_options(con, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    if (mysql_real_connect(con, config.host.c_str(), config.user.c_str(), config.password.c_str(),
                           config.database.c_str(), config.port, nullptr, 0) == nullptr) {
        string message = mysql_error(con);
        mysql_close(con);
        con = nullptr;
        BOOST_THROW_EXCEPTION(storage_error(fmt::format("MySQL: unable to connect to {}:{}: {}", config.host, config.port, message)));
    }
    LOG(INFO) << "MySQL: connected to " << config.host << ":" << config.port << "/" << config.database;
}

bool mysql_conn::ping() {
    return con != nullptr && mysql_ping(con) == 0;
}

string mysql_conn::escape(const string &value) const {
    if (con == nullptr) throw storage_error("MySQL: connection is not established");
    string buffer(value.size() * 2 + 1, '\0');
    unsigned long len = mysql_real_escape_string(con, buffer.data(), value.data(), value.size());
    buffer.resize(len);
    return "'" + buffer + "'";
}

string mysql_conn::bind(string_view sql, const vector<string> &params) const {
    string result;
    size_t index = 0;
    for (char ch : sql) {
        if (ch == '?') {
            if (index >= params.size())
                throw invalid_argument("argument number not matched");
            result += params[index++];
        } else {
            result += ch;
        }
    }
    if (index != params.size())
        throw invalid_argument("argument number not matched");
    return result;
}

void mysql_conn::raise(const string &sql) {
    unsigned code = mysql_errno(con);
    string message = fmt::format("MySQL error {}: {}", code, mysql_error(con));
    switch (code) {
        case ER_DUP_ENTRY:
        case ER_LOCK_DEADLOCK:
        case ER_LOCK_WAIT_TIMEOUT:
            DLOG(INFO) << message << ", statement: " << sql;
            throw concurrency_conflict(message);
        default:
            LOG(ERROR) << message << ", statement: " << sql;
            throw storage_error(message);
    }
}

vector<mysql_row> mysql_conn::query_raw(const string &sql) {
    if (con == nullptr) throw storage_error("MySQL: connection is not established");
    if (mysql_real_query(con, sql.data(), sql.size()) != 0)
        raise(sql);

    MYSQL_RES *res = mysql_store_result(con);
    if (res == nullptr) {
        if (mysql_field_count(con) != 0) raise(sql);
        return {};
    }

    vector<mysql_row> rows;
    unsigned fields = mysql_num_fields(res);
    while (MYSQL_ROW row = mysql_fetch_row(res)) {
        unsigned long *lengths = mysql_fetch_lengths(res);
        mysql_row values(fields);
        for (unsigned i = 0; i < fields; ++i)
            if (row[i] != nullptr) values[i] = string(row[i], lengths[i]);
        rows.push_back(move(values));
    }
    mysql_free_result(res);
    return rows;
}

uint64_t mysql_conn::execute_raw(const string &sql) {
    if (con == nullptr) throw storage_error("MySQL: connection is not established");
    if (mysql_real_query(con, sql.data(), sql.size()) != 0)
        raise(sql);
    return mysql_affected_rows(con);
}

uint64_t mysql_conn::last_insert_id() {
    return mysql_insert_id(con);
}

mysql_pool::lease::lease(mysql_pool &pool, unique_ptr<mysql_conn> conn)
    : pool(&pool), conn(move(conn)) {}

mysql_pool::lease::~lease() {
    if (conn) pool->idle.push(move(conn));
}

mysql_pool::mysql_pool(const database_config &config)
    : config(config) {
    for (size_t i = 0; i < config.pool_size; ++i) {
        auto conn = make_unique<mysql_conn>();
        conn->connect(config);
        idle.push(move(conn));
    }
}

mysql_pool::lease mysql_pool::acquire() {
    auto conn = idle.pop();
    if (!conn) throw storage_error("MySQL: connection pool is closed");
    lease result(*this, move(*conn));
    if (!result->ping()) {
        LOG(WARNING) << "MySQL: lost connection, trying to reconnect";
        result->connect(config);
    }
    return result;
}

}  // namespace ctf::store
