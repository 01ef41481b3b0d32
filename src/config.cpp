#include "config.hpp"
#include <fstream>
#include <stdexcept>
#include "common/json_utils.hpp"

namespace ctf {
using namespace std;
using namespace nlohmann;

bool DEBUG = false;

void from_json(const json &j, scoring_config &config) {
    assign_optional(j, config.decay_factor, "decay_factor");
    assign_optional(j, config.min_points_floor, "min_points_floor");
    assign_optional(j, config.min_points_divisor, "min_points_divisor");
    if (config.decay_factor < 0)
        throw invalid_argument("scoring.decay_factor must not be negative");
    if (config.min_points_divisor <= 0)
        throw invalid_argument("scoring.min_points_divisor must be positive");
}

void from_json(const json &j, ledger_config &config) {
    assign_optional(j, config.max_flag_length, "max_flag_length");
    assign_optional(j, config.submit_retries, "submit_retries");
    if (config.submit_retries < 1)
        throw invalid_argument("ledger.submit_retries must be at least 1");
}

void from_json(const json &j, cache_config &config) {
    assign_optional(j, config.enabled, "enabled");
    assign_optional(j, config.ttl_ms, "ttl_ms");
}

void from_json(const json &j, database_config &db) {
    j.at("host").get_to(db.host);
    j.at("user").get_to(db.user);
    j.at("password").get_to(db.password);
    j.at("database").get_to(db.database);
    assign_optional(j, db.port, "port");
    assign_optional(j, db.pool_size, "pool_size");
    if (db.pool_size == 0)
        throw invalid_argument("database.pool_size must be positive");
}

void from_json(const json &j, configuration &config) {
    assign_optional(j, config.storage, "storage");
    if (config.storage != "memory" && config.storage != "mysql")
        throw invalid_argument("Unrecognized storage " + config.storage);
    if (exists(j, "database"))
        config.database = j.at("database").get<database_config>();
    else if (config.storage == "mysql")
        throw invalid_argument("mysql storage requires a database section");
    if (exists(j, "scoring"))
        config.scoring = j.at("scoring").get<scoring_config>();
    if (exists(j, "ledger"))
        config.ledger = j.at("ledger").get<ledger_config>();
    if (exists(j, "cache"))
        config.cache = j.at("cache").get<cache_config>();
    config.seed = get_value_def<string>(j, "", "seed");
}

configuration load_configuration(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw runtime_error("Unable to find configuration file " + path.string());
    ifstream fin(path);
    json j;
    fin >> j;
    return j.get<configuration>();
}

}  // namespace ctf
