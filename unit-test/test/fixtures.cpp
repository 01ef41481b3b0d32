#include "test/fixtures.hpp"
#include <fmt/core.h>
#include "gtest/gtest.h"

namespace ctf::test {
using namespace std;

configuration test_configuration() {
    configuration config;
    config.cache.enabled = false;
    return config;
}

unique_ptr<engine> make_engine(const configuration &config) {
    return make_unique<engine>(make_unique<store::memory_store>(), config);
}

unique_ptr<engine> make_engine(store::memory_store::clock_type clock, const configuration &config) {
    return make_unique<engine>(make_unique<store::memory_store>(move(clock)), config);
}

challenge make_challenge(id_type id, int points, bool is_dynamic, const string &flag, int max_attempts) {
    challenge c;
    c.id = id;
    c.name = fmt::format("challenge-{}", id);
    c.category = "misc";
    c.points = points;
    c.is_dynamic = is_dynamic;
    c.max_attempts = max_attempts;
    c.flag = flag;
    return c;
}

void add_challenge(engine &e, id_type id, int points, bool is_dynamic, const string &flag, int max_attempts) {
    e.catalog().save(make_challenge(id, points, is_dynamic, flag, max_attempts));
}

void add_user(engine &e, id_type id, const string &name) {
    user u;
    u.id = id;
    u.name = name.empty() ? fmt::format("user-{}", id) : name;
    e.roster().register_user(u);
}

void add_team(engine &e, id_type id, id_type captain_id, int max_members, const string &name) {
    team t;
    t.id = id;
    t.name = name.empty() ? fmt::format("team-{}", id) : name;
    t.captain_id = captain_id;
    t.max_members = max_members;
    ASSERT_EQ(e.roster().create_team(t), roster_status::OK);
}

}  // namespace ctf::test
