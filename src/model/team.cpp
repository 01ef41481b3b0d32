#include "model/team.hpp"
#include "common/json_utils.hpp"

namespace ctf {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const user &u) {
    j = {{"id", u.id}, {"name", u.name}};
    if (u.team_id)
        j["team_id"] = *u.team_id;
    else
        j["team_id"] = nullptr;
}

void from_json(const json &j, user &u) {
    j.at("id").get_to(u.id);
    assign_optional(j, u.name, "name");
    if (exists(j, "team_id"))
        u.team_id = j.at("team_id").get<id_type>();
    else
        u.team_id.reset();
}

void to_json(json &j, const team &t) {
    j = {{"id", t.id},
         {"name", t.name},
         {"max_members", t.max_members},
         {"captain_id", t.captain_id},
         {"is_active", t.is_active}};
}

void from_json(const json &j, team &t) {
    j.at("id").get_to(t.id);
    j.at("captain_id").get_to(t.captain_id);
    assign_optional(j, t.name, "name");
    assign_optional(j, t.max_members, "max_members");
    assign_optional(j, t.is_active, "is_active");
}

}  // namespace ctf
