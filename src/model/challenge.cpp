#include "model/challenge.hpp"
#include "common/json_utils.hpp"

namespace ctf {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const challenge &c) {
    j = {{"id", c.id},
         {"name", c.name},
         {"category", c.category},
         {"points", c.points},
         {"is_dynamic", c.is_dynamic},
         {"is_active", c.is_active},
         {"max_attempts", c.max_attempts}};
}

void from_json(const json &j, challenge &c) {
    j.at("id").get_to(c.id);
    j.at("flag").get_to(c.flag);
    assign_optional(j, c.name, "name");
    assign_optional(j, c.category, "category");
    assign_optional(j, c.points, "points");
    assign_optional(j, c.is_dynamic, "is_dynamic");
    assign_optional(j, c.is_active, "is_active");
    assign_optional(j, c.max_attempts, "max_attempts");
}

}  // namespace ctf
