#include "model/submission.hpp"
#include <tuple>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace ctf {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const submission &s) {
    j = {{"id", s.id},
         {"user_id", s.user_id},
         {"challenge_id", s.challenge_id},
         {"submitted_flag", s.submitted_flag},
         {"is_correct", s.is_correct},
         {"points_awarded", s.points_awarded},
         {"created_at", to_epoch_millis(s.created_at)},
         {"ip_address", s.meta.ip_address}};
}

void from_json(const json &j, submission_filter &filter) {
    if (exists(j, "user_id")) filter.user_id = j.at("user_id").get<id_type>();
    if (exists(j, "challenge_id")) filter.challenge_id = j.at("challenge_id").get<id_type>();
    if (exists(j, "team_id")) filter.team_id = j.at("team_id").get<id_type>();
    assign_optional(j, filter.correct_only, "correct_only");
    assign_optional(j, filter.ascending, "ascending");
    assign_optional(j, filter.limit, "limit");
}

bool solved_before(const submission &a, const submission &b) {
    return tie(a.created_at, a.id) < tie(b.created_at, b.id);
}

void to_json(json &j, const submission_result &r) {
    j = {{"status", get_display_message(r.status)},
         {"correct", r.correct},
         {"points_awarded", r.points_awarded},
         {"is_first_blood", r.is_first_blood},
         {"rank", r.rank},
         {"prior_solves", r.prior_solves},
         {"message", r.message}};
    if (r.submission_id)
        j["submission_id"] = *r.submission_id;
    else
        j["submission_id"] = nullptr;
}

}  // namespace ctf
