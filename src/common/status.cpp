#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace ctf {
using namespace std;

// clang-format off
static const unordered_map<submit_status, const char *> submit_status_string = boost::assign::map_list_of
    (submit_status::ACCEPTED, "Accepted")
    (submit_status::WRONG_FLAG, "Wrong Flag")
    (submit_status::CHALLENGE_UNAVAILABLE, "Challenge Unavailable")
    (submit_status::ATTEMPT_LIMIT_EXCEEDED, "Attempt Limit Exceeded")
    (submit_status::ALREADY_SOLVED, "Already Solved")
    (submit_status::VALIDATION_ERROR, "Validation Error");

static const unordered_map<roster_status, const char *> roster_status_string = boost::assign::map_list_of
    (roster_status::OK, "OK")
    (roster_status::USER_NOT_FOUND, "User Not Found")
    (roster_status::TEAM_NOT_FOUND, "Team Not Found")
    (roster_status::TEAM_INACTIVE, "Team Inactive")
    (roster_status::TEAM_FULL, "Team Full")
    (roster_status::ALREADY_IN_TEAM, "Already In Team")
    (roster_status::NOT_A_MEMBER, "Not A Member")
    (roster_status::CAPTAIN_MUST_TRANSFER, "Captain Must Transfer")
    (roster_status::NOT_CAPTAIN, "Not Captain")
    (roster_status::INVALID_TEAM, "Invalid Team");
// clang-format on

const char *get_display_message(submit_status stat) {
    return submit_status_string.at(stat);
}

const char *get_display_message(roster_status stat) {
    return roster_status_string.at(stat);
}

}  // namespace ctf
