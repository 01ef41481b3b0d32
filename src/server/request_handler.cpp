#include "server/request_handler.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace ctf::server {
using namespace std;
using namespace nlohmann;

static json roster_response(roster_status status) {
    return {{"status", get_display_message(status)}, {"ok", status == roster_status::OK}};
}

static json error_response(const string &message, bool retryable) {
    return {{"error", message}, {"retryable", retryable}};
}

request_handler::request_handler(engine &e)
    : e(e) {}

json request_handler::dispatch(const string &op, const json &request) {
    if (op == "submit") {
        client_meta meta;
        meta.ip_address = get_value_def<string>(request, "", "ip_address");
        meta.user_agent = get_value_def<string>(request, "", "user_agent");
        return e.submit_flag(get_value<id_type>(request, "user_id"),
                             get_value<id_type>(request, "challenge_id"),
                             get_value<string>(request, "flag"),
                             meta);
    } else if (op == "submissions") {
        return {{"submissions", e.list_submissions(request.get<submission_filter>())}};
    } else if (op == "stats") {
        id_type challenge_id = get_value<id_type>(request, "challenge_id");
        auto stats = e.get_challenge_solve_stats(challenge_id);
        if (!stats) return error_response("Challenge " + to_string(challenge_id) + " not found", false);
        return *stats;
    } else if (op == "leaderboard") {
        string kind = get_value_def<string>(request, "users", "kind");
        size_t limit = get_value_def<size_t>(request, 0, "limit");
        if (kind == "users")
            return {{"kind", kind}, {"entries", e.get_individual_leaderboard(limit)}};
        else if (kind == "teams")
            return {{"kind", kind}, {"entries", e.get_team_leaderboard(limit)}};
        throw invalid_argument("Unrecognized leaderboard kind " + kind);
    } else if (op == "standing") {
        id_type user_id = get_value<id_type>(request, "user_id");
        auto standing = e.board().get_user_standing(user_id);
        if (!standing) return error_response("User " + to_string(user_id) + " not found", false);
        return *standing;
    } else if (op == "team") {
        id_type team_id = get_value<id_type>(request, "team_id");
        auto standing = e.board().get_team_standing(team_id);
        if (!standing) return error_response("Team " + to_string(team_id) + " not found", false);
        return *standing;
    } else if (op == "solves") {
        id_type challenge_id = get_value<id_type>(request, "challenge_id");
        json response = {{"solves", e.resolver().solves(challenge_id, get_value_def<size_t>(request, 0, "limit"))}};
        if (auto first = e.resolver().first_blood(challenge_id))
            response["first_blood"] = *first;
        else
            response["first_blood"] = nullptr;
        return response;
    } else if (op == "recent") {
        return {{"solves", e.board().recent_solves(get_value_def<size_t>(request, 10, "limit"))}};
    } else if (op == "join") {
        return roster_response(e.roster().join(get_value<id_type>(request, "user_id"), get_value<id_type>(request, "team_id")));
    } else if (op == "transfer") {
        return roster_response(e.roster().transfer(get_value<id_type>(request, "user_id"), get_value<id_type>(request, "team_id")));
    } else if (op == "leave") {
        return roster_response(e.roster().leave(get_value<id_type>(request, "user_id")));
    } else if (op == "transfer_captain") {
        return roster_response(e.roster().transfer_captain(get_value<id_type>(request, "team_id"),
                                                           get_value<id_type>(request, "user_id"),
                                                           get_value<id_type>(request, "new_captain_id")));
    } else if (op == "disband") {
        return roster_response(e.roster().disband(get_value<id_type>(request, "team_id"), get_value<id_type>(request, "user_id")));
    } else if (op == "create_team") {
        return roster_response(e.roster().create_team(get_value<team>(request, "team")));
    } else if (op == "challenge") {
        e.catalog().save(get_value<challenge>(request, "challenge"));
        return {{"ok", true}};
    } else if (op == "deactivate") {
        return {{"ok", e.catalog().deactivate(get_value<id_type>(request, "challenge_id"))}};
    } else if (op == "user") {
        e.roster().register_user(get_value<user>(request, "user"));
        return {{"ok", true}};
    }
    throw invalid_argument("Unrecognized op " + op);
}

json request_handler::handle(const json &request) {
    json response;
    try {
        if (!request.is_object()) throw invalid_argument("Request must be a JSON object");
        response = dispatch(get_value<string>(request, "op"), request);
    } catch (concurrency_conflict &ex) {
        response = error_response(ex.what(), true);
    } catch (storage_error &ex) {
        LOG(ERROR) << "Storage failure while handling request " << request.dump() << ": " << ex.what();
        response = error_response(ex.what(), true);
        if (DEBUG) response["detail"] = boost::diagnostic_information(ex);
    } catch (validation_error &ex) {
        response = error_response(ex.what(), false);
    } catch (invalid_argument &ex) {
        response = error_response(ex.what(), false);
    } catch (json::exception &ex) {
        response = error_response(string("Malformed request: ") + ex.what(), false);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unexpected failure while handling request " << request.dump() << ": " << boost::diagnostic_information(ex);
        response = error_response(ex.what(), false);
        if (DEBUG) response["detail"] = boost::diagnostic_information(ex);
    }

    if (request.is_object() && request.count("id"))
        response["id"] = request.at("id");
    return response;
}

string request_handler::handle_line(const string &line) {
    json request;
    try {
        request = json::parse(line);
    } catch (json::parse_error &ex) {
        return error_response(string("Malformed request: ") + ex.what(), false).dump();
    }
    return handle(request).dump();
}

}  // namespace ctf::server
