#include "ledger/team_roster.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"

namespace ctf::ledger {
using namespace std;

static const size_t MIN_TEAM_NAME_LENGTH = 2;
static const int MAX_TEAM_MEMBERS = 10;

team_roster::team_roster(store::ledger_store &store)
    : store(store) {}

void team_roster::on_changed(function<void()> callback) {
    callbacks.push_back(move(callback));
}

void team_roster::notify_changed() {
    for (auto &callback : callbacks) callback();
}

void team_roster::register_user(const user &u) {
    if (boost::algorithm::trim_copy(u.name).empty())
        throw validation_error(fmt::format("user {}: name must not be empty", u.id));

    user row = u;
    auto existing = store.get_user(u.id);
    row.team_id = existing ? existing->team_id : nullopt;
    store.save_user(row);
    notify_changed();
}

roster_status team_roster::create_team(const team &t) {
    if (boost::algorithm::trim_copy(t.name).size() < MIN_TEAM_NAME_LENGTH ||
        t.max_members < 1 || t.max_members > MAX_TEAM_MEMBERS)
        return roster_status::INVALID_TEAM;
    if (store.get_team(t.id))
        return roster_status::INVALID_TEAM;

    auto captain = store.get_user(t.captain_id);
    if (!captain) return roster_status::USER_NOT_FOUND;
    if (captain->team_id) return roster_status::ALREADY_IN_TEAM;

    team row = t;
    row.is_active = true;
    store.save_team(row);

    roster_status status = move_member(t.captain_id, t.id, nullopt);
    if (status != roster_status::OK) {
        // 队长在建队的同时加入了其他队伍，新队伍没有任何成员
        row.is_active = false;
        store.save_team(row);
        return status;
    }
    LOG(INFO) << fmt::format("Team {} ({}) created by user {}", t.id, t.name, t.captain_id);
    return roster_status::OK;
}

roster_status team_roster::join(id_type user_id, id_type team_id) {
    return move_member(user_id, team_id, nullopt);
}

roster_status team_roster::transfer(id_type user_id, id_type team_id) {
    auto u = store.get_user(user_id);
    if (!u) return roster_status::USER_NOT_FOUND;
    if (!u->team_id) return roster_status::NOT_A_MEMBER;
    if (*u->team_id == team_id) return roster_status::ALREADY_IN_TEAM;
    return move_member(user_id, team_id, u->team_id);
}

roster_status team_roster::move_member(id_type user_id, id_type team_id, optional<id_type> from) {
    store::roster_scope scope{{user_id}, {team_id}};
    if (from) scope.teams.push_back(*from);
    auto txn = store.begin_roster(scope);

    auto u = txn->find_user(user_id);
    if (!u) return roster_status::USER_NOT_FOUND;
    auto t = txn->find_team(team_id);
    if (!t) return roster_status::TEAM_NOT_FOUND;
    if (!t->is_active) return roster_status::TEAM_INACTIVE;
    if (u->team_id != from)
        return from ? roster_status::NOT_A_MEMBER : roster_status::ALREADY_IN_TEAM;
    if (txn->count_members(team_id) >= static_cast<size_t>(t->max_members))
        return roster_status::TEAM_FULL;

    if (from) {
        auto source = txn->find_team(*from);
        size_t remaining = txn->count_members(*from);
        if (source && source->captain_id == user_id && remaining > 1)
            return roster_status::CAPTAIN_MUST_TRANSFER;
        if (source && remaining <= 1) {
            source->is_active = false;
            txn->update_team(*source);
        }
    }

    txn->set_user_team(user_id, team_id);
    txn->commit();

    if (from)
        LOG(INFO) << fmt::format("User {} transferred from team {} to team {}", user_id, *from, team_id);
    else
        LOG(INFO) << fmt::format("User {} joined team {}", user_id, team_id);
    notify_changed();
    return roster_status::OK;
}

roster_status team_roster::leave(id_type user_id) {
    auto u = store.get_user(user_id);
    if (!u) return roster_status::USER_NOT_FOUND;
    if (!u->team_id) return roster_status::NOT_A_MEMBER;
    id_type team_id = *u->team_id;

    auto txn = store.begin_roster({{user_id}, {team_id}});
    u = txn->find_user(user_id);
    if (!u || u->team_id != team_id) return roster_status::NOT_A_MEMBER;

    auto t = txn->find_team(team_id);
    size_t members = txn->count_members(team_id);
    if (t && t->captain_id == user_id && members > 1)
        return roster_status::CAPTAIN_MUST_TRANSFER;

    txn->set_user_team(user_id, nullopt);
    if (t && members <= 1) {
        t->is_active = false;
        txn->update_team(*t);
    }
    txn->commit();

    LOG(INFO) << fmt::format("User {} left team {}", user_id, team_id);
    notify_changed();
    return roster_status::OK;
}

roster_status team_roster::transfer_captain(id_type team_id, id_type actor_id, id_type new_captain_id) {
    auto txn = store.begin_roster({{}, {team_id}});

    auto t = txn->find_team(team_id);
    if (!t) return roster_status::TEAM_NOT_FOUND;
    if (!t->is_active) return roster_status::TEAM_INACTIVE;
    if (t->captain_id != actor_id) return roster_status::NOT_CAPTAIN;

    auto candidate = txn->find_user(new_captain_id);
    if (!candidate) return roster_status::USER_NOT_FOUND;
    if (candidate->team_id != team_id) return roster_status::NOT_A_MEMBER;

    t->captain_id = new_captain_id;
    txn->update_team(*t);
    txn->commit();

    LOG(INFO) << fmt::format("Captain of team {} transferred from user {} to user {}", team_id, actor_id, new_captain_id);
    notify_changed();
    return roster_status::OK;
}

roster_status team_roster::disband(id_type team_id, id_type actor_id) {
    auto txn = store.begin_roster({{}, {team_id}});

    auto t = txn->find_team(team_id);
    if (!t) return roster_status::TEAM_NOT_FOUND;
    if (!t->is_active) return roster_status::TEAM_INACTIVE;
    if (t->captain_id != actor_id) return roster_status::NOT_CAPTAIN;

    auto members = txn->member_ids(team_id);
    for (id_type member : members)
        txn->set_user_team(member, nullopt);
    t->is_active = false;
    txn->update_team(*t);
    txn->commit();

    LOG(INFO) << fmt::format("Team {} disbanded by user {}, {} members released", team_id, actor_id, members.size());
    notify_changed();
    return roster_status::OK;
}

}  // namespace ctf::ledger
