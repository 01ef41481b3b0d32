#include "ledger/challenge_catalog.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "ledger/flag.hpp"

namespace ctf::ledger {
using namespace std;

challenge_catalog::challenge_catalog(store::ledger_store &store)
    : store(store) {}

optional<challenge> challenge_catalog::get(id_type challenge_id) {
    return store.get_challenge(challenge_id);
}

vector<challenge> challenge_catalog::list(bool active_only) {
    auto challenges = store.list_challenges();
    if (active_only)
        challenges.erase(remove_if(challenges.begin(), challenges.end(), [](const challenge &c) { return !c.is_active; }),
                         challenges.end());
    sort(challenges.begin(), challenges.end(), [](const challenge &a, const challenge &b) { return a.id < b.id; });
    return challenges;
}

void challenge_catalog::save(const challenge &c) {
    if (c.name.empty())
        throw validation_error(fmt::format("challenge {}: name must not be empty", c.id));
    if (c.points < 0)
        throw validation_error(fmt::format("challenge {}: points must not be negative, got {}", c.id, c.points));
    if (c.max_attempts < 0)
        throw validation_error(fmt::format("challenge {}: max_attempts must not be negative, got {}", c.id, c.max_attempts));
    if (normalize_flag(c.flag).empty())
        throw validation_error(fmt::format("challenge {}: flag must not be empty", c.id));

    store.save_challenge(c);
    LOG(INFO) << fmt::format("Challenge {} ({}) saved, {} points, {}", c.id, c.name, c.points, c.is_dynamic ? "dynamic" : "static");
    for (auto &callback : callbacks) callback(c.id);
}

bool challenge_catalog::deactivate(id_type challenge_id) {
    if (!store.set_challenge_active(challenge_id, false)) return false;
    LOG(INFO) << "Challenge " << challenge_id << " deactivated";
    for (auto &callback : callbacks) callback(challenge_id);
    return true;
}

void challenge_catalog::on_changed(function<void(id_type)> callback) {
    callbacks.push_back(move(callback));
}

}  // namespace ctf::ledger
