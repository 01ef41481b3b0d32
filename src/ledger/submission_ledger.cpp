#include "ledger/submission_ledger.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "ledger/flag.hpp"

namespace ctf::ledger {
using namespace std;

static submission_result make_result(submit_status status, const string &message = "") {
    submission_result result;
    result.status = status;
    result.message = message.empty() ? get_display_message(status) : message;
    return result;
}

submission_ledger::submission_ledger(store::ledger_store &store, const scoring_engine &scoring, const ledger_config &config)
    : store(store), scoring(scoring), config(config) {}

void submission_ledger::on_recorded(function<void(const submission &)> callback) {
    scoped_lock guard(callback_mutex);
    callbacks.push_back(move(callback));
}

void submission_ledger::notify_recorded(const submission &row) {
    scoped_lock guard(callback_mutex);
    for (auto &callback : callbacks) callback(row);
}

submission_result submission_ledger::submit(id_type user_id, id_type challenge_id, const string &raw_flag, const client_meta &meta) {
    if (normalize_flag(raw_flag).empty())
        return make_result(submit_status::VALIDATION_ERROR, "Flag must not be empty");
    if (raw_flag.size() > config.max_flag_length)
        return make_result(submit_status::VALIDATION_ERROR, fmt::format("Flag must not be longer than {} characters", config.max_flag_length));
    if (!store.get_user(user_id))
        return make_result(submit_status::VALIDATION_ERROR, fmt::format("User {} does not exist", user_id));

    for (int attempt = 1;; ++attempt) {
        try {
            return submit_once(user_id, challenge_id, raw_flag, meta);
        } catch (concurrency_conflict &ex) {
            if (attempt >= config.submit_retries) {
                LOG(ERROR) << "Submission of user " << user_id << " on challenge " << challenge_id
                           << " still conflicts after " << attempt << " attempts: " << ex.what();
                throw;
            }
            LOG(WARNING) << "Submission of user " << user_id << " on challenge " << challenge_id
                         << " conflicted, retrying (" << attempt << "/" << config.submit_retries << "): " << ex.what();
        }
    }
}

submission_result submission_ledger::submit_once(id_type user_id, id_type challenge_id, const string &raw_flag, const client_meta &meta) {
    auto txn = store.begin_submission(challenge_id);

    auto c = txn->find_challenge(challenge_id);
    if (!c || !c->is_active) {
        txn->rollback();
        return make_result(submit_status::CHALLENGE_UNAVAILABLE);
    }

    if (c->max_attempts > 0 && txn->count_attempts(user_id, challenge_id) >= static_cast<size_t>(c->max_attempts)) {
        txn->rollback();
        return make_result(submit_status::ATTEMPT_LIMIT_EXCEEDED,
                           fmt::format("Maximum of {} attempts reached", c->max_attempts));
    }

    if (txn->has_solved(user_id, challenge_id)) {
        txn->rollback();
        return make_result(submit_status::ALREADY_SOLVED);
    }

    bool correct = check_flag(raw_flag, c->flag);
    size_t prior = txn->count_solves(challenge_id);

    submission row;
    row.user_id = user_id;
    row.challenge_id = challenge_id;
    row.submitted_flag = raw_flag;
    row.is_correct = correct;
    row.points_awarded = correct ? scoring.points_for_solve(*c, prior) : 0;
    row.meta = meta;
    row = txn->insert_submission(row);
    txn->commit();

    submission_result result = make_result(correct ? submit_status::ACCEPTED : submit_status::WRONG_FLAG);
    result.correct = correct;
    result.points_awarded = row.points_awarded;
    result.prior_solves = prior;
    result.submission_id = row.id;
    if (correct) {
        result.rank = prior + 1;
        result.is_first_blood = prior == 0;
        if (result.is_first_blood) {
            LOG(INFO) << fmt::format("First blood on challenge {} ({}) by user {}, {} points", c->id, c->name, user_id, row.points_awarded);
            result.message = fmt::format("Correct! First blood, {} points", row.points_awarded);
        } else {
            LOG(INFO) << fmt::format("User {} solved challenge {} at rank {}, {} points", user_id, c->id, result.rank, row.points_awarded);
            result.message = fmt::format("Correct! {} points", row.points_awarded);
        }
    } else {
        DLOG(INFO) << "User " << user_id << " submitted a wrong flag for challenge " << challenge_id;
    }

    notify_recorded(row);
    return result;
}

}  // namespace ctf::ledger
