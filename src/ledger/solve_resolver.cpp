#include "ledger/solve_resolver.hpp"
#include <algorithm>

namespace ctf::ledger {
using namespace std;

solve_resolver::solve_resolver(store::ledger_store &store)
    : store(store) {}

vector<submission> solve_resolver::solves(id_type challenge_id, size_t limit) {
    submission_filter filter;
    filter.challenge_id = challenge_id;
    filter.correct_only = true;
    filter.ascending = true;
    filter.limit = limit;
    return store.query_submissions(filter);
}

optional<submission> solve_resolver::first_blood(id_type challenge_id) {
    auto first = solves(challenge_id, 1);
    if (first.empty()) return nullopt;
    return first.front();
}

bool solve_resolver::is_first_blood(const submission &s) {
    return rank(s) == 1;
}

size_t solve_resolver::rank(const submission &s) {
    if (!s.is_correct) return 0;
    auto all = solves(s.challenge_id);
    return 1 + count_if(all.begin(), all.end(), [&s](const submission &other) {
               return solved_before(other, s);
           });
}

}  // namespace ctf::ledger
