#include "ledger/scoring.hpp"
#include <algorithm>
#include <cstdint>

namespace ctf::ledger {
using namespace std;

scoring_engine::scoring_engine(const scoring_config &config)
    : conf(config) {}

int scoring_engine::min_points(int base) const {
    return max(conf.min_points_floor, base / conf.min_points_divisor);
}

int scoring_engine::dynamic_points(int base, size_t prior_solves) const {
    // 解题数很大时 decay_factor * k 可能超出 int 范围
    int64_t decayed = static_cast<int64_t>(base) - static_cast<int64_t>(conf.decay_factor) * static_cast<int64_t>(prior_solves);
    return static_cast<int>(max<int64_t>(min_points(base), decayed));
}

int scoring_engine::points_for_solve(const challenge &c, size_t prior_solves) const {
    if (!c.is_dynamic) return c.points;
    return dynamic_points(c.points, prior_solves);
}

int scoring_engine::current_dynamic_value(const challenge &c, size_t total_solves) const {
    return points_for_solve(c, total_solves);
}

int scoring_engine::awarded_points_at_submission(const submission &s) {
    return s.is_correct ? s.points_awarded : 0;
}

const scoring_config &scoring_engine::config() const {
    return conf;
}

}  // namespace ctf::ledger
