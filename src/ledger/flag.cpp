#include "ledger/flag.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>

namespace ctf::ledger {
using namespace std;

string normalize_flag(const string &raw) {
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(raw));
}

bool check_flag(const string &submitted, const string &expected) {
    string a = normalize_flag(submitted), b = normalize_flag(expected);
    size_t len = max(a.size(), b.size());
    unsigned char diff = a.size() == b.size() ? 0 : 1;
    for (size_t i = 0; i < len; ++i) {
        unsigned char x = i < a.size() ? a[i] : 0;
        unsigned char y = i < b.size() ? b[i] : 0;
        diff |= x ^ y;
    }
    return diff == 0;
}

}  // namespace ctf::ledger
