#include "common/utils.hpp"
#include <cstdlib>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

int64_t to_epoch_millis(chrono::system_clock::time_point tp) {
    return chrono::duration_cast<chrono::milliseconds>(tp.time_since_epoch()).count();
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
