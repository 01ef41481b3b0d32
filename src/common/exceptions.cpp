#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace ctf {
using namespace std;

ctf_exception::ctf_exception()
    : ctf_exception("") {}

ctf_exception::ctf_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *ctf_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const ctf_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

storage_error::storage_error()
    : ctf_exception() {}

storage_error::storage_error(const string &message)
    : ctf_exception(message) {}

concurrency_conflict::concurrency_conflict()
    : ctf_exception() {}

concurrency_conflict::concurrency_conflict(const string &message)
    : ctf_exception(message) {}

validation_error::validation_error()
    : ctf_exception() {}

validation_error::validation_error(const string &message)
    : ctf_exception(message) {}

}  // namespace ctf
