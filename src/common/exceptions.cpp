#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace gradeguard {
using namespace std;

gradeguard_exception::gradeguard_exception()
    : gradeguard_exception("") {}

gradeguard_exception::gradeguard_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *gradeguard_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const gradeguard_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : gradeguard_exception() {}

internal_error::internal_error(const string &message)
    : gradeguard_exception(message) {}

network_error::network_error()
    : gradeguard_exception() {}

network_error::network_error(const string &message)
    : gradeguard_exception(message) {}

store_error::store_error()
    : gradeguard_exception() {}

store_error::store_error(const string &message)
    : gradeguard_exception(message) {}

invalid_request_error::invalid_request_error()
    : gradeguard_exception() {}

invalid_request_error::invalid_request_error(const string &message)
    : gradeguard_exception(message) {}

authorization_error::authorization_error()
    : gradeguard_exception() {}

authorization_error::authorization_error(const string &message)
    : gradeguard_exception(message) {}

rate_limit_error::rate_limit_error(const string &message, long long retry_after)
    : gradeguard_exception(message), retry_after(retry_after) {}

}  // namespace gradeguard
