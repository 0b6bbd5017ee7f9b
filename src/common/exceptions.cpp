#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace judgecore {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

configuration_error::configuration_error()
    : judge_exception() {}

configuration_error::configuration_error(const string &message)
    : judge_exception(message) {}

artifact_error::artifact_error()
    : judge_exception() {}

artifact_error::artifact_error(const string &message)
    : judge_exception(message) {}

sandbox_error::sandbox_error()
    : judge_exception() {}

sandbox_error::sandbox_error(const string &message)
    : judge_exception(message) {}

bool sandbox_error::retryable() const noexcept {
    return false;
}

sandbox_unavailable::sandbox_unavailable(const string &message)
    : sandbox_error(message) {}

bool sandbox_unavailable::retryable() const noexcept {
    return true;
}

sandbox_rejected::sandbox_rejected(const string &message)
    : sandbox_error(message) {}

sandbox_timeout::sandbox_timeout(const string &message)
    : sandbox_error(message) {}

bool sandbox_timeout::retryable() const noexcept {
    return true;
}

const char *get_display_message(cancel_reason reason) {
    switch (reason) {
        case cancel_reason::NONE:
            return "None";
        case cancel_reason::CANCELLED:
            return "Cancelled";
        case cancel_reason::DEADLINE:
            return "Deadline Exceeded";
    }
    return "Unknown";
}

cancelled_error::cancelled_error(cancel_reason reason)
    : judge_exception(string("judging interrupted: ") + get_display_message(reason)), reason(reason) {}

}  // namespace judgecore
