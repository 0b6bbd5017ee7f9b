#include "common/status.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <unordered_map>

namespace judgecore {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::RUNNING, "Running")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (status::PRESENTATION_ERROR, "Presentation Error")
    (status::PARTIAL_CORRECT, "Partial Correct")
    (status::SYSTEM_ERROR, "System Error")
    (status::SKIPPED, "Skipped")
    (status::CANCELLED, "Cancelled");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

bool parse_status(const string &name, status &value) {
    string normalized = boost::algorithm::to_lower_copy(name);
    boost::algorithm::replace_all(normalized, "_", " ");
    for (auto &[stat, display] : status_string) {
        if (boost::algorithm::to_lower_copy(string(display)) == normalized) {
            value = stat;
            return true;
        }
    }
    return false;
}

bool is_final(status stat) {
    return stat != status::PENDING && stat != status::RUNNING;
}

}  // namespace judgecore
