#include "sandbox/sandbox.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace judgecore::sandbox {
using namespace std;

// clang-format off
static const unordered_map<string, sandbox_status> status_names = boost::assign::map_list_of
    ("Accepted", sandbox_status::ACCEPTED)
    ("Time Limit Exceeded", sandbox_status::TIME_LIMIT_EXCEEDED)
    ("Memory Limit Exceeded", sandbox_status::MEMORY_LIMIT_EXCEEDED)
    ("Output Limit Exceeded", sandbox_status::OUTPUT_LIMIT_EXCEEDED)
    ("File Error", sandbox_status::FILE_ERROR)
    ("Nonzero Exit Status", sandbox_status::NONZERO_EXIT_STATUS)
    ("Signalled", sandbox_status::SIGNALLED)
    ("Dangerous Syscall", sandbox_status::DANGEROUS_SYSCALL)
    ("Internal Error", sandbox_status::INTERNAL_ERROR);
// clang-format on

const char *get_display_message(sandbox_status status) {
    for (auto &[name, value] : status_names)
        if (value == status) return name.c_str();
    return "Unknown";
}

bool parse_sandbox_status(const string &name, sandbox_status &status) {
    auto it = status_names.find(name);
    if (it == status_names.end()) return false;
    status = it->second;
    return true;
}

file_ref file_ref::memory(const string &content) {
    return file_ref{type::MEMORY, content};
}

file_ref file_ref::cached(const string &file_id) {
    return file_ref{type::CACHED, file_id};
}

bool file_ref::operator==(const file_ref &other) const {
    return kind == other.kind && value == other.value;
}

optional<int> run_result::signal() const {
    if (status == sandbox_status::SIGNALLED) return exit_status;
    return nullopt;
}

string run_result::file(const string &name) const {
    auto it = files.find(name);
    if (it == files.end()) return {};
    return it->second;
}

ostream &operator<<(ostream &os, const run_result &result) {
    os << "RunResult[" << get_display_message(result.status) << ", exit: " << result.exit_status
       << ", cpu: " << result.cpu_time << "ms, wall: " << result.wall_time
       << "ms, memory: " << result.memory << "B";
    if (!result.error.empty()) os << ", error: " << result.error;
    os << "]";
    return os;
}

sandbox::~sandbox() = default;

}  // namespace judgecore::sandbox
