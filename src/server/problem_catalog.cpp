#include "server/problem_catalog.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "server/protocol.hpp"

namespace judgecore::server {
using namespace std;
using namespace nlohmann;

problem_catalog::~problem_catalog() = default;

json_problem_catalog::json_problem_catalog(const filesystem::path &dir)
    : dir(dir) {}

problem_policy_ptr json_problem_catalog::find(const string &problem_id) {
    lock_guard<mutex> guard(mut);
    auto it = cache.find(problem_id);
    if (it != cache.end()) return it->second;

    filesystem::path path;
    try {
        path = dir / (assert_safe_path(problem_id) + ".json");
    } catch (artifact_error &) {
        throw configuration_error("invalid problem id " + problem_id);
    }
    error_code ec;
    if (!filesystem::is_regular_file(path, ec))
        throw configuration_error(fmt::format("problem {} does not exist{}", problem_id, ec ? ": " + ec.message() : ""));

    auto problem = make_shared<problem_policy>();
    try {
        from_json(json::parse(read_file_content(path)), *problem);
    } catch (artifact_error &ex) {
        throw configuration_error(fmt::format("unable to read problem {}: {}", problem_id, ex.what()));
    } catch (json::exception &ex) {
        throw configuration_error(fmt::format("malformed problem {}: {}", problem_id, ex.what()));
    } catch (invalid_argument &ex) {
        throw configuration_error(fmt::format("malformed problem {}: {}", problem_id, ex.what()));
    }
    if (problem->id != problem_id)
        throw configuration_error(fmt::format("problem file {} declares id {}", path.string(), problem->id));

    LOG(INFO) << "Loaded problem " << problem_id << " with " << problem->test_cases.size() << " test case(s)";
    cache[problem_id] = problem;
    return problem;
}

void memory_problem_catalog::add(const problem_policy &problem) {
    lock_guard<mutex> guard(mut);
    problems[problem.id] = make_shared<problem_policy>(problem);
}

problem_policy_ptr memory_problem_catalog::find(const string &problem_id) {
    lock_guard<mutex> guard(mut);
    auto it = problems.find(problem_id);
    if (it == problems.end())
        throw configuration_error("problem " + problem_id + " does not exist");
    return it->second;
}

}  // namespace judgecore::server
