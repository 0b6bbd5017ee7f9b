#include "server/protocol.hpp"
#include <boost/rational.hpp>
#include "common/json_utils.hpp"

namespace judgecore {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, compare_mode &mode) {
    string str = j.get<string>();
    if (str == "exact")
        mode = compare_mode::EXACT;
    else if (str == "whitespace")
        mode = compare_mode::WHITESPACE;
    else if (str == "special")
        mode = compare_mode::SPECIAL_JUDGE;
    else
        throw invalid_argument("Unrecognized compare mode " + str);
}

void from_json(const json &j, program_source &source) {
    j.at("language").get_to(source.language);
    j.at("source").get_to(source.artifact);
}

template <typename T>
static void assign_limit(const json &j, optional<T> &value, const char *key) {
    if (exists(j, key)) value = get_value<T>(j, key);
}

void from_json(const json &j, limit_override &override) {
    assign_limit(j, override.time_limit, "time_limit");
    assign_limit(j, override.wall_time_limit, "wall_time_limit");
    assign_limit(j, override.memory_limit, "memory_limit");
    assign_limit(j, override.output_limit, "output_limit");
    assign_limit(j, override.process_limit, "process_limit");
}

void from_json(const json &j, test_case &test) {
    j.at("input").get_to(test.input);
    j.at("output").get_to(test.output);
    assign_optional(j, test.weight, "weight");
    if (test.weight < 0)
        throw invalid_argument("weight of test case must not be negative");
    from_json(j, test.override);
}

void from_json(const json &j, problem_policy &problem) {
    j.at("id").get_to(problem.id);
    assign_optional(j, problem.time_limit, "time_limit");
    assign_optional(j, problem.wall_time_limit, "wall_time_limit");
    assign_optional(j, problem.memory_limit, "memory_limit");
    assign_optional(j, problem.output_limit, "output_limit");
    assign_optional(j, problem.process_limit, "process_limit");
    assign_optional(j, problem.compare, "compare");
    if (exists(j, "checker")) problem.checker = get_value<program_source>(j, "checker");
    j.at("test_cases").get_to(problem.test_cases);
}

void from_json(const json &j, submission &submit) {
    j.at("id").get_to(submit.id);
    j.at("problem").get_to(submit.problem);
    j.at("language").get_to(submit.source.language);
    j.at("source").get_to(submit.source.artifact);
    assign_optional(j, submit.submit_time, "submit_time");
}

void to_json(json &j, const test_verdict &verdict) {
    j = {{"id", verdict.id},
         {"status", get_display_message(verdict.status)},
         {"score", boost::rational_cast<double>(verdict.score)},
         {"cpu_time", verdict.cpu_time},
         {"wall_time", verdict.wall_time},
         {"memory", verdict.memory}};
    if (!verdict.message.empty()) j["message"] = verdict.message;
}

void to_json(json &j, const judge_result &result) {
    j = {{"submission_id", result.submission_id},
         {"problem", result.problem},
         {"status", get_display_message(result.status)},
         {"score", result.score},
         {"time", result.time},
         {"memory", result.memory},
         {"tests", result.tests}};
    if (!result.message.empty()) j["message"] = result.message;
}

}  // namespace judgecore
