#pragma once

#include <nlohmann/json.hpp>
#include "judge/submission.hpp"

/**
 * 评测请求、题目配置和评测结果的 JSON 格式
 *
 * 评测请求：
 * {"id": "1001", "problem": "a-plus-b", "language": "cpp", "source": "submissions/1001.cpp"}
 *
 * 题目配置：
 * {
 *   "id": "a-plus-b", "time_limit": 1000, "memory_limit": 268435456, "compare": "whitespace",
 *   "checker": {"language": "cpp", "source": "checkers/a-plus-b.cpp"},
 *   "test_cases": [{"input": "a-plus-b/1.in", "output": "a-plus-b/1.out", "weight": 1}]
 * }
 */
namespace judgecore {

void from_json(const nlohmann::json &j, compare_mode &mode);
void from_json(const nlohmann::json &j, program_source &source);
void from_json(const nlohmann::json &j, limit_override &override);
void from_json(const nlohmann::json &j, test_case &test);
void from_json(const nlohmann::json &j, problem_policy &problem);
void from_json(const nlohmann::json &j, submission &submit);

void to_json(nlohmann::json &j, const test_verdict &verdict);
void to_json(nlohmann::json &j, const judge_result &result);

}  // namespace judgecore
