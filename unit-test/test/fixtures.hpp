#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "judge/submission.hpp"
#include "store/artifact_store.hpp"

namespace judgecore::test {

/**
 * @brief 测试用的配置：重试不等待，限制取整到 10ms
 */
inline core_config test_config() {
    core_config config;
    config.pool_size = 2;
    config.sandbox.max_attempts = 3;
    config.sandbox.backoff = 1;
    config.limits.time_granularity = 10;
    return config;
}

/**
 * @brief 创建一道题目，测试数据保存在 store 中
 * 标准输出和输入相同，配合 fake_sandbox 的 echo 程序使用
 */
inline problem_policy make_problem(store::memory_store &store, const std::string &id, const std::vector<std::string> &inputs) {
    problem_policy problem;
    problem.id = id;
    problem.time_limit = 1000;
    problem.memory_limit = 64 << 20;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        test_case test;
        test.input = id + "/" + std::to_string(i) + ".in";
        test.output = id + "/" + std::to_string(i) + ".out";
        store.put(test.input, inputs[i]);
        store.put(test.output, inputs[i]);
        problem.test_cases.push_back(test);
    }
    return problem;
}

inline submission make_submission(const std::string &id, const std::string &problem, const std::string &source = "echo.cpp", const std::string &language = "cpp") {
    submission submit;
    submit.id = id;
    submit.problem = problem;
    submit.source.language = language;
    submit.source.artifact = source;
    return submit;
}

/**
 * @brief 放入常用的程序：echo.cpp、error.cpp、checker.cpp、echo.py
 */
inline void put_programs(store::memory_store &store) {
    store.put("echo.cpp", "echo");
    store.put("echo.py", "echo");
    store.put("error.cpp", "error: not a program");
    store.put("checker.cpp", "checker");
    store.put("broken-checker.cpp", "error: broken checker");
}

}  // namespace judgecore::test
