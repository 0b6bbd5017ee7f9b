#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "common/cancellation.hpp"
#include "config.hpp"
#include "judge/aggregator.hpp"
#include "judge/limits.hpp"
#include "judge/runner.hpp"
#include "judge/submission.hpp"
#include "sandbox/client.hpp"
#include "store/artifact_store.hpp"

namespace judgecore {

/**
 * @brief 评测流水线的状态
 * PENDING -> FETCHING -> [COMPILING] -> RUNNING(0) -> ... -> RUNNING(n-1) -> AGGREGATING -> DONE
 * COMPILING 出现编译错误时直接进入 AGGREGATING。
 * 任何非终态都可以进入 FAILED。DONE 和 FAILED 是终态。
 */
enum class pipeline_state {
    PENDING,
    FETCHING,
    COMPILING,
    RUNNING,
    AGGREGATING,
    DONE,
    FAILED
};

const char *get_display_message(pipeline_state state);

/**
 * @brief 所有评测流水线共享的依赖，流水线不持有它们的所有权
 */
struct pipeline_context {
    const core_config &config;
    sandbox::sandbox_client &client;
    store::artifact_store &store;
    const resource_limiter &limiter;
};

/**
 * @brief 单个提交的评测流水线
 * 每个提交只会创建一个流水线，流水线只会运行一次。流水线只会修改自己的状态，
 * 不同提交的流水线之间不共享任何可变状态。
 */
struct judge_pipeline {
    typedef std::function<void(pipeline_state state, std::size_t test)> state_listener;

    judge_pipeline(const pipeline_context &context, const submission &submit, problem_policy_ptr problem, cancellation_token_ptr token);

    /**
     * @brief 运行流水线直到终态
     * 不会抛出异常：所有错误都会转换为 SYSTEM_ERROR 或者 CANCELLED 的评测结果。
     * 返回前会删除所有缓存在沙箱中的文件。
     */
    judge_result run();

    pipeline_state state() const;

    /**
     * @brief 状态为 RUNNING 时正在评测的测试点下标
     */
    std::size_t current_test() const;

    /**
     * @brief 设置状态变化的回调，在流水线线程中调用
     */
    void on_state_changed(state_listener listener);

    /**
     * @brief 状态转换表
     */
    static bool can_transition(pipeline_state from, pipeline_state to);

private:
    /**
     * @brief 转换到下一个状态
     * @throw internal_error 若转换不合法
     */
    void transition(pipeline_state next, std::size_t test = 0);

    void fetch();

    /**
     * @brief 编译选手程序和比较器
     * @return 选手程序是否编译成功
     * @throw internal_error 若比较器编译失败
     */
    bool compile();

    /**
     * @brief 在沙箱中编译程序
     * @param source 缓存在沙箱中的源代码
     * @param language 语言配置
     * @param exec_file 保存编译产物
     * @param message 编译失败时保存编译器输出
     */
    bool compile_program(const sandbox::staged_file &source, const language_policy &language, sandbox::staged_file &exec_file, std::string &message);

    void run_tests();

    void run_test(test_case_runner &runner, std::size_t index);

    void fail(status value, const std::string &message);

    void release();

    const pipeline_context &context;
    submission submit;
    problem_policy_ptr problem;
    cancellation_token_ptr token;

    mutable std::mutex mut;
    pipeline_state current_state = pipeline_state::PENDING;
    std::size_t test_index = 0;
    state_listener listener;

    const language_policy *language = nullptr;
    const language_policy *checker_language = nullptr;

    sandbox::staged_file source_file;
    sandbox::staged_file exec_file;
    sandbox::staged_file checker_source_file;
    sandbox::staged_file checker_exec_file;
    std::optional<sandbox::executable> program;
    std::optional<sandbox::executable> checker;
    std::vector<staged_test> tests;

    verdict_aggregator aggregator;
    judge_result result;
};

}  // namespace judgecore
