#pragma once

#include <optional>
#include <string>
#include "common/cancellation.hpp"
#include "judge/submission.hpp"
#include "sandbox/client.hpp"

namespace judgecore {

/**
 * @brief 已经准备好的测试点：输入数据已经缓存在沙箱中，资源限制已经确定
 */
struct staged_test {
    /**
     * @brief 测试点下标
     */
    std::size_t id = 0;

    sandbox::staged_file input;

    /**
     * @brief 标准输出的内容
     */
    std::string answer;

    /**
     * @brief 缓存在沙箱中的标准输出，仅 special judge 使用
     */
    sandbox::staged_file answer_file;

    resource_limits limits;
};

/**
 * @brief 运行单个测试点并给出评测结果
 * 先判断资源限制和退出状态，只有程序正常结束时才比较答案：
 * TIME_LIMIT_EXCEEDED > MEMORY_LIMIT_EXCEEDED > OUTPUT_LIMIT_EXCEEDED > SYSTEM_ERROR > RUNTIME_ERROR > 比较结果
 */
struct test_case_runner {
    /**
     * @param client 沙箱客户端
     * @param checker_limits 运行比较器的资源限制
     */
    test_case_runner(sandbox::sandbox_client &client, const resource_limits &checker_limits);

    /**
     * @brief 评测一个测试点
     * 沙箱调用超时（重试用尽）时返回 SYSTEM_ERROR，而不是抛出异常。
     * @param program 选手程序
     * @param test 测试点
     * @param mode 比较方式
     * @param checker 比较器，仅在 mode 为 SPECIAL_JUDGE 时使用
     * @throw sandbox_unavailable, sandbox_rejected 沙箱不可用，需要终止整个提交的评测
     * @throw cancelled_error 提交被取消
     */
    test_verdict run(const sandbox::executable &program,
                     const staged_test &test,
                     compare_mode mode,
                     const sandbox::executable *checker,
                     const cancellation_token &token);

    /**
     * @brief 根据沙箱的运行结果判断是否超出限制或者运行错误
     * @param message 保存错误原因
     * @return 若程序正常结束，返回空，需要继续比较答案
     */
    static std::optional<status> classify(const sandbox::run_result &result, const resource_limits &limits, std::string &message);

private:
    void judge_special(const staged_test &test, const sandbox::staged_file &output, const sandbox::executable &checker, test_verdict &verdict, const cancellation_token &token);

    sandbox::sandbox_client &client;
    resource_limits checker_limits;
};

}  // namespace judgecore
