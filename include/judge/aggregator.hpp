#pragma once

#include <mutex>
#include <vector>
#include "judge/submission.hpp"

namespace judgecore {

/**
 * @brief 根据测试点结果计算整个提交的评测结果
 * 1. 存在 COMPILATION_ERROR 时为 COMPILATION_ERROR
 * 2. 存在 SYSTEM_ERROR 时为 SYSTEM_ERROR
 * 3. 存在 CANCELLED 时为 CANCELLED
 * 4. 否则为按声明顺序第一个既不是 ACCEPTED 也不是 SKIPPED 的测试点结果
 * 5. 否则为 ACCEPTED
 *
 * 结果只和测试点下标有关，与测试点完成的先后顺序无关。
 * 选手程序的编译错误由评测流水线直接给出，没有测试点结果。
 * @throw internal_error 若存在尚未完成的测试点
 */
status aggregate_status(const std::vector<test_verdict> &verdicts);

/**
 * @brief 计算加权总分，范围 0~100
 * @param weights 测试点权重，和 verdicts 一一对应
 */
double aggregate_score(const std::vector<test_verdict> &verdicts, const std::vector<int> &weights);

/**
 * @brief 收集一个提交的测试点结果
 * 测试点可以以任意顺序完成，结果按下标保存。线程安全。
 */
struct verdict_aggregator {
    explicit verdict_aggregator(std::size_t test_count);

    /**
     * @brief 记录一个测试点的结果
     * @throw internal_error 若下标越界，或者该测试点已经有最终结果
     */
    void record(const test_verdict &verdict);

    /**
     * @brief 将所有还没有最终结果的测试点标记为 value
     * 用于 fail-fast 跳过测试点，以及取消评测
     */
    void mark_unfinished(status value, const std::string &message = "");

    /**
     * @brief 已经有最终结果的测试点数
     */
    std::size_t completed() const;

    std::vector<test_verdict> verdicts() const;

    /**
     * @brief 汇总结果，填充 status、tests、score、time、memory
     */
    void summarize(const std::vector<int> &weights, judge_result &result) const;

private:
    mutable std::mutex mut;
    std::vector<test_verdict> slots;
};

}  // namespace judgecore
