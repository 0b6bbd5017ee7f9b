#pragma once

#include <boost/rational.hpp>
#include <string>
#include "common/status.hpp"

namespace judgecore {

/**
 * @brief 逐字节比较选手输出和标准输出
 */
bool compare_exact(const std::string &output, const std::string &answer);

/**
 * @brief 忽略行末空格和文末空行比较选手输出和标准输出
 * 行末的空格、制表符和 \r 都会被忽略。
 */
bool compare_whitespace(const std::string &output, const std::string &answer);

/**
 * @brief testlib 比较器的输出
 */
struct checker_output {
    /**
     * @brief 只可能是 ACCEPTED、WRONG_ANSWER、PRESENTATION_ERROR、PARTIAL_CORRECT、SYSTEM_ERROR
     */
    judgecore::status status = status::SYSTEM_ERROR;

    /**
     * @brief 0~1 范围内的得分比例
     */
    boost::rational<int> score;

    /**
     * @brief 截断后的比较器信息
     */
    std::string message;

    /**
     * @brief 解析 testlib 比较器写入 stderr 的内容
     * 1. ok: ACCEPTED
     * 2. wrong answer: WRONG_ANSWER
     * 3. FAIL: SYSTEM_ERROR（比较器自身出错）
     * 4. wrong output format: PRESENTATION_ERROR
     * 5. points X 或 partially correct (X): X >= 1 为 ACCEPTED，X <= 0 为 WRONG_ANSWER，否则 PARTIAL_CORRECT
     *
     * 如果存在以 status(...) 开头的行，则使用括号内的评测结果，只接受
     * accepted、wrong_answer、partially_correct、presentation_error、system_error；
     * 如果存在以 score(...) 开头的行，则使用括号内的分数（截断到 0~1）。
     */
    static checker_output parse(const std::string &output);
};

/**
 * @brief 将 0~1 的浮点分数转为有理数，精度为 1/1000
 */
boost::rational<int> make_score(double value);

}  // namespace judgecore
