#pragma once

#include <boost/rational.hpp>
#include <ctime>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/limits.hpp"

/**
 * 这个头文件包含评测的数据模型
 * 包含：
 * 1. problem_policy 类（表示题目的评测配置）
 * 2. test_case 类（表示一个测试点）
 * 3. submission 类（表示一个选手提交）
 * 4. test_verdict、judge_result 类（表示评测结果）
 */
namespace judgecore {

/**
 * @brief 答案比较方式
 */
enum class compare_mode {
    /**
     * @brief 逐字节比较
     */
    EXACT,

    /**
     * @brief 忽略行末空格和文末空行
     */
    WHITESPACE,

    /**
     * @brief 使用 testlib 比较器
     */
    SPECIAL_JUDGE
};

const char *get_display_message(compare_mode mode);

/**
 * @brief 表示一个程序来源：语言加上存储中的文件引用
 */
struct program_source {
    /**
     * @brief 语言名称，对应配置文件中 languages 的键
     */
    std::string language;

    /**
     * @brief 源代码在文件存储中的引用
     */
    std::string artifact;
};

/**
 * @brief 表示一个测试点
 */
struct test_case {
    /**
     * @brief 输入数据在文件存储中的引用，输入数据会喂给 stdin
     */
    std::string input;

    /**
     * @brief 标准输出在文件存储中的引用
     */
    std::string output;

    /**
     * @brief 测试点权重，计算总分时使用
     */
    int weight = 1;

    /**
     * @brief 本测试点单独的资源限制
     */
    limit_override override;
};

/**
 * @brief 题目的评测配置，由题目目录提供，评测过程中只读
 */
struct problem_policy {
    std::string id;

    /**
     * @brief 时间限制
     * @note 单位为毫秒，小于等于 0 表示使用语言默认值
     */
    int64_t time_limit = -1;

    /**
     * @brief 时钟时间限制，未设置时根据 CPU 时间限制计算
     * @note 单位为毫秒
     */
    int64_t wall_time_limit = -1;

    /**
     * @brief 内存限制
     * @note 单位为字节，小于等于 0 表示使用语言默认值
     */
    int64_t memory_limit = -1;

    /**
     * @brief 输出限制
     * @note 单位为字节，小于等于 0 表示使用语言默认值
     */
    int64_t output_limit = -1;

    int64_t process_limit = -1;

    compare_mode compare = compare_mode::WHITESPACE;

    /**
     * @brief testlib 比较器，仅在 compare 为 SPECIAL_JUDGE 时使用
     */
    std::optional<program_source> checker;

    /**
     * @brief 测试点，按声明顺序评测
     */
    std::vector<test_case> test_cases;
};

typedef std::shared_ptr<const problem_policy> problem_policy_ptr;

/**
 * @brief 一个选手提交
 */
struct submission {
    /**
     * @brief 选手提交的 id，同一个 id 同时只会有一个评测流水线
     * string 可以兼容一切情况
     */
    std::string id;

    /**
     * @brief 题目 id
     */
    std::string problem;

    /**
     * @brief 选手代码的语言和在文件存储中的引用
     */
    program_source source;

    /**
     * @brief 提交时间
     */
    time_t submit_time = 0;
};

std::ostream &operator<<(std::ostream &os, const submission &submit);

/**
 * @brief 单个测试点的评测结果
 */
struct test_verdict {
    test_verdict();
    explicit test_verdict(std::size_t id, judgecore::status status = status::PENDING);

    /**
     * @brief 测试点下标，对应 problem_policy.test_cases
     */
    std::size_t id;

    judgecore::status status;

    /**
     * @brief 0~1 范围内的得分比例
     */
    boost::rational<int> score;

    /**
     * @brief CPU 时间（毫秒）
     */
    int64_t cpu_time = 0;

    /**
     * @brief 时钟时间（毫秒）
     */
    int64_t wall_time = 0;

    /**
     * @brief 内存（字节）
     */
    int64_t memory = 0;

    /**
     * @brief 比较器的输出，或者错误原因
     */
    std::string message;
};

/**
 * @brief 整个提交的评测结果，每个提交只会产生一次
 */
struct judge_result {
    std::string submission_id;
    std::string problem;

    judgecore::status status = status::PENDING;

    /**
     * @brief 按测试点声明顺序保存的结果，编译错误时为空
     */
    std::vector<test_verdict> tests;

    /**
     * @brief 加权总分，0~100
     */
    double score = 0;

    /**
     * @brief 所有测试点中的最大 CPU 时间（毫秒）
     */
    int64_t time = 0;

    /**
     * @brief 所有测试点中的最大内存（字节）
     */
    int64_t memory = 0;

    /**
     * @brief 编译错误信息或者系统错误原因
     */
    std::string message;
};

}  // namespace judgecore
