#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace judgecore {

/**
 * @brief 一次沙箱运行的具体资源限制
 * 由 resource_limiter 针对每个阶段重新计算，不在多次运行之间共享。
 * 所有字段都必须为正数，沙箱客户端会拒绝存在未设置字段的限制。
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制
     * @note 单位为毫秒
     */
    int64_t cpu_time = -1;

    /**
     * @brief 时钟时间限制
     * @note 单位为毫秒
     */
    int64_t wall_time = -1;

    /**
     * @brief 内存限制
     * @note 单位为字节
     */
    int64_t memory = -1;

    /**
     * @brief 标准输出大小限制
     * @note 单位为字节
     */
    int64_t output = -1;

    /**
     * @brief 进程数限制
     */
    int64_t processes = -1;

    /**
     * @brief 是否所有字段都已经确定
     */
    bool resolved() const;

    bool operator==(const resource_limits &other) const;
    bool operator!=(const resource_limits &other) const;
};

std::ostream &operator<<(std::ostream &os, const resource_limits &limits);

/**
 * @brief 单个测试点对限制的覆盖，未设置的字段沿用题目限制
 */
struct limit_override {
    std::optional<int64_t> time_limit;
    std::optional<int64_t> wall_time_limit;
    std::optional<int64_t> memory_limit;
    std::optional<int64_t> output_limit;
    std::optional<int64_t> process_limit;
};

/**
 * @brief 编程语言的配置
 * 包括编译命令、运行命令，以及该语言的默认资源限制（优先级最低）。
 */
struct language_policy {
    std::string name;

    /**
     * @brief 编译命令，为空时表示该语言不需要编译（比如 Python）
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令，可执行文件名需要包含在命令中
     */
    std::vector<std::string> run_command;

    /**
     * @brief 源代码在沙箱中的文件名，如 foo.cpp
     */
    std::string source_name;

    /**
     * @brief 编译产物在沙箱中的文件名，如 foo
     * 对于不需要编译的语言，运行的就是源代码文件本身
     */
    std::string exec_name;

    /**
     * @brief 默认 CPU 时间限制（毫秒）
     */
    int64_t time_limit = 1000;

    /**
     * @brief 默认内存限制（字节）
     */
    int64_t memory_limit = 256ll << 20;

    /**
     * @brief 默认输出限制（字节）
     */
    int64_t output_limit = 64ll << 20;

    /**
     * @brief 默认进程数限制
     */
    int64_t process_limit = 16;

    bool requires_compilation() const;
};

/**
 * @brief 资源限制的全局规则
 */
struct limit_config {
    /**
     * @brief 沙箱时间统计的最小粒度，时间限制会向上取整到该粒度的整数倍
     * @note 单位为毫秒
     */
    int64_t time_granularity = 10;

    /**
     * @brief 内存限制下限，低于该值的内存限制会被提升到该值，避免
     * 错误的配置导致所有提交都得到 MEMORY_LIMIT_EXCEEDED
     * @note 单位为字节
     */
    int64_t memory_floor = 16ll << 20;

    /**
     * @brief 没有显式设置时钟时间限制时，时钟时间限制 = CPU 时间限制 * wall_time_factor
     */
    int64_t wall_time_factor = 2;
};

struct problem_policy;

/**
 * @brief 计算一次运行的资源限制
 * 这是纯函数：不做任何 IO，不读写共享状态，相同的输入一定得到相同的输出。
 *
 * 优先级从高到低：测试点覆盖 > 题目限制 > 语言默认值
 */
struct resource_limiter {
    explicit resource_limiter(const limit_config &config);

    /**
     * @brief 计算运行选手程序时的资源限制
     * @param problem 题目限制，小于等于 0 的字段视为未设置
     * @param override 测试点覆盖
     * @param language 选手程序语言
     * @throw configuration_error 若计算结果中存在无法确定的字段
     */
    resource_limits resolve(const problem_policy &problem, const limit_override &override, const language_policy &language) const;

    /**
     * @brief 对编译、比较器等评测方程序的限制进行取整和下限处理
     */
    resource_limits normalize(resource_limits limits) const;

    const limit_config &config() const;

private:
    limit_config cfg;
};

}  // namespace judgecore
