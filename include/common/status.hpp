#pragma once

#include <string>

namespace judgecore {

/**
 * @brief 表示数据点或整个提交的评测结果
 */
enum class status {
    /**
     * @brief 提交正在等待队列中，或者数据点还没有开始评测
     */
    PENDING = 0,

    /**
     * @brief 数据点正在评测
     */
    RUNNING = 1,

    /**
     * @brief 用户程序本测试点评测通过
     */
    ACCEPTED = 2,

    /**
     * @brief 答案错误
     */
    WRONG_ANSWER = 3,

    /**
     * @brief 用户程序运行时间超出限制
     * CPU 时间或者时钟时间超过限制都会返回该结果。
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序运行内存超限
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief 用户程序出现运行时错误
     * 退出码非零或者因为信号崩溃，并且没有超出任何限制。
     */
    RUNTIME_ERROR = 6,

    /**
     * @brief 用户程序编译错误
     */
    COMPILATION_ERROR = 7,

    /**
     * @brief 用户程序输出内容过多
     * 在比较答案之前检查。
     */
    OUTPUT_LIMIT_EXCEEDED = 8,

    /**
     * @brief 格式错误
     * 只有 special judge 会返回该结果。
     */
    PRESENTATION_ERROR = 9,

    /**
     * @brief 部分正确
     * 只有 special judge 会返回该结果，分数保存在 score 中。
     */
    PARTIAL_CORRECT = 10,

    /**
     * @brief 内部错误，评测系统出错
     * 比如沙箱不可用、比较器崩溃、测试数据下载失败。
     */
    SYSTEM_ERROR = 11,

    /**
     * @brief 开启 fail-fast 后，前面的测试点没有通过，因此本测试点没有评测
     */
    SKIPPED = 12,

    /**
     * @brief 评测被取消
     */
    CANCELLED = 13
};

const char *get_display_message(status);

/**
 * @brief 根据显示名称查找评测结果
 * 接受 "Wrong Answer" 和 "wrong_answer" 两种写法
 * @return 是否找到对应的评测结果
 */
bool parse_status(const std::string &name, status &value);

/**
 * @brief 判断评测结果是否为终态
 */
bool is_final(status);

}  // namespace judgecore
