#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace judgecore {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测核心自身的错误
 * 比如向沙箱发送了格式错误的请求、同一个提交出现了两个评测流水线。
 * 这类错误只会让当前提交得到 SYSTEM_ERROR，不会影响其他提交。
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示配置错误
 * 比如题目不存在、语言不存在、限制无法计算。出现这类错误的提交不会被接收。
 */
struct configuration_error : public judge_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示文件存储错误，通常由 CURL 或者文件系统产生
 */
struct artifact_error : public judge_exception {
    artifact_error();
    explicit artifact_error(const std::string &message);
};

/**
 * @brief 沙箱调用失败的基类
 */
struct sandbox_error : public judge_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);

    /**
     * @brief 该错误是否允许重试
     */
    virtual bool retryable() const noexcept;
};

/**
 * @brief 无法连接沙箱，或者传输过程中连接断开
 * 可以重试
 */
struct sandbox_unavailable : public sandbox_error {
    explicit sandbox_unavailable(const std::string &message);

    bool retryable() const noexcept override;
};

/**
 * @brief 沙箱拒绝了请求（请求格式错误）
 * 说明评测核心存在 bug，不可以重试
 */
struct sandbox_rejected : public sandbox_error {
    explicit sandbox_rejected(const std::string &message);
};

/**
 * @brief 沙箱调用本身没有在运维期限内返回
 * 注意这和选手程序的时间限制无关，可以退避后重试
 */
struct sandbox_timeout : public sandbox_error {
    explicit sandbox_timeout(const std::string &message);

    bool retryable() const noexcept override;
};

enum class cancel_reason {
    NONE = 0,

    /**
     * @brief 调用方主动取消
     */
    CANCELLED = 1,

    /**
     * @brief 超过了提交的端到端评测期限
     */
    DEADLINE = 2,
};

const char *get_display_message(cancel_reason reason);

/**
 * @brief 评测被取消时抛出，用于中断正在进行的沙箱调用
 */
struct cancelled_error : public judge_exception {
    explicit cancelled_error(cancel_reason reason);

    cancel_reason reason;
};

}  // namespace judgecore
