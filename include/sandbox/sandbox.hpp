#pragma once

#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "judge/limits.hpp"

/**
 * 这个头文件包含沙箱的抽象接口
 * 沙箱负责在资源限制下运行程序，并管理沙箱内缓存的文件。
 * 评测核心只通过这个接口和沙箱交互，实现见 sandbox/go_judge.hpp。
 */
namespace judgecore::sandbox {

/**
 * @brief 表示传入沙箱的一个文件
 * 可以是直接携带的文件内容，也可以是已经缓存在沙箱中的文件 id
 */
struct file_ref {
    enum class type {
        /**
         * @brief 文件内容随请求一起发送
         */
        MEMORY,

        /**
         * @brief 文件已经通过 add_file 缓存在沙箱中
         */
        CACHED
    };

    file_ref::type kind = type::MEMORY;

    /**
     * @brief 文件内容或者沙箱文件 id
     */
    std::string value;

    static file_ref memory(const std::string &content);
    static file_ref cached(const std::string &file_id);

    bool operator==(const file_ref &other) const;
};

/**
 * @brief 一次沙箱运行请求
 */
struct run_request {
    /**
     * @brief 命令行参数，args[0] 为要执行的程序
     */
    std::vector<std::string> args;

    /**
     * @brief 环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 标准输入，为空时使用空输入
     */
    std::optional<file_ref> stdin_file;

    /**
     * @brief 已经确定的资源限制，output 同时是 stdout 的收集上限
     */
    resource_limits limits;

    /**
     * @brief stderr 的收集上限（字节）
     */
    int64_t stderr_limit = 16 << 10;

    /**
     * @brief 运行前复制进沙箱工作目录的文件，键为文件名
     */
    std::map<std::string, file_ref> copy_in;

    /**
     * @brief 运行结束后随结果返回内容的文件，如 stdout、stderr
     */
    std::vector<std::string> copy_out;

    /**
     * @brief 运行结束后缓存在沙箱中的文件，结果中只返回文件 id
     * 比如编译产物。调用者负责在使用完后删除这些文件。
     */
    std::vector<std::string> copy_out_cached;
};

/**
 * @brief 沙箱报告的运行状态
 */
enum class sandbox_status {
    ACCEPTED,
    TIME_LIMIT_EXCEEDED,
    MEMORY_LIMIT_EXCEEDED,
    OUTPUT_LIMIT_EXCEEDED,

    /**
     * @brief 复制文件失败，比如 copy_out 的文件不存在
     */
    FILE_ERROR,
    NONZERO_EXIT_STATUS,
    SIGNALLED,

    /**
     * @brief 程序调用了被禁止的系统调用
     */
    DANGEROUS_SYSCALL,

    /**
     * @brief 沙箱自身出错
     */
    INTERNAL_ERROR
};

const char *get_display_message(sandbox_status status);

/**
 * @brief 根据沙箱返回的名称查找运行状态
 * @return 是否识别该名称
 */
bool parse_sandbox_status(const std::string &name, sandbox_status &status);

/**
 * @brief 一次沙箱运行的结果
 */
struct run_result {
    sandbox_status status = sandbox_status::INTERNAL_ERROR;

    /**
     * @brief 程序退出码，若程序被信号终止则为信号编号
     */
    int exit_status = 0;

    /**
     * @brief CPU 时间（毫秒）
     */
    int64_t cpu_time = 0;

    /**
     * @brief 时钟时间（毫秒）
     */
    int64_t wall_time = 0;

    /**
     * @brief 内存使用峰值（字节）
     */
    int64_t memory = 0;

    /**
     * @brief copy_out 中文件的内容
     */
    std::map<std::string, std::string> files;

    /**
     * @brief copy_out_cached 中文件的 id
     */
    std::map<std::string, std::string> file_ids;

    /**
     * @brief 沙箱给出的错误信息
     */
    std::string error;

    /**
     * @brief 导致程序终止的信号，没有被信号终止时返回空
     */
    std::optional<int> signal() const;

    /**
     * @brief 获取 copy_out 中的文件内容，不存在时返回空字符串
     */
    std::string file(const std::string &name) const;
};

std::ostream &operator<<(std::ostream &os, const run_result &result);

/**
 * @brief 沙箱接口
 * 所有函数都可能阻塞，调用期间通过 token 检查取消，实现需要是线程安全的。
 * 错误通过 sandbox_error 的子类报告：
 * 1. sandbox_unavailable: 连接失败，可以重试
 * 2. sandbox_timeout: 沙箱调用本身超时，可以重试
 * 3. sandbox_rejected: 请求格式错误，不可以重试
 * 4. cancelled_error: 调用期间 token 被取消
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 运行一个程序
     */
    virtual run_result execute(const run_request &request, const cancellation_token &token) = 0;

    /**
     * @brief 将文件缓存到沙箱中
     * @return 沙箱文件 id
     */
    virtual std::string add_file(const std::string &content, const cancellation_token &token) = 0;

    /**
     * @brief 获取沙箱中缓存文件的内容
     */
    virtual std::string get_file(const std::string &file_id, const cancellation_token &token) = 0;

    /**
     * @brief 删除沙箱中缓存的文件
     */
    virtual void delete_file(const std::string &file_id) = 0;
};

}  // namespace judgecore::sandbox
