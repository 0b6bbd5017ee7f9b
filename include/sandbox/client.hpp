#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "config.hpp"
#include "sandbox/sandbox.hpp"

namespace judgecore::sandbox {

struct sandbox_client;

/**
 * @brief 缓存在沙箱中的文件，析构时自动从沙箱中删除
 * 只能移动，保证每个沙箱文件只会被删除一次。
 */
struct staged_file {
    staged_file();
    staged_file(sandbox_client *client, const std::string &file_id);
    staged_file(staged_file &&other);
    staged_file &operator=(staged_file &&other);
    staged_file(const staged_file &) = delete;
    staged_file &operator=(const staged_file &) = delete;
    ~staged_file();

    const std::string &id() const;

    /**
     * @brief 作为 run_request 中的文件引用
     */
    file_ref ref() const;

    bool empty() const;

    /**
     * @brief 立即删除沙箱中的文件
     */
    void reset();

private:
    sandbox_client *client;
    std::string file_id;
};

/**
 * @brief 沙箱中可以运行的程序
 * 比如编译好的选手程序，或者不需要编译的 Python 源代码。
 */
struct executable {
    /**
     * @brief 运行命令
     */
    std::vector<std::string> command;

    /**
     * @brief 程序在沙箱工作目录中的文件名
     */
    std::string name;

    /**
     * @brief 程序文件，必须是已经缓存在沙箱中的文件
     */
    file_ref file;
};

/**
 * @brief 运行选手程序或者编译器时需要收集的输出
 */
struct capture_options {
    /**
     * @brief 随结果返回内容的文件
     */
    std::vector<std::string> copy_out = {"stdout", "stderr"};

    /**
     * @brief 运行后缓存在沙箱中的文件
     */
    std::vector<std::string> copy_out_cached;
};

/**
 * @brief 沙箱客户端
 * 在 sandbox 接口的基础上提供：
 * 1. 请求参数检查：资源限制必须完全确定、程序必须已经缓存在沙箱中
 * 2. 可重试错误的有限次数指数退避重试
 * 3. 取消检查
 *
 * 不会缓存任何运行结果，每次调用都会实际发送给沙箱。
 */
struct sandbox_client {
    sandbox_client(sandbox &box, const sandbox_config &config);

    /**
     * @brief 在沙箱中运行程序
     * @param program 要运行的程序
     * @param args 追加在运行命令后的参数
     * @param stdin_file 标准输入，为空时使用空输入
     * @param limits 资源限制，必须所有字段都已经确定
     * @param bindings 额外复制进沙箱的文件，键为文件名
     * @param capture 需要收集的输出
     * @param token 取消令牌
     * @throw sandbox_rejected 请求不合法或者沙箱拒绝请求
     * @throw sandbox_unavailable 重试次数用完后沙箱仍然不可用
     * @throw sandbox_timeout 重试次数用完后沙箱调用仍然超时
     * @throw cancelled_error 提交被取消或者超过评测期限
     */
    run_result execute(const executable &program,
                       const std::vector<std::string> &args,
                       const std::optional<file_ref> &stdin_file,
                       const resource_limits &limits,
                       const std::map<std::string, file_ref> &bindings,
                       const capture_options &capture,
                       const cancellation_token &token);

    /**
     * @brief 运行未经检查的命令，用于编译
     * 编译命令直接调用沙箱外的编译器，因此不要求程序已经缓存在沙箱中。
     */
    run_result execute(const run_request &request, const cancellation_token &token);

    /**
     * @brief 将内容缓存到沙箱中
     */
    staged_file stage(const std::string &content, const cancellation_token &token);

    /**
     * @brief 接管 run_result 中 copy_out_cached 产生的文件
     */
    staged_file adopt(const std::string &file_id);

    /**
     * @brief 读取沙箱中缓存的文件
     */
    std::string fetch(const std::string &file_id, const cancellation_token &token);

    /**
     * @brief 删除沙箱中缓存的文件，失败时只记录日志
     */
    void remove(const std::string &file_id) noexcept;

    const sandbox_config &config() const;

private:
    template <typename Func>
    auto with_retry(const char *operation, const cancellation_token &token, Func &&func) -> decltype(func());

    sandbox &box;
    sandbox_config cfg;
};

}  // namespace judgecore::sandbox
