#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "judge/limits.hpp"

namespace judgecore {

/**
 * @brief 沙箱服务的连接配置
 */
struct sandbox_config {
    /**
     * @brief go-judge 服务地址
     */
    std::string host = "http://127.0.0.1:5050";

    /**
     * @brief 单次沙箱调用的运维期限，超过后视为 sandbox_timeout
     * 运行程序时会再加上程序的墙上时间限制。
     * @note 单位为毫秒
     */
    int64_t request_timeout = 60000;

    /**
     * @brief 可重试错误的最大尝试次数（包括第一次）
     */
    int max_attempts = 3;

    /**
     * @brief 第一次重试前的等待时间，之后每次翻倍
     * @note 单位为毫秒
     */
    int64_t backoff = 200;

    /**
     * @brief 沙箱内程序的环境变量
     */
    std::vector<std::string> env = {"PATH=/usr/local/bin:/usr/bin:/bin", "HOME=/w", "ONLINE_JUDGE=true"};

    /**
     * @brief stderr 的收集上限（字节）
     */
    int64_t stderr_limit = 16 << 10;
};

/**
 * @brief 文件存储配置
 */
struct store_config {
    /**
     * @brief local 或者 remote
     */
    std::string type = "local";

    /**
     * @brief 本地存储的根目录
     */
    std::filesystem::path root = "data";

    /**
     * @brief 远程存储的地址，文件引用拼接在后面
     */
    std::string url;

    /**
     * @brief 远程存储请求的超时时间（毫秒）
     */
    int64_t timeout = 30000;

    /**
     * @brief 远程存储请求的最大尝试次数
     */
    int max_attempts = 3;
};

/**
 * @brief 评测核心的全部配置
 * 启动时从配置文件读取，之后只读。
 */
struct core_config {
    core_config();

    /**
     * @brief 同时评测的提交数上限
     */
    std::size_t pool_size = 4;

    /**
     * @brief 是否在第一个未通过的测试点后跳过剩下的测试点
     */
    bool fail_fast = false;

    /**
     * @brief 单个提交内同时运行的测试点数
     */
    std::size_t test_parallelism = 1;

    /**
     * @brief 单个提交从开始评测算起的端到端期限
     * @note 单位为毫秒
     */
    int64_t submission_deadline = 600000;

    sandbox_config sandbox;

    store_config store;

    /**
     * @brief 编译选手程序、编译和运行比较器时使用的资源限制
     */
    resource_limits compile_limits;

    limit_config limits;

    /**
     * @brief 支持的语言，键为语言名称
     */
    std::map<std::string, language_policy> languages;

    /**
     * @brief 查找语言配置
     * @throw configuration_error 若语言不存在
     */
    const language_policy &language(const std::string &name) const;
};

/**
 * @brief 读取配置文件
 * @throw configuration_error 若配置文件不存在或格式错误
 */
core_config load_config(const std::filesystem::path &path);

void from_json(const nlohmann::json &j, sandbox_config &config);
void from_json(const nlohmann::json &j, store_config &config);
void from_json(const nlohmann::json &j, resource_limits &limits);
void from_json(const nlohmann::json &j, limit_config &config);
void from_json(const nlohmann::json &j, language_policy &language);
void from_json(const nlohmann::json &j, core_config &config);

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后会以 INFO 级别输出每次沙箱调用的请求和结果。
 */
extern bool DEBUG;

}  // namespace judgecore
