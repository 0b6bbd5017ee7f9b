#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "common/cancellation.hpp"
#include "config.hpp"

namespace judgecore::store {

/**
 * @brief 文件存储，保存源代码、测试数据、比较器
 * 文件通过引用（字符串）定位，引用的格式由实现决定。
 * 实现需要是线程安全的。
 */
struct artifact_store {
    virtual ~artifact_store();

    /**
     * @brief 读取文件内容
     * @param ref 文件引用
     * @throw artifact_error 若文件不存在或者读取失败
     * @throw cancelled_error 若读取期间提交被取消
     */
    virtual std::string fetch(const std::string &ref, const cancellation_token &token) = 0;

    /**
     * @brief 保存文件
     * @return 文件引用
     * @throw artifact_error 若保存失败
     */
    virtual std::string store(const std::string &content) = 0;
};

/**
 * @brief 本地目录中的文件存储，文件引用为相对 root 的路径
 */
struct local_store : public artifact_store {
    explicit local_store(const std::filesystem::path &root);

    std::string fetch(const std::string &ref, const cancellation_token &token) override;

    std::string store(const std::string &content) override;

private:
    std::filesystem::path root;
};

/**
 * @brief 通过 HTTP 访问的文件存储
 * fetch 发送 GET url/ref，store 发送 POST url，返回体为文件引用。
 * 连接失败、超时、5xx 会按照 max_attempts 退避重试。
 */
struct remote_store : public artifact_store {
    explicit remote_store(const store_config &config);

    std::string fetch(const std::string &ref, const cancellation_token &token) override;

    std::string store(const std::string &content) override;

private:
    store_config cfg;
};

/**
 * @brief 内存中的文件存储
 */
struct memory_store : public artifact_store {
    std::string fetch(const std::string &ref, const cancellation_token &token) override;

    std::string store(const std::string &content) override;

    /**
     * @brief 以指定的引用保存文件，会覆盖已有文件
     */
    void put(const std::string &ref, const std::string &content);

private:
    std::mutex mut;
    std::map<std::string, std::string> files;
};

/**
 * @brief 根据配置创建文件存储
 * @throw configuration_error 若存储类型未知
 */
std::unique_ptr<artifact_store> make_artifact_store(const store_config &config);

}  // namespace judgecore::store
