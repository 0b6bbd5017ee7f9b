#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "sandbox/sandbox.hpp"

namespace judgecore::sandbox {

/**
 * @brief go-judge 沙箱的 REST 接口实现
 * 接口：
 * 1. POST /run 运行程序
 * 2. POST /file 缓存文件，返回文件 id
 * 3. GET /file/{id} 读取缓存文件
 * 4. DELETE /file/{id} 删除缓存文件
 *
 * 错误映射：
 * 1. 连接失败、HTTP 5xx：sandbox_unavailable
 * 2. HTTP 4xx：sandbox_rejected
 * 3. 请求超过 request_timeout：sandbox_timeout
 * 4. 令牌被取消：cancelled_error
 */
struct go_judge_sandbox : public sandbox {
    explicit go_judge_sandbox(const sandbox_config &config);

    run_result execute(const run_request &request, const cancellation_token &token) override;

    std::string add_file(const std::string &content, const cancellation_token &token) override;

    std::string get_file(const std::string &file_id, const cancellation_token &token) override;

    void delete_file(const std::string &file_id) override;

private:
    std::string request(const std::string &method, const std::string &path, const std::string &body, std::chrono::milliseconds timeout, const cancellation_token *token);

    sandbox_config cfg;
};

/**
 * @brief 将运行请求编码为 go-judge 的请求体
 * 时间单位转换为纳秒。
 */
nlohmann::json encode_run_request(const run_request &request);

/**
 * @brief 解码 go-judge 返回的单个运行结果
 * @throw sandbox_rejected 若返回了无法识别的状态
 */
run_result decode_run_result(const nlohmann::json &j);

/**
 * @brief 一次 /run 请求的 HTTP 超时时间
 * 在程序自身的墙上时间限制之外再给出 request_timeout 的余量，
 * 避免沙箱调用的超时把未超出限制的程序判为系统错误。
 */
std::chrono::milliseconds run_timeout(const sandbox_config &config, const run_request &request);

}  // namespace judgecore::sandbox
