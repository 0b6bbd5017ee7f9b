#pragma once

#include <chrono>
#include <curl/curl.h>
#include <string>
#include "common/cancellation.hpp"

namespace judgecore {

/**
 * @brief 一次 HTTP 请求的结果
 */
struct http_response {
    /**
     * @brief CURL 的错误码，CURLE_OK 表示传输成功
     */
    CURLcode code = CURLE_OK;

    /**
     * @brief HTTP 状态码，传输失败时为 0
     */
    long status = 0;

    std::string body;

    /**
     * @brief 传输失败时的错误描述
     */
    std::string error;

    bool timed_out() const;

    /**
     * @brief 是否因为取消令牌被中止
     */
    bool aborted() const;
};

/**
 * @brief 发送 HTTP 请求，阻塞直到请求结束、超时或者被取消
 * 传输错误不会抛出异常，由调用者根据 code 和 status 映射到自己的错误类型。
 * @param method GET、POST、PUT、DELETE
 * @param url 请求地址
 * @param body 请求体，为空时不发送
 * @param content_type 请求体类型
 * @param timeout 整个请求的超时时间
 * @param token 取消令牌，可以为 nullptr
 */
http_response http_perform(const std::string &method,
                           const std::string &url,
                           const std::string &body,
                           const std::string &content_type,
                           std::chrono::milliseconds timeout,
                           const cancellation_token *token);

/**
 * @brief 以 multipart/form-data 的形式上传文件
 * @param field 表单字段名
 * @param filename 文件名
 * @param content 文件内容
 */
http_response http_upload(const std::string &url,
                          const std::string &field,
                          const std::string &filename,
                          const std::string &content,
                          std::chrono::milliseconds timeout,
                          const cancellation_token *token);

/**
 * @brief 对 URL 的路径片段进行转义
 */
std::string url_escape(const std::string &segment);

}  // namespace judgecore
