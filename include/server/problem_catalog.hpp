#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include "judge/submission.hpp"

namespace judgecore::server {

/**
 * @brief 题目目录，根据题目 id 查找题目的评测配置
 */
struct problem_catalog {
    virtual ~problem_catalog();

    /**
     * @brief 查找题目
     * @throw configuration_error 若题目不存在或者配置格式错误
     */
    virtual problem_policy_ptr find(const std::string &problem_id) = 0;
};

/**
 * @brief 从目录中读取 <id>.json 格式的题目配置
 * 读取过的题目会被缓存，题目配置在运行期间不会改变。
 */
struct json_problem_catalog : public problem_catalog {
    explicit json_problem_catalog(const std::filesystem::path &dir);

    problem_policy_ptr find(const std::string &problem_id) override;

private:
    std::filesystem::path dir;
    std::mutex mut;
    std::map<std::string, problem_policy_ptr> cache;
};

/**
 * @brief 内存中的题目目录
 */
struct memory_problem_catalog : public problem_catalog {
    void add(const problem_policy &problem);

    problem_policy_ptr find(const std::string &problem_id) override;

private:
    std::mutex mut;
    std::map<std::string, problem_policy_ptr> problems;
};

}  // namespace judgecore::server
